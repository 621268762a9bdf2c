/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/14/20.
//

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "util/Log.hh"

int main( int argc, char* argv[] )
{
	// keep the test output readable
	ink::open_log("inkwell-unittest", LOG_WARNING);

	return Catch::Session().run(argc, argv);
}
