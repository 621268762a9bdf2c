/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#include "Exception.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/get_error_info.hpp>

namespace ink {

const char* Exception::what() const noexcept
{
	return boost::diagnostic_information_what(*this, true);
}

std::string message(const Exception& e)
{
	if (auto msg = boost::get_error_info<Message>(e))
		return *msg;
	return e.what();
}

} // end of namespace
