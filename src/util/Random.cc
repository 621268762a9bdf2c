/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/6/20.
//

#include "Random.hh"

#include <cerrno>
#include <system_error>

#include <sys/random.h>

namespace ink {

void secure_random(void *buf, std::size_t size)
{
	if (::getrandom(buf, size, 0) != static_cast<ssize_t>(size))
		throw std::system_error(errno, std::generic_category());
}

} // end of namespace ink
