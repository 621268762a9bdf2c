/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#pragma once

#include <system_error>

namespace ink {

enum class Error
{
	ok,
	timeout,
	http_error,
	too_many_redirects,
	unsupported_scheme,
	invalid_url,

	unknown_error
};

const std::error_category& ink_error_category();
std::error_code make_error_code(Error err);

} // end of namespace ink

namespace std
{
	template <> struct is_error_code_enum<ink::Error> : true_type {};
}
