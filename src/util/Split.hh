/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

#pragma once

#include <string>
#include <string_view>
#include <tuple>

namespace ink {

/// Removes and returns the text in front of the first character in \a value.
/// The matching character, or '\0' if none, is returned along with it.
std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value);
std::string_view split_front_substring(std::string_view& in, std::string_view substring);

std::string_view trim(std::string_view in);
std::string to_lower(std::string_view in);

} // end of namespace
