/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

#include "Split.hh"

#include <algorithm>
#include <cctype>

namespace ink {

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value)
{
	// substr() will not throw even if "in" is empty and location==npos
	auto location = in.find_first_of(value);
	auto result   = in.substr(0, location);

	in.remove_prefix(result.size());

	// Remove the matching character, if any
	char match = '\0';
	if (location != in.npos)
	{
		match = in.front();
		in.remove_prefix(1);
	}

	return std::make_tuple(result, match);
}

std::string_view split_front_substring(std::string_view& in, std::string_view substring)
{
	auto location = in.find(substring);
	auto result   = in.substr(0, location);

	in.remove_prefix(result.size());

	// Remove the matching substring, if any
	if (location != in.npos)
		in.remove_prefix(substring.size());

	return result;
}

std::string_view trim(std::string_view in)
{
	auto space = [](unsigned char c){return std::isspace(c) != 0;};
	while (!in.empty() && space(in.front()))
		in.remove_prefix(1);
	while (!in.empty() && space(in.back()))
		in.remove_suffix(1);
	return in;
}

std::string to_lower(std::string_view in)
{
	std::string result{in};
	std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
	{
		return static_cast<char>(std::tolower(c));
	});
	return result;
}

} // end of namespace
