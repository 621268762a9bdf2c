/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the inkwell
	distribution for more details.
*/

//
// Created by nestal on 10/4/20.
//

#include "Color.hh"

#include "util/Log.hh"
#include "util/Split.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <array>
#include <optional>
#include <utility>

namespace ink {
namespace {

std::optional<int> hex_digit(char c)
{
	if      ( c >= '0' && c <= '9' ) return c - '0';
	else if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
	else if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
	else return std::nullopt;
}

std::optional<Color> parse_hex(std::string_view hex)
{
	std::array<int, 8> digits{};
	if (hex.size() > digits.size())
		return std::nullopt;

	for (std::size_t i = 0; i < hex.size(); ++i)
	{
		auto d = hex_digit(hex[i]);
		if (!d)
			return std::nullopt;
		digits[i] = *d;
	}

	auto byte = [](int msb, int lsb){return static_cast<std::uint8_t>(msb * 16 + lsb);};
	switch (hex.size())
	{
		// #rgb: each digit is repeated
		case 3: return Color{byte(digits[0], digits[0]), byte(digits[1], digits[1]), byte(digits[2], digits[2])};

		// alpha is ignored
		case 6:
		case 8: return Color{byte(digits[0], digits[1]), byte(digits[2], digits[3]), byte(digits[4], digits[5])};

		default: return std::nullopt;
	}
}

std::optional<int> parse_component(std::string_view str)
{
	str = trim(str);
	if (str.empty() || str.size() > 3)
		return std::nullopt;

	int value = 0;
	for (auto c : str)
	{
		if (c < '0' || c > '9')
			return std::nullopt;
		value = value * 10 + (c - '0');
	}
	return value <= 255 ? std::optional<int>{value} : std::nullopt;
}

// rgb(r, g, b)
std::optional<Color> parse_rgb(std::string_view args)
{
	std::array<std::uint8_t, 3> rgb{};
	for (auto i = 0U; i < rgb.size(); ++i)
	{
		auto [field, match] = split_left(args, ",");
		auto value = parse_component(field);
		if (!value || (match == ',') != (i + 1 < rgb.size()))
			return std::nullopt;
		rgb[i] = static_cast<std::uint8_t>(*value);
	}
	return Color{rgb[0], rgb[1], rgb[2]};
}

std::optional<Color> named(std::string_view name)
{
	static const std::array<std::pair<std::string_view, Color>, 18> names{{
		{"white",   {255, 255, 255}},
		{"black",   {0,   0,   0}},
		{"red",     {255, 0,   0}},
		{"green",   {0,   128, 0}},
		{"lime",    {0,   255, 0}},
		{"blue",    {0,   0,   255}},
		{"yellow",  {255, 255, 0}},
		{"orange",  {255, 165, 0}},
		{"gray",    {128, 128, 128}},
		{"grey",    {128, 128, 128}},
		{"silver",  {192, 192, 192}},
		{"maroon",  {128, 0,   0}},
		{"purple",  {128, 0,   128}},
		{"navy",    {0,   0,   128}},
		{"teal",    {0,   128, 128}},
		{"aqua",    {0,   255, 255}},
		{"fuchsia", {255, 0,   255}},
		{"olive",   {128, 128, 0}}
	}};
	for (auto&& [n, color] : names)
		if (n == name)
			return color;
	return std::nullopt;
}

} // end of local namespace

Color parse_color(std::string_view str)
{
	auto lower = to_lower(trim(str));
	std::string_view remain{lower};

	std::optional<Color> result;
	if (!remain.empty() && remain.front() == '#')
		result = parse_hex(remain.substr(1));

	else if (remain.substr(0, 4) == "rgb(" && remain.back() == ')')
		result = parse_rgb(remain.substr(4, remain.size() - 5));

	else
		result = named(remain);

	if (!result)
		BOOST_THROW_EXCEPTION(InvalidColor() << ColorString{std::string{str}});

	return *result;
}

Color parse_color(std::string_view str, const Color& fallback)
{
	try
	{
		return parse_color(str);
	}
	catch (InvalidColor&)
	{
		Log(LOG_WARNING, "invalid background colour \"%1%\": using #%2$02X%3$02X%4$02X instead",
			str, int{fallback.red}, int{fallback.green}, int{fallback.blue});
		return fallback;
	}
}

} // end of namespace ink
