/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the inkwell
	distribution for more details.
*/

//
// Created by nestal on 10/4/20.
//

#pragma once

#include "util/Exception.hh"

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace ink {

struct InvalidColor : virtual Exception {};
using ColorString = boost::error_info<struct tag_color_string, std::string>;

struct Color
{
	std::uint8_t red{}, green{}, blue{};

	static Color white() {return {255, 255, 255};}

	// images are in BGR order
	cv::Scalar scalar() const {return {double(blue), double(green), double(red)};}

	bool operator==(const Color& rhs) const {return red == rhs.red && green == rhs.green && blue == rhs.blue;}
	bool operator!=(const Color& rhs) const {return !(*this == rhs);}
};

/// Parses "#rgb", "#rrggbb", "#rrggbbaa", "rgb(r, g, b)" or a basic CSS colour name.
/// Throws InvalidColor.
Color parse_color(std::string_view str);

/// Same as parse_color() but logs a warning and returns \a fallback on failure.
Color parse_color(std::string_view str, const Color& fallback);

} // end of namespace ink
