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

#include <opencv2/core.hpp>

#include <string_view>

namespace ink {

enum class Orientation {horizontal, vertical};

/// Throws ConfigurationError for anything other than "horizontal" or "vertical".
Orientation parse_orientation(std::string_view orientation);
std::string_view to_string(Orientation orientation);

/// Rotates counter-clockwise by 0 (horizontal) or 90 (vertical) degrees, plus
/// 180 degrees if \a inverted. The canvas grows to hold the rotated image.
cv::Mat change_orientation(const cv::Mat& image, Orientation orientation, bool inverted = false);

/// Counter-clockwise rotation by a multiple of 90 degrees.
cv::Mat rotate(const cv::Mat& image, int degrees);

} // end of namespace ink
