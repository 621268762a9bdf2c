/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the inkwell
	distribution for more details.
*/

//
// Created by nestal on 10/5/20.
//

#pragma once

#include "util/FS.hh"
#include "util/Exception.hh"

#include <opencv2/core.hpp>

#include <string>
#include <string_view>

namespace ink {

using ImagePath = boost::error_info<struct tag_image_path, fs::path>;

/// Decodes an encoded image (JPEG, PNG, ...) into 8-bit BGR.
/// Throws DecodeError if the bytes are not an image.
cv::Mat decode_image(std::string_view raw);

/// Throws DecodeError if the file cannot be read as an image.
cv::Mat read_image(const fs::path& path);

/// Writes the image in the format implied by the extension of \a path, creating
/// its parent directory if needed.
void save_image(const cv::Mat& image, const fs::path& path);

/// SHA-256 of the raw pixel data. Two images with the same pixels have the same hash.
std::string image_hash(const cv::Mat& image);

} // end of namespace ink
