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

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

namespace ink {

/// Multipliers relative to the current image. 1.0 means no change.
struct EnhancementSettings
{
	double brightness{1.0};
	double contrast{1.0};
	double saturation{1.0};
	double sharpness{1.0};

	friend void from_json(const nlohmann::json& src, EnhancementSettings& dest);
	friend void to_json(nlohmann::json& dest, const EnhancementSettings& src);
};

/// Applies brightness, contrast, saturation and sharpness in that order. Each stage
/// works on the output of the previous one.
cv::Mat enhance(const cv::Mat& image, const EnhancementSettings& settings);

cv::Mat adjust_brightness(const cv::Mat& image, double factor);
cv::Mat adjust_contrast(const cv::Mat& image, double factor);
cv::Mat adjust_saturation(const cv::Mat& image, double factor);
cv::Mat adjust_sharpness(const cv::Mat& image, double factor);

} // end of namespace ink
