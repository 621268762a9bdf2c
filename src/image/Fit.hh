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

#include "Color.hh"
#include "RotateImage.hh"

#include "util/Size.hh"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include <string_view>

namespace ink {

/// How a source image is reconciled with a fixed target canvas.
struct FitConfig
{
	enum class Strategy {cover, contain, stretch, smart};
	enum class Preserve {none, width, height};

	Strategy strategy{Strategy::cover};
	Preserve preserve{Preserve::none};

	static Strategy parse_strategy(std::string_view str);
	static Preserve parse_preserve(std::string_view str);

	bool operator==(const FitConfig& rhs) const {return strategy == rhs.strategy && preserve == rhs.preserve;}
	bool operator!=(const FitConfig& rhs) const {return !(*this == rhs);}

	friend void from_json(const nlohmann::json& src, FitConfig& dest);
	friend void to_json(nlohmann::json& dest, const FitConfig& src);
};

std::string_view to_string(FitConfig::Strategy strategy);
std::string_view to_string(FitConfig::Preserve preserve);

/// Returns an image of exactly \a target.
///
/// If \a config preserves the width or the height, the image is centre-cropped along the
/// other axis to the aspect ratio of \a target. Otherwise the strategy decides:
/// cover crops, contain pads with \a background, stretch distorts, and smart picks one
/// of them depending on \a orientation and whether the image is portrait.
///
/// Throws ConfigurationError if \a target is not positive, and DecodeError if \a image
/// is empty.
cv::Mat fit(const cv::Mat& image, Size target, const FitConfig& config, Orientation orientation, const Color& background);

// The individual strategies.
cv::Mat cover(const cv::Mat& image, Size target);
cv::Mat contain(const cv::Mat& image, Size target, const Color& background);
cv::Mat stretch(const cv::Mat& image, Size target);
cv::Mat preserve_width(const cv::Mat& image, Size target);
cv::Mat preserve_height(const cv::Mat& image, Size target);

/// Size of \a source scaled to fit inside \a target with its aspect ratio intact.
Size contain_size(Size source, Size target);

/// Resizes with INTER_AREA for shrinking and INTER_LANCZOS4 for enlarging.
cv::Mat resample(const cv::Mat& image, Size target);

} // end of namespace ink
