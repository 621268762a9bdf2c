/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the inkwell
	distribution for more details.
*/

//
// Created by nestal on 10/5/20.
//

#include "Enhance.hh"

#include "util/Log.hh"

#include <opencv2/imgproc.hpp>

#include <cmath>

namespace ink {
namespace {

// Interpolates between the degenerate image (factor 0) and the image (factor 1).
// Factors above 1 extrapolate away from the degenerate image.
cv::Mat blend(const cv::Mat& degenerate, const cv::Mat& image, double factor)
{
	cv::Mat out;
	cv::addWeighted(image, factor, degenerate, 1.0 - factor, 0.0, out);
	return out;
}

cv::Mat gray_of(const cv::Mat& image)
{
	cv::Mat gray;
	cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
	return gray;
}

} // end of local namespace

void from_json(const nlohmann::json& src, EnhancementSettings& dest)
{
	dest = EnhancementSettings{};
	if (src.is_object())
	{
		dest.brightness = src.value("brightness", dest.brightness);
		dest.contrast   = src.value("contrast",   dest.contrast);
		dest.saturation = src.value("saturation", dest.saturation);
		dest.sharpness  = src.value("sharpness",  dest.sharpness);
	}
}

void to_json(nlohmann::json& dest, const EnhancementSettings& src)
{
	dest = nlohmann::json{
		{"brightness", src.brightness},
		{"contrast",   src.contrast},
		{"saturation", src.saturation},
		{"sharpness",  src.sharpness}
	};
}

cv::Mat enhance(const cv::Mat& image, const EnhancementSettings& settings)
{
	Log(LOG_DEBUG, "enhancing image: brightness=%1% contrast=%2% saturation=%3% sharpness=%4%",
		settings.brightness, settings.contrast, settings.saturation, settings.sharpness);

	auto out = adjust_brightness(image, settings.brightness);
	out = adjust_contrast(out, settings.contrast);
	out = adjust_saturation(out, settings.saturation);
	return adjust_sharpness(out, settings.sharpness);
}

cv::Mat adjust_brightness(const cv::Mat& image, double factor)
{
	if (factor == 1.0)
		return image.clone();

	return blend(cv::Mat::zeros(image.size(), image.type()), image, factor);
}

cv::Mat adjust_contrast(const cv::Mat& image, double factor)
{
	if (factor == 1.0 || image.empty())
		return image.clone();

	// flat grey image with the mean luminance of the image
	auto mean = std::floor(cv::mean(image.channels() == 1 ? image : gray_of(image))[0] + 0.5);
	return blend(cv::Mat{image.size(), image.type(), cv::Scalar::all(mean)}, image, factor);
}

cv::Mat adjust_saturation(const cv::Mat& image, double factor)
{
	if (factor == 1.0 || image.channels() == 1)
		return image.clone();

	cv::Mat degenerate;
	cv::cvtColor(gray_of(image), degenerate, image.channels() == 4 ? cv::COLOR_GRAY2BGRA : cv::COLOR_GRAY2BGR);
	return blend(degenerate, image, factor);
}

cv::Mat adjust_sharpness(const cv::Mat& image, double factor)
{
	if (factor == 1.0 || image.rows < 3 || image.cols < 3)
		return image.clone();

	// 3x3 smoothing kernel. The border pixels are left as is.
	cv::Mat kernel = (cv::Mat_<float>(3, 3) <<
		1, 1, 1,
		1, 5, 1,
		1, 1, 1
	);
	kernel /= 13.0;

	cv::Mat degenerate = image.clone();
	cv::Rect inner{1, 1, image.cols - 2, image.rows - 2};
	cv::Mat smoothed;
	cv::filter2D(image, smoothed, -1, kernel, {-1, -1}, 0, cv::BORDER_REPLICATE);
	smoothed(inner).copyTo(degenerate(inner));

	return blend(degenerate, image, factor);
}

} // end of namespace ink
