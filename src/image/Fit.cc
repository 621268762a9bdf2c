/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the inkwell
	distribution for more details.
*/

//
// Created by nestal on 10/4/20.
//

#include "Fit.hh"

#include "util/Exception.hh"
#include "util/Log.hh"
#include "util/Split.hh"

#include <opencv2/imgproc.hpp>

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ink {
namespace {

Size size_of(const cv::Mat& image)
{
	return {image.cols, image.rows};
}

void check(const cv::Mat& image, Size target)
{
	if (!target.positive())
	{
		std::ostringstream ss;
		ss << "invalid target size " << target;
		BOOST_THROW_EXCEPTION(ConfigurationError() << Message{ss.str()});
	}
	if (image.empty())
		BOOST_THROW_EXCEPTION(DecodeError() << Message{"cannot fit an empty image"});
}

// Centre crop to the aspect ratio of target. The crop rectangle never leaves the image.
cv::Rect cover_roi(Size source, Size target)
{
	// compare w1/h1 with w2/h2 without rounding errors
	auto lhs = static_cast<long long>(source.width()) * target.height();
	auto rhs = static_cast<long long>(target.width()) * source.height();

	cv::Rect roi{0, 0, source.width(), source.height()};
	if (lhs > rhs)
	{
		// source is wider: crop left and right
		roi.width = std::clamp(
			static_cast<int>(std::lround(static_cast<double>(rhs) / target.height())),
			1, source.width()
		);
		roi.x = (source.width() - roi.width) / 2;
	}
	else if (lhs < rhs)
	{
		// source is taller: crop top and bottom
		roi.height = std::clamp(
			static_cast<int>(std::lround(static_cast<double>(lhs) / target.width())),
			1, source.height()
		);
		roi.y = (source.height() - roi.height) / 2;
	}
	return roi;
}

} // end of local namespace

FitConfig::Strategy FitConfig::parse_strategy(std::string_view str)
{
	auto lower = to_lower(trim(str));
	if (lower == "contain") return Strategy::contain;
	if (lower == "stretch") return Strategy::stretch;
	if (lower == "smart")   return Strategy::smart;

	// "cover", "default" and anything unrecognised
	return Strategy::cover;
}

FitConfig::Preserve FitConfig::parse_preserve(std::string_view str)
{
	auto lower = to_lower(trim(str));
	if (lower == "width")  return Preserve::width;
	if (lower == "height") return Preserve::height;
	return Preserve::none;
}

std::string_view to_string(FitConfig::Strategy strategy)
{
	switch (strategy)
	{
		case FitConfig::Strategy::contain: return "contain";
		case FitConfig::Strategy::stretch: return "stretch";
		case FitConfig::Strategy::smart:   return "smart";
		default:                           return "cover";
	}
}

std::string_view to_string(FitConfig::Preserve preserve)
{
	switch (preserve)
	{
		case FitConfig::Preserve::width:  return "width";
		case FitConfig::Preserve::height: return "height";
		default:                          return "none";
	}
}

void from_json(const nlohmann::json& src, FitConfig& dest)
{
	dest = FitConfig{};
	if (!src.is_object())
		return;

	// both {"strategy": ..., "preserve": ...} and {"fit": {...}} are accepted
	auto& obj = src.contains("fit") && src["fit"].is_object() ? src["fit"] : src;

	if (auto it = obj.find("strategy"); it != obj.end() && it->is_string())
		dest.strategy = FitConfig::parse_strategy(it->get<std::string>());
	if (auto it = obj.find("preserve"); it != obj.end() && it->is_string())
		dest.preserve = FitConfig::parse_preserve(it->get<std::string>());
}

void to_json(nlohmann::json& dest, const FitConfig& src)
{
	dest = nlohmann::json{
		{"strategy", to_string(src.strategy)},
		{"preserve", to_string(src.preserve)}
	};
}

cv::Mat fit(const cv::Mat& image, Size target, const FitConfig& config, Orientation orientation, const Color& background)
{
	check(image, target);
	Log(LOG_DEBUG, "fitting %1%x%2% image into %3%x%4% with strategy=%5% preserve=%6%",
		image.cols, image.rows, target.width(), target.height(),
		to_string(config.strategy), to_string(config.preserve)
	);

	// preserve overrides strategy
	switch (config.preserve)
	{
		case FitConfig::Preserve::width:  return preserve_width(image, target);
		case FitConfig::Preserve::height: return preserve_height(image, target);
		default: break;
	}

	auto portrait = size_of(image).portrait();
	switch (config.strategy)
	{
		case FitConfig::Strategy::smart:
			if (orientation == Orientation::horizontal)
				return portrait ? contain(image, target, background) : cover(image, target);
			else
				return portrait ? cover(image, target) : stretch(image, target);

		case FitConfig::Strategy::contain: return contain(image, target, background);
		case FitConfig::Strategy::stretch: return stretch(image, target);
		default:                           return cover(image, target);
	}
}

cv::Mat cover(const cv::Mat& image, Size target)
{
	check(image, target);
	return resample(image(cover_roi(size_of(image), target)), target);
}

cv::Mat contain(const cv::Mat& image, Size target, const Color& background)
{
	check(image, target);
	auto fitted = resample(image, contain_size(size_of(image), target));

	cv::Mat canvas{target.height(), target.width(), fitted.type(), background.scalar()};
	fitted.copyTo(canvas(cv::Rect{
		(target.width()  - fitted.cols) / 2,
		(target.height() - fitted.rows) / 2,
		fitted.cols, fitted.rows
	}));
	return canvas;
}

cv::Mat stretch(const cv::Mat& image, Size target)
{
	check(image, target);
	return resample(image, target);
}

cv::Mat preserve_width(const cv::Mat& image, Size target)
{
	check(image, target);

	// keep the full width and crop the height to the target aspect ratio
	auto ratio  = static_cast<double>(target.width()) / target.height();
	auto height = std::clamp(static_cast<int>(image.cols / ratio), 1, image.rows);
	auto y      = std::max(0, (image.rows - height) / 2);

	return resample(image(cv::Rect{0, y, image.cols, height}), target);
}

cv::Mat preserve_height(const cv::Mat& image, Size target)
{
	check(image, target);

	auto ratio = static_cast<double>(target.width()) / target.height();
	auto width = std::clamp(static_cast<int>(image.rows * ratio), 1, image.cols);
	auto x     = std::max(0, (image.cols - width) / 2);

	return resample(image(cv::Rect{x, 0, width, image.rows}), target);
}

Size contain_size(Size source, Size target)
{
	auto lhs = static_cast<long long>(source.width()) * target.height();
	auto rhs = static_cast<long long>(target.width()) * source.height();

	if (lhs > rhs)
		return {target.width(), std::clamp(
			static_cast<int>(std::lround(static_cast<double>(source.height()) / source.width() * target.width())),
			1, target.height()
		)};
	else if (lhs < rhs)
		return {std::clamp(
			static_cast<int>(std::lround(static_cast<double>(source.width()) / source.height() * target.height())),
			1, target.width()
		), target.height()};
	else
		return target;
}

cv::Mat resample(const cv::Mat& image, Size target)
{
	if (size_of(image) == target)
		return image.clone();

	auto shrink = target.width() <= image.cols && target.height() <= image.rows;

	cv::Mat out;
	cv::resize(image, out, cv::Size{target.width(), target.height()}, 0, 0,
		shrink ? cv::INTER_AREA : cv::INTER_LANCZOS4);
	return out;
}

} // end of namespace ink
