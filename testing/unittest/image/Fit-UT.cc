/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/14/20.
//

#include <catch2/catch.hpp>

#include "common/TestImages.hh"

#include "image/Fit.hh"
#include "util/Exception.hh"

using namespace ink;

namespace {
const FitConfig::Strategy all_strategies[] = {
	FitConfig::Strategy::cover, FitConfig::Strategy::contain,
	FitConfig::Strategy::stretch, FitConfig::Strategy::smart
};
const FitConfig::Preserve all_preserves[] = {
	FitConfig::Preserve::none, FitConfig::Preserve::width, FitConfig::Preserve::height
};
}

TEST_CASE("fit() always returns an image of the target size", "[normal]")
{
	const Size sources[] = {{640, 480}, {480, 640}, {100, 100}, {2000, 10}, {10, 2000}, {1, 1}};
	const Size targets[] = {{800, 480}, {480, 800}, {64, 64}};

	for (auto&& source : sources)
	{
		auto image = pattern_image(source.width(), source.height());
		for (auto&& target : targets)
			for (auto strategy : all_strategies)
				for (auto preserve : all_preserves)
					for (auto orientation : {Orientation::horizontal, Orientation::vertical})
					{
						INFO("source " << source << " target " << target <<
							" strategy " << to_string(strategy) << " preserve " << to_string(preserve));

						auto out = fit(image, target, FitConfig{strategy, preserve}, orientation, Color::white());
						REQUIRE(out.cols == target.width());
						REQUIRE(out.rows == target.height());
						REQUIRE(out.type() == CV_8UC3);
					}
	}
}

TEST_CASE("fitting an image into its own size leaves it untouched", "[normal]")
{
	auto image = pattern_image(120, 80);
	for (auto strategy : all_strategies)
	{
		auto out = fit(image, {120, 80}, FitConfig{strategy}, Orientation::horizontal, Color::white());
		REQUIRE(same_pixels(out, image));
	}
}

TEST_CASE("preserve width and height survive extreme aspect ratios", "[normal]")
{
	SECTION("very wide source")
	{
		auto image = pattern_image(2000, 10);
		auto out = preserve_width(image, {800, 480});
		REQUIRE(out.cols == 800);
		REQUIRE(out.rows == 480);

		out = preserve_height(image, {800, 480});
		REQUIRE(out.cols == 800);
		REQUIRE(out.rows == 480);
	}
	SECTION("very tall source")
	{
		auto image = pattern_image(10, 2000);
		auto out = preserve_width(image, {800, 480});
		REQUIRE(out.cols == 800);
		REQUIRE(out.rows == 480);

		out = preserve_height(image, {800, 480});
		REQUIRE(out.cols == 800);
		REQUIRE(out.rows == 480);
	}
	SECTION("one pixel")
	{
		auto out = fit(pattern_image(1, 1), {800, 480}, FitConfig{FitConfig::Strategy::cover, FitConfig::Preserve::width},
			Orientation::horizontal, Color::white());
		REQUIRE(out.cols == 800);
		REQUIRE(out.rows == 480);
	}
}

TEST_CASE("preserve crops from the centre", "[normal]")
{
	// 400x100 into a square: keep the middle 100 columns
	auto image = pattern_image(400, 100);
	auto out = preserve_height(image, {100, 100});
	REQUIRE(same_pixels(out, image(cv::Rect{150, 0, 100, 100})));

	// 100x400 into a square: keep the middle 100 rows
	image = pattern_image(100, 400);
	out = preserve_width(image, {100, 100});
	REQUIRE(same_pixels(out, image(cv::Rect{0, 150, 100, 100})));
}

TEST_CASE("preserve takes precedence over strategy", "[normal]")
{
	auto image = pattern_image(400, 100);
	auto out = fit(image, {100, 100}, FitConfig{FitConfig::Strategy::contain, FitConfig::Preserve::height},
		Orientation::horizontal, Color::white());
	REQUIRE(same_pixels(out, image(cv::Rect{150, 0, 100, 100})));
}

TEST_CASE("smart fit letterboxes portrait images on a horizontal display", "[normal]")
{
	auto image = solid_image(300, 600, red);
	auto out = fit(image, {800, 480}, FitConfig{FitConfig::Strategy::smart}, Orientation::horizontal, Color::white());
	REQUIRE(out.cols == 800);
	REQUIRE(out.rows == 480);

	// padding on the left and right edges
	REQUIRE(out.at<cv::Vec3b>(240, 0)   == cv::Vec3b(255, 255, 255));
	REQUIRE(out.at<cv::Vec3b>(240, 799) == cv::Vec3b(255, 255, 255));
	REQUIRE(out.at<cv::Vec3b>(0, 400)   == cv::Vec3b(0, 0, 255));
	REQUIRE(out.at<cv::Vec3b>(479, 400) == cv::Vec3b(0, 0, 255));

	// 300:600 scaled to 240:480
	REQUIRE(count_in_row(out, 240, red) == 240);
	REQUIRE(count_in_row(out, 240, white) == 560);
}

TEST_CASE("smart fit covers landscape images on a horizontal display", "[normal]")
{
	auto image = split_image(200, 100, blue, red);
	auto out = fit(image, {100, 100}, FitConfig{FitConfig::Strategy::smart}, Orientation::horizontal, Color::white());
	REQUIRE(out.cols == 100);
	REQUIRE(count_in_row(out, 50, white) == 0);
	REQUIRE(count_in_row(out, 50, blue) == 50);
	REQUIRE(count_in_row(out, 50, red) == 50);
}

TEST_CASE("smart fit on a vertical display", "[normal]")
{
	SECTION("portrait source is covered")
	{
		auto image = pattern_image(100, 300);
		auto out = fit(image, {100, 100}, FitConfig{FitConfig::Strategy::smart}, Orientation::vertical, Color::white());
		REQUIRE(same_pixels(out, image(cv::Rect{0, 100, 100, 100})));
	}
	SECTION("landscape source is stretched")
	{
		auto image = split_image(200, 100, blue, red);
		auto out = fit(image, {100, 100}, FitConfig{FitConfig::Strategy::smart}, Orientation::vertical, Color::white());
		REQUIRE(same_pixels(out, stretch(image, {100, 100})));
	}
}

TEST_CASE("contain pads with the background colour", "[normal]")
{
	auto out = contain(solid_image(100, 100, red), {300, 100}, parse_color("#0000ff"));
	REQUIRE(out.cols == 300);
	REQUIRE(out.rows == 100);
	REQUIRE(count_in_row(out, 50, red) == 100);
	REQUIRE(count_in_row(out, 50, blue) == 200);
	REQUIRE(out.at<cv::Vec3b>(50, 0) == cv::Vec3b(255, 0, 0));
	REQUIRE(out.at<cv::Vec3b>(50, 150) == cv::Vec3b(0, 0, 255));
}

TEST_CASE("stretch ignores the aspect ratio", "[normal]")
{
	auto out = stretch(solid_image(100, 300, red), {800, 480});
	REQUIRE(out.cols == 800);
	REQUIRE(out.rows == 480);
	REQUIRE(count_in_row(out, 0, red) == 800);
	REQUIRE(count_in_row(out, 479, red) == 800);
}

TEST_CASE("contain_size keeps the aspect ratio", "[normal]")
{
	REQUIRE(contain_size({300, 600}, {800, 480}) == Size{240, 480});
	REQUIRE(contain_size({1000, 500}, {800, 480}) == Size{800, 400});
	REQUIRE(contain_size({400, 240}, {800, 480}) == Size{800, 480});
	REQUIRE(contain_size({10000, 1}, {800, 480}) == Size{800, 1});
}

TEST_CASE("fit rejects bad input", "[error]")
{
	auto image = pattern_image(10, 10);
	REQUIRE_THROWS_AS(fit(image, {0, 480}, {}, Orientation::horizontal, Color::white()), ConfigurationError);
	REQUIRE_THROWS_AS(fit(image, {800, -1}, {}, Orientation::horizontal, Color::white()), ConfigurationError);
	REQUIRE_THROWS_AS(fit(cv::Mat{}, {800, 480}, {}, Orientation::horizontal, Color::white()), DecodeError);
}

TEST_CASE("FitConfig from JSON", "[normal]")
{
	SECTION("direct object")
	{
		auto cfg = nlohmann::json{{"strategy", "contain"}, {"preserve", "height"}}.get<FitConfig>();
		REQUIRE(cfg.strategy == FitConfig::Strategy::contain);
		REQUIRE(cfg.preserve == FitConfig::Preserve::height);
	}
	SECTION("wrapped in fit and in upper case")
	{
		auto cfg = nlohmann::json{{"fit", {{"strategy", "SMART"}, {"preserve", "Width"}}}}.get<FitConfig>();
		REQUIRE(cfg.strategy == FitConfig::Strategy::smart);
		REQUIRE(cfg.preserve == FitConfig::Preserve::width);
	}
	SECTION("unknown values fall back to the defaults")
	{
		auto cfg = nlohmann::json{{"strategy", "zoom"}, {"preserve", "depth"}}.get<FitConfig>();
		REQUIRE(cfg == FitConfig{});
	}
	SECTION("not an object")
	{
		REQUIRE(nlohmann::json{}.get<FitConfig>() == FitConfig{});
		REQUIRE(nlohmann::json("contain").get<FitConfig>() == FitConfig{});
	}
	SECTION("back to JSON")
	{
		nlohmann::json json = FitConfig{FitConfig::Strategy::stretch, FitConfig::Preserve::none};
		REQUIRE(json == nlohmann::json{{"strategy", "stretch"}, {"preserve", "none"}});
	}
}
