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

#include "image/Image.hh"
#include "util/Exception.hh"

#include <boost/filesystem/operations.hpp>

using namespace ink;

TEST_CASE("decode PNG", "[normal]")
{
	auto image = pattern_image(30, 20);
	auto decoded = decode_image(encode_png(image));
	REQUIRE(same_pixels(decoded, image));
}

TEST_CASE("decode garbage", "[error]")
{
	REQUIRE_THROWS_AS(decode_image(""), DecodeError);
	REQUIRE_THROWS_AS(decode_image("this is not an image"), DecodeError);
}

TEST_CASE("save and read image files", "[normal]")
{
	TempDir dir;
	auto image = pattern_image(30, 20);

	// parent directories are created
	auto path = dir / "sub" / "dir" / "image.png";
	save_image(image, path);
	REQUIRE(fs::exists(path));
	REQUIRE(same_pixels(read_image(path), image));

	REQUIRE_THROWS_AS(read_image(dir / "no such file.png"), DecodeError);
}

TEST_CASE("image hash", "[normal]")
{
	auto image = pattern_image(30, 20);
	auto hash = image_hash(image);
	REQUIRE(hash.size() == 64);
	REQUIRE(hash == image_hash(image.clone()));

	// only the pixels matter, not how the matrix is stored
	cv::Mat big = pattern_image(40, 40);
	REQUIRE(image_hash(big(cv::Rect{0, 0, 30, 20})) == image_hash(big(cv::Rect{0, 0, 30, 20}).clone()));

	auto changed = image.clone();
	changed.at<cv::Vec3b>(10, 10)[0] ^= 1;
	REQUIRE(hash != image_hash(changed));

	// same bytes but different shapes
	REQUIRE(image_hash(solid_image(2, 1, red)) != image_hash(solid_image(1, 2, red)));

	// empty image
	REQUIRE(image_hash(cv::Mat{}) != image_hash(solid_image(1, 1, red)));
}
