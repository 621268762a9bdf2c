/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/15/20.
//

#include <catch2/catch.hpp>

#include "common/TestImages.hh"

#include "album/ImageFetcher.hh"
#include "util/Exception.hh"

#include <boost/exception/get_error_info.hpp>

using namespace ink;

namespace {

HTTPTransport serve(std::string body, unsigned status = 200)
{
	return [body=std::move(body), status](const HTTPRequest& req)
	{
		REQUIRE(req.method == boost::beast::http::verb::get);
		return HTTPResponse{status, body, "image/png"};
	};
}

}

TEST_CASE("fetch and letterbox a photo", "[normal]")
{
	ImageFetcher subject{serve(encode_png(solid_image(300, 600, red)))};

	auto image = subject.fetch_and_fit("https://example.com/photo.png", {800, 480}, parse_color("#0000FF"));
	REQUIRE(image.cols == 800);
	REQUIRE(image.rows == 480);
	REQUIRE(count_in_row(image, 240, red) == 240);
	REQUIRE(count_in_row(image, 240, blue) == 560);
}

TEST_CASE("not modified counts as success", "[normal]")
{
	ImageFetcher subject{serve(encode_png(solid_image(80, 48, red)), 304)};
	auto image = subject.fetch_and_fit("https://example.com/photo.png", {80, 48}, Color::white());
	REQUIRE(count_in_row(image, 0, red) == 80);
}

TEST_CASE("download failures", "[error]")
{
	SECTION("HTTP error")
	{
		ImageFetcher subject{serve("not found", 404)};
		REQUIRE_THROWS_AS(subject.download("https://example.com/photo.png"), TransportError);
	}
	SECTION("not an image")
	{
		ImageFetcher subject{serve("<html></html>")};
		try
		{
			subject.fetch_and_fit("https://example.com/photo.png", {800, 480}, Color::white());
			FAIL("no exception");
		}
		catch (DecodeError& e)
		{
			REQUIRE(boost::get_error_info<SourceURL>(e));
			REQUIRE(*boost::get_error_info<SourceURL>(e) == "https://example.com/photo.png");
		}
	}
}
