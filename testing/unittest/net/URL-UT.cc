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

#include "net/URL.hh"
#include "net/HTTPTransport.hh"
#include "util/Exception.hh"

#include <boost/exception/get_error_info.hpp>

using namespace ink;

TEST_CASE("parse URL", "[normal]")
{
	URL subject{"https://p42-sharedstreams.icloud.com/B0abc/sharedstreams/webstream"};
	REQUIRE(subject.scheme() == "https");
	REQUIRE(subject.host() == "p42-sharedstreams.icloud.com");
	REQUIRE(subject.port() == "443");
	REQUIRE(subject.target() == "/B0abc/sharedstreams/webstream");
	REQUIRE(subject.str() == "https://p42-sharedstreams.icloud.com/B0abc/sharedstreams/webstream");

	URL with_port{"HTTP://localhost:8080?a=b#top"};
	REQUIRE(with_port.scheme() == "http");
	REQUIRE(with_port.host() == "localhost");
	REQUIRE(with_port.port() == "8080");
	REQUIRE(with_port.target() == "/?a=b");
	REQUIRE(with_port.str() == "http://localhost:8080/?a=b");

	URL host_only{"https://example.com"};
	REQUIRE(host_only.target() == "/");
}

TEST_CASE("resolve redirect locations", "[normal]")
{
	URL base{"https://example.com/a/b/c.jpg"};
	REQUIRE(base.resolve("https://cdn.example.com/x.jpg").str() == "https://cdn.example.com/x.jpg");
	REQUIRE(base.resolve("//cdn.example.com/x.jpg").str() == "https://cdn.example.com/x.jpg");
	REQUIRE(base.resolve("/x.jpg").str() == "https://example.com/x.jpg");
	REQUIRE(base.resolve("d.jpg").str() == "https://example.com/a/b/d.jpg");
}

TEST_CASE("invalid URLs", "[error]")
{
	REQUIRE_THROWS_AS(URL{"example.com/path"}, ConfigurationError);
	REQUIRE_THROWS_AS(URL{"ftp://example.com/"}, ConfigurationError);
	REQUIRE_THROWS_AS(URL{"https:///path"}, ConfigurationError);
	REQUIRE_THROWS_AS(URL{""}, ConfigurationError);
}

TEST_CASE("HTTP status", "[normal]")
{
	HTTPResponse ok{200};
	REQUIRE(ok.success());
	REQUIRE_NOTHROW(check_status(ok, "https://example.com"));

	HTTPResponse not_modified{304};
	REQUIRE(not_modified.success());
	REQUIRE_FALSE(not_modified.redirect());

	HTTPResponse moved{302, {}, {}, "/elsewhere"};
	REQUIRE(moved.redirect());
	REQUIRE_FALSE(moved.success());

	try
	{
		check_status(HTTPResponse{404}, "https://example.com/missing");
		FAIL("no exception");
	}
	catch (TransportError& e)
	{
		REQUIRE(boost::get_error_info<HTTPStatus>(e));
		REQUIRE(*boost::get_error_info<HTTPStatus>(e) == 404);
		REQUIRE(*boost::get_error_info<SourceURL>(e) == "https://example.com/missing");
	}
}
