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

#include "util/Configuration.hh"

#include <boost/exception/get_error_info.hpp>

#include <syslog.h>

using namespace ink;

namespace {
const fs::path test_data{fs::path{__FILE__}.parent_path()};

Configuration load_file(const fs::path& path, std::vector<const char*> extra = {})
{
	std::string cfg = path.string();
	std::vector<const char*> argv{"inkwell", "--cfg", cfg.c_str()};
	argv.insert(argv.end(), extra.begin(), extra.end());
	return Configuration{static_cast<int>(argv.size()), argv.data(), nullptr};
}
}

TEST_CASE("load device configuration", "[normal]")
{
	auto subject = load_file(test_data / "device.json");

	REQUIRE(subject.display_type() == "epd7in3f");
	REQUIRE(subject.resolution() == Size{800, 480});
	REQUIRE(subject.orientation() == Orientation::vertical);
	REQUIRE(subject.inverted_image());
	REQUIRE(subject.image_settings().brightness == 1.1);
	REQUIRE(subject.image_settings().contrast == 1.0);
	REQUIRE(subject.image_settings().saturation == 1.4);
	REQUIRE(subject.http_timeout() == std::chrono::seconds{10});
	REQUIRE_FALSE(subject.verify_peer());
	REQUIRE(subject.log_priority() == LOG_DEBUG);

	// relative paths are relative to the configuration file
	REQUIRE(subject.current_image_file() == (test_data / "images/current.png").lexically_normal());
	REQUIRE(subject.settings_file() == (test_data.parent_path() / "settings.json").lexically_normal());
	REQUIRE(subject.mock_output_dir() == fs::path{"/var/tmp/mock"});

	// any other key
	REQUIRE(subject.get_config("plugin_cycle_interval_seconds", 0) == 3600);
	REQUIRE(subject.get_config("no_such_key", std::string{"default"}) == "default");

	REQUIRE_FALSE(subject.help());
	REQUIRE_FALSE(subject.rotate());
	REQUIRE_FALSE(subject.force());
	REQUIRE_FALSE(subject.render_file());
	REQUIRE_FALSE(subject.image_url());
}

TEST_CASE("defaults of device configuration", "[normal]")
{
	auto subject = load_file(test_data / "minimal.json");

	REQUIRE(subject.display_type() == "mock");
	REQUIRE(subject.resolution() == Size{640, 400});
	REQUIRE(subject.orientation() == Orientation::horizontal);
	REQUIRE_FALSE(subject.inverted_image());
	REQUIRE(subject.http_timeout() == std::chrono::seconds{30});
	REQUIRE(subject.verify_peer());
	REQUIRE(subject.log_priority() == LOG_INFO);
	REQUIRE(subject.current_image_file() == (test_data / "current_image.png").lexically_normal());
	REQUIRE(subject.settings_file() == (test_data / "settings.json").lexically_normal());
}

TEST_CASE("command line options", "[normal]")
{
	auto subject = load_file(test_data / "minimal.json", {
		"--rotate", "--force", "--fit", "contain", "--preserve", "width", "--background", "#000000",
		"--image-url", "https://example.com/a.jpg", "--render", "a.png"
	});

	REQUIRE(subject.rotate());
	REQUIRE(subject.force());
	REQUIRE(subject.background() == "#000000");
	REQUIRE(subject.image_url() == "https://example.com/a.jpg");
	REQUIRE(subject.render_file() == fs::path{"a.png"});

	auto fit = subject.fit_config(FitConfig{});
	REQUIRE(fit.strategy == FitConfig::Strategy::contain);
	REQUIRE(fit.preserve == FitConfig::Preserve::width);

	// --fit and --preserve override the base
	auto plain = load_file(test_data / "minimal.json", {"--fit", "stretch"});
	fit = plain.fit_config(FitConfig{FitConfig::Strategy::smart, FitConfig::Preserve::height});
	REQUIRE(fit.strategy == FitConfig::Strategy::stretch);
	REQUIRE(fit.preserve == FitConfig::Preserve::height);
}

TEST_CASE("--help needs no configuration file", "[normal]")
{
	const char* argv[] = {"inkwell", "--help", "--cfg", "/no/such/file.json"};
	Configuration subject{4, argv, nullptr};
	REQUIRE(subject.help());
}

TEST_CASE("bad configuration files", "[error]")
{
	SECTION("missing file")
	{
		auto path = test_data / "no_such_file.json";
		try
		{
			load_file(path);
			FAIL("no exception");
		}
		catch (Configuration::FileError& e)
		{
			auto&& error_path = boost::get_error_info<Configuration::Path>(e);
			REQUIRE(error_path);
			REQUIRE(*error_path == path);
		}
	}
	SECTION("malformed JSON")
	{
		REQUIRE_THROWS_AS(load_file(test_data / "malformed.json"), Configuration::Error);
	}
	SECTION("non-positive resolution")
	{
		REQUIRE_THROWS_AS(load_file(test_data / "bad_resolution.json"), Configuration::Error);
	}
}

TEST_CASE("bad configuration values", "[error]")
{
	Configuration subject;
	REQUIRE_NOTHROW(subject.load({{"resolution", {800, 480}}}, "/"));

	REQUIRE_THROWS_AS(subject.load({{"resolution", {800, 480}}, {"orientation", "sideways"}}, "/"), ConfigurationError);
	REQUIRE_THROWS_AS(subject.load({{"resolution", {800, 480}}, {"log_level", "chatty"}}, "/"), Configuration::Error);
	REQUIRE_THROWS_AS(subject.load({{"resolution", {800, 480}}, {"http_timeout_sec", 0}}, "/"), Configuration::Error);
	REQUIRE_THROWS_AS(subject.load({{"resolution", {-1, 480}}}, "/"), Configuration::Error);
	REQUIRE_THROWS_AS(subject.load(nlohmann::json::array(), "/"), Configuration::Error);
}
