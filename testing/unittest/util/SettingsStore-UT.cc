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

#include "util/SettingsStore.hh"

#include <boost/filesystem/operations.hpp>

#include <fstream>

using namespace ink;

TEST_CASE("in-memory settings", "[normal]")
{
	SettingsStore subject;
	REQUIRE_FALSE(subject.contains("album_url"));
	REQUIRE(subject.get("album_url").is_null());
	REQUIRE(subject.get("album_url", std::string{"none"}) == "none");

	subject.set("album_url", "https://www.icloud.com/sharedalbum/#B0");
	REQUIRE(subject.contains("album_url"));
	REQUIRE(subject.get("album_url", std::string{}) == "https://www.icloud.com/sharedalbum/#B0");

	REQUIRE(subject.revision() == 0);
	subject.save();
	REQUIRE(subject.revision() == 1);
}

TEST_CASE("settings are saved to and loaded from a file", "[normal]")
{
	TempDir dir;
	auto path = dir / "settings.json";

	SettingsStore subject{path};
	REQUIRE(subject.json() == nlohmann::json::object());

	subject.set("backgroundColor", "#000000");
	subject.set("photos", {{"abc", {{"checksum", "123"}, {"viewed", true}}}});
	REQUIRE_FALSE(fs::exists(path));

	subject.save();
	REQUIRE(fs::exists(path));
	REQUIRE_FALSE(fs::exists(dir / "settings.json.tmp"));

	SettingsStore loaded{path};
	REQUIRE(loaded.json() == subject.json());
	REQUIRE(loaded.get("photos")["abc"]["viewed"] == true);
}

TEST_CASE("settings file must be a JSON object", "[error]")
{
	TempDir dir;
	auto path = dir / "settings.json";

	std::ofstream{path.string()} << "[1, 2, 3]";
	REQUIRE_THROWS_AS(SettingsStore{path}, SettingsStore::Error);

	std::ofstream{path.string()} << "{ this is not JSON";
	REQUIRE_THROWS_AS(SettingsStore{path}, SettingsStore::Error);

	REQUIRE_THROWS_AS(SettingsStore{nlohmann::json::array()}, SettingsStore::Error);
}
