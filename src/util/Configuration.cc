/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/6/20.
//

#include "Configuration.hh"
#include "Log.hh"

#include "config.hh"

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>

namespace po = boost::program_options;

namespace ink {
namespace {

fs::path relative_to(const std::string& path, const fs::path& base_dir)
{
	return fs::absolute(path, base_dir).lexically_normal();
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",       "produce help message")
		("cfg",        po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable INKWELL_CONFIG to set default path.")
		("render",     po::value<std::string>()->value_name("file"), "display a local image file")
		("image-url",  po::value<std::string>()->value_name("url"), "download an image and display it")
		("rotate",     "display the next photo from the shared album")
		("fit",        po::value<std::string>()->value_name("strategy"), "cover, contain, stretch or smart")
		("preserve",   po::value<std::string>()->value_name("axis"), "none, width or height")
		("background", po::value<std::string>()->value_name("colour"), "padding colour, e.g. #FFFFFF")
		("force",      "refresh the display even if the image has not changed")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(m_args["cfg"].as<std::string>());
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const fs::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		// Paths are relative to the configuration file
		load(nlohmann::json::parse(config_file), fs::absolute(path).parent_path());
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error() << Message{e.what()} << Path{path});
	}
}

void Configuration::load(const nlohmann::json& json, const fs::path& base_dir)
{
	if (!json.is_object())
		BOOST_THROW_EXCEPTION(Error() << Message{"configuration must be a JSON object"});

	m_json = json;

	using jptr = nlohmann::json::json_pointer;
	m_display_type = json.value(jptr{"/display_type"}, m_display_type);

	auto&& resolution = json.at(jptr{"/resolution"});
	m_resolution.assign(resolution.at(0).get<int>(), resolution.at(1).get<int>());
	if (!m_resolution.positive())
		BOOST_THROW_EXCEPTION(Error()
			<< Message{"resolution must be positive"}
			<< Key{"resolution"}
		);

	m_orientation    = parse_orientation(json.value(jptr{"/orientation"}, std::string{to_string(m_orientation)}));
	m_inverted_image = json.value(jptr{"/inverted_image"}, m_inverted_image);
	m_image_settings = json.value(jptr{"/image_settings"}, EnhancementSettings{});

	m_current_image_file = relative_to(json.value(jptr{"/current_image_file"}, m_current_image_file.string()), base_dir);
	m_mock_output_dir    = relative_to(json.value(jptr{"/mock_output_dir"},    m_mock_output_dir.string()),    base_dir);
	m_settings_file      = relative_to(json.value(jptr{"/settings_file"},      m_settings_file.string()),      base_dir);

	m_http_timeout = std::chrono::seconds{json.value(jptr{"/http_timeout_sec"}, m_http_timeout.count())};
	if (m_http_timeout.count() <= 0)
		BOOST_THROW_EXCEPTION(Error()
			<< Message{"HTTP timeout must be positive"}
			<< Key{"http_timeout_sec"}
		);
	m_verify_peer = json.value(jptr{"/verify_peer"}, m_verify_peer);

	auto level = json.value(jptr{"/log_level"}, std::string{"info"});
	if (auto priority = ink::log_priority(level))
		m_log_priority = *priority;
	else
		BOOST_THROW_EXCEPTION(Error()
			<< Message{"unknown log level \"" + level + "\""}
			<< Key{"log_level"}
		);
}

std::optional<std::string> Configuration::option(const char *name) const
{
	return m_args.count(name) > 0 ? std::optional<std::string>{m_args[name].as<std::string>()} : std::nullopt;
}

std::optional<fs::path> Configuration::render_file() const
{
	if (auto file = option("render"))
		return fs::path{*file};
	return std::nullopt;
}

std::optional<std::string> Configuration::image_url() const
{
	return option("image-url");
}

std::optional<std::string> Configuration::background() const
{
	return option("background");
}

FitConfig Configuration::fit_config(FitConfig base) const
{
	if (auto strategy = option("fit"))
		base.strategy = FitConfig::parse_strategy(*strategy);
	if (auto preserve = option("preserve"))
		base.preserve = FitConfig::parse_preserve(*preserve);
	return base;
}

} // end of namespace
