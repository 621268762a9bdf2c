/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/6/20.
//

#pragma once

#include "Exception.hh"
#include "FS.hh"
#include "Size.hh"

#include "image/Enhance.hh"
#include "image/Fit.hh"
#include "image/RotateImage.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/filesystem/path.hpp>

#include <nlohmann/json.hpp>

#include <syslog.h>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>

namespace ink {

/// \brief  Parsing command line options and the device configuration file
class Configuration
{
public:
	struct Error : virtual ConfigurationError {};
	struct FileError : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    fs::path>;
	using Key       = boost::error_info<struct tag_key,     std::string>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	const std::string& display_type() const {return m_display_type;}
	Size resolution() const {return m_resolution;}
	Orientation orientation() const {return m_orientation;}
	bool inverted_image() const {return m_inverted_image;}
	const EnhancementSettings& image_settings() const {return m_image_settings;}
	const fs::path& current_image_file() const {return m_current_image_file;}
	const fs::path& mock_output_dir() const {return m_mock_output_dir;}
	const fs::path& settings_file() const {return m_settings_file;}
	std::chrono::seconds http_timeout() const {return m_http_timeout;}
	bool verify_peer() const {return m_verify_peer;}
	int log_priority() const {return m_log_priority;}

	/// Any value in the configuration file, or \a def if it is absent.
	template <typename T>
	T get_config(const std::string& key, const T& def) const
	{
		auto it = m_json.find(key);
		return it != m_json.end() && !it->is_null() ? it->template get<T>() : def;
	}

	bool help() const {return m_args.count("help") > 0;}
	bool force() const {return m_args.count("force") > 0;}
	bool rotate() const {return m_args.count("rotate") > 0;}
	std::optional<fs::path> render_file() const;
	std::optional<std::string> image_url() const;
	std::optional<std::string> background() const;

	/// \a base with the --fit and --preserve options applied on top.
	FitConfig fit_config(FitConfig base) const;

	void usage(std::ostream& out) const;

	// for unit tests
	void load(const nlohmann::json& json, const fs::path& base_dir);

private:
	void load_config(const fs::path& path);
	std::optional<std::string> option(const char *name) const;

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	nlohmann::json      m_json = nlohmann::json::object();

	std::string         m_display_type{"mock"};
	Size                m_resolution{800, 480};
	Orientation         m_orientation{Orientation::horizontal};
	bool                m_inverted_image{false};
	EnhancementSettings m_image_settings;

	fs::path m_current_image_file{"current_image.png"};
	fs::path m_mock_output_dir{"mock_display"};
	fs::path m_settings_file{"settings.json"};

	std::chrono::seconds m_http_timeout{30};
	bool                 m_verify_peer{true};
	int                  m_log_priority{LOG_INFO};
};

} // end of namespace
