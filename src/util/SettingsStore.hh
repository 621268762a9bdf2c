/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/7/20.
//

#pragma once

#include "Exception.hh"
#include "FS.hh"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace ink {

/// Key-value settings kept as a JSON object in a file.
///
/// A store without a path lives in memory only. save() then only counts
/// the revision.
class SettingsStore
{
public:
	struct Error : virtual Exception {};
	using Path = boost::error_info<struct tag_path, fs::path>;

public:
	SettingsStore() = default;
	explicit SettingsStore(fs::path path);
	explicit SettingsStore(nlohmann::json settings);

	bool contains(const std::string& key) const;

	template <typename T>
	T get(const std::string& key, const T& def) const
	{
		auto it = m_settings.find(key);
		return it != m_settings.end() && !it->is_null() ? it->template get<T>() : def;
	}

	const nlohmann::json& get(const std::string& key) const;

	void set(const std::string& key, nlohmann::json value);

	void save();

	const nlohmann::json& json() const {return m_settings;}
	const fs::path& path() const {return m_path;}

	/// Number of times save() has been called.
	std::size_t revision() const {return m_revision;}

private:
	fs::path        m_path;
	nlohmann::json  m_settings = nlohmann::json::object();
	std::size_t     m_revision{0};
};

} // end of namespace ink
