/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/7/20.
//

#include "SettingsStore.hh"
#include "Log.hh"

#include <boost/exception/info.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>

namespace ink {

SettingsStore::SettingsStore(fs::path path) : m_path{std::move(path)}
{
	// a missing file means nothing has been saved yet
	if (!exists(m_path))
		return;

	try
	{
		std::ifstream file{m_path.string(), std::ios::in};
		if (!file)
			BOOST_THROW_EXCEPTION(Error() << ErrorCode({errno, std::system_category()}));

		m_settings = nlohmann::json::parse(file);
		if (!m_settings.is_object())
			BOOST_THROW_EXCEPTION(Error() << Message{"settings must be a JSON object"});
	}
	catch (Exception& e)
	{
		e << Path{m_path};
		throw;
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error() << Message{e.what()} << Path{m_path});
	}
}

SettingsStore::SettingsStore(nlohmann::json settings) : m_settings{std::move(settings)}
{
	if (!m_settings.is_object())
		BOOST_THROW_EXCEPTION(Error() << Message{"settings must be a JSON object"});
}

bool SettingsStore::contains(const std::string& key) const
{
	return m_settings.find(key) != m_settings.end();
}

const nlohmann::json& SettingsStore::get(const std::string& key) const
{
	static const nlohmann::json null;
	auto it = m_settings.find(key);
	return it != m_settings.end() ? *it : null;
}

void SettingsStore::set(const std::string& key, nlohmann::json value)
{
	m_settings[key] = std::move(value);
}

void SettingsStore::save()
{
	if (!m_path.empty())
	{
		atomic_write(m_path, m_settings.dump(4));
		Log(LOG_DEBUG, "saved settings to %1%", m_path.string());
	}
	++m_revision;
}

} // end of namespace ink
