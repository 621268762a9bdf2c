/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/12/20.
//

#include "DisplayRegistry.hh"
#include "MockDisplay.hh"

#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <fnmatch.h>

#include <algorithm>

namespace ink {

DisplayRegistry::DisplayRegistry()
{
	add("mock", [](const Configuration& cfg) -> DisplayDriver
	{
		return MockDisplay{cfg.mock_output_dir()};
	});
}

void DisplayRegistry::add(std::string name, Factory factory)
{
	auto& list = name.find_first_of("*?[") == name.npos ? m_exact : m_patterns;

	auto it = std::find_if(list.begin(), list.end(), [&name](auto& entry){return entry.name == name;});
	if (it != list.end())
		it->factory = std::move(factory);
	else
		list.push_back({std::move(name), std::move(factory)});
}

const DisplayRegistry::Factory* DisplayRegistry::find(std::string_view display_type) const
{
	for (auto&& entry : m_exact)
		if (entry.name == display_type)
			return &entry.factory;

	std::string type{display_type};
	for (auto&& entry : m_patterns)
		if (::fnmatch(entry.name.c_str(), type.c_str(), 0) == 0)
			return &entry.factory;

	return nullptr;
}

DisplayDriver DisplayRegistry::create(const Configuration& cfg) const
{
	auto factory = find(cfg.display_type());
	if (!factory)
		BOOST_THROW_EXCEPTION(ConfigurationError()
			<< DisplayType{cfg.display_type()}
			<< Message{"Unsupported display type: " + cfg.display_type()}
		);

	Log(LOG_INFO, "using %1% display", cfg.display_type());
	return (*factory)(cfg);
}

} // end of namespace ink
