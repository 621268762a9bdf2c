/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/11/20.
//

#include "RotationEngine.hh"

#include "util/Exception.hh"
#include "util/Log.hh"
#include "util/SettingsStore.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <vector>

namespace ink {

RotationEngine::RotationEngine() : m_engine{seeded_engine()}
{
}

RotationEngine::RotationEngine(std::uint64_t seed) : m_engine{seed}
{
}

PhotoPool RotationEngine::sync(const PhotoPool& pool, const Catalog& catalog)
{
	PhotoPool result;
	std::size_t kept = 0;
	for (auto&& [id, checksum] : catalog)
	{
		auto it = pool.find(id);
		if (it != pool.end())
			++kept;

		result.emplace(id, CatalogEntry{
			checksum,
			it != pool.end() && it->second.viewed
		});
	}

	Log(LOG_DEBUG, "photo pool sync: %1% added, %2% removed, %3% kept",
		result.size() - kept, pool.size() - kept, kept);
	return result;
}

RotationEngine::Selection RotationEngine::next(
	PhotoPool& pool, const Catalog& catalog, const Resolver& resolve, bool& dirty
)
{
	auto working = sync(pool, catalog);

	std::vector<std::string> unseen;
	for (auto&& [id, entry] : working)
		if (!entry.viewed)
			unseen.push_back(id);

	if (unseen.empty())
	{
		Log(LOG_INFO, "all %1% photos have been shown, starting over", working.size());
		for (auto&& kv : working)
			kv.second.viewed = false;

		for (auto&& kv : working)
			unseen.push_back(kv.first);
	}

	if (unseen.empty())
		BOOST_THROW_EXCEPTION(DataError() << Message{"no photos available"});

	auto& id = pick(unseen, m_engine);
	auto& entry = working.at(id);

	// May throw. Leave the pool untouched in that case.
	Selection result{id, entry.checksum, resolve(id, entry.checksum), unseen.size()};

	entry.viewed = true;
	pool  = std::move(working);
	dirty = true;

	Log(LOG_DEBUG, "picked photo %1%, %2% photos were unseen", result.id, result.remaining);
	return result;
}

RotationEngine::Selection RotationEngine::next(SettingsStore& settings, const Catalog& catalog, const Resolver& resolve)
{
	auto pool = load_pool(settings.get(settings_key));

	bool dirty = false;
	auto result = next(pool, catalog, resolve, dirty);
	if (dirty)
	{
		settings.set(settings_key, pool);
		settings.save();
	}
	return result;
}

} // end of namespace ink
