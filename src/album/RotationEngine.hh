/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/11/20.
//

#pragma once

#include "PhotoPool.hh"

#include "util/Random.hh"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace ink {

class SettingsStore;

/// Picks photos from an album without repeating one until all of them have
/// been shown.
class RotationEngine
{
public:
	struct Selection
	{
		std::string id;
		std::string checksum;
		std::string url;
		std::size_t remaining{};	//!< Number of unseen photos before this pick
	};

	/// Turns a photo ID and checksum into a download URL.
	using Resolver = std::function<std::string(const std::string& id, const std::string& checksum)>;

	static constexpr const char* settings_key = "photos";

public:
	RotationEngine();
	explicit RotationEngine(std::uint64_t seed);

	/// Replaces the pool with the catalog. Photos that are still in the
	/// album keep their viewed flag even if their checksum has changed.
	static PhotoPool sync(const PhotoPool& pool, const Catalog& catalog);

	/// Picks an unseen photo and marks it viewed. \a pool is changed only
	/// if \a resolve succeeds. \a dirty is set once \a pool has been changed.
	Selection next(PhotoPool& pool, const Catalog& catalog, const Resolver& resolve, bool& dirty);

	/// Same as above but loads and saves the pool in \a settings. The
	/// settings are saved at most once and only after \a resolve succeeds.
	Selection next(SettingsStore& settings, const Catalog& catalog, const Resolver& resolve);

private:
	Engine m_engine;
};

} // end of namespace ink
