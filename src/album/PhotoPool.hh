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

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace ink {

/// Photo ID -> checksum of its largest derivative, as reported by the album.
using Catalog = std::map<std::string, std::string>;

/// The persisted state of one photo in the album.
struct CatalogEntry
{
	std::string checksum;	//!< Identifies the version of the photo to download
	bool        viewed{false};	//!< Shown since the last time all photos were shown

	bool operator==(const CatalogEntry& rhs) const {return checksum == rhs.checksum && viewed == rhs.viewed;}
	bool operator!=(const CatalogEntry& rhs) const {return !(*this == rhs);}

	friend void from_json(const nlohmann::json& src, CatalogEntry& dest);
	friend void to_json(nlohmann::json& dest, const CatalogEntry& src);
};

/// Photo ID -> CatalogEntry. At most one entry per photo.
using PhotoPool = std::map<std::string, CatalogEntry>;

/// Reads the pool saved by to_json(). Malformed entries are skipped.
PhotoPool load_pool(const nlohmann::json& src);

} // end of namespace ink
