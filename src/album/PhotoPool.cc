/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/11/20.
//

#include "PhotoPool.hh"

#include "util/Log.hh"

namespace ink {

void from_json(const nlohmann::json& src, CatalogEntry& dest)
{
	dest.checksum = src.value("checksum", std::string{});
	dest.viewed   = src.value("viewed", false);
}

void to_json(nlohmann::json& dest, const CatalogEntry& src)
{
	dest = nlohmann::json{
		{"checksum", src.checksum},
		{"viewed",   src.viewed}
	};
}

PhotoPool load_pool(const nlohmann::json& src)
{
	PhotoPool pool;
	if (src.is_null())
		return pool;

	if (!src.is_object())
	{
		Log(LOG_WARNING, "ignoring saved photos: expected a JSON object but got %1%", src.type_name());
		return pool;
	}

	for (auto&& item : src.items())
	{
		auto& entry = item.value();
		if (entry.is_object() && entry.contains("checksum") && entry["checksum"].is_string() &&
			(!entry.contains("viewed") || entry["viewed"].is_boolean()))
			pool.emplace(item.key(), entry.get<CatalogEntry>());
		else
			Log(LOG_WARNING, "ignoring malformed saved state of photo %1%", item.key());
	}
	return pool;
}

} // end of namespace ink
