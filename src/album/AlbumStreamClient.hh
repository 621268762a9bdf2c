/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/10/20.
//

#pragma once

#include "PhotoPool.hh"
#include "StreamID.hh"

#include "net/HTTPTransport.hh"
#include "util/Random.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace ink {

/// Client of the shared album web API.
///
/// Both calls POST a JSON body to the shard selected by the album token and
/// need no authentication.
class AlbumStreamClient
{
public:
	explicit AlbumStreamClient(HTTPTransport transport, Engine engine = seeded_engine());

	/// Lists the photos in the album with the checksum of their largest derivative.
	/// Throws DataError if the album has no photos or no derivatives.
	Catalog fetch_catalog(const StreamID& stream);

	/// Returns a download URL for the derivative of \a id identified by \a checksum.
	/// When the server offers several equivalent hosts one is chosen at random.
	/// Throws DataError if the response has no item with \a checksum.
	std::string resolve_url(const StreamID& stream, const std::string& id, const std::string& checksum);

	/// Parses the response of the webstream call.
	static Catalog parse_catalog(const nlohmann::json& stream);

private:
	nlohmann::json post(const std::string& url, const nlohmann::json& body);

private:
	HTTPTransport   m_transport;
	Engine          m_engine;
};

} // end of namespace ink
