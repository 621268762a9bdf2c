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

#include "util/Exception.hh"

#include <cstdint>
#include <string>
#include <string_view>

namespace ink {

struct InvalidBase62 : virtual ConfigurationError {};
using InvalidChar = boost::error_info<struct tag_invalid_char, char>;

/// Decodes digits in 0-9, A-Z, a-z. Throws InvalidBase62 on any other character.
std::uint64_t base62_decode(std::string_view str);

/// Identifies a shared album by the token at the end of its public URL, e.g.
/// https://www.icloud.com/sharedalbum/#B2D5ON9t3G4vM9
class StreamID
{
public:
	static constexpr std::string_view url_prefix{"https://www.icloud.com/sharedalbum/#"};

public:
	/// Throws ConfigurationError if \a album_url is not a shared album URL.
	explicit StreamID(std::string_view album_url);

	const std::string& token() const {return m_token;}

	/// Selects the server shard that hosts the album.
	std::uint64_t partition() const {return m_partition;}

	/// https://p<partition>-sharedstreams.icloud.com/<token>/sharedstreams/
	std::string base_url() const;

private:
	std::string     m_token;
	std::uint64_t   m_partition{};
};

} // end of namespace ink
