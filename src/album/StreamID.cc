/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/10/20.
//

#include "StreamID.hh"

#include "util/Log.hh"
#include "util/Split.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <cctype>
#include <optional>

namespace ink {
namespace {

std::optional<int> base62_digit(char c)
{
	if      ( c >= '0' && c <= '9' ) return c - '0';
	else if ( c >= 'A' && c <= 'Z' ) return c - 'A' + 10;
	else if ( c >= 'a' && c <= 'z' ) return c - 'a' + 36;
	else return std::nullopt;
}

[[noreturn]] void invalid_url(std::string_view url, const std::string& reason)
{
	BOOST_THROW_EXCEPTION(ConfigurationError()
		<< SourceURL{std::string{url}}
		<< Message{reason + " Please provide a full shared album URL, e.g. " + std::string{StreamID::url_prefix} + "B2D..."}
	);
}

} // end of local namespace

std::uint64_t base62_decode(std::string_view str)
{
	std::uint64_t value = 0;
	for (auto c : str)
	{
		auto digit = base62_digit(c);
		if (!digit)
			BOOST_THROW_EXCEPTION(InvalidBase62()
				<< InvalidChar{c}
				<< Message{"invalid base62 character '" + std::string(1, c) + "'"}
			);

		value = value * 62 + static_cast<std::uint64_t>(*digit);
	}
	return value;
}

StreamID::StreamID(std::string_view album_url)
{
	auto url = trim(album_url);
	if (url.substr(0, url_prefix.size()) != url_prefix)
		invalid_url(album_url, "This is not a shared album URL.");

	auto token = trim(url.substr(url_prefix.size()));
	if (token.empty() || !std::all_of(token.begin(), token.end(), [](unsigned char c){return std::isalnum(c) != 0;}))
		invalid_url(album_url, "The album ID in the URL appears invalid.");

	// the partition is in the second character if the token starts with 'A',
	// otherwise in the second and third characters
	auto encoded = token.front() == 'A' ? token.substr(1, 1) : token.substr(1, 2);
	if (encoded.size() != (token.front() == 'A' ? 1U : 2U))
		invalid_url(album_url, "The album ID in the URL is too short.");

	m_token     = std::string{token};
	m_partition = base62_decode(encoded);

	Log(LOG_DEBUG, "album token %1% is in partition %2%", m_token, m_partition);
}

std::string StreamID::base_url() const
{
	return "https://p" + std::to_string(m_partition) + "-sharedstreams.icloud.com/" + m_token + "/sharedstreams/";
}

} // end of namespace ink
