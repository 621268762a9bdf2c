/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/10/20.
//

#include "AlbumStreamClient.hh"

#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <optional>
#include <vector>

namespace ink {
namespace {

// Widths come as strings, e.g. "2048", but accept numbers too.
std::optional<long long> width_of(const nlohmann::json& derivative)
{
	auto it = derivative.find("width");
	if (it == derivative.end())
		return std::nullopt;

	if (it->is_number_integer())
		return it->get<long long>();

	if (it->is_string())
	{
		try
		{
			return std::stoll(it->get<std::string>());
		}
		catch (std::logic_error&)
		{
			return std::nullopt;
		}
	}
	return std::nullopt;
}

std::optional<std::string> largest_derivative(const nlohmann::json& derivatives)
{
	std::optional<long long> max_width;
	std::optional<std::string> checksum;
	for (auto&& item : derivatives.items())
	{
		auto& derivative = item.value();
		if (!derivative.is_object() || !derivative.contains("checksum") || !derivative["checksum"].is_string())
			continue;

		auto width = width_of(derivative);
		if (!width)
			continue;

		if (!max_width || *width > *max_width)
		{
			max_width = width;
			checksum  = derivative["checksum"].get<std::string>();
		}
	}
	return checksum;
}

} // end of local namespace

AlbumStreamClient::AlbumStreamClient(HTTPTransport transport, Engine engine) :
	m_transport{std::move(transport)}, m_engine{std::move(engine)}
{
}

nlohmann::json AlbumStreamClient::post(const std::string& url, const nlohmann::json& body)
{
	auto response = m_transport({boost::beast::http::verb::post, url, body.dump(), "text/plain"});
	check_status(response, url);

	try
	{
		return nlohmann::json::parse(response.body);
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(DataError()
			<< SourceURL{url}
			<< Message{"malformed response from " + url + ": " + e.what()}
		);
	}
}

Catalog AlbumStreamClient::fetch_catalog(const StreamID& stream)
{
	auto url = stream.base_url() + "webstream";
	Log(LOG_DEBUG, "fetching album contents from %1%", url);

	auto catalog = parse_catalog(post(url, {{"streamCtag", nullptr}}));
	Log(LOG_INFO, "album %1% has %2% photos", stream.token(), catalog.size());
	return catalog;
}

Catalog AlbumStreamClient::parse_catalog(const nlohmann::json& stream)
{
	auto photos = stream.is_object() ? stream.value("photos", nlohmann::json::array()) : nlohmann::json::array();
	if (!photos.is_array() || photos.empty())
		BOOST_THROW_EXCEPTION(DataError() << Message{"No photos found in the shared album."});

	Catalog catalog;
	for (auto&& photo : photos)
	{
		if (!photo.is_object() || !photo.contains("photoGuid") || !photo["photoGuid"].is_string())
			continue;

		auto derivatives = photo.find("derivatives");
		if (derivatives == photo.end() || !derivatives->is_object() || derivatives->empty())
			continue;

		if (auto checksum = largest_derivative(*derivatives))
			catalog.insert_or_assign(photo["photoGuid"].get<std::string>(), std::move(*checksum));
	}

	if (catalog.empty())
		BOOST_THROW_EXCEPTION(DataError() << Message{"No derivatives found for any photo in the shared album."});

	return catalog;
}

std::string AlbumStreamClient::resolve_url(const StreamID& stream, const std::string& id, const std::string& checksum)
{
	auto url = stream.base_url() + "webasseturls";
	Log(LOG_DEBUG, "resolving download URL of photo %1% via %2%", id, url);

	auto assets = post(url, {{"photoGuids", {id}}});

	auto items = assets.is_object() ? assets.value("items", nlohmann::json::object()) : nlohmann::json::object();
	auto item  = items.is_object() ? items.find(checksum) : items.end();
	if (item == items.end() || !item->is_object() ||
		!item->contains("url_location") || !(*item)["url_location"].is_string() ||
		!item->contains("url_path")     || !(*item)["url_path"].is_string())
		BOOST_THROW_EXCEPTION(DataError()
			<< Message{"Could not find a matching checksum for photo " + id + " in the response."}
		);

	auto location = (*item)["url_location"].get<std::string>();
	auto path     = (*item)["url_path"].get<std::string>();

	auto locations = assets.value("locations", nlohmann::json::object());
	auto loc = locations.is_object() ? locations.value(location, nlohmann::json::object()) : nlohmann::json::object();

	std::string scheme{"https"};
	if (loc.is_object() && loc.contains("scheme") && loc["scheme"].is_string())
		scheme = loc["scheme"].get<std::string>();

	std::vector<std::string> hosts;
	if (loc.is_object() && loc.contains("hosts") && loc["hosts"].is_array())
		for (auto&& host : loc["hosts"])
			if (host.is_string())
				hosts.push_back(host.get<std::string>());
	if (hosts.empty())
		hosts.push_back(location);

	auto& host = pick(hosts, m_engine);
	Log(LOG_DEBUG, "download host of photo %1% is %2% (location %3%)", id, host, location);

	return scheme + "://" + host + path;
}

} // end of namespace ink
