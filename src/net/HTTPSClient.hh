/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/8/20.
//

#pragma once

#include "HTTPTransport.hh"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>

namespace ink {

class URL;

/// Blocking HTTPS client. Each request runs on its own io_context and connection.
/// Redirects of GET requests are followed.
class HTTPSClient
{
public:
	static constexpr std::size_t max_redirects = 5;
	static constexpr std::uint64_t body_limit = 64 * 1024 * 1024;

public:
	explicit HTTPSClient(std::chrono::seconds timeout = std::chrono::seconds{30}, bool verify_peer = true);

	HTTPResponse operator()(const HTTPRequest& req);

	/// An HTTPTransport backed by a shared HTTPSClient.
	static HTTPTransport transport(std::chrono::seconds timeout, bool verify_peer);

private:
	HTTPResponse send(const HTTPRequest& req, const URL& url);

private:
	boost::asio::ssl::context   m_ssl{boost::asio::ssl::context::tls_client};
	std::chrono::seconds        m_timeout;
	bool                        m_verify_peer;
};

} // end of namespace ink
