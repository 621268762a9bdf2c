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

#include "URL.hh"

#include "config.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/core/ignore_unused.hpp>

#include <openssl/err.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace ink {

using tcp = boost::asio::ip::tcp;       // from <boost/asio/ip/tcp.hpp>
namespace ssl = boost::asio::ssl;       // from <boost/asio/ssl.hpp>
namespace http = boost::beast::http;    // from <boost/beast/http.hpp>

/// One HTTPS request/response exchange over its own connection.
///
/// Every phase (resolve, connect, handshake, write, read) must finish within the
/// timeout, otherwise the completion handler receives boost::beast::error::timeout.
/// The completion handler is called exactly once, before the connection is shut down.
template <typename RequestBody, typename ResponseBody>
class GenericHTTPRequest : public std::enable_shared_from_this<
    GenericHTTPRequest<RequestBody, ResponseBody>
>
{
public:
	using Completion = std::function<void(boost::system::error_code, std::string_view, GenericHTTPRequest&)>;

	// Resolver and stream require an io_context
	GenericHTTPRequest(
		boost::asio::io_context& ioc,
		ssl::context& ctx,
		std::chrono::steady_clock::duration timeout,
		std::uint64_t body_limit
	) :
		m_resolver{ioc}, m_deadline{ioc}, m_stream{ioc, ctx}, m_timeout{timeout}
	{
		m_parser.body_limit(body_limit);
	}

	auto& response() {return m_res;}
	auto& request() {return m_req;}

	template <typename Comp>
	void on_load(Comp&& comp) {m_comp = std::forward<Comp>(comp);}

	// Start the asynchronous operation
	void run(const URL& url, http::verb method, bool verify_peer, int version = 11)
	{
		m_host = url.host();

		// Set SNI Hostname (many hosts need this to handshake successfully)
		if (!SSL_set_tlsext_host_name(m_stream.native_handle(), m_host.c_str()))
		{
			boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
			return complete(ec, "SSL_set_tlsext_host_name");
		}
		if (verify_peer)
			m_stream.set_verify_callback(ssl::host_name_verification{m_host});

		m_req.version(version);
		m_req.method(method);
		m_req.target(url.target());
		m_req.set(http::field::host, m_host);
		m_req.set(http::field::user_agent, std::string{constants::user_agent});
		m_req.prepare_payload();

		// tcp_stream has no timeout for name lookup
		m_deadline.expires_after(m_timeout);
		m_deadline.async_wait([self=this->shared_from_this()](auto ec)
		{
			if (!ec)
			{
				self->m_resolve_timed_out = true;
				self->m_resolver.cancel();
			}
		});

		// Look up the domain name
		m_resolver.async_resolve(
			m_host,
			url.port(),
			[self=this->shared_from_this()](auto ec, auto&& results){self->on_resolve(ec, std::move(results));}
		);
	}

private:
	void complete(boost::system::error_code ec, std::string_view phase)
	{
		if (m_comp)
		{
			auto comp = std::move(m_comp);
			m_comp = nullptr;
			comp(ec, phase, *this);
		}
	}

	void on_resolve(
		boost::system::error_code ec,
		tcp::resolver::results_type results
	)
	{
		m_deadline.cancel();
		if (ec)
			return complete(m_resolve_timed_out ? boost::system::error_code{boost::beast::error::timeout} : ec, "resolve");

		// Make the connection on the IP address we get from a lookup
		boost::beast::get_lowest_layer(m_stream).expires_after(m_timeout);
		boost::beast::get_lowest_layer(m_stream).async_connect(
			results,
			[self=this->shared_from_this()](auto ec, auto&&){self->on_connect(ec);}
		);
	}

	void on_connect(boost::system::error_code ec)
	{
		if (ec)
			return complete(ec, "connect");

		// Perform the SSL handshake
		boost::beast::get_lowest_layer(m_stream).expires_after(m_timeout);
		m_stream.async_handshake(
			ssl::stream_base::client,
			[self=this->shared_from_this()](auto ec)
			{
				self->on_handshake(ec);
			}
		);
	}

	void on_handshake(boost::system::error_code ec)
	{
		if (ec)
			return complete(ec, "handshake");

		// Send the HTTP request to the remote host
		boost::beast::get_lowest_layer(m_stream).expires_after(m_timeout);
		http::async_write(
			m_stream, m_req,
			[self=this->shared_from_this()](auto ec, auto bytes)
			{
				self->on_write(ec, bytes);
			}
		);
	}

	void on_write(
		boost::system::error_code ec,
		std::size_t bytes_transferred
	)
	{
		boost::ignore_unused(bytes_transferred);

		if (ec)
			return complete(ec, "write");

		// Receive the HTTP response
		boost::beast::get_lowest_layer(m_stream).expires_after(m_timeout);
		http::async_read(
			m_stream, m_buffer, m_parser,
			[self=this->shared_from_this()](auto ec, auto bytes)
			{
				self->on_read(ec, bytes);
			}
		);
	}

	void on_read(
		boost::system::error_code ec,
		std::size_t bytes_transferred
	)
	{
		boost::ignore_unused(bytes_transferred);

		if (ec)
			return complete(ec, "read");

		m_res = m_parser.release();
		complete(ec, "read");

		// Gracefully close the stream
		boost::beast::get_lowest_layer(m_stream).expires_after(m_timeout);
		m_stream.async_shutdown(
			[self=this->shared_from_this()](auto ec)
			{
				self->on_shutdown(ec);
			}
		);
	}

	void on_shutdown(boost::system::error_code ec)
	{
		// Many servers close the connection without a close_notify. The response has
		// already been delivered, so the error does not matter.
		// http://stackoverflow.com/questions/25587403/boost-asio-ssl-async-shutdown-always-finishes-with-an-error
		boost::ignore_unused(ec);
	}

private:
	tcp::resolver m_resolver;
	boost::asio::steady_timer m_deadline;
	boost::beast::ssl_stream<boost::beast::tcp_stream> m_stream;
	boost::beast::flat_buffer m_buffer; // (Must persist between reads)
	http::request<RequestBody> m_req;
	http::response_parser<ResponseBody> m_parser;
	http::response<ResponseBody> m_res;

	std::chrono::steady_clock::duration m_timeout;
	std::string m_host;
	bool m_resolve_timed_out{false};

	Completion m_comp;
};

} // end of namespace ink
