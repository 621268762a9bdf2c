/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/8/20.
//

#include "HTTPSClient.hh"
#include "GenericHTTPRequest.hh"
#include "URL.hh"

#include "util/Error.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <memory>

namespace ink {

HTTPSClient::HTTPSClient(std::chrono::seconds timeout, bool verify_peer) :
	m_timeout{timeout}, m_verify_peer{verify_peer}
{
	m_ssl.set_default_verify_paths();
	m_ssl.set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
}

HTTPTransport HTTPSClient::transport(std::chrono::seconds timeout, bool verify_peer)
{
	// std::function needs a copyable target, but ssl::context is move-only
	return [client=std::make_shared<HTTPSClient>(timeout, verify_peer)](const HTTPRequest& req)
	{
		return (*client)(req);
	};
}

HTTPResponse HTTPSClient::operator()(const HTTPRequest& req)
{
	URL url{req.url};
	if (url.scheme() != "https")
		BOOST_THROW_EXCEPTION(ConfigurationError()
			<< ErrorCode{Error::unsupported_scheme}
			<< SourceURL{req.url}
			<< Message{"only https URLs are supported: " + req.url}
		);

	auto current = req;
	for (std::size_t redirect = 0; redirect <= max_redirects; ++redirect)
	{
		auto response = send(current, url);
		if (!response.redirect() || (current.method != http::verb::get && response.status != 303))
			return response;

		url = url.resolve(response.location);
		Log(LOG_DEBUG, "%1% redirected to %2%", current.url, url.str());

		if (url.scheme() != "https")
			BOOST_THROW_EXCEPTION(TransportError()
				<< ErrorCode{Error::unsupported_scheme}
				<< SourceURL{url.str()}
				<< Message{"redirected to a non-https URL: " + url.str()}
			);

		// 303 See Other always turns into a GET
		current.url = url.str();
		if (response.status == 303)
		{
			current.method = http::verb::get;
			current.body.clear();
			current.content_type.clear();
		}
	}

	BOOST_THROW_EXCEPTION(TransportError()
		<< ErrorCode{Error::too_many_redirects}
		<< SourceURL{req.url}
		<< Message{"too many redirects from " + req.url}
	);
}

HTTPResponse HTTPSClient::send(const HTTPRequest& req, const URL& url)
{
	using Request = GenericHTTPRequest<http::string_body, http::string_body>;

	boost::asio::io_context ioc;
	auto request = std::make_shared<Request>(ioc, m_ssl, m_timeout, body_limit);

	if (!req.content_type.empty())
		request->request().set(http::field::content_type, req.content_type);
	request->request().body() = req.body;

	HTTPResponse response;
	boost::system::error_code result{boost::asio::error::operation_aborted};
	std::string phase;
	request->on_load([&response, &result, &phase](auto ec, auto what, Request& self)
	{
		result = ec;
		phase  = std::string{what};
		if (!ec)
		{
			auto& res = self.response();
			response.status       = res.result_int();
			auto content_type = res[http::field::content_type];
			auto location     = res[http::field::location];
			response.content_type.assign(content_type.data(), content_type.size());
			response.location.assign(location.data(), location.size());
			response.body         = std::move(res.body());
		}
	});
	request->run(url, req.method, m_verify_peer);
	request.reset();

	ioc.run();

	if (result == boost::beast::error::timeout)
		BOOST_THROW_EXCEPTION(Timeout()
			<< ErrorCode{Error::timeout}
			<< SourceURL{url.str()}
			<< Message{phase + " timed out after " + std::to_string(m_timeout.count()) + " seconds: " + url.str()}
		);
	if (result)
		BOOST_THROW_EXCEPTION(TransportError()
			<< ErrorCode{std::error_code{result}}
			<< SourceURL{url.str()}
			<< Message{phase + " failed: " + result.message() + ": " + url.str()}
		);

	Log(LOG_DEBUG, "%1% %2%: HTTP %3% (%4% bytes)", http::to_string(req.method), url.str(), response.status, response.body.size());
	return response;
}

} // end of namespace ink
