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

#include <boost/beast/http/verb.hpp>

#include <functional>
#include <string>

namespace ink {

struct HTTPRequest
{
	boost::beast::http::verb method{boost::beast::http::verb::get};
	std::string url;
	std::string body;
	std::string content_type;
};

struct HTTPResponse
{
	unsigned    status{};
	std::string body;
	std::string content_type;
	std::string location;

	// 304 is accepted because some image servers answer conditional requests with it
	bool success() const {return (status >= 200 && status < 300) || status == 304;}
	bool redirect() const;
};

/// Sends one request and waits for its response. Throws TransportError (or Timeout)
/// if no response is received. The status code is not checked.
using HTTPTransport = std::function<HTTPResponse(const HTTPRequest&)>;

/// Throws TransportError carrying the status and URL unless the response is successful.
void check_status(const HTTPResponse& response, const std::string& url);

} // end of namespace ink
