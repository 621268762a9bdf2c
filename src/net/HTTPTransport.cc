/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/8/20.
//

#include "HTTPTransport.hh"

#include "util/Error.hh"
#include "util/Exception.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace ink {

bool HTTPResponse::redirect() const
{
	switch (status)
	{
		case 301: case 302: case 303: case 307: case 308:
			return !location.empty();
		default:
			return false;
	}
}

void check_status(const HTTPResponse& response, const std::string& url)
{
	if (!response.success())
		BOOST_THROW_EXCEPTION(TransportError()
			<< ErrorCode{Error::http_error}
			<< HTTPStatus{response.status}
			<< SourceURL{url}
			<< Message{"HTTP status " + std::to_string(response.status) + " from " + url}
		);
}

} // end of namespace ink
