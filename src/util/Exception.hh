/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#pragma once

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>

#include <string>
#include <system_error>

namespace ink {

struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

struct SystemError : virtual Exception {};

/// Bad display type, orientation, album URL, target size or missing driver.
/// Never retried.
struct ConfigurationError : virtual Exception {};

/// Network failure or non-success HTTP status. The whole cycle may be retried.
struct TransportError : virtual Exception {};
struct Timeout : virtual TransportError {};

/// The downloaded bytes are not an image.
struct DecodeError : virtual Exception {};

/// Nothing to show: empty catalog, no derivatives, no matching checksum.
struct DataError : virtual Exception {};

using ErrorCode  = boost::error_info<struct tag_error_code,  std::error_code>;
using Message    = boost::error_info<struct tag_message,     std::string>;
using SourceURL  = boost::error_info<struct tag_source_url,  std::string>;
using HTTPStatus = boost::error_info<struct tag_http_status, unsigned>;

/// Returns the Message attached to the exception, or what() if there is none.
std::string message(const Exception& e);

} // end of namespace
