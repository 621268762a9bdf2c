/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/11/20.
//

#pragma once

#include "image/Color.hh"
#include "net/HTTPTransport.hh"
#include "util/Size.hh"

#include <opencv2/core.hpp>

#include <string>
#include <string_view>

namespace ink {

class ImageFetcher
{
public:
	explicit ImageFetcher(HTTPTransport transport);

	/// Returns the body of \a url. Throws TransportError on any failure.
	std::string download(const std::string& url);

	/// Throws DecodeError carrying \a url if \a raw is not an image.
	static cv::Mat decode(std::string_view raw, const std::string& url = {});

	/// Downloads the image at \a url and letterboxes it onto a canvas of
	/// \a target filled with \a background.
	cv::Mat fetch_and_fit(const std::string& url, Size target, const Color& background);

private:
	HTTPTransport m_transport;
};

} // end of namespace ink
