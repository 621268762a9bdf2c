/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/11/20.
//

#include "ImageFetcher.hh"

#include "image/Fit.hh"
#include "image/Image.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>

namespace ink {

ImageFetcher::ImageFetcher(HTTPTransport transport) : m_transport{std::move(transport)}
{
}

std::string ImageFetcher::download(const std::string& url)
{
	Log(LOG_DEBUG, "downloading %1%", url);

	auto response = m_transport({boost::beast::http::verb::get, url});
	check_status(response, url);

	Log(LOG_DEBUG, "downloaded %1% bytes from %2%", response.body.size(), url);
	return std::move(response.body);
}

cv::Mat ImageFetcher::decode(std::string_view raw, const std::string& url)
{
	try
	{
		return decode_image(raw);
	}
	catch (DecodeError& e)
	{
		if (!url.empty())
			e << SourceURL{url};
		throw;
	}
}

cv::Mat ImageFetcher::fetch_and_fit(const std::string& url, Size target, const Color& background)
{
	auto image = decode(download(url), url);
	Log(LOG_INFO, "fitting %1%x%2% image from %3% into %4%", image.cols, image.rows, url, target);
	return contain(image, target, background);
}

} // end of namespace ink
