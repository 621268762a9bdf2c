/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the inkwell
	distribution for more details.
*/

//
// Created by nestal on 10/4/20.
//

#include "RotateImage.hh"

#include "util/Exception.hh"
#include "util/Log.hh"

#include <opencv2/core.hpp>

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace ink {
namespace {

int angle(Orientation orientation)
{
	switch (orientation)
	{
		case Orientation::horizontal: return 0;
		case Orientation::vertical: return 90;
	}
	BOOST_THROW_EXCEPTION(ConfigurationError()
		<< Message{"unknown orientation " + std::to_string(static_cast<int>(orientation))}
	);
}

} // end of local namespace

Orientation parse_orientation(std::string_view orientation)
{
	if (orientation == "horizontal")
		return Orientation::horizontal;
	else if (orientation == "vertical")
		return Orientation::vertical;

	BOOST_THROW_EXCEPTION(ConfigurationError()
		<< Message{"orientation must be \"horizontal\" or \"vertical\", not \"" + std::string{orientation} + "\""}
	);
}

std::string_view to_string(Orientation orientation)
{
	return orientation == Orientation::vertical ? "vertical" : "horizontal";
}

cv::Mat change_orientation(const cv::Mat& image, Orientation orientation, bool inverted)
{
	auto degrees = angle(orientation);
	if (inverted)
		degrees = (degrees + 180) % 360;

	Log(LOG_DEBUG, "rotating %1%x%2% image by %3% degrees", image.cols, image.rows, degrees);
	return rotate(image, degrees);
}

cv::Mat rotate(const cv::Mat& image, int degrees)
{
	// cv::rotate() turns clockwise
	cv::Mat out;
	switch (((degrees % 360) + 360) % 360)
	{
		case 0:   out = image.clone(); break;
		case 90:  cv::rotate(image, out, cv::ROTATE_90_COUNTERCLOCKWISE); break;
		case 180: cv::rotate(image, out, cv::ROTATE_180); break;
		case 270: cv::rotate(image, out, cv::ROTATE_90_CLOCKWISE); break;
		default:
			BOOST_THROW_EXCEPTION(ConfigurationError()
				<< Message{"cannot rotate by " + std::to_string(degrees) + " degrees"}
			);
	}
	return out;
}

} // end of namespace ink
