/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the inkwell
	distribution for more details.
*/

//
// Created by nestal on 10/5/20.
//

#include "Image.hh"

#include "util/EVPWrapper.hh"
#include "util/Log.hh"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <boost/exception/info.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/throw_exception.hpp>

namespace ink {
namespace {

// 16-bit PNGs and the like are scaled down to 8 bits per channel
cv::Mat to_bgr8(cv::Mat image)
{
	if (image.depth() != CV_8U)
	{
		cv::Mat converted;
		image.convertTo(converted, CV_8U, image.depth() == CV_16U ? 1.0/257 : 1.0);
		image = converted;
	}
	if (image.channels() == 1)
		cv::cvtColor(image, image, cv::COLOR_GRAY2BGR);
	else if (image.channels() == 4)
		cv::cvtColor(image, image, cv::COLOR_BGRA2BGR);
	return image;
}

} // end of local namespace

cv::Mat decode_image(std::string_view raw)
{
	cv::Mat image;
	if (!raw.empty())
	{
		try
		{
			image = cv::imdecode(
				cv::Mat{1, static_cast<int>(raw.size()), CV_8U, const_cast<char*>(raw.data())},
				cv::IMREAD_COLOR
			);
		}
		catch (cv::Exception& e)
		{
			BOOST_THROW_EXCEPTION(DecodeError() << Message{e.what()});
		}
	}

	if (image.empty())
		BOOST_THROW_EXCEPTION(DecodeError()
			<< Message{"cannot decode " + std::to_string(raw.size()) + " bytes as an image"}
		);

	return to_bgr8(std::move(image));
}

cv::Mat read_image(const fs::path& path)
{
	auto image = cv::imread(path.string(), cv::IMREAD_COLOR);
	if (image.empty())
		BOOST_THROW_EXCEPTION(DecodeError()
			<< Message{"cannot read image from " + path.string()}
			<< ImagePath{path}
		);
	return to_bgr8(std::move(image));
}

void save_image(const cv::Mat& image, const fs::path& path)
{
	if (path.has_parent_path())
		create_directories(path.parent_path());

	auto ok = false;
	try
	{
		ok = cv::imwrite(path.string(), image);
	}
	catch (cv::Exception& e)
	{
		BOOST_THROW_EXCEPTION(SystemError() << Message{e.what()} << ImagePath{path});
	}

	if (!ok)
		BOOST_THROW_EXCEPTION(SystemError() << Message{"cannot write image"} << ImagePath{path});

	Log(LOG_DEBUG, "saved %1%x%2% image to %3%", image.cols, image.rows, path.string());
}

std::string image_hash(const cv::Mat& image)
{
	SHA256 hash;

	// images with the same bytes but different shapes are different
	int shape[] = {image.cols, image.rows, image.type()};
	hash.update(shape, sizeof(shape));

	for (auto row = 0; row < image.rows; ++row)
		hash.update(image.ptr(row), image.cols * image.elemSize());
	return hash.hex_digest();
}

} // end of namespace ink
