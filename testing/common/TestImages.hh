/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/14/20.
//

#pragma once

#include "util/FS.hh"

#include <opencv2/core/mat.hpp>

#include <string>

namespace ink {

	// BGR
	const cv::Scalar red{0, 0, 255};
	const cv::Scalar blue{255, 0, 0};
	const cv::Scalar white{255, 255, 255};

	cv::Mat solid_image(int width, int height, const cv::Scalar& color);

	/// Every pixel is different from its neighbours.
	cv::Mat pattern_image(int width, int height);

	/// Left half \a left and right half \a right.
	cv::Mat split_image(int width, int height, const cv::Scalar& left, const cv::Scalar& right);

	std::string encode_png(const cv::Mat& image);

	bool same_pixels(const cv::Mat& lhs, const cv::Mat& rhs);

	/// Number of pixels in row \a row that are exactly \a color.
	int count_in_row(const cv::Mat& image, int row, const cv::Scalar& color);

	/// An empty directory that is removed with the object.
	class TempDir
	{
	public:
		TempDir();
		~TempDir();
		TempDir(const TempDir&) = delete;
		TempDir& operator=(const TempDir&) = delete;

		const fs::path& path() const {return m_path;}
		fs::path operator/(const fs::path& name) const {return m_path / name;}

	private:
		fs::path m_path;
	};
}
