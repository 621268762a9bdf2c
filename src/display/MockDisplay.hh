/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/12/20.
//

#pragma once

#include "util/FS.hh"

#include <opencv2/core.hpp>

namespace ink {

/// A display that saves every frame as a PNG file.
///
/// Each frame is written to a file named after the time it is shown, and
/// latest.png is overwritten with the last one.
class MockDisplay
{
public:
	explicit MockDisplay(fs::path output_dir);

	void operator()(const cv::Mat& image) const;

	const fs::path& output_dir() const {return m_dir;}

private:
	fs::path m_dir;
};

} // end of namespace ink
