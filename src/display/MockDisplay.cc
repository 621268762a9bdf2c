/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/12/20.
//

#include "MockDisplay.hh"

#include "image/Image.hh"
#include "util/Log.hh"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ink {
namespace {

std::string frame_filename()
{
	using namespace std::chrono;
	auto now = system_clock::now();
	auto tt  = system_clock::to_time_t(now);
	auto ms  = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

	std::ostringstream ss;
	std::tm tm_{};
	if (auto tm = ::localtime_r(&tt, &tm_); tm)
		ss << std::put_time(tm, "display_%Y%m%d_%H%M%S_") << std::setw(3) << std::setfill('0') << ms << ".png";
	else
		ss << "display_" << tt << ".png";
	return ss.str();
}

} // end of local namespace

MockDisplay::MockDisplay(fs::path output_dir) : m_dir{std::move(output_dir)}
{
}

void MockDisplay::operator()(const cv::Mat& image) const
{
	auto frame = m_dir / frame_filename();
	save_image(image, frame);
	save_image(image, m_dir / "latest.png");

	Log(LOG_INFO, "mock display: %1%x%2% frame saved to %3%", image.cols, image.rows, frame);
}

} // end of namespace ink
