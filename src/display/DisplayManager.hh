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

#include "DisplayRegistry.hh"

#include "image/Fit.hh"

#include <opencv2/core.hpp>

#include <string_view>

namespace ink {

class Configuration;

/// Turns an arbitrary image into what the panel shows and hands it to the driver.
class DisplayManager
{
public:
	/// Throws ConfigurationError if the display type of \a cfg is not in \a registry.
	explicit DisplayManager(const Configuration& cfg, const DisplayRegistry& registry = DisplayRegistry{});
	DisplayManager(const Configuration& cfg, DisplayDriver driver);

	/// Orients, fits, inverts and enhances \a image according to the device
	/// configuration. An invalid \a background falls back to white.
	cv::Mat prepare(const cv::Mat& image, const FitConfig& fit, std::string_view background) const;

	/// Saves \a prepared to the current image file and shows it.
	void show(const cv::Mat& prepared) const;

	/// prepare() then show(). Returns the image shown.
	cv::Mat render(const cv::Mat& image, const FitConfig& fit, std::string_view background) const;

private:
	void check_driver() const;

private:
	const Configuration&    m_cfg;
	DisplayDriver           m_driver;
};

} // end of namespace ink
