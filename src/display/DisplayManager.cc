/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/12/20.
//

#include "DisplayManager.hh"

#include "image/Color.hh"
#include "image/Enhance.hh"
#include "image/Image.hh"
#include "image/RotateImage.hh"
#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace ink {

DisplayManager::DisplayManager(const Configuration& cfg, const DisplayRegistry& registry) :
	m_cfg{cfg}, m_driver{registry.create(cfg)}
{
}

DisplayManager::DisplayManager(const Configuration& cfg, DisplayDriver driver) :
	m_cfg{cfg}, m_driver{std::move(driver)}
{
}

void DisplayManager::check_driver() const
{
	if (!m_driver)
		BOOST_THROW_EXCEPTION(ConfigurationError()
			<< DisplayType{m_cfg.display_type()}
			<< Message{"No valid display instance initialized."}
		);
}

cv::Mat DisplayManager::prepare(const cv::Mat& image, const FitConfig& fit_config, std::string_view background) const
{
	check_driver();

	auto bg = parse_color(background.empty() ? std::string_view{"#FFFFFF"} : background, Color::white());

	auto orientation = m_cfg.orientation();
	auto oriented = change_orientation(image, orientation);
	Log(LOG_DEBUG, "oriented image to %1%: %2%x%3%", to_string(orientation), oriented.cols, oriented.rows);

	auto fitted = fit(oriented, m_cfg.resolution(), fit_config, orientation, bg);
	Log(LOG_DEBUG, "fitted image with strategy %1% preserve %2%: %3%x%4%",
		to_string(fit_config.strategy), to_string(fit_config.preserve), fitted.cols, fitted.rows
	);

	if (m_cfg.inverted_image())
		fitted = rotate(fitted, 180);

	return enhance(fitted, m_cfg.image_settings());
}

void DisplayManager::show(const cv::Mat& prepared) const
{
	check_driver();

	Log(LOG_INFO, "saving image to %1%", m_cfg.current_image_file());
	save_image(prepared, m_cfg.current_image_file());

	m_driver(prepared);
}

cv::Mat DisplayManager::render(const cv::Mat& image, const FitConfig& fit_config, std::string_view background) const
{
	auto prepared = prepare(image, fit_config, background);
	show(prepared);
	return prepared;
}

} // end of namespace ink
