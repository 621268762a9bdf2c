/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/13/20.
//

#pragma once

#include "album/AlbumStreamClient.hh"
#include "album/ImageFetcher.hh"
#include "album/RotationEngine.hh"
#include "display/DisplayManager.hh"
#include "image/Fit.hh"
#include "net/HTTPTransport.hh"
#include "util/FS.hh"

#include <opencv2/core.hpp>

#include <string>

namespace ink {

class Configuration;
class SettingsStore;

/// What the inkwell executable does in one run.
class InkWell
{
public:
	InkWell(
		const Configuration& cfg, SettingsStore& settings, HTTPTransport transport,
		const DisplayRegistry& registry = DisplayRegistry{}
	);
	InkWell(
		const Configuration& cfg, SettingsStore& settings, HTTPTransport transport,
		DisplayDriver driver, Engine engine
	);

	/// Each returns true if the display has been refreshed, or false if
	/// the image is the same as the one already shown.
	bool render_file(const fs::path& path);
	bool render_url(const std::string& url);

	/// One album cycle. The selected photo is committed to the settings file
	/// before it is downloaded, and last_image_hash is saved in a second commit
	/// after the display is refreshed. A photo that fails to download or render
	/// stays viewed so the next cycle moves on.
	bool rotate();
	bool render(const cv::Mat& image, const FitConfig& fit, const std::string& background);

	/// photo_fit in the settings overridden by the command line.
	FitConfig fit_config() const;

	/// Padding colour from the command line or backgroundColor in the settings.
	std::string background() const;

private:
	const Configuration&    m_cfg;
	SettingsStore&          m_settings;

	DisplayManager          m_display;
	AlbumStreamClient       m_album;
	ImageFetcher            m_fetcher;
	RotationEngine          m_rotation;
};

} // end of namespace ink
