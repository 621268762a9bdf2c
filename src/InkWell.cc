/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/13/20.
//

#include "InkWell.hh"

#include "album/StreamID.hh"
#include "image/Color.hh"
#include "image/Image.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"
#include "util/SettingsStore.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace ink {
namespace {

std::string settings_string(const SettingsStore& settings, const std::string& key)
{
	auto& value = settings.get(key);
	return value.is_string() ? value.get<std::string>() : std::string{};
}

} // end of local namespace

InkWell::InkWell(
	const Configuration& cfg, SettingsStore& settings, HTTPTransport transport,
	const DisplayRegistry& registry
) :
	m_cfg{cfg}, m_settings{settings},
	m_display{cfg, registry},
	m_album{transport},
	m_fetcher{transport}
{
}

InkWell::InkWell(
	const Configuration& cfg, SettingsStore& settings, HTTPTransport transport,
	DisplayDriver driver, Engine engine
) :
	m_cfg{cfg}, m_settings{settings},
	m_display{cfg, std::move(driver)},
	m_album{transport, engine},
	m_fetcher{transport},
	m_rotation{engine()}
{
}

FitConfig InkWell::fit_config() const
{
	return m_cfg.fit_config(m_settings.get("photo_fit").get<FitConfig>());
}

std::string InkWell::background() const
{
	if (auto bg = m_cfg.background())
		return *bg;

	auto bg = settings_string(m_settings, "backgroundColor");
	return bg.empty() ? "#FFFFFF" : bg;
}

bool InkWell::render(const cv::Mat& image, const FitConfig& fit, const std::string& bg)
{
	auto prepared = m_display.prepare(image, fit, bg);

	auto hash = image_hash(prepared);
	if (!m_cfg.force() && hash == settings_string(m_settings, "last_image_hash"))
	{
		Log(LOG_INFO, "image unchanged (%1%), skipping display refresh", hash);
		return false;
	}

	m_display.show(prepared);

	m_settings.set("last_image_hash", hash);
	m_settings.save();
	return true;
}

bool InkWell::render_file(const fs::path& path)
{
	Log(LOG_INFO, "rendering %1%", path);
	return render(read_image(path), fit_config(), background());
}

bool InkWell::render_url(const std::string& url)
{
	Log(LOG_INFO, "rendering %1%", url);
	return render(ImageFetcher::decode(m_fetcher.download(url), url), fit_config(), background());
}

bool InkWell::rotate()
{
	auto album_url = settings_string(m_settings, "album_url");
	if (album_url.empty())
		BOOST_THROW_EXCEPTION(ConfigurationError() << Message{"Shared album URL is required."});

	StreamID stream{album_url};
	auto catalog = m_album.fetch_catalog(stream);

	auto selection = m_rotation.next(m_settings, catalog, [this, &stream](auto&& id, auto&& checksum)
	{
		return m_album.resolve_url(stream, id, checksum);
	});
	Log(LOG_NOTICE, "showing photo %1% (%2% of %3% not yet shown)", selection.id, selection.remaining, catalog.size());

	// the orientation change in DisplayManager will rotate it back
	auto target = m_cfg.resolution();
	if (m_cfg.orientation() == Orientation::vertical)
		target = target.transposed();

	auto bg = background();
	auto image = m_fetcher.fetch_and_fit(selection.url, target, parse_color(bg, Color::white()));
	return render(image, fit_config(), bg);
}

} // end of namespace ink
