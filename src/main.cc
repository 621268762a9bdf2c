/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

#include "InkWell.hh"

#include "net/HTTPSClient.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"
#include "util/SettingsStore.hh"

#include <boost/exception/diagnostic_information.hpp>

#include <iostream>
#include <cstdlib>

namespace ink {

int run(const Configuration& cfg)
{
	Log(LOG_NOTICE, "inkwell (version %1%) starting", constants::version);

	SettingsStore settings{cfg.settings_file()};
	InkWell app{cfg, settings, HTTPSClient::transport(cfg.http_timeout(), cfg.verify_peer())};

	if (auto file = cfg.render_file())
		app.render_file(*file);

	else if (auto url = cfg.image_url())
		app.render_url(*url);

	else if (cfg.rotate())
		app.rotate();

	else
	{
		cfg.usage(std::cout);
		std::cout << "\n";
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace ink;
	try
	{
		Configuration cfg{argc, argv, ::getenv("INKWELL_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		open_log("inkwell", cfg.log_priority());
		return run(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		return EXIT_FAILURE;
	}
}
