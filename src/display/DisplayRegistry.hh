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

#include "util/Exception.hh"

#include <boost/exception/error_info.hpp>

#include <opencv2/core.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ink {

class Configuration;

/// Shows a fully prepared image on the panel. Reducing the colour depth to
/// what the panel supports is the driver's business.
using DisplayDriver = std::function<void(const cv::Mat& image)>;

using DisplayType = boost::error_info<struct tag_display_type, std::string>;

/// Maps display types in the configuration to drivers.
///
/// A name is either an exact display type or a shell wildcard pattern like
/// "epd*in*". Exact names are tried first, then patterns in the order they
/// were added.
class DisplayRegistry
{
public:
	using Factory = std::function<DisplayDriver(const Configuration&)>;

public:
	/// Contains the "mock" display only.
	DisplayRegistry();

	void add(std::string name, Factory factory);

	const Factory* find(std::string_view display_type) const;

	/// Throws ConfigurationError if the display type is not supported.
	DisplayDriver create(const Configuration& cfg) const;

private:
	struct Entry
	{
		std::string name;
		Factory     factory;
	};
	std::vector<Entry> m_exact;
	std::vector<Entry> m_patterns;
};

} // end of namespace ink
