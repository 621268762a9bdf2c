/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#pragma once

#include <boost/format.hpp>

#include "config.hh"
#include <syslog.h>

#include <optional>
#include <string_view>

namespace ink {

namespace detail {
void DetailLog(int priority, std::string&& line);
}

template <typename... Args>
void Log(int priority, const std::string& fmt, Args... args)
{
	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

/// Maps "debug", "info", "notice", "warning" and "error" to syslog priorities.
std::optional<int> log_priority(std::string_view level);

/// Opens the system log and drops messages less important than \a max_priority.
/// Messages are copied to stderr.
void open_log(const char *ident, int max_priority);

} // end of namespace
