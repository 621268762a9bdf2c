/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#include "Log.hh"

#ifdef SYSTEMD_FOUND
#include <systemd/sd-journal.h>
#endif

#include <array>
#include <utility>

namespace ink {
namespace detail {

void DetailLog(int priority, std::string &&line)
{
	// journald ignores the setlogmask() filter
#ifdef SYSTEMD_FOUND
	if ((::setlogmask(0) & LOG_MASK(priority)) != 0)
		::sd_journal_print
#else
	::syslog
#endif
	(priority, "%s", line.c_str());
}

} // end of namespace detail

std::optional<int> log_priority(std::string_view level)
{
	static const std::array<std::pair<std::string_view, int>, 6> levels{{
		{"debug",   LOG_DEBUG},
		{"info",    LOG_INFO},
		{"notice",  LOG_NOTICE},
		{"warning", LOG_WARNING},
		{"error",   LOG_ERR},
		{"crit",    LOG_CRIT}
	}};
	for (auto&& [name, priority] : levels)
		if (name == level)
			return priority;

	return std::nullopt;
}

void open_log(const char *ident, int max_priority)
{
	::openlog(ident, LOG_PID | LOG_PERROR, LOG_USER);
	::setlogmask(LOG_UPTO(max_priority));
}

} // end of namespace
