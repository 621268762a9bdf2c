/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/8/20.
//

#include "URL.hh"

#include "util/Error.hh"
#include "util/Exception.hh"
#include "util/Split.hh"

#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace ink {

URL::URL(std::string_view url)
{
	auto remain = trim(url);
	auto absolute = remain.find("://") != remain.npos;
	auto scheme = split_front_substring(remain, "://");
	if (!absolute || scheme.empty())
		BOOST_THROW_EXCEPTION(ConfigurationError()
			<< ErrorCode{Error::invalid_url}
			<< SourceURL{std::string{url}}
			<< Message{"not an absolute URL: " + std::string{url}}
		);

	m_scheme = to_lower(scheme);
	if (m_scheme != "http" && m_scheme != "https")
		BOOST_THROW_EXCEPTION(ConfigurationError()
			<< ErrorCode{Error::unsupported_scheme}
			<< SourceURL{std::string{url}}
			<< Message{"unsupported URL scheme: " + m_scheme}
		);

	// authority ends at the first '/', '?' or '#'
	auto authority = remain.substr(0, remain.find_first_of("/?#"));
	remain.remove_prefix(authority.size());

	auto [host, colon] = split_left(authority, ":");
	if (host.empty())
		BOOST_THROW_EXCEPTION(ConfigurationError()
			<< ErrorCode{Error::invalid_url}
			<< SourceURL{std::string{url}}
			<< Message{"missing host name in URL: " + std::string{url}}
		);

	m_host = std::string{host};
	m_port = colon == ':' && !authority.empty() ? std::string{authority} : (m_scheme == "https" ? "443" : "80");

	// drop the fragment: it is never sent to the server
	auto target = remain.substr(0, remain.find('#'));
	if (target.empty())
		m_target = "/";
	else if (target.front() == '?')
		m_target = "/" + std::string{target};
	else
		m_target = std::string{target};
}

URL URL::resolve(std::string_view location) const
{
	location = trim(location);
	if (location.find("://") != location.npos)
		return URL{location};

	URL result{*this};
	if (location.substr(0, 2) == "//")
		return URL{m_scheme + ":" + std::string{location}};
	else if (!location.empty() && location.front() == '/')
		result.m_target = std::string{location};
	else
		result.m_target = m_target.substr(0, m_target.rfind('/') + 1) + std::string{location};

	return result;
}

std::string URL::str() const
{
	auto default_port = (m_scheme == "https" && m_port == "443") || (m_scheme == "http" && m_port == "80");
	return m_scheme + "://" + m_host + (default_port ? "" : ":" + m_port) + m_target;
}

} // end of namespace ink
