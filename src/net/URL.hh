/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/8/20.
//

#pragma once

#include <string>
#include <string_view>

namespace ink {

/// scheme://host[:port]/target
class URL
{
public:
	URL() = default;

	/// Throws ConfigurationError if \a url is not an absolute http or https URL.
	explicit URL(std::string_view url);

	const std::string& scheme() const {return m_scheme;}
	const std::string& host() const {return m_host;}
	const std::string& port() const {return m_port;}
	const std::string& target() const {return m_target;}

	/// Resolves a Location header, which may be relative to this URL.
	URL resolve(std::string_view location) const;

	std::string str() const;

private:
	std::string m_scheme;
	std::string m_host;
	std::string m_port;
	std::string m_target{"/"};
};

} // end of namespace ink
