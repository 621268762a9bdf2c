/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/3/20.
//

#include "Error.hh"

#include <string>

namespace ink {

const std::error_category& ink_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "ink"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::timeout: return "operation timed out";
				case Error::http_error: return "HTTP request failed";
				case Error::too_many_redirects: return "too many redirects";
				case Error::unsupported_scheme: return "unsupported URL scheme";
				case Error::invalid_url: return "invalid URL";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), ink_error_category());
}

} // end of namespace
