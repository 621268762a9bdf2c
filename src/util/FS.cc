/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/5/20.
//

#include "FS.hh"
#include "Exception.hh"

#include <boost/exception/info.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>

namespace ink {

using Path = boost::error_info<struct tag_path, fs::path>;

void atomic_write(const fs::path& dest, std::string_view data)
{
	if (dest.has_parent_path())
		create_directories(dest.parent_path());

	auto tmp = dest;
	tmp += ".tmp";
	{
		std::ofstream out{tmp.string(), std::ios::out | std::ios::binary | std::ios::trunc};
		if (!out.write(data.data(), static_cast<std::streamsize>(data.size())))
			BOOST_THROW_EXCEPTION(SystemError()
				<< ErrorCode({errno, std::system_category()})
				<< Path{tmp}
			);
	}

	boost::system::error_code ec;
	fs::rename(tmp, dest, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode({ec.value(), std::system_category()})
			<< Path{dest}
		);
}

} // end of namespace
