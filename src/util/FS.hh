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

#include <boost/filesystem/path.hpp>

#include <string_view>

namespace ink {
namespace fs = boost::filesystem;

/// Writes \a data to a temporary file beside \a dest and renames it over \a dest,
/// so readers never see a half-written file.
void atomic_write(const fs::path& dest, std::string_view data);

}
