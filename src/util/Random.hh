/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/6/20.
//

#pragma once

#include <cstddef>
#include <random>
#include <type_traits>

namespace ink {

void secure_random(void *buf, std::size_t size);

template <typename T>
std::enable_if_t<std::is_standard_layout<T>::value, T> secure_random()
{
	T val;
	secure_random(&val, sizeof(val));
	return val;
}

/// Generator for choosing photos and mirror hosts. Not for anything secret.
using Engine = std::mt19937_64;

inline Engine seeded_engine()
{
	return Engine{secure_random<Engine::result_type>()};
}

/// Picks one element of a non-empty random-access range with equal probability.
template <typename Range>
auto& pick(const Range& range, Engine& engine)
{
	std::uniform_int_distribution<std::size_t> dis{0, range.size() - 1};
	return range[dis(engine)];
}

} // end of namespace ink
