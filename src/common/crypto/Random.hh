/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/27/18.
//

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <type_traits>

namespace imagio {

void secure_random(void* buf, std::size_t size);

template <typename T>
requires std::is_standard_layout_v<T>
T secure_random()
{
	T t;
	secure_random(&t, sizeof(t));
	return t;
}

template <typename T, std::size_t size> std::array<T,size> secure_random_array()
{
	return secure_random<std::array<T,size>>();
}

/// Random (version 4) UUID in its canonical 8-4-4-4-12 textual form.
std::string random_uuid();

} // end of namespace imagio
