/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/27/18.
//

#include "Random.hh"

#include "common/util/Escape.hh"

#include <system_error>
#include <cassert>
#include <limits>

#include <openssl/rand.h>
#include <openssl/err.h>

namespace {
template <typename OpenSSLRandomFunction>
inline void open_ssl_rand(void *buf, std::size_t size, OpenSSLRandomFunction&& func)
{
	assert(size <= std::numeric_limits<int>::max());

	if (func(reinterpret_cast<unsigned char*>(buf), static_cast<int>(size)) != 1)
		throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());
}
}

namespace imagio {
void secure_random(void *buf, std::size_t size)
{
	open_ssl_rand(buf, size, ::RAND_priv_bytes);
}

std::string random_uuid()
{
	auto bytes = secure_random_array<unsigned char, 16>();

	// RFC4122 section 4.4
	bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
	bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

	auto hex = to_hex(bytes);
	return hex.substr(0, 8)  + '-' +
		hex.substr(8, 4)  + '-' +
		hex.substr(12, 4) + '-' +
		hex.substr(16, 4) + '-' +
		hex.substr(20);
}

} // end of namespace imagio
