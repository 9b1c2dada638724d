/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

#pragma once

#include "BufferView.hh"

#include <boost/algorithm/hex.hpp>

#include <array>
#include <string>
#include <string_view>
#include <tuple>

namespace imagio {

template <std::size_t N>
std::string to_hex(const std::array<unsigned char, N>& arr)
{
	std::string result(arr.size()*2, '\0');
	boost::algorithm::hex_lower(arr.begin(), arr.end(), result.begin());
	return result;
}

std::string to_hex(BufferView buf);

/// Percent-encode everything except the RFC3986 unreserved characters.
/// Slashes are kept as-is if \a keep_slash is true, which is what URI paths need.
std::string url_encode(std::string_view in, bool keep_slash = false);

std::string url_decode(std::string_view in);

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value);

} // end of namespace
