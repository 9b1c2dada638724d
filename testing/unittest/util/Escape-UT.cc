/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/22/18.
//

#include <catch2/catch.hpp>

#include "common/util/Escape.hh"

using namespace imagio;

TEST_CASE( "split left", "[normal]" )
{
	std::string_view in{"name=value"};
	REQUIRE(split_left(in, "=&;") == std::make_tuple("name", '='));
	REQUIRE(in == "value");
	REQUIRE(split_left(in, "&;")  == std::make_tuple("value", '\0'));
	REQUIRE(in.empty());
	REQUIRE(split_left(in, "=&;") == std::make_tuple("", '\0'));
	REQUIRE(in.empty());
}

TEST_CASE("url encode keeps unreserved characters", "[normal]")
{
	REQUIRE(url_encode("abc-XYZ_0.9~") == "abc-XYZ_0.9~");
	REQUIRE(url_encode("a b+c") == "a%20b%2Bc");
	REQUIRE(url_encode("public/abc.JPG") == "public%2Fabc.JPG");
	REQUIRE(url_encode("public/abc.JPG", true) == "public/abc.JPG");
	REQUIRE(url_encode("\xe4\xb8\xad") == "%E4%B8%AD");
}

TEST_CASE("url decode", "[normal]")
{
	REQUIRE(url_decode("a%20b%2Bc") == "a b+c");
	REQUIRE(url_decode("%e4%B8%ad") == "\xe4\xb8\xad");
	REQUIRE(url_decode("plain") == "plain");
}

TEST_CASE("url decode stops at malformed escapes", "[error]")
{
	REQUIRE(url_decode("abc%2") == "abc");
	REQUIRE(url_decode("abc%zz") == "abc");
}

TEST_CASE("hex strings are lower case", "[normal]")
{
	std::array<unsigned char, 3> arr{0x00, 0xAB, 0x7f};
	REQUIRE(to_hex(arr) == "00ab7f");

	Blob blob{0xde, 0xad, 0xbe, 0xef};
	REQUIRE(to_hex(BufferView{blob}) == "deadbeef");
}
