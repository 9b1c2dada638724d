/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/10/24.
//

#include <catch2/catch.hpp>

#include "TestImages.hh"

#include "image/Image.hh"
#include "common/Error.hh"

using namespace imagio;

TEST_CASE("decode JPEG and PNG", "[normal]")
{
	std::error_code ec;

	auto jpeg = load_image(random_jpeg({64, 48}), ec);
	REQUIRE(!ec);
	REQUIRE(dimension(jpeg) == Size2D{64, 48});
	REQUIRE(jpeg.channels() == 3);

	auto rgba = load_image(random_png({32, 16}, CV_8UC4), ec);
	REQUIRE(!ec);
	REQUIRE(dimension(rgba) == Size2D{32, 16});
	REQUIRE(rgba.channels() == 4);

	auto deep = load_image(random_png({16, 16}, CV_16UC3), ec);
	REQUIRE(!ec);
	REQUIRE(deep.depth() == CV_16U);
}

TEST_CASE("garbage is not an image", "[error]")
{
	std::error_code ec;

	Blob garbage{'h', 'e', 'l', 'l', 'o'};
	REQUIRE(load_image(garbage, ec).empty());
	REQUIRE(ec == Error::decode_error);

	ec.clear();
	REQUIRE(load_image(Blob{}, ec).empty());
	REQUIRE(ec == Error::decode_error);
}

TEST_CASE("encoding follows the pixel format", "[normal]")
{
	REQUIRE(select_encoding(random_image({8, 8}, CV_8UC3)) == Encoding::jpeg);
	REQUIRE(select_encoding(random_image({8, 8}, CV_8UC1)) == Encoding::jpeg);
	REQUIRE(select_encoding(random_image({8, 8}, CV_8UC4)) == Encoding::png);
	REQUIRE(select_encoding(random_image({8, 8}, CV_8UC2)) == Encoding::png);
	REQUIRE(select_encoding(random_image({8, 8}, CV_16UC3)) == Encoding::png);

	REQUIRE(mime(Encoding::jpeg) == "image/jpeg");
	REQUIRE(mime(Encoding::png) == "image/png");
}

TEST_CASE("encode then decode keeps the dimension", "[normal]")
{
	std::error_code ec;
	auto png = encode_image(random_image({40, 30}, CV_8UC4), Encoding::png, 85, ec);
	REQUIRE(!ec);

	auto decoded = load_image(png, ec);
	REQUIRE(!ec);
	REQUIRE(dimension(decoded) == Size2D{40, 30});
	REQUIRE(decoded.channels() == 4);
}
