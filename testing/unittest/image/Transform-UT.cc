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
#include "image/Transform.hh"
#include "common/Error.hh"

#include <opencv2/imgcodecs.hpp>

using namespace imagio;

namespace {

bool is_jpeg(const Blob& blob)
{
	return blob.size() > 3 && blob[0] == 0xFF && blob[1] == 0xD8 && blob[2] == 0xFF;
}

bool is_png(const Blob& blob)
{
	return blob.size() > 8 && blob[0] == 0x89 && blob[1] == 'P' && blob[2] == 'N' && blob[3] == 'G';
}

}

TEST_CASE("render embed variant of an RGB JPEG", "[normal]")
{
	Transform subject;
	REQUIRE(subject.jpeg_quality() == 85);

	std::error_code ec;
	auto out = subject(random_jpeg({2000, 1000}), Variant::embed, ec);
	REQUIRE(!ec);
	REQUIRE(is_jpeg(out));

	auto decoded = load_image(out, ec);
	REQUIRE(!ec);
	REQUIRE(dimension(decoded) == Size2D{1024, 512});
}

TEST_CASE("all variants fit their boxes", "[normal]")
{
	Transform subject{90};
	auto source = random_image({1600, 1200});

	for (auto variant : derived_variants)
	{
		INFO(variant);

		std::error_code ec;
		auto out = subject(source, variant, ec);
		REQUIRE(!ec);

		auto decoded = load_image(out, ec);
		REQUIRE(!ec);
		REQUIRE(dimension(decoded) == target_size(variant, {1600, 1200}));
	}
}

TEST_CASE("small images are re-encoded without resizing", "[normal]")
{
	Transform subject;

	std::error_code ec;
	auto out = subject(random_jpeg({100, 80}), Variant::thumb, ec);
	REQUIRE(!ec);

	auto decoded = load_image(out, ec);
	REQUIRE(dimension(decoded) == Size2D{100, 80});
}

TEST_CASE("images with alpha channel or 16-bit depth are rendered as PNG", "[normal]")
{
	Transform subject;
	std::error_code ec;

	auto rgba = subject(random_png({600, 600}, CV_8UC4), Variant::square, ec);
	REQUIRE(!ec);
	REQUIRE(is_png(rgba));

	auto decoded = load_image(rgba, ec);
	REQUIRE(dimension(decoded) == Size2D{320, 320});
	REQUIRE(decoded.channels() == 4);

	auto deep = subject(random_png({512, 256}, CV_16UC3), Variant::thumb, ec);
	REQUIRE(!ec);
	REQUIRE(is_png(deep));
	REQUIRE(dimension(load_image(deep, ec)) == Size2D{256, 128});
}

TEST_CASE("undecodable originals", "[error]")
{
	Transform subject;
	std::error_code ec;

	Blob garbage(1000, 0x42);
	REQUIRE(subject(garbage, Variant::thumb, ec).empty());
	REQUIRE(ec == Error::decode_error);

	ec.clear();
	REQUIRE(subject(cv::Mat{}, Variant::thumb, ec).empty());
	REQUIRE(ec == Error::decode_error);
}
