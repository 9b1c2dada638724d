/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/13/24.
//

#include <catch2/catch.hpp>

#include "imagio/StorageKey.hh"

#include <nlohmann/json.hpp>

using namespace imagio;

TEST_CASE("storage keys of originals and variants", "[normal]")
{
	ImageRecord record{"abc", "public", "image/jpeg"};

	REQUIRE(storage_key(record, Variant::original) == "public/abc.JPG");
	REQUIRE(storage_key(record, Variant::embed)    == "public_abc_embed.JPG");
	REQUIRE(storage_key(record, Variant::public_)  == "public_abc_public.JPG");
	REQUIRE(storage_key(record, Variant::thumb)    == "public_abc_thumb.JPG");

	// derived keys use the extension of the original, not of the rendered variant
	ImageRecord png{"0f1e", "avatars", "image/png"};
	REQUIRE(storage_key(png, Variant::square) == "avatars_0f1e_square.PNG");
}

TEST_CASE("storage keys are deterministic", "[normal]")
{
	ImageRecord r1{"abc", "public", "image/gif", Timestamp{std::chrono::milliseconds{1}}};
	ImageRecord r2{"abc", "public", "image/gif", Timestamp{std::chrono::milliseconds{2}}};

	for (auto variant : {Variant::original, Variant::public_, Variant::embed, Variant::thumb, Variant::banner, Variant::square})
		REQUIRE(storage_key(r1, variant) == storage_key(r2, variant));
}

TEST_CASE("extension of MIME types", "[normal]")
{
	REQUIRE(extension("image/jpeg") == "JPG");
	REQUIRE(extension("image/png")  == "PNG");
	REQUIRE(extension("image/gif")  == "GIF");
	REQUIRE(extension("image/webp") == "WEBP");
	REQUIRE(extension("image/bmp")  == "BMP");
	REQUIRE(extension("image/x-ms-bmp") == "BMP");
	REQUIRE(extension("image/tiff") == "TIFF");
}

TEST_CASE("unknown MIME types are BIN", "[error]")
{
	REQUIRE(extension("application/octet-stream") == "BIN");
	REQUIRE(extension("") == "BIN");
	REQUIRE(extension("IMAGE/JPEG") == "BIN");

	ImageRecord record{"x", "c", "text/plain"};
	REQUIRE(storage_key(record, Variant::original) == "c/x.BIN");
}

TEST_CASE("image record to and from JSON", "[normal]")
{
	ImageRecord record{"abc", "public", "image/jpeg", Timestamp{std::chrono::milliseconds{1710403262345}}};

	nlohmann::json json(record);
	REQUIRE(json["uuid"] == "abc");
	REQUIRE(json["category"] == "public");
	REQUIRE(json["mime"] == "image/jpeg");
	REQUIRE(json["created"] == 1710403262345);

	REQUIRE(json.get<ImageRecord>() == record);
	REQUIRE(record.created().iso8601() == "2024-03-14T08:01:02.345Z");
}
