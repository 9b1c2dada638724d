/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/3/18.
//

#include <catch2/catch.hpp>

#include "common/crypto/Random.hh"

#include <future>
#include <regex>
#include <set>

using namespace imagio;

TEST_CASE("secure_random() generates random numbers", "[normal]")
{
	REQUIRE(secure_random<std::uint64_t>() != secure_random<std::uint64_t>());
}

TEST_CASE("multithreaded calls to secure_random_array() generated different random numbers", "[normal]")
{
	auto fut_arr1 = std::async([]{return secure_random_array<std::uint64_t, 4>();});
	auto fut_arr2 = std::async([]{return secure_random_array<std::uint64_t, 4>();});

	REQUIRE(fut_arr1.get() != fut_arr2.get());
}

TEST_CASE("random UUIDs are version 4", "[normal]")
{
	const std::regex v4{"^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$"};

	std::set<std::string> generated;
	for (int i = 0; i < 100; ++i)
	{
		auto uuid = random_uuid();
		INFO(uuid);
		REQUIRE(std::regex_match(uuid, v4));
		REQUIRE(generated.insert(uuid).second);
	}
}
