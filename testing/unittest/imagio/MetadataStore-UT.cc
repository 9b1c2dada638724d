/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/15/24.
//

#include <catch2/catch.hpp>

#include "imagio/MemoryMetadataStore.hh"
#include "imagio/PostgresMetadataStore.hh"
#include "common/Error.hh"
#include "common/crypto/Random.hh"

#include <cstdlib>
#include <memory>

using namespace imagio;

namespace {

Timestamp at(std::int64_t ms)
{
	return Timestamp{std::chrono::milliseconds{ms}};
}

// Same expectations for all implementations.
void check_metadata_store(MetadataStore& subject)
{
	std::error_code ec;
	subject.init(ec);
	REQUIRE(!ec);

	// unique category so that the test can be repeated on a persistent database
	auto category = "test-" + random_uuid();
	auto other    = "other-" + random_uuid();

	ImageRecord r1{random_uuid(), category, "image/jpeg", at(1000)};
	ImageRecord r2{random_uuid(), category, "image/png",  at(3000)};
	ImageRecord r3{random_uuid(), category, "image/gif",  at(2000)};
	ImageRecord r4{random_uuid(), other,    "image/jpeg", at(4000)};

	for (auto& r : {r1, r2, r3, r4})
	{
		subject.put(r, ec);
		REQUIRE(!ec);
	}

	SECTION("get")
	{
		REQUIRE(subject.get(r2.uuid(), ec) == r2);
		REQUIRE(!ec);

		subject.get(random_uuid(), ec);
		REQUIRE(ec == Error::object_not_exist);
	}
	SECTION("list newest first")
	{
		auto all = subject.list(category, 100, 0, ec);
		REQUIRE(!ec);
		REQUIRE(all == ImageRecords{r2, r3, r1});

		REQUIRE(subject.list(category, 1, 1, ec) == ImageRecords{r3});
		REQUIRE(subject.list(category, 10, 2, ec) == ImageRecords{r1});
		REQUIRE(subject.list(category, 10, 3, ec).empty());
		REQUIRE(subject.list(category, 0, 0, ec).empty());
		REQUIRE(subject.list("no-such-category-" + random_uuid(), 10, 0, ec).empty());
		REQUIRE(!ec);
	}
	SECTION("put replaces")
	{
		ImageRecord moved{r1.uuid(), category, "image/jpeg", at(5000)};
		subject.put(moved, ec);
		REQUIRE(!ec);
		REQUIRE(subject.get(r1.uuid(), ec) == moved);
		REQUIRE(subject.list(category, 1, 0, ec) == ImageRecords{moved});
	}
	SECTION("remove")
	{
		REQUIRE(subject.remove(r3.uuid(), ec) == r3);
		REQUIRE(!ec);

		subject.get(r3.uuid(), ec);
		REQUIRE(ec == Error::object_not_exist);

		subject.remove(r3.uuid(), ec);
		REQUIRE(ec == Error::object_not_exist);

		REQUIRE(subject.list(category, 10, 0, ec) == ImageRecords{r2, r1});
	}

	// clean up
	for (auto& r : {r1, r2, r3, r4})
		subject.remove(r.uuid(), ec);
}

}

TEST_CASE("memory metadata store", "[normal]")
{
	MemoryMetadataStore subject;
	check_metadata_store(subject);
	REQUIRE(subject.size() == 0);
}

TEST_CASE("records created at the same time are listed in reverse order of insertion", "[normal]")
{
	MemoryMetadataStore subject;
	std::error_code ec;

	ImageRecord a{"a", "c", "image/jpeg", at(1)};
	ImageRecord b{"b", "c", "image/jpeg", at(1)};
	subject.put(a, ec);
	subject.put(b, ec);
	REQUIRE(subject.list("c", 10, 0, ec) == ImageRecords{b, a});
}

TEST_CASE("postgres metadata store", "[.postgres]")
{
	auto env = std::getenv("IMAGIO_TEST_POSTGRES");
	PostgresMetadataStore subject{env ? env : "host=localhost dbname=imagio_test", 2};
	check_metadata_store(subject);
}
