/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/15/24.
//

#include "PostgresMetadataStore.hh"

#include "common/Error.hh"
#include "common/util/Log.hh"

#include <charconv>

namespace imagio {
namespace {

const char create_table[] =
	"CREATE TABLE IF NOT EXISTS images ("
		"uuid text PRIMARY KEY, "
		"category text NOT NULL, "
		"mime text NOT NULL, "
		"create_time bigint NOT NULL, "
		"seq bigserial"
	")";

const char create_index[] =
	"CREATE INDEX IF NOT EXISTS images_category_time ON images (category, create_time DESC, seq DESC)";

ImageRecord to_record(const postgres::Result& result, int row)
{
	auto created = result.value(row, 3);

	Timestamp::duration::rep ms{};
	std::from_chars(created.data(), created.data() + created.size(), ms);

	return ImageRecord{
		std::string{result.value(row, 0)},
		std::string{result.value(row, 1)},
		std::string{result.value(row, 2)},
		Timestamp{Timestamp::duration{ms}}
	};
}

} // end of local namespace

PostgresMetadataStore::PostgresMetadataStore(const std::string& connection_string, std::size_t pool_size) :
	m_pool{connection_string, pool_size}
{
}

void PostgresMetadataStore::init(std::error_code& ec)
{
	auto conn = m_pool.acquire();
	conn->exec(ec, create_table);
	if (!ec)
		conn->exec(ec, create_index);
}

ImageRecord PostgresMetadataStore::get(std::string_view uuid, std::error_code& ec) const
{
	auto conn = m_pool.acquire();
	auto result = conn->exec(ec,
		"SELECT uuid, category, mime, create_time FROM images WHERE uuid=$1",
		uuid
	);
	if (ec)
		return {};

	if (result.tuples() == 0)
	{
		ec = Error::object_not_exist;
		return {};
	}
	return to_record(result, 0);
}

void PostgresMetadataStore::put(const ImageRecord& record, std::error_code& ec)
{
	auto conn = m_pool.acquire();
	conn->exec(ec,
		"INSERT INTO images (uuid, category, mime, create_time) VALUES ($1, $2, $3, $4) "
		"ON CONFLICT (uuid) DO UPDATE SET "
			"category=EXCLUDED.category, mime=EXCLUDED.mime, create_time=EXCLUDED.create_time",
		record.uuid(), record.category(), record.mime(),
		std::to_string(record.created().time_since_epoch().count())
	);
}

ImageRecord PostgresMetadataStore::remove(std::string_view uuid, std::error_code& ec)
{
	auto conn = m_pool.acquire();
	auto result = conn->exec(ec,
		"DELETE FROM images WHERE uuid=$1 RETURNING uuid, category, mime, create_time",
		uuid
	);
	if (ec)
		return {};

	if (result.tuples() == 0)
	{
		ec = Error::object_not_exist;
		return {};
	}
	return to_record(result, 0);
}

ImageRecords PostgresMetadataStore::list(std::string_view category, std::size_t limit, std::size_t skip, std::error_code& ec) const
{
	auto conn = m_pool.acquire();
	auto result = conn->exec(ec,
		"SELECT uuid, category, mime, create_time FROM images WHERE category=$1 "
		"ORDER BY create_time DESC, seq DESC LIMIT $2 OFFSET $3",
		category, std::to_string(limit), std::to_string(skip)
	);
	if (ec)
		return {};

	ImageRecords records;
	for (int row = 0; row < result.tuples(); ++row)
		records.push_back(to_record(result, row));

	Log(LOG_DEBUG, "%1% images in category %2%", records.size(), category);
	return records;
}

} // end of namespace imagio
