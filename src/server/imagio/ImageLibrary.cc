/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/16/24.
//

#include "ImageLibrary.hh"
#include "MemoryMetadataStore.hh"
#include "PostgresMetadataStore.hh"
#include "StorageKey.hh"

#include "image/Image.hh"
#include "util/Magic.hh"

#include "common/Error.hh"
#include "common/crypto/Random.hh"
#include "common/util/Log.hh"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <mutex>

namespace imagio {
namespace {

std::unique_ptr<MetadataStore> open_metadata(const MetadataSetting& setting)
{
	if (setting.connection.empty())
	{
		Log(LOG_NOTICE, "no database configured, image records are kept in memory");
		return std::make_unique<MemoryMetadataStore>();
	}
	return std::make_unique<PostgresMetadataStore>(setting.connection, setting.pool_size);
}

} // end of local namespace

ImageLibrary::ImageLibrary(const Configuration& cfg) :
	ImageLibrary{
		open_storage(cfg.originals()),
		open_storage(cfg.derivatives()),
		open_metadata(cfg.metadata()),
		cfg.cache()
	}
{
}

ImageLibrary::ImageLibrary(
	std::unique_ptr<StorageOperator> originals,
	std::unique_ptr<StorageOperator> derivatives,
	std::unique_ptr<MetadataStore> metadata,
	const CacheSetting& setting
) :
	m_originals{std::move(originals)},
	m_derivatives{std::move(derivatives)},
	m_metadata{std::move(metadata)},
	m_setting{setting},
	m_naive{*m_originals, *m_derivatives, Transform{setting.jpeg_quality}, setting.write_through}
{
	if (m_setting.deduplicate)
		m_dedup.emplace(m_naive);

	Log(LOG_NOTICE, "originals in %1%, derivatives in %2%", m_originals->name(), m_derivatives->name());
}

const Orchestrator& ImageLibrary::orchestrator() const
{
	if (m_dedup)
		return *m_dedup;
	return m_naive;
}

void ImageLibrary::init(std::error_code& ec)
{
	m_metadata->init(ec);
}

ImageRecord ImageLibrary::upload(std::string_view category, BufferView blob, std::error_code& ec)
{
	auto mime = Magic::instance().mime(blob);

	// make sure we can render it later
	if (load_image(blob, ec); ec)
	{
		Log(LOG_WARNING, "uploaded blob (%1% bytes, %2%) is not an image", blob.size(), mime);
		return {};
	}

	ImageRecord record{random_uuid(), std::string{category}, mime};

	m_originals->write(storage_key(record, Variant::original), blob, ec);
	if (ec)
		return {};

	m_metadata->put(record, ec);
	if (ec)
		return {};

	Log(LOG_INFO, "uploaded %1% (%2%, %3% bytes) to %4%", record.uuid(), record.mime(), blob.size(), record.category());
	return record;
}

ImageRecord ImageLibrary::find(std::string_view uuid, std::error_code& ec) const
{
	return m_metadata->get(uuid, ec);
}

ImageRecords ImageLibrary::list(std::string_view category, std::size_t limit, std::size_t skip, std::error_code& ec) const
{
	return m_metadata->list(category, limit, skip, ec);
}

Blob ImageLibrary::resolve(std::string_view uuid, Variant variant, std::error_code& ec) const
{
	auto record = m_metadata->get(uuid, ec);
	if (ec)
		return {};

	return orchestrator().resolve(record, variant, ec);
}

ImageRecord ImageLibrary::remove(std::string_view uuid, std::error_code& ec)
{
	auto record = m_metadata->remove(uuid, ec);
	if (ec)
		return {};

	orchestrator().remove(record, ec);
	return record;
}

std::size_t ImageLibrary::generate(std::string_view category, std::error_code& ec) const
{
	const std::size_t page = 100;

	ImageRecords records;
	while (true)
	{
		auto next = m_metadata->list(category, page, records.size(), ec);
		if (ec)
			return 0;

		records.insert(records.end(), next.begin(), next.end());
		if (next.size() < page)
			break;
	}

	std::atomic<std::size_t> count{0};
	std::mutex mutex;
	std::error_code first_error;

	boost::asio::thread_pool pool{m_setting.thread_count};
	for (auto&& record : records)
	{
		for (auto variant : derived_variants)
		{
			boost::asio::post(pool, [this, &record, variant, &count, &mutex, &first_error]
			{
				std::error_code ec;
				orchestrator().resolve(record, variant, ec);
				if (ec)
				{
					Log(LOG_WARNING, "cannot generate %1% of %2%: %3%", variant, record.uuid(), ec.message());

					std::unique_lock lock{mutex};
					if (!first_error)
						first_error = ec;
				}
				else
					++count;
			});
		}
	}
	pool.join();

	Log(LOG_NOTICE, "%1% variants of %2% images in %3% generated", count.load(), records.size(), category);
	ec = first_error;
	return count;
}

} // end of namespace imagio
