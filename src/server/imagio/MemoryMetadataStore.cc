/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/15/24.
//

#include "MemoryMetadataStore.hh"

#include "common/Error.hh"

#include <algorithm>
#include <mutex>
#include <vector>

namespace imagio {

ImageRecord MemoryMetadataStore::get(std::string_view uuid, std::error_code& ec) const
{
	std::shared_lock lock{m_mutex};
	if (auto it = m_records.find(uuid); it != m_records.end())
	{
		ec.clear();
		return it->second.record;
	}

	ec = Error::object_not_exist;
	return {};
}

void MemoryMetadataStore::put(const ImageRecord& record, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	m_records.insert_or_assign(record.uuid(), Entry{record, ++m_seq});
	ec.clear();
}

ImageRecord MemoryMetadataStore::remove(std::string_view uuid, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto it = m_records.find(uuid);
	if (it == m_records.end())
	{
		ec = Error::object_not_exist;
		return {};
	}

	auto record = std::move(it->second.record);
	m_records.erase(it);
	ec.clear();
	return record;
}

ImageRecords MemoryMetadataStore::list(std::string_view category, std::size_t limit, std::size_t skip, std::error_code& ec) const
{
	std::vector<const Entry*> matched;
	std::shared_lock lock{m_mutex};
	for (auto&& [uuid, entry] : m_records)
		if (entry.record.category() == category)
			matched.push_back(&entry);

	std::sort(matched.begin(), matched.end(), [](auto lhs, auto rhs)
	{
		return lhs->record.created() != rhs->record.created() ?
			lhs->record.created() > rhs->record.created() :
			lhs->seq > rhs->seq;
	});

	ImageRecords result;
	for (auto i = skip; i < matched.size() && result.size() < limit; ++i)
		result.push_back(matched[i]->record);

	ec.clear();
	return result;
}

std::size_t MemoryMetadataStore::size() const
{
	std::shared_lock lock{m_mutex};
	return m_records.size();
}

} // end of namespace imagio
