/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/15/24.
//

#pragma once

#include "MetadataStore.hh"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>

namespace imagio {

/// \brief  MetadataStore that lives and dies with the process.
/// Records created at the same millisecond are listed in reverse order of insertion.
class MemoryMetadataStore : public MetadataStore
{
public:
	MemoryMetadataStore() = default;

	ImageRecord get(std::string_view uuid, std::error_code& ec) const override;
	void put(const ImageRecord& record, std::error_code& ec) override;
	ImageRecord remove(std::string_view uuid, std::error_code& ec) override;
	ImageRecords list(std::string_view category, std::size_t limit, std::size_t skip, std::error_code& ec) const override;

	[[nodiscard]] std::size_t size() const;

private:
	struct Entry
	{
		ImageRecord     record;
		std::uint64_t   seq;
	};

	mutable std::shared_mutex               m_mutex;
	std::map<std::string, Entry, std::less<>> m_records;
	std::uint64_t                           m_seq{0};
};

} // end of namespace imagio
