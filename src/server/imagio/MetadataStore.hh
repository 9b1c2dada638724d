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

#include "ImageRecord.hh"

#include <string_view>
#include <system_error>

namespace imagio {

/// \brief  Where the image records are kept.
/// Absent uuids are reported as Error::object_not_exist. Implementations are
/// safe to be called concurrently.
class MetadataStore
{
public:
	virtual ~MetadataStore() = default;

	/// Prepares the underlying storage, e.g. creating database tables.
	virtual void init(std::error_code& ec) {ec.clear();}

	virtual ImageRecord get(std::string_view uuid, std::error_code& ec) const = 0;

	/// Adds the record, or replaces the one with the same uuid.
	virtual void put(const ImageRecord& record, std::error_code& ec) = 0;

	/// Returns the removed record.
	virtual ImageRecord remove(std::string_view uuid, std::error_code& ec) = 0;

	/// Records of a category, newest first.
	virtual ImageRecords list(std::string_view category, std::size_t limit, std::size_t skip, std::error_code& ec) const = 0;
};

} // end of namespace imagio
