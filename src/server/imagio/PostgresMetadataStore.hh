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

#include "net/Postgres.hh"

#include <string>

namespace imagio {

/// \brief  MetadataStore in the "images" table of a PostgreSQL database.
/// Every operation checks out one connection from the pool for its duration.
class PostgresMetadataStore : public MetadataStore
{
public:
	/// Throws postgres::Error if the database cannot be connected.
	PostgresMetadataStore(const std::string& connection_string, std::size_t pool_size);

	/// Creates the table and its index if they do not exist.
	void init(std::error_code& ec) override;

	ImageRecord get(std::string_view uuid, std::error_code& ec) const override;
	void put(const ImageRecord& record, std::error_code& ec) override;
	ImageRecord remove(std::string_view uuid, std::error_code& ec) override;
	ImageRecords list(std::string_view category, std::size_t limit, std::size_t skip, std::error_code& ec) const override;

private:
	mutable postgres::ConnectionPool m_pool;
};

} // end of namespace imagio
