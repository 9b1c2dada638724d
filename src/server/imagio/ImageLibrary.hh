/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/16/24.
//

#pragma once

#include "DeduplicatingOrchestrator.hh"
#include "MetadataStore.hh"
#include "NaiveOrchestrator.hh"

#include "storage/StorageOperator.hh"
#include "util/Configuration.hh"

#include <memory>
#include <optional>
#include <string_view>

namespace imagio {

/// \brief  Upload, query, render and delete images.
/// Ties the storage of the originals, the derivative cache and the metadata store together.
class ImageLibrary
{
public:
	/// Throws Configuration::Error or postgres::Error if the backends cannot be opened.
	explicit ImageLibrary(const Configuration& cfg);

	ImageLibrary(
		std::unique_ptr<StorageOperator> originals,
		std::unique_ptr<StorageOperator> derivatives,
		std::unique_ptr<MetadataStore> metadata,
		const CacheSetting& setting = {}
	);

	ImageLibrary(ImageLibrary&&) = delete;
	ImageLibrary(const ImageLibrary&) = delete;
	ImageLibrary& operator=(ImageLibrary&&) = delete;
	ImageLibrary& operator=(const ImageLibrary&) = delete;

	void init(std::error_code& ec);

	/// Stores the original first, then its record. The blob must be a decodable image.
	ImageRecord upload(std::string_view category, BufferView blob, std::error_code& ec);

	ImageRecord find(std::string_view uuid, std::error_code& ec) const;
	ImageRecords list(std::string_view category, std::size_t limit, std::size_t skip, std::error_code& ec) const;
	Blob resolve(std::string_view uuid, Variant variant, std::error_code& ec) const;

	/// Removes the record, then the original.
	ImageRecord remove(std::string_view uuid, std::error_code& ec);

	/// Renders all derived variants of all images in the category, using
	/// CacheSetting::thread_count threads. Returns the number of variants that
	/// are in the cache afterwards. \a ec is the first failure, if any.
	std::size_t generate(std::string_view category, std::error_code& ec) const;

	[[nodiscard]] const Orchestrator& orchestrator() const;
	[[nodiscard]] const CacheSetting& setting() const {return m_setting;}

private:
	std::unique_ptr<StorageOperator>            m_originals;
	std::unique_ptr<StorageOperator>            m_derivatives;
	std::unique_ptr<MetadataStore>              m_metadata;
	CacheSetting                                m_setting;

	NaiveOrchestrator                           m_naive;
	std::optional<DeduplicatingOrchestrator>    m_dedup;
};

} // end of namespace imagio
