/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/11/24.
//

#pragma once

#include "common/util/BufferView.hh"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace imagio {

struct FileStorageSetting;
struct S3StorageSetting;
using StorageSetting = std::variant<FileStorageSetting, S3StorageSetting>;

/// \brief  Key/value byte store behind one storage namespace.
/// There are two instances in the process: one for the originals and one for the
/// derivative cache. Their configuration is fixed at construction and all operations
/// are const, so they can be shared by concurrent callers.
///
/// Absent keys are reported as Error::object_not_exist, and all other failures
/// as Error::backend_error. exists() never reports absence as an error.
class StorageOperator
{
public:
	virtual ~StorageOperator() = default;

	virtual Blob read(std::string_view key, std::error_code& ec) const = 0;
	virtual void write(std::string_view key, BufferView blob, std::error_code& ec) const = 0;
	virtual bool exists(std::string_view key, std::error_code& ec) const = 0;
	virtual void remove(std::string_view key, std::error_code& ec) const = 0;

	/// for logging
	[[nodiscard]] virtual std::string name() const = 0;
};

/// Throws Configuration::Error if the setting cannot be used.
std::unique_ptr<StorageOperator> open_storage(const StorageSetting& setting);

} // end of namespace imagio
