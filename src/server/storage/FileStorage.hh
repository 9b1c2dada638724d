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

#include "StorageOperator.hh"

#include "common/FS.hh"

namespace imagio {

/// \brief  Storage backed by a directory in the local file system.
/// Keys are relative paths under the root directory. Parent directories are created
/// when writing. Writes go to a temporary file in the same directory which is then
/// renamed, so readers never see a partially written file.
class FileStorage : public StorageOperator
{
public:
	explicit FileStorage(fs::path root);

	Blob read(std::string_view key, std::error_code& ec) const override;
	void write(std::string_view key, BufferView blob, std::error_code& ec) const override;
	bool exists(std::string_view key, std::error_code& ec) const override;
	void remove(std::string_view key, std::error_code& ec) const override;

	[[nodiscard]] std::string name() const override;
	[[nodiscard]] const fs::path& root() const {return m_root;}

	/// Path of the file storing \a key. Keys escaping the root directory are rejected.
	fs::path path(std::string_view key, std::error_code& ec) const;

private:
	fs::path m_root;
};

} // end of namespace imagio
