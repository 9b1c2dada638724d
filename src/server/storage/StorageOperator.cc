/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/11/24.
//

#include "StorageOperator.hh"
#include "FileStorage.hh"
#include "S3Storage.hh"

#include "util/Configuration.hh"
#include "common/util/Overload.hh"

namespace imagio {

std::unique_ptr<StorageOperator> open_storage(const StorageSetting& setting)
{
	return std::visit(Overloaded{
		[](const FileStorageSetting& fs) -> std::unique_ptr<StorageOperator>
		{
			return std::make_unique<FileStorage>(fs.root);
		},
		[](const S3StorageSetting& s3) -> std::unique_ptr<StorageOperator>
		{
			return std::make_unique<S3Storage>(s3);
		}
	}, setting);
}

} // end of namespace imagio
