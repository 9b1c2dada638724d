/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/13/24.
//

#pragma once

#include "ImageRecord.hh"
#include "image/Variant.hh"

#include <string>

namespace imagio {

/// Key of a variant of an image. The same key is used in both the originals and
/// the derivatives storage.
///
/// Originals are stored as "category/uuid.EXT" and derived variants as
/// "category_uuid_variant.EXT", where EXT is extension(record.mime()).
std::string storage_key(const ImageRecord& record, Variant variant);

} // end of namespace imagio
