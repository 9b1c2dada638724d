/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/13/24.
//

#include "StorageKey.hh"

namespace imagio {

std::string storage_key(const ImageRecord& record, Variant variant)
{
	std::string key{record.category()};
	if (variant == Variant::original)
	{
		key += '/';
		key += record.uuid();
	}
	else
	{
		key += '_';
		key += record.uuid();
		key += '_';
		key += to_string(variant);
	}
	key += '.';
	key += extension(record.mime());
	return key;
}

} // end of namespace imagio
