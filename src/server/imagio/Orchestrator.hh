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

#include "common/util/BufferView.hh"

#include <system_error>

namespace imagio {

/// \brief  Entry point to the derivative cache.
/// resolve() returns the bytes of a variant of an image, rendering and caching
/// it if it is not in the cache yet. Implementations are safe to be called
/// concurrently.
class Orchestrator
{
public:
	virtual ~Orchestrator() = default;

	virtual Blob resolve(const ImageRecord& record, Variant variant, std::error_code& ec) const = 0;

	/// Deletes the original. Cached variants are left behind.
	virtual void remove(const ImageRecord& record, std::error_code& ec) const = 0;
};

} // end of namespace imagio
