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

#include "Orchestrator.hh"

#include "image/Transform.hh"
#include "util/Configuration.hh"

namespace imagio {

class StorageOperator;

/// \brief  Check the cache, otherwise render from the original and write through.
/// Concurrent misses of the same variant all render it and write it to the cache.
/// The last writer wins, which is harmless because the results are identical.
class NaiveOrchestrator : public Orchestrator
{
public:
	NaiveOrchestrator(
		const StorageOperator& originals,
		const StorageOperator& derivatives,
		Transform transform = Transform{},
		WriteThrough policy = WriteThrough::strict
	);

	Blob resolve(const ImageRecord& record, Variant variant, std::error_code& ec) const override;
	void remove(const ImageRecord& record, std::error_code& ec) const override;

	[[nodiscard]] const Transform& transform() const {return m_transform;}
	[[nodiscard]] WriteThrough write_through() const {return m_policy;}

private:
	Blob render(const ImageRecord& record, Variant variant, const std::string& key, std::error_code& ec) const;

private:
	const StorageOperator&  m_originals;
	const StorageOperator&  m_derivatives;
	Transform               m_transform;
	WriteThrough            m_policy;
};

} // end of namespace imagio
