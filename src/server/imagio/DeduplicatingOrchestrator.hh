/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/14/24.
//

#pragma once

#include "Orchestrator.hh"

#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace imagio {

/// \brief  Collapses concurrent requests of the same derived variant into one.
/// The first caller of a key resolves it through the inner orchestrator. Callers
/// arriving while it is in progress wait for its result, including its error.
/// The key is forgotten as soon as the result is published, so later requests
/// go through the inner orchestrator (and its cache) again.
class DeduplicatingOrchestrator : public Orchestrator
{
public:
	explicit DeduplicatingOrchestrator(const Orchestrator& inner);

	Blob resolve(const ImageRecord& record, Variant variant, std::error_code& ec) const override;
	void remove(const ImageRecord& record, std::error_code& ec) const override;

	/// Number of keys being resolved
	[[nodiscard]] std::size_t in_flight() const;

private:
	struct Outcome
	{
		Blob            blob;
		std::error_code ec;
	};

	const Orchestrator& m_inner;

	mutable std::mutex m_mutex;
	mutable std::unordered_map<std::string, std::shared_future<Outcome>> m_in_flight;
};

} // end of namespace imagio
