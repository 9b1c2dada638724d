/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/14/24.
//

#include "DeduplicatingOrchestrator.hh"
#include "StorageKey.hh"

#include "common/util/Log.hh"

namespace imagio {

DeduplicatingOrchestrator::DeduplicatingOrchestrator(const Orchestrator& inner) : m_inner{inner}
{
}

Blob DeduplicatingOrchestrator::resolve(const ImageRecord& record, Variant variant, std::error_code& ec) const
{
	// originals are not rendered, nothing to share
	if (variant == Variant::original)
		return m_inner.resolve(record, variant, ec);

	auto key = storage_key(record, variant);

	std::promise<Outcome> promise;
	std::shared_future<Outcome> future;
	bool leader = false;
	{
		std::unique_lock lock{m_mutex};
		if (auto it = m_in_flight.find(key); it != m_in_flight.end())
			future = it->second;
		else
		{
			future = promise.get_future().share();
			m_in_flight.emplace(key, future);
			leader = true;
		}
	}

	if (leader)
	{
		try
		{
			Outcome outcome;
			outcome.blob = m_inner.resolve(record, variant, outcome.ec);

			{
				std::unique_lock lock{m_mutex};
				m_in_flight.erase(key);
			}
			promise.set_value(std::move(outcome));
		}
		catch (...)
		{
			{
				std::unique_lock lock{m_mutex};
				m_in_flight.erase(key);
			}
			promise.set_exception(std::current_exception());
			throw;
		}
	}
	else
		Log(LOG_DEBUG, "waiting for %1% in progress", key);

	auto& outcome = future.get();
	ec = outcome.ec;
	return outcome.blob;
}

void DeduplicatingOrchestrator::remove(const ImageRecord& record, std::error_code& ec) const
{
	m_inner.remove(record, ec);
}

std::size_t DeduplicatingOrchestrator::in_flight() const
{
	std::unique_lock lock{m_mutex};
	return m_in_flight.size();
}

} // end of namespace imagio
