/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/13/24.
//

#include "NaiveOrchestrator.hh"
#include "StorageKey.hh"

#include "storage/StorageOperator.hh"

#include "common/Error.hh"
#include "common/util/Log.hh"

namespace imagio {

NaiveOrchestrator::NaiveOrchestrator(
	const StorageOperator& originals,
	const StorageOperator& derivatives,
	Transform transform,
	WriteThrough policy
) :
	m_originals{originals}, m_derivatives{derivatives}, m_transform{transform}, m_policy{policy}
{
}

Blob NaiveOrchestrator::resolve(const ImageRecord& record, Variant variant, std::error_code& ec) const
{
	if (variant == Variant::original)
	{
		auto key = storage_key(record, Variant::original);
		auto blob = m_originals.read(key, ec);
		if (ec)
			Log(LOG_NOTICE, "cannot read original %1% from %2%: %3%", key, m_originals.name(), ec.message());
		return blob;
	}

	auto key = storage_key(record, variant);
	auto cached = m_derivatives.exists(key, ec);
	if (ec)
		return {};

	if (cached)
	{
		auto blob = m_derivatives.read(key, ec);
		if (!ec)
		{
			Log(LOG_DEBUG, "cache hit: %1%", key);
			return blob;
		}

		// removed between exists() and read(): render it again
		if (ec != Error::object_not_exist)
			return {};
	}

	Log(LOG_INFO, "cache miss: %1%", key);
	return render(record, variant, key, ec);
}

Blob NaiveOrchestrator::render(const ImageRecord& record, Variant variant, const std::string& key, std::error_code& ec) const
{
	auto original = m_originals.read(storage_key(record, Variant::original), ec);
	if (ec)
	{
		Log(LOG_NOTICE, "cannot read original of %1% for rendering %2%: %3%", record.uuid(), variant, ec.message());
		return {};
	}

	auto rendered = m_transform(original, variant, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot render %1% of %2%: %3%", variant, record.uuid(), ec.message());
		return {};
	}

	m_derivatives.write(key, rendered, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot write %1% to %2%: %3%", key, m_derivatives.name(), ec.message());
		if (m_policy == WriteThrough::strict)
			return {};

		ec.clear();
	}

	return rendered;
}

void NaiveOrchestrator::remove(const ImageRecord& record, std::error_code& ec) const
{
	auto key = storage_key(record, Variant::original);
	m_originals.remove(key, ec);
	if (ec == Error::object_not_exist)
	{
		Log(LOG_NOTICE, "original %1% does not exist in %2%", key, m_originals.name());
		ec.clear();
	}
}

} // end of namespace imagio
