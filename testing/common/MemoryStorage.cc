/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/17/24.
//

#include "MemoryStorage.hh"

#include "common/Error.hh"

namespace imagio {

Blob MemoryStorage::read(std::string_view key, std::error_code& ec) const
{
	std::unique_lock lock{m_mutex};
	if (auto it = m_objects.find(key); it != m_objects.end())
	{
		ec.clear();
		return it->second;
	}
	ec = Error::object_not_exist;
	return {};
}

void MemoryStorage::write(std::string_view key, BufferView blob, std::error_code& ec) const
{
	std::unique_lock lock{m_mutex};
	m_objects.insert_or_assign(std::string{key}, Blob{blob.begin(), blob.end()});
	ec.clear();
}

bool MemoryStorage::exists(std::string_view key, std::error_code& ec) const
{
	std::unique_lock lock{m_mutex};
	ec.clear();
	return m_objects.find(key) != m_objects.end();
}

void MemoryStorage::remove(std::string_view key, std::error_code& ec) const
{
	std::unique_lock lock{m_mutex};
	if (auto it = m_objects.find(key); it != m_objects.end())
	{
		m_objects.erase(it);
		ec.clear();
	}
	else
		ec = Error::object_not_exist;
}

std::size_t MemoryStorage::size() const
{
	std::unique_lock lock{m_mutex};
	return m_objects.size();
}

Blob CountingStorage::read(std::string_view key, std::error_code& ec) const
{
	++reads;
	return m_inner.read(key, ec);
}

void CountingStorage::write(std::string_view key, BufferView blob, std::error_code& ec) const
{
	++writes;
	m_inner.write(key, blob, ec);
}

bool CountingStorage::exists(std::string_view key, std::error_code& ec) const
{
	++checks;
	return m_inner.exists(key, ec);
}

void CountingStorage::remove(std::string_view key, std::error_code& ec) const
{
	++removes;
	m_inner.remove(key, ec);
}

void CountingStorage::reset()
{
	reads = writes = checks = removes = 0;
}

Blob FailingStorage::read(std::string_view key, std::error_code& ec) const
{
	if (m_mode == Mode::everything)
	{
		ec = Error::backend_error;
		return {};
	}
	return m_inner.read(key, ec);
}

void FailingStorage::write(std::string_view, BufferView, std::error_code& ec) const
{
	ec = Error::backend_error;
}

bool FailingStorage::exists(std::string_view key, std::error_code& ec) const
{
	if (m_mode == Mode::everything)
	{
		ec = Error::backend_error;
		return false;
	}
	return m_inner.exists(key, ec);
}

void FailingStorage::remove(std::string_view key, std::error_code& ec) const
{
	if (m_mode == Mode::everything)
	{
		ec = Error::backend_error;
		return;
	}
	m_inner.remove(key, ec);
}

} // end of namespace imagio
