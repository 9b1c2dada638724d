/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/17/24.
//

#pragma once

#include "storage/StorageOperator.hh"

#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace imagio {

/// Storage in a std::map, for testing.
class MemoryStorage : public StorageOperator
{
public:
	Blob read(std::string_view key, std::error_code& ec) const override;
	void write(std::string_view key, BufferView blob, std::error_code& ec) const override;
	bool exists(std::string_view key, std::error_code& ec) const override;
	void remove(std::string_view key, std::error_code& ec) const override;
	[[nodiscard]] std::string name() const override {return "memory";}

	[[nodiscard]] std::size_t size() const;

private:
	mutable std::mutex m_mutex;
	mutable std::map<std::string, Blob, std::less<>> m_objects;
};

/// Counts the calls to another storage.
class CountingStorage : public StorageOperator
{
public:
	explicit CountingStorage(const StorageOperator& inner) : m_inner{inner} {}

	Blob read(std::string_view key, std::error_code& ec) const override;
	void write(std::string_view key, BufferView blob, std::error_code& ec) const override;
	bool exists(std::string_view key, std::error_code& ec) const override;
	void remove(std::string_view key, std::error_code& ec) const override;
	[[nodiscard]] std::string name() const override {return "counting " + m_inner.name();}

	mutable std::atomic<int> reads{0}, writes{0}, checks{0}, removes{0};

	void reset();

private:
	const StorageOperator& m_inner;
};

/// Forwards reads to another storage but fails all writes, or all operations.
class FailingStorage : public StorageOperator
{
public:
	enum class Mode {write_only, everything};

	FailingStorage(const StorageOperator& inner, Mode mode) : m_inner{inner}, m_mode{mode} {}

	Blob read(std::string_view key, std::error_code& ec) const override;
	void write(std::string_view key, BufferView blob, std::error_code& ec) const override;
	bool exists(std::string_view key, std::error_code& ec) const override;
	void remove(std::string_view key, std::error_code& ec) const override;
	[[nodiscard]] std::string name() const override {return "failing " + m_inner.name();}

private:
	const StorageOperator&  m_inner;
	Mode                    m_mode;
};

} // end of namespace imagio
