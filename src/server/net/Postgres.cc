/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 25/8/2020.
//

#include "Postgres.hh"

#include "common/Error.hh"
#include "common/util/Log.hh"

#include <boost/exception/info.hpp>

#include <charconv>

namespace imagio::postgres {

Connection::Connection(const std::string& connection_string) :
	m_conn{::PQconnectdb(connection_string.c_str())}
{
	if (!m_conn)
		BOOST_THROW_EXCEPTION(Error() << Message{"cannot connect to postgresql server"});

	if (::PQstatus(m_conn.get()) != CONNECTION_OK)
		BOOST_THROW_EXCEPTION(Error() << Message{::PQerrorMessage(m_conn.get())});
}

std::string_view Connection::last_error() const
{
	return ::PQerrorMessage(m_conn.get());
}

Result Connection::send(const Query& query)
{
	return Result{query.get(
		[this](auto&& query, std::size_t size, const char* const* values, const int* sizes, const int* formats)
		{
			return ::PQexecParams(
				m_conn.get(), query.c_str(), static_cast<int>(size), nullptr, values, sizes, formats, 0
			);
		}
	)};
}

Result Connection::exec(const Query& query, std::error_code& ec)
{
	if (::PQstatus(m_conn.get()) != CONNECTION_OK)
	{
		Log(LOG_WARNING, "postgresql connection lost, reconnecting");
		::PQreset(m_conn.get());
	}

	auto result = send(query);
	if (!result.ok())
	{
		Log(LOG_WARNING, "postgresql query \"%1%\" failed: %2%", query.str(), last_error());
		ec = imagio::Error::backend_error;
	}
	else
		ec.clear();

	return result;
}

Result::Result(::PGresult *result) : m_result{result}
{
}

bool Result::ok() const
{
	auto status = ::PQresultStatus(m_result.get());
	return m_result && (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);
}

std::size_t Result::affected() const
{
	std::string_view count{::PQcmdTuples(m_result.get())};

	std::size_t result{};
	std::from_chars(count.data(), count.data() + count.size(), result);
	return result;
}

std::string_view Result::value(int row, int field) const
{
	return {
		::PQgetvalue(m_result.get(), row, field),
		static_cast<std::size_t>(::PQgetlength(m_result.get(), row, field))
	};
}

ConnectionPool::Lease::Lease(ConnectionPool& pool, std::unique_ptr<Connection>&& conn) :
	m_pool{&pool}, m_conn{std::move(conn)}
{
}

ConnectionPool::Lease::~Lease()
{
	// moved-from leases own nothing
	if (m_conn)
		m_pool->release(std::move(m_conn));
}

ConnectionPool::ConnectionPool(const std::string& connection_string, std::size_t size) : m_size{size}
{
	for (std::size_t i = 0; i < size; ++i)
		m_idle.push_back(std::make_unique<Connection>(connection_string));
}

ConnectionPool::Lease ConnectionPool::acquire()
{
	std::unique_lock lock{m_mutex};
	m_available.wait(lock, [this]{return !m_idle.empty();});

	auto conn = std::move(m_idle.back());
	m_idle.pop_back();
	return Lease{*this, std::move(conn)};
}

void ConnectionPool::release(std::unique_ptr<Connection>&& conn)
{
	{
		std::unique_lock lock{m_mutex};
		m_idle.push_back(std::move(conn));
	}
	m_available.notify_one();
}

std::size_t ConnectionPool::idle() const
{
	std::unique_lock lock{m_mutex};
	return m_idle.size();
}

} // end of namespace imagio::postgres
