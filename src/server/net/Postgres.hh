/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 25/8/2020.
//

#pragma once

#include "common/util/Exception.hh"

#include <libpq-fe.h>

#include <condition_variable>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace imagio::postgres {

struct Error : virtual Exception {};
using Message = boost::error_info<struct tag_pg_message, std::string>;

class Result
{
public:
	explicit Result(::PGresult* result = nullptr);
	Result(Result&& r) = default;
	Result(const Result&) = delete;
	Result& operator=(Result&&) = default;
	Result& operator=(const Result&) = delete;
	~Result() = default;

	[[nodiscard]] auto tuples() const {return ::PQntuples(m_result.get());}
	[[nodiscard]] bool ok() const;

	/// Number of rows affected by INSERT, UPDATE or DELETE
	[[nodiscard]] std::size_t affected() const;

	[[nodiscard]] std::string_view value(int row, int field) const;

private:
	struct DestroyResult
	{
		void operator()(::PGresult *result) const
		{
			if (result)
				::PQclear(result);
		}
	};
	std::unique_ptr<::PGresult, DestroyResult> m_result;
};

class Query
{
public:
	template <typename String, typename... Args>
	explicit Query(String&& query, const Args& ... args) : m_query{std::forward<String>(query)}
	{
		add(args...);
	}

	template <typename Function>
	auto get(Function&& func) const
	{
		std::vector<const char*> values;
		std::vector<int> sizes;
		std::vector<int> formats;

		for (auto& arg : m_args)
		{
			values.push_back(arg.value.data());
			sizes.push_back(static_cast<int>(arg.value.size()));
			formats.push_back(arg.is_text ? 0 : 1);
		}
		return func(m_query, m_args.size(), values.data(), sizes.data(), formats.data());
	}

	[[nodiscard]] const std::string& str() const {return m_query;}

private:
	void add()
	{
	}

	template <typename FirstArg, typename ... NextArgs>
	void add(const FirstArg& first, const NextArgs& ... next)
	{
		auto& arg = m_args.emplace_back();

		// special handling for const char*
		if constexpr (std::is_same_v<std::decay_t<decltype(first)>, const char*>)
		{
			arg.value   = first;
			arg.is_text = true;
		}

		// for string, string_view, Blob etc
		else
		{
			arg.value.assign(
				reinterpret_cast<const char*>(std::data(first)),
				std::size(first) * sizeof(*std::data(first))
			);

			if constexpr (!std::is_same_v<std::decay_t<decltype(std::data(first))>, const char*>)
				arg.is_text = false;
		}

		add(next...);
	}

private:
	std::string m_query;
	struct Arg
	{
		std::string value;
		bool        is_text{true};
	};
	std::vector<Arg>  m_args;
};

/// \brief  Blocking connection to a PostgreSQL server.
/// A connection must not be used by more than one thread at the same time.
/// Use ConnectionPool to share connections among threads.
class Connection
{
public:
	explicit Connection(const std::string& connection_string);
	~Connection() = default;

	Connection(Connection&&) = default;
	Connection(const Connection&) = delete;
	Connection& operator=(Connection&&) = default;
	Connection& operator=(const Connection&) = delete;

	[[nodiscard]] std::string_view last_error() const;

	/// Runs the query and waits for its result. Failures are logged and reported
	/// as Error::backend_error. A broken connection is reset once before giving up.
	Result exec(const Query& query, std::error_code& ec);

	template <typename... Args>
	Result exec(std::error_code& ec, const char *query_string, const Args& ... args)
	{
		return exec(Query{query_string, args...}, ec);
	}

private:
	Result send(const Query& query);

private:
	struct CloseConnection
	{
		void operator()(::PGconn* conn) const
		{
			::PQfinish(conn);
		}
	};
	std::unique_ptr<::PGconn, CloseConnection>  m_conn;
};

/// \brief  Fixed number of connections shared by many threads.
/// acquire() blocks until a connection is available.
class ConnectionPool
{
public:
	class Lease
	{
	public:
		Lease(ConnectionPool& pool, std::unique_ptr<Connection>&& conn);
		Lease(Lease&&) = default;
		Lease(const Lease&) = delete;
		Lease& operator=(Lease&&) = delete;
		Lease& operator=(const Lease&) = delete;
		~Lease();

		Connection* operator->() const {return m_conn.get();}
		Connection& operator*() const {return *m_conn;}

	private:
		ConnectionPool*             m_pool;
		std::unique_ptr<Connection> m_conn;
	};

public:
	/// Opens all connections. Throws postgres::Error if any of them fails.
	ConnectionPool(const std::string& connection_string, std::size_t size);

	ConnectionPool(ConnectionPool&&) = delete;
	ConnectionPool(const ConnectionPool&) = delete;
	ConnectionPool& operator=(ConnectionPool&&) = delete;
	ConnectionPool& operator=(const ConnectionPool&) = delete;

	Lease acquire();

	[[nodiscard]] std::size_t size() const {return m_size;}
	[[nodiscard]] std::size_t idle() const;

private:
	void release(std::unique_ptr<Connection>&& conn);

private:
	std::size_t                                 m_size;
	mutable std::mutex                          m_mutex;
	std::condition_variable                     m_available;
	std::vector<std::unique_ptr<Connection>>    m_idle;
};

} // end of namespace imagio::postgres
