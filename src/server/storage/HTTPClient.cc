/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/12/24.
//

#include "HTTPClient.hh"

#include "common/util/Log.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include <limits>
#include <type_traits>

namespace imagio {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

namespace {

using Parser = http::response_parser<http::vector_body<unsigned char>>;

// One request/response exchange over an unconnected stream.
// All operations are asynchronous so that the timeout applies to them, including name resolution.
template <typename Stream>
class Exchange
{
public:
	static constexpr bool is_tls = !std::is_same_v<Stream, beast::tcp_stream>;

	Exchange(Stream& stream, tcp::resolver& resolver, HTTPClient::Request& req, Parser& parser, std::chrono::seconds timeout) :
		m_stream{stream}, m_resolver{resolver}, m_deadline{resolver.get_executor()},
		m_req{req}, m_parser{parser}, m_timeout{timeout}
	{
	}

	void run(const std::string& host, const std::string& port)
	{
		// tcp_stream::expires_after() does not cover the resolver
		m_deadline.expires_after(m_timeout);
		m_deadline.async_wait([this](auto ec)
		{
			if (!ec)
			{
				m_resolve_timed_out = true;
				m_resolver.cancel();
			}
		});

		m_resolver.async_resolve(
			host, port,
			[this](auto ec, auto&& results){on_resolve(ec, std::move(results));}
		);
	}

	[[nodiscard]] boost::system::error_code result() const {return m_ec;}

private:
	void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results)
	{
		m_deadline.cancel();
		if (m_resolve_timed_out)
			ec = boost::asio::error::timed_out;
		if (ec)
			return fail(ec, "resolve");

		beast::get_lowest_layer(m_stream).expires_after(m_timeout);
		beast::get_lowest_layer(m_stream).async_connect(
			results,
			[this](auto ec, auto&&){on_connect(ec);}
		);
	}

	void on_connect(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "connect");

		if constexpr (is_tls)
		{
			m_stream.async_handshake(
				boost::asio::ssl::stream_base::client,
				[this](auto ec){on_handshake(ec);}
			);
		}
		else
			on_handshake(ec);
	}

	void on_handshake(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "handshake");

		http::async_write(m_stream, m_req, [this](auto ec, auto){on_write(ec);});
	}

	void on_write(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "write");

		http::async_read(m_stream, m_buffer, m_parser, [this](auto ec, auto){on_read(ec);});
	}

	void on_read(boost::system::error_code ec)
	{
		if (ec)
			return fail(ec, "read");

		// the connection is closed when the stream is destroyed
		beast::get_lowest_layer(m_stream).expires_never();
	}

	void fail(boost::system::error_code ec, const char *what)
	{
		Log(LOG_WARNING, "HTTP %1% %2%: %3% error: %4%", m_req.method_string(), m_req.target(), what, ec.message());
		m_ec = ec;
	}

private:
	Stream&                     m_stream;
	tcp::resolver&              m_resolver;
	boost::asio::steady_timer   m_deadline;
	bool                        m_resolve_timed_out{false};
	HTTPClient::Request&        m_req;
	Parser&                     m_parser;
	std::chrono::seconds        m_timeout;
	beast::flat_buffer          m_buffer;
	boost::system::error_code   m_ec;
};

} // end of local namespace

std::string Endpoint::host_header() const
{
	return (port == (tls ? "443" : "80")) ? host : host + ":" + port;
}

std::optional<Endpoint> parse_endpoint(std::string_view url)
{
	Endpoint result;
	if (url.starts_with("https://"))
	{
		result.tls = true;
		url.remove_prefix(8);
	}
	else if (url.starts_with("http://"))
		url.remove_prefix(7);
	else
		return std::nullopt;

	auto slash = url.find('/');
	auto authority = url.substr(0, slash);
	if (slash != url.npos)
	{
		auto path = url.substr(slash);
		while (path.ends_with('/'))
			path.remove_suffix(1);
		result.base_path = path;
	}

	auto colon = authority.rfind(':');
	if (colon != authority.npos)
	{
		result.host = authority.substr(0, colon);
		result.port = authority.substr(colon + 1);
		if (result.port.empty() || result.port.find_first_not_of("0123456789") != result.port.npos)
			return std::nullopt;
	}
	else
	{
		result.host = authority;
		result.port = result.tls ? "443" : "80";
	}

	if (result.host.empty())
		return std::nullopt;

	return result;
}

HTTPClient::HTTPClient(Endpoint endpoint, std::chrono::seconds timeout) :
	m_endpoint{std::move(endpoint)}, m_timeout{timeout}
{
	if (m_endpoint.tls)
	{
		m_ssl = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
		m_ssl->set_default_verify_paths();
		m_ssl->set_verify_mode(boost::asio::ssl::verify_peer);
	}
}

HTTPClient::Response HTTPClient::perform(Request& req, boost::system::error_code& ec) const
{
	if (req.find(http::field::host) == req.end())
		req.set(http::field::host, m_endpoint.host_header());
	req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
	req.prepare_payload();

	Parser parser;
	parser.body_limit(std::numeric_limits<std::uint64_t>::max());

	// responses to HEAD carry a Content-Length but no body
	if (req.method() == http::verb::head)
		parser.skip(true);

	boost::asio::io_context ioc;
	tcp::resolver resolver{ioc};

	if (m_endpoint.tls)
	{
		beast::ssl_stream<beast::tcp_stream> stream{ioc, *m_ssl};

		// Set SNI Hostname (many hosts need this to handshake successfully)
		if (!SSL_set_tlsext_host_name(stream.native_handle(), m_endpoint.host.c_str()))
		{
			ec.assign(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category());
			Log(LOG_WARNING, "SSL_set_tlsext_host_name() failed: %1%", ec.message());
			return {};
		}
		stream.set_verify_callback(boost::asio::ssl::host_name_verification(m_endpoint.host));

		Exchange exchange{stream, resolver, req, parser, m_timeout};
		exchange.run(m_endpoint.host, m_endpoint.port);
		ioc.run();
		ec = exchange.result();
	}
	else
	{
		beast::tcp_stream stream{ioc};

		Exchange exchange{stream, resolver, req, parser, m_timeout};
		exchange.run(m_endpoint.host, m_endpoint.port);
		ioc.run();
		ec = exchange.result();
	}

	return ec ? Response{} : parser.release();
}

} // end of namespace imagio
