/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/12/24.
//

#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace imagio {

namespace http = boost::beast::http;

struct Endpoint
{
	bool        tls{false};
	std::string host;
	std::string port;
	std::string base_path;      //!< without trailing slash

	/// value of the Host header
	[[nodiscard]] std::string host_header() const;
};

/// Parses "http://host[:port][/path]" or "https://...". Returns nullopt for anything else.
std::optional<Endpoint> parse_endpoint(std::string_view url);

/// \brief  Blocking HTTP/1.1 client for one endpoint.
/// Every request opens its own connection so the client can be used by many threads.
/// The whole exchange (connect, handshake, write and read) is bounded by the timeout.
class HTTPClient
{
public:
	using Request  = http::request<http::vector_body<unsigned char>>;
	using Response = http::response<http::vector_body<unsigned char>>;

	HTTPClient(Endpoint endpoint, std::chrono::seconds timeout);

	/// Sets the Host header if the request does not have one.
	/// \a ec is set for transport failures only. HTTP error statuses are not failures.
	Response perform(Request& req, boost::system::error_code& ec) const;

	[[nodiscard]] const Endpoint& endpoint() const {return m_endpoint;}
	[[nodiscard]] std::chrono::seconds timeout() const {return m_timeout;}

private:
	Endpoint                                        m_endpoint;
	std::chrono::seconds                            m_timeout;
	std::shared_ptr<boost::asio::ssl::context>      m_ssl;
};

} // end of namespace imagio
