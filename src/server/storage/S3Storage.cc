/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/12/24.
//

#include "S3Storage.hh"

#include "common/Error.hh"
#include "common/util/Escape.hh"
#include "common/util/Log.hh"
#include "util/Configuration.hh"

#include <boost/exception/info.hpp>

namespace imagio {

namespace {

Endpoint checked_endpoint(const S3StorageSetting& setting)
{
	auto endpoint = parse_endpoint(setting.endpoint);
	if (!endpoint)
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Field{"endpoint"}
			<< Configuration::Message{"invalid S3 endpoint \"" + setting.endpoint + "\""}
		);
	if (setting.bucket.empty())
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Field{"bucket"}
			<< Configuration::Message{"S3 bucket name is empty"}
		);
	return *endpoint;
}

} // end of local namespace

S3Storage::S3Storage(const S3StorageSetting& setting) :
	m_client{checked_endpoint(setting), setting.timeout},
	m_cred{setting.access_key, setting.secret_key, setting.region},
	m_bucket{setting.bucket},
	m_prefix{setting.prefix}
{
}

std::string S3Storage::name() const
{
	return "s3://" + m_bucket + "/" + m_prefix;
}

std::string S3Storage::target(std::string_view key) const
{
	return m_client.endpoint().base_path + "/" + url_encode(m_bucket) + "/" + url_encode(m_prefix + std::string{key}, true);
}

HTTPClient::Response S3Storage::perform(http::verb method, std::string_view key, Blob&& body, std::error_code& ec) const
{
	HTTPClient::Request req{method, target(key), 11};
	req.set(http::field::host, m_client.endpoint().host_header());
	if (method == http::verb::put)
		req.set(http::field::content_type, "application/octet-stream");
	req.body() = std::move(body);
	sigv4::sign(req, m_cred, std::chrono::system_clock::now());

	boost::system::error_code bec;
	auto res = m_client.perform(req, bec);
	if (bec)
		ec = Error::backend_error;
	else
		ec.clear();
	return res;
}

Blob S3Storage::read(std::string_view key, std::error_code& ec) const
{
	auto res = perform(http::verb::get, key, {}, ec);
	if (ec)
		return {};

	if (res.result() == http::status::not_found)
	{
		ec = Error::object_not_exist;
		return {};
	}
	if (res.result() != http::status::ok)
	{
		Log(LOG_WARNING, "S3 GET %1% returned %2%", target(key), res.result_int());
		ec = Error::backend_error;
		return {};
	}
	return std::move(res.body());
}

void S3Storage::write(std::string_view key, BufferView blob, std::error_code& ec) const
{
	auto res = perform(http::verb::put, key, Blob{blob.begin(), blob.end()}, ec);
	if (!ec && res.result() != http::status::ok)
	{
		Log(LOG_WARNING, "S3 PUT %1% returned %2%", target(key), res.result_int());
		ec = Error::backend_error;
	}
}

bool S3Storage::exists(std::string_view key, std::error_code& ec) const
{
	auto res = perform(http::verb::head, key, {}, ec);
	if (ec)
		return false;

	switch (res.result())
	{
		case http::status::ok:          return true;
		case http::status::not_found:   return false;
		default:
			Log(LOG_WARNING, "S3 HEAD %1% returned %2%", target(key), res.result_int());
			ec = Error::backend_error;
			return false;
	}
}

void S3Storage::remove(std::string_view key, std::error_code& ec) const
{
	// DELETE succeeds for absent objects, so check first to report object_not_exist
	if (!exists(key, ec))
	{
		if (!ec)
			ec = Error::object_not_exist;
		return;
	}

	auto res = perform(http::verb::delete_, key, {}, ec);
	if (!ec && res.result() != http::status::no_content && res.result() != http::status::ok)
	{
		Log(LOG_WARNING, "S3 DELETE %1% returned %2%", target(key), res.result_int());
		ec = Error::backend_error;
	}
}

} // end of namespace imagio
