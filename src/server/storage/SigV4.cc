/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/12/24.
//

#include "SigV4.hh"

#include "common/crypto/SHA256.hh"
#include "common/util/Escape.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <ctime>
#include <map>
#include <utility>
#include <vector>

namespace imagio::sigv4 {

namespace {

const std::string_view algorithm = "AWS4-HMAC-SHA256";

BufferView as_buffer(std::string_view s)
{
	return {reinterpret_cast<const unsigned char*>(s.data()), s.size()};
}

template <typename StringLike>
std::string to_string(const StringLike& s)
{
	return {s.data(), s.size()};
}

std::string canonical_query(std::string_view query)
{
	std::vector<std::pair<std::string, std::string>> params;
	while (!query.empty())
	{
		auto [param, sep] = split_left(query, "&");
		if (param.empty())
			continue;

		auto eq = param.find('=');
		params.emplace_back(
			url_encode(url_decode(param.substr(0, eq))),
			eq == param.npos ? std::string{} : url_encode(url_decode(param.substr(eq+1)))
		);
	}
	std::sort(params.begin(), params.end());

	std::string result;
	for (auto&& [key, value] : params)
	{
		if (!result.empty())
			result += '&';
		result += key;
		result += '=';
		result += value;
	}
	return result;
}

} // end of local namespace

std::string amz_date(std::chrono::system_clock::time_point tp)
{
	auto time = std::chrono::system_clock::to_time_t(tp);
	std::tm tm{};
	::gmtime_r(&time, &tm);

	char buf[32];
	auto size = std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
	return {buf, size};
}

std::string canonical_request(const HTTPClient::Request& req, std::string& signed_headers)
{
	std::string_view target{req.target().data(), req.target().size()};
	auto qmark = target.find('?');
	auto path  = target.substr(0, qmark);
	auto query = qmark == target.npos ? std::string_view{} : target.substr(qmark+1);

	// sorted by lower-case name, values of repeated headers joined by comma
	std::map<std::string, std::string> headers;
	for (auto&& field : req)
	{
		auto name = boost::algorithm::to_lower_copy(sigv4::to_string(field.name_string()));
		if (name == "authorization" || name == "user-agent")
			continue;

		auto value = boost::algorithm::trim_copy(sigv4::to_string(field.value()));
		auto [it, inserted] = headers.emplace(name, value);
		if (!inserted)
			it->second += "," + value;
	}

	std::string result{sigv4::to_string(req.method_string())};
	result += '\n';
	result += path.empty() ? std::string_view{"/"} : path;
	result += '\n';
	result += canonical_query(query);
	result += '\n';

	signed_headers.clear();
	for (auto&& [name, value] : headers)
	{
		result += name + ":" + value + "\n";

		if (!signed_headers.empty())
			signed_headers += ';';
		signed_headers += name;
	}
	result += '\n';
	result += signed_headers;
	result += '\n';

	auto payload_hash = req.find("x-amz-content-sha256");
	result += payload_hash != req.end() ? sigv4::to_string(payload_hash->value()) : to_hex(evp::sha256(BufferView{req.body()}));
	return result;
}

std::string string_to_sign(std::string_view amz_date, std::string_view scope, std::string_view canonical_request)
{
	std::string result{algorithm};
	result += '\n';
	result += amz_date;
	result += '\n';
	result += scope;
	result += '\n';
	result += to_hex(evp::sha256(canonical_request));
	return result;
}

std::string authorization(const HTTPClient::Request& req, const Credential& cred)
{
	auto date_time = sigv4::to_string(req["x-amz-date"]);
	auto date = date_time.substr(0, 8);
	auto scope = date + "/" + cred.region + "/" + cred.service + "/aws4_request";

	std::string signed_headers;
	auto to_sign = string_to_sign(date_time, scope, canonical_request(req, signed_headers));

	auto key = evp::hmac_sha256(as_buffer("AWS4" + cred.secret_key), date);
	key = evp::hmac_sha256(key, cred.region);
	key = evp::hmac_sha256(key, cred.service);
	key = evp::hmac_sha256(key, "aws4_request");

	return std::string{algorithm} +
		" Credential=" + cred.access_key + "/" + scope +
		",SignedHeaders=" + signed_headers +
		",Signature=" + to_hex(evp::hmac_sha256(key, to_sign));
}

void sign(HTTPClient::Request& req, const Credential& cred, std::chrono::system_clock::time_point now)
{
	req.set("x-amz-date", amz_date(now));
	req.set("x-amz-content-sha256", to_hex(evp::sha256(BufferView{req.body()})));
	req.set(http::field::authorization, authorization(req, cred));
}

} // end of namespace imagio::sigv4
