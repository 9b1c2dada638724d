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

#include "HTTPClient.hh"

#include <chrono>
#include <string>
#include <string_view>

namespace imagio::sigv4 {

struct Credential
{
	std::string access_key;
	std::string secret_key;
	std::string region;
	std::string service{"s3"};
};

/// "YYYYMMDDTHHMMSSZ"
std::string amz_date(std::chrono::system_clock::time_point tp);

/// Canonical request of AWS Signature Version 4. All headers except
/// Authorization and User-Agent are signed.
std::string canonical_request(const HTTPClient::Request& req, std::string& signed_headers);
std::string string_to_sign(std::string_view amz_date, std::string_view scope, std::string_view canonical_request);

/// Value of the Authorization header. The request must already carry its
/// Host, X-Amz-Date and X-Amz-Content-Sha256 headers.
std::string authorization(const HTTPClient::Request& req, const Credential& cred);

/// Adds X-Amz-Date, X-Amz-Content-Sha256 and Authorization to the request.
void sign(HTTPClient::Request& req, const Credential& cred, std::chrono::system_clock::time_point now);

} // end of namespace imagio::sigv4
