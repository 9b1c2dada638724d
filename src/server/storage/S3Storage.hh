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

#include "StorageOperator.hh"
#include "HTTPClient.hh"
#include "SigV4.hh"

namespace imagio {

/// \brief  Storage in an S3-compatible bucket.
/// Objects are addressed path-style as "<endpoint>/<bucket>/<prefix><key>", which
/// works with AWS as well as self-hosted servers like MinIO. Requests are signed
/// with AWS Signature Version 4.
class S3Storage : public StorageOperator
{
public:
	explicit S3Storage(const S3StorageSetting& setting);

	Blob read(std::string_view key, std::error_code& ec) const override;
	void write(std::string_view key, BufferView blob, std::error_code& ec) const override;
	bool exists(std::string_view key, std::error_code& ec) const override;
	void remove(std::string_view key, std::error_code& ec) const override;

	[[nodiscard]] std::string name() const override;

	/// Request target of the object, URI-encoded.
	[[nodiscard]] std::string target(std::string_view key) const;

private:
	HTTPClient::Response perform(http::verb method, std::string_view key, Blob&& body, std::error_code& ec) const;

private:
	HTTPClient          m_client;
	sigv4::Credential   m_cred;
	std::string         m_bucket;
	std::string         m_prefix;
};

} // end of namespace imagio
