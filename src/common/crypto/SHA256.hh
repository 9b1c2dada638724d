/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/28/18.
//

#pragma once

#include "common/util/BufferView.hh"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <string_view>

namespace imagio {

struct HashCTXRelease
{
	void operator()(EVP_MD_CTX *ctx) const;
};
using HashCTX = std::unique_ptr<EVP_MD_CTX, HashCTXRelease>;

HashCTX NewHashCTX();

namespace evp {

/// Incremental SHA-256 over the OpenSSL EVP interface
class SHA256
{
public:
	static const std::size_t size = 32;
	using Digest = std::array<unsigned char, size>;

	SHA256();
	SHA256(SHA256&&) = default;
	SHA256(const SHA256&) = delete;
	~SHA256() = default;

	SHA256& operator=(SHA256&&) = default;
	SHA256& operator=(const SHA256&) = delete;

	void update(const void *data, std::size_t len);
	Digest finalize();

private:
	HashCTX m_ctx;
};

SHA256::Digest sha256(BufferView data);
SHA256::Digest sha256(std::string_view data);
SHA256::Digest hmac_sha256(BufferView key, std::string_view data);

}} // end of namespace imagio::evp
