/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 1/28/18.
//

#include "SHA256.hh"

#include <openssl/err.h>
#include <openssl/hmac.h>

#include <system_error>

namespace imagio {

void HashCTXRelease::operator()(EVP_MD_CTX *ctx) const
{
	// This is a macro, so can't take its address and put it to unique_ptr
	::EVP_MD_CTX_free(ctx);
}

HashCTX NewHashCTX()
{
	return HashCTX{::EVP_MD_CTX_new(), HashCTXRelease{}};
}

namespace evp {
namespace {

void check(int openssl_result)
{
	if (openssl_result != 1)
		throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());
}

} // end of local namespace

SHA256::SHA256() : m_ctx{NewHashCTX()}
{
	if (!m_ctx)
		throw std::bad_alloc();
	check(::EVP_DigestInit_ex(m_ctx.get(), ::EVP_sha256(), nullptr));
}

void SHA256::update(const void *data, std::size_t len)
{
	check(::EVP_DigestUpdate(m_ctx.get(), data, len));
}

SHA256::Digest SHA256::finalize()
{
	Digest result{};
	unsigned int len = static_cast<unsigned int>(result.size());
	check(::EVP_DigestFinal_ex(m_ctx.get(), result.data(), &len));
	return result;
}

SHA256::Digest sha256(BufferView data)
{
	SHA256 hash;
	hash.update(data.data(), data.size());
	return hash.finalize();
}

SHA256::Digest sha256(std::string_view data)
{
	SHA256 hash;
	hash.update(data.data(), data.size());
	return hash.finalize();
}

SHA256::Digest hmac_sha256(BufferView key, std::string_view data)
{
	SHA256::Digest result{};
	unsigned int len = static_cast<unsigned int>(result.size());
	if (!::HMAC(
		::EVP_sha256(),
		key.data(), static_cast<int>(key.size()),
		reinterpret_cast<const unsigned char*>(data.data()), data.size(),
		result.data(), &len
	))
		throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());

	return result;
}

}} // end of namespace imagio::evp
