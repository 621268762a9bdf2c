/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/9/20.
//

#include "EVPWrapper.hh"

#include <boost/algorithm/hex.hpp>

#include <iterator>
#include <stdexcept>

namespace ink {

void HashCTXRelease::operator()(EVP_MD_CTX *ctx) const
{
	::EVP_MD_CTX_free(ctx);
}

HashCTX NewHashCTX()
{
	return HashCTX{::EVP_MD_CTX_new(), HashCTXRelease{}};
}

SHA256::SHA256()
{
	if (!m_ctx || ::EVP_DigestInit_ex(m_ctx.get(), ::EVP_sha256(), nullptr) != 1)
		throw std::runtime_error("EVP_DigestInit_ex() failed");
}

void SHA256::update(const void *data, std::size_t len)
{
	if (::EVP_DigestUpdate(m_ctx.get(), data, len) != 1)
		throw std::runtime_error("EVP_DigestUpdate() failed");
}

std::string SHA256::hex_digest()
{
	unsigned char md[EVP_MAX_MD_SIZE];
	unsigned size{};
	if (::EVP_DigestFinal_ex(m_ctx.get(), md, &size) != 1)
		throw std::runtime_error("EVP_DigestFinal_ex() failed");

	std::string result;
	boost::algorithm::hex_lower(md, md + size, std::back_inserter(result));
	return result;
}

} // end of namespace ink
