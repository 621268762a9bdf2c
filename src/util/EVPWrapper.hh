/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the inkwell
    distribution for more details.
*/

//
// Created by nestal on 10/9/20.
//

#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>

namespace ink {

struct HashCTXRelease
{
	void operator()(EVP_MD_CTX *ctx) const;
};
using HashCTX = std::unique_ptr<EVP_MD_CTX, HashCTXRelease>;

HashCTX NewHashCTX();

/// Incremental SHA-256 producing a lower-case hex digest.
class SHA256
{
public:
	SHA256();

	void update(const void *data, std::size_t len);
	std::string hex_digest();

private:
	HashCTX m_ctx{NewHashCTX()};
};

} // end of namespace ink
