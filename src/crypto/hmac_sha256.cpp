// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/hmac_sha256.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

CHMAC_SHA256::CHMAC_SHA256(const unsigned char* keyIn, size_t keylen)
    : key(reinterpret_cast<const char*>(keyIn), keylen)
{
}

void CHMAC_SHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash, &len) || len != OUTPUT_SIZE) {
        throw std::runtime_error("CHMAC_SHA256: HMAC failed");
    }
}

std::string HMACSHA256(const std::string& key, const std::string& msg)
{
    unsigned char out[CHMAC_SHA256::OUTPUT_SIZE];
    CHMAC_SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size())
        .Write(reinterpret_cast<const unsigned char*>(msg.data()), msg.size())
        .Finalize(out);
    return std::string(reinterpret_cast<const char*>(out), CHMAC_SHA256::OUTPUT_SIZE);
}
