// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_CRYPTO_HMAC_SHA256_H
#define SCVERIFY_CRYPTO_HMAC_SHA256_H

#include <stdint.h>
#include <stdlib.h>
#include <string>

/** A one-shot HMAC-SHA256 over OpenSSL. */
class CHMAC_SHA256
{
private:
    std::string key;
    std::string data;

public:
    static const size_t OUTPUT_SIZE = 32;

    CHMAC_SHA256(const unsigned char* key, size_t keylen);
    CHMAC_SHA256& Write(const unsigned char* data, size_t len)
    {
        this->data.append(reinterpret_cast<const char*>(data), len);
        return *this;
    }
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
};

/** Raw (binary) HMAC-SHA256 of msg under key, as a byte string */
std::string HMACSHA256(const std::string& key, const std::string& msg);

#endif // SCVERIFY_CRYPTO_HMAC_SHA256_H
