// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_HASH_H
#define RUMBLE_HASH_H

#include "serialize.h"
#include "uint256.h"

#include <openssl/evp.h>

#include <string>

/**
 * CHashWriter - serialize objects straight into a double-SHA256
 *
 * Used for round snapshot hashes, seed commitments and the per-participant
 * random factor. SHA-256 is provided by OpenSSL's EVP interface.
 */
class CHashWriter
{
private:
    EVP_MD_CTX* ctx;

    const int nType;
    const int nVersion;

public:
    CHashWriter(int nTypeIn, int nVersionIn);
    ~CHashWriter();

    CHashWriter(const CHashWriter&) = delete;
    CHashWriter& operator=(const CHashWriter&) = delete;

    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void write(const char* pch, size_t size);

    /** Compute the double-SHA256 hash of all data written to this object.
     *  Invalidates this object. */
    uint256 GetHash();

    template <typename T>
    CHashWriter& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

/** Compute the 256-bit hash of an object's serialization. */
template <typename T>
uint256 SerializeHash(const T& obj, int nType = SER_GETHASH, int nVersion = CLIENT_VERSION)
{
    CHashWriter ss(nType, nVersion);
    ss << obj;
    return ss.GetHash();
}

#endif // RUMBLE_HASH_H
