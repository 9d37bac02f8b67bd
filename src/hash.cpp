// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

#include <stdexcept>

CHashWriter::CHashWriter(int nTypeIn, int nVersionIn) : ctx(EVP_MD_CTX_new()), nType(nTypeIn), nVersion(nVersionIn)
{
    if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("CHashWriter: SHA-256 context initialization failed");
    }
}

CHashWriter::~CHashWriter()
{
    EVP_MD_CTX_free(ctx);
}

void CHashWriter::write(const char* pch, size_t size)
{
    if (EVP_DigestUpdate(ctx, pch, size) != 1) {
        throw std::runtime_error("CHashWriter: SHA-256 update failed");
    }
}

uint256 CHashWriter::GetHash()
{
    unsigned char first[EVP_MAX_MD_SIZE];
    unsigned int nFirst = 0;
    if (EVP_DigestFinal_ex(ctx, first, &nFirst) != 1) {
        throw std::runtime_error("CHashWriter: SHA-256 finalization failed");
    }

    uint256 result;
    unsigned int nSecond = 0;
    if (EVP_Digest(first, nFirst, result.begin(), &nSecond, EVP_sha256(), nullptr) != 1 || nSecond != result.size()) {
        throw std::runtime_error("CHashWriter: SHA-256 second round failed");
    }
    return result;
}
