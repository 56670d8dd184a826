// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_HASH_H
#define BOUNTY_HASH_H

#include "serialize.h"
#include "uint256.h"

#include <openssl/sha.h>


/** A hasher class for SHA256d (double SHA-256). */
class CHash256
{
private:
    SHA256_CTX ctx;

public:
    static const size_t OUTPUT_SIZE = SHA256_DIGEST_LENGTH;

    CHash256() { Reset(); }

    void Finalize(unsigned char hash[OUTPUT_SIZE])
    {
        unsigned char buf[OUTPUT_SIZE];
        SHA256_Final(buf, &ctx);
        SHA256(buf, OUTPUT_SIZE, hash);
    }

    CHash256& Write(const unsigned char* data, size_t len)
    {
        SHA256_Update(&ctx, data, len);
        return *this;
    }

    CHash256& Reset()
    {
        SHA256_Init(&ctx);
        return *this;
    }
};

/** Compute the 256-bit hash of a byte range. */
template<typename T1>
inline uint256 Hash(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256().Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0]))
              .Finalize((unsigned char*)&result);
    return result;
}

/** A writer stream (for serialization) that computes a 256-bit hash. */
class CHashWriter
{
private:
    CHash256 ctx;

    const int nType;
    const int nVersion;

public:
    CHashWriter(int nTypeIn, int nVersionIn) : nType(nTypeIn), nVersion(nVersionIn) {}

    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void write(const char* pch, size_t size)
    {
        ctx.Write((const unsigned char*)pch, size);
    }

    // invalidates the object
    uint256 GetHash()
    {
        uint256 result;
        ctx.Finalize((unsigned char*)&result);
        return result;
    }

    template<typename T>
    CHashWriter& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

/** Compute the 256-bit hash of an object's serialization. */
template<typename T>
uint256 SerializeHash(const T& obj, int nType = SER_GETHASH, int nVersion = 0)
{
    CHashWriter ss(nType, nVersion);
    ss << obj;
    return ss.GetHash();
}

#endif // BOUNTY_HASH_H
