// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_STREAMS_H
#define BOUNTY_STREAMS_H

#include "serialize.h"

#include <algorithm>
#include <assert.h>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

/** Double ended buffer combining vector and stream-like interfaces.
 *
 * >> and << read and write unformatted data using the above serialization templates.
 */
class CDataStream
{
protected:
    typedef std::vector<char> vector_type;
    vector_type vch;
    unsigned int nReadPos{0};

    int nType;
    int nVersion;

public:
    typedef vector_type::size_type size_type;
    typedef vector_type::const_iterator const_iterator;

    explicit CDataStream(int nTypeIn, int nVersionIn) : nType{nTypeIn}, nVersion{nVersionIn} {}

    CDataStream(const char* pbegin, const char* pend, int nTypeIn, int nVersionIn)
        : vch(pbegin, pend), nType{nTypeIn}, nVersion{nVersionIn} {}

    template <typename... Args>
    CDataStream(int nTypeIn, int nVersionIn, const Args&... args) : nType{nTypeIn}, nVersion{nVersionIn}
    {
        ::SerializeMany(*this, args...);
    }

    std::string str() const
    {
        return (std::string(begin(), end()));
    }

    //
    // Vector subset
    //
    const_iterator begin() const { return vch.begin() + nReadPos; }
    const_iterator end() const { return vch.end(); }
    size_type size() const { return vch.size() - nReadPos; }
    bool empty() const { return vch.size() == nReadPos; }
    void resize(size_type n, char c = 0) { vch.resize(n + nReadPos, c); }
    void reserve(size_type n) { vch.reserve(n + nReadPos); }
    char* data() { return vch.data() + nReadPos; }
    const char* data() const { return vch.data() + nReadPos; }

    void clear()
    {
        vch.clear();
        nReadPos = 0;
    }

    bool eof() const { return size() == 0; }
    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void read(char* pch, size_t nSize)
    {
        if (nSize == 0) return;

        // Read from the beginning of the buffer
        unsigned int nReadPosNext = nReadPos + nSize;
        if (nReadPosNext > vch.size()) {
            throw std::ios_base::failure("CDataStream::read(): end of data");
        }
        memcpy(pch, &vch[nReadPos], nSize);
        if (nReadPosNext == vch.size()) {
            nReadPos = 0;
            vch.clear();
            return;
        }
        nReadPos = nReadPosNext;
    }

    void write(const char* pch, size_t nSize)
    {
        // Write to the end of the buffer
        vch.insert(vch.end(), pch, pch + nSize);
    }

    template<typename T>
    CDataStream& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }

    template<typename T>
    CDataStream& operator>>(T&& obj)
    {
        // Unserialize from this stream
        ::Unserialize(*this, obj);
        return (*this);
    }
};

#endif // BOUNTY_STREAMS_H
