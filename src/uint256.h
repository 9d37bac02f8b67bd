// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_UINT256_H
#define RUMBLE_UINT256_H

#include <cstring>
#include <stdint.h>
#include <string>
#include <vector>

/** 256-bit opaque blob. Used for round ids, seed commitments and hashes. */
class uint256
{
public:
    static constexpr int WIDTH = 32;

private:
    uint8_t data[WIDTH];

public:
    uint256()
    {
        memset(data, 0, sizeof(data));
    }

    explicit uint256(const std::vector<unsigned char>& vch);

    bool IsNull() const
    {
        for (int i = 0; i < WIDTH; i++)
            if (data[i] != 0)
                return false;
        return true;
    }

    void SetNull()
    {
        memset(data, 0, sizeof(data));
    }

    inline int Compare(const uint256& other) const { return memcmp(data, other.data, sizeof(data)); }

    friend inline bool operator==(const uint256& a, const uint256& b) { return a.Compare(b) == 0; }
    friend inline bool operator!=(const uint256& a, const uint256& b) { return a.Compare(b) != 0; }
    friend inline bool operator<(const uint256& a, const uint256& b) { return a.Compare(b) < 0; }

    /** Hex in reversed byte order, as displayed by the RPC layer */
    std::string GetHex() const;
    void SetHex(const std::string& str);
    std::string ToString() const;

    unsigned char* begin() { return &data[0]; }
    unsigned char* end() { return &data[WIDTH]; }
    const unsigned char* begin() const { return &data[0]; }
    const unsigned char* end() const { return &data[WIDTH]; }

    unsigned int size() const { return sizeof(data); }

    /** Little-endian 64-bit word at position pos (0..3) */
    uint64_t GetUint64(int pos) const
    {
        const uint8_t* ptr = data + pos * 8;
        return ((uint64_t)ptr[0]) |
               ((uint64_t)ptr[1]) << 8 |
               ((uint64_t)ptr[2]) << 16 |
               ((uint64_t)ptr[3]) << 24 |
               ((uint64_t)ptr[4]) << 32 |
               ((uint64_t)ptr[5]) << 40 |
               ((uint64_t)ptr[6]) << 48 |
               ((uint64_t)ptr[7]) << 56;
    }

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        s.write((char*)data, sizeof(data));
    }

    template <typename Stream>
    void Unserialize(Stream& s)
    {
        s.read((char*)data, sizeof(data));
    }
};

/* uint256 from const char *.
 * This is a separate function because the constructor uint256(const char*) can result
 * in dangerously catching uint256(0).
 */
inline uint256 uint256S(const std::string& str)
{
    uint256 rv;
    rv.SetHex(str);
    return rv;
}

#endif // RUMBLE_UINT256_H
