// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_SERIALIZE_H
#define RUMBLE_SERIALIZE_H

#include <algorithm>
#include <ios>
#include <map>
#include <stdint.h>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

static const unsigned int MAX_SIZE = 0x02000000;

enum
{
    // primary actions
    SER_NETWORK         = (1 << 0),
    SER_DISK            = (1 << 1),
    SER_GETHASH         = (1 << 2),
};

static const int CLIENT_VERSION = 10000;

/*
 * Lowest-level serialization: integers are written little-endian with their
 * native width, enums as their underlying type.
 */
template <typename T>
struct is_serializable_int
    : std::integral_constant<bool, std::is_integral<T>::value && !std::is_same<T, bool>::value> {};

template <typename Stream, typename T, typename std::enable_if<is_serializable_int<T>::value, int>::type = 0>
inline void Serialize(Stream& s, T a)
{
    unsigned char buf[sizeof(T)];
    uint64_t v = static_cast<typename std::make_unsigned<T>::type>(a);
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = (unsigned char)(v & 0xff);
        v >>= 8;
    }
    s.write((char*)buf, sizeof(T));
}

template <typename Stream, typename T, typename std::enable_if<is_serializable_int<T>::value, int>::type = 0>
inline void Unserialize(Stream& s, T& a)
{
    unsigned char buf[sizeof(T)];
    s.read((char*)buf, sizeof(T));
    uint64_t v = 0;
    for (size_t i = sizeof(T); i-- > 0;) {
        v = (v << 8) | buf[i];
    }
    a = static_cast<T>(static_cast<typename std::make_unsigned<T>::type>(v));
}

template <typename Stream>
inline void Serialize(Stream& s, bool a)
{
    uint8_t f = a;
    Serialize(s, f);
}

template <typename Stream>
inline void Unserialize(Stream& s, bool& a)
{
    uint8_t f;
    Unserialize(s, f);
    a = f != 0;
}

template <typename Stream, typename T, typename std::enable_if<std::is_enum<T>::value, int>::type = 0>
inline void Serialize(Stream& s, T a)
{
    Serialize(s, static_cast<typename std::underlying_type<T>::type>(a));
}

template <typename Stream, typename T, typename std::enable_if<std::is_enum<T>::value, int>::type = 0>
inline void Unserialize(Stream& s, T& a)
{
    typename std::underlying_type<T>::type v;
    Unserialize(s, v);
    a = static_cast<T>(v);
}

/**
 * Compact Size
 * size <  253        -- 1 byte
 * size <= USHRT_MAX  -- 3 bytes  (253 + 2 bytes)
 * size <= UINT_MAX   -- 5 bytes  (254 + 4 bytes)
 * size >  UINT_MAX   -- 9 bytes  (255 + 8 bytes)
 */
template <typename Stream>
void WriteCompactSize(Stream& os, uint64_t nSize)
{
    if (nSize < 253) {
        Serialize(os, (uint8_t)nSize);
    } else if (nSize <= 0xffffu) {
        Serialize(os, (uint8_t)253);
        Serialize(os, (uint16_t)nSize);
    } else if (nSize <= 0xffffffffu) {
        Serialize(os, (uint8_t)254);
        Serialize(os, (uint32_t)nSize);
    } else {
        Serialize(os, (uint8_t)255);
        Serialize(os, (uint64_t)nSize);
    }
}

template <typename Stream>
uint64_t ReadCompactSize(Stream& is)
{
    uint8_t chSize;
    Unserialize(is, chSize);
    uint64_t nSizeRet = 0;
    if (chSize < 253) {
        nSizeRet = chSize;
    } else if (chSize == 253) {
        uint16_t n;
        Unserialize(is, n);
        nSizeRet = n;
        if (nSizeRet < 253)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else if (chSize == 254) {
        uint32_t n;
        Unserialize(is, n);
        nSizeRet = n;
        if (nSizeRet < 0x10000u)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else {
        uint64_t n;
        Unserialize(is, n);
        nSizeRet = n;
        if (nSizeRet < 0x100000000ULL)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (nSizeRet > (uint64_t)MAX_SIZE)
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    return nSizeRet;
}

/**
 * Forward declarations
 */
template <typename Stream, typename C>
void Serialize(Stream& os, const std::basic_string<C>& str);
template <typename Stream, typename C>
void Unserialize(Stream& is, std::basic_string<C>& str);

template <typename Stream, typename T, typename A>
void Serialize(Stream& os, const std::vector<T, A>& v);
template <typename Stream, typename T, typename A>
void Unserialize(Stream& is, std::vector<T, A>& v);

template <typename Stream, typename K, typename T>
void Serialize(Stream& os, const std::pair<K, T>& item);
template <typename Stream, typename K, typename T>
void Unserialize(Stream& is, std::pair<K, T>& item);

template <typename Stream, typename K, typename T, typename Pred, typename A>
void Serialize(Stream& os, const std::map<K, T, Pred, A>& m);
template <typename Stream, typename K, typename T, typename Pred, typename A>
void Unserialize(Stream& is, std::map<K, T, Pred, A>& m);

/**
 * If none of the specialized versions above matched, default to calling member function.
 */
template <typename Stream, typename T>
inline auto Serialize(Stream& os, const T& a) -> decltype(a.Serialize(os))
{
    a.Serialize(os);
}

template <typename Stream, typename T>
inline auto Unserialize(Stream& is, T& a) -> decltype(a.Unserialize(is))
{
    a.Unserialize(is);
}

/**
 * string
 */
template <typename Stream, typename C>
void Serialize(Stream& os, const std::basic_string<C>& str)
{
    WriteCompactSize(os, str.size());
    if (!str.empty())
        os.write((char*)str.data(), str.size() * sizeof(C));
}

template <typename Stream, typename C>
void Unserialize(Stream& is, std::basic_string<C>& str)
{
    unsigned int nSize = ReadCompactSize(is);
    str.resize(nSize);
    if (nSize != 0)
        is.read((char*)&str[0], nSize * sizeof(C));
}

/**
 * vector
 */
template <typename Stream, typename T, typename A>
void Serialize(Stream& os, const std::vector<T, A>& v)
{
    WriteCompactSize(os, v.size());
    for (const T& item : v)
        Serialize(os, item);
}

template <typename Stream, typename T, typename A>
void Unserialize(Stream& is, std::vector<T, A>& v)
{
    v.clear();
    unsigned int nSize = ReadCompactSize(is);
    v.reserve(std::min<unsigned int>(nSize, 5000));
    for (unsigned int i = 0; i < nSize; i++) {
        T item;
        Unserialize(is, item);
        v.push_back(std::move(item));
    }
}

/**
 * pair
 */
template <typename Stream, typename K, typename T>
void Serialize(Stream& os, const std::pair<K, T>& item)
{
    Serialize(os, item.first);
    Serialize(os, item.second);
}

template <typename Stream, typename K, typename T>
void Unserialize(Stream& is, std::pair<K, T>& item)
{
    Unserialize(is, item.first);
    Unserialize(is, item.second);
}

/**
 * map
 */
template <typename Stream, typename K, typename T, typename Pred, typename A>
void Serialize(Stream& os, const std::map<K, T, Pred, A>& m)
{
    WriteCompactSize(os, m.size());
    for (const auto& entry : m)
        Serialize(os, entry);
}

template <typename Stream, typename K, typename T, typename Pred, typename A>
void Unserialize(Stream& is, std::map<K, T, Pred, A>& m)
{
    m.clear();
    unsigned int nSize = ReadCompactSize(is);
    typename std::map<K, T, Pred, A>::iterator mi = m.begin();
    for (unsigned int i = 0; i < nSize; i++) {
        std::pair<K, T> item;
        Unserialize(is, item);
        mi = m.insert(mi, item);
    }
}

/**
 * Support for SERIALIZE_METHODS and READWRITE macro.
 */
struct CSerActionSerialize
{
    constexpr bool ForRead() const { return false; }
};
struct CSerActionUnserialize
{
    constexpr bool ForRead() const { return true; }
};

template <typename Stream>
void SerializeMany(Stream& s)
{
}

template <typename Stream, typename Arg, typename... Args>
void SerializeMany(Stream& s, const Arg& arg, const Args&... args)
{
    ::Serialize(s, arg);
    ::SerializeMany(s, args...);
}

template <typename Stream>
inline void UnserializeMany(Stream& s)
{
}

template <typename Stream, typename Arg, typename... Args>
inline void UnserializeMany(Stream& s, Arg& arg, Args&... args)
{
    ::Unserialize(s, arg);
    ::UnserializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionSerialize ser_action, const Args&... args)
{
    ::SerializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionUnserialize ser_action, Args&... args)
{
    ::UnserializeMany(s, args...);
}

#define READWRITE(...) (::SerReadWriteMany(s, ser_action, __VA_ARGS__))

/**
 * Implement the Serialize and Unserialize methods by delegating to a single
 * templated static method that takes the to-be-(de)serialized object as a
 * parameter. The body follows the macro and uses READWRITE on obj.<field>.
 */
#define SERIALIZE_METHODS(cls, obj)                                                       \
    template <typename Stream>                                                            \
    void Serialize(Stream& s) const                                                       \
    {                                                                                     \
        SerializationOps(*this, s, CSerActionSerialize());                                \
    }                                                                                     \
    template <typename Stream>                                                            \
    void Unserialize(Stream& s)                                                           \
    {                                                                                     \
        SerializationOps(*this, s, CSerActionUnserialize());                              \
    }                                                                                     \
    template <typename Stream, typename Type, typename Operation>                         \
    static inline void SerializationOps(Type& obj, Stream& s, Operation ser_action)

#endif // RUMBLE_SERIALIZE_H
