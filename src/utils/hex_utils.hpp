#ifndef HEX_UTILS_HPP_
#define HEX_UTILS_HPP_

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

constexpr char GetHex(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    else if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    else if (c >= 'A' && c <= 'F')
        return 10 + (c - 'A');

    return 0;
}

constexpr bool IsHex(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

inline bool IsHexString(std::string_view hex)
{
    if (hex.size() % 2) return false;

    for (char c : hex)
    {
        if (!IsHex(c)) return false;
    }
    return true;
}

template <typename T>
constexpr void Hexlify(char* dest, const T* src, size_t srcSize)
{
    constexpr const char hex[] = "0123456789abcdef";

    // each byte is 2 characters in hex
    for (size_t i = 0; i < srcSize; i++)
    {
        unsigned char val = src[i];

        dest[i * 2] = hex[val / 16];
        dest[i * 2 + 1] = hex[val % 16];
    }
}

inline std::string HexlifyS(std::span<const uint8_t> src)
{
    std::string res;
    res.resize(src.size() * 2);
    Hexlify(res.data(), src.data(), src.size());
    return res;
}

constexpr void Unhexlify(unsigned char* dest, const char* src,
                         const size_t size)
{
    // each byte is 2 characters in hex
    for (size_t i = 0; i < size / 2; i++)
    {
        unsigned char char1 = GetHex(src[i * 2]);
        unsigned char char2 = GetHex(src[i * 2 + 1]);
        dest[i] = char2 + char1 * 16;
    }
}

inline std::vector<uint8_t> UnhexlifyV(std::string_view src)
{
    std::vector<uint8_t> res(src.size() / 2);
    Unhexlify(res.data(), src.data(), src.size());
    return res;
}

#endif
