#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tbl::utils
{

inline constexpr char const kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Decodes standard base64 into raw bytes held in a std::string.
// Whitespace is skipped and decoding stops at the first '='.
inline std::optional<std::string> decode_base64(std::string_view input)
{
    static const std::array<int8_t, 256> kLookup = []
    {
        std::array<int8_t, 256> table{};
        table.fill(-1);
        for (int i = 0; kBase64Alphabet[i] != '\0'; ++i)
        {
            table[static_cast<std::uint8_t>(kBase64Alphabet[i])] =
                static_cast<int8_t>(i);
        }
        return table;
    }();

    std::string result;
    result.reserve((input.size() * 3) / 4);
    unsigned buffer = 0;
    int bits_collected = 0;
    for (char ch : input)
    {
        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            continue;
        }
        if (ch == '=')
        {
            break;
        }
        auto value = kLookup[static_cast<std::uint8_t>(ch)];
        if (value < 0)
        {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<unsigned>(value);
        bits_collected += 6;
        if (bits_collected >= 8)
        {
            bits_collected -= 8;
            result.push_back(
                static_cast<char>((buffer >> bits_collected) & 0xFF));
        }
    }
    return result;
}

inline std::string encode_base64(std::string_view data)
{
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    unsigned buffer = 0;
    int bits_collected = 0;
    for (char ch : data)
    {
        buffer = (buffer << 8) | static_cast<std::uint8_t>(ch);
        bits_collected += 8;
        while (bits_collected >= 6)
        {
            bits_collected -= 6;
            encoded.push_back(kBase64Alphabet[(buffer >> bits_collected) & 0x3F]);
        }
    }
    if (bits_collected > 0)
    {
        buffer <<= (6 - bits_collected);
        encoded.push_back(kBase64Alphabet[buffer & 0x3F]);
    }
    while (encoded.size() % 4 != 0)
    {
        encoded.push_back('=');
    }
    return encoded;
}

} // namespace tbl::utils
