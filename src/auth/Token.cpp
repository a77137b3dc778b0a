#include "auth/Token.hpp"

#include "utils/Errors.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdio>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace tbl::auth
{

namespace
{

bool fill_from_urandom(std::uint8_t *buffer, std::size_t length)
{
    std::FILE *fp = std::fopen("/dev/urandom", "rb");
    if (fp == nullptr)
    {
        return false;
    }
    auto read = std::fread(buffer, 1, length, fp);
    std::fclose(fp);
    return read == length;
}

bool fill_secure_random(std::uint8_t *buffer, std::size_t length)
{
#if defined(__linux__)
    std::size_t filled = 0;
    while (filled < length)
    {
        auto got = getrandom(buffer + filled, length - filled, 0);
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return fill_from_urandom(buffer, length);
        }
        filled += static_cast<std::size_t>(got);
    }
    return true;
#else
    return fill_from_urandom(buffer, length);
#endif
}

} // namespace

std::string generate_token()
{
    static constexpr char kHexDigits[] = "0123456789abcdef";
    std::array<std::uint8_t, kTokenBytes> bytes{};
    if (!fill_secure_random(bytes.data(), bytes.size()))
    {
        throw LaunchError("no secure random source available for the session "
                          "token");
    }
    std::string token;
    token.reserve(kTokenHexLength);
    for (auto byte : bytes)
    {
        token.push_back(kHexDigits[byte >> 4]);
        token.push_back(kHexDigits[byte & 0xF]);
    }
    return token;
}

bool token_matches(std::string_view presented, std::string_view actual) noexcept
{
    // Token length is public; only the content needs to be compared without
    // short-circuiting.
    if (presented.size() != actual.size() || actual.empty())
    {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < actual.size(); ++i)
    {
        diff |= static_cast<unsigned char>(presented[i] ^ actual[i]);
    }
    return diff == 0;
}

bool is_well_formed_token(std::string_view token) noexcept
{
    if (token.size() != kTokenHexLength)
    {
        return false;
    }
    for (char ch : token)
    {
        bool digit = ch >= '0' && ch <= '9';
        bool lower_hex = ch >= 'a' && ch <= 'f';
        if (!digit && !lower_hex)
        {
            return false;
        }
    }
    return true;
}

} // namespace tbl::auth
