#include "auth/Session.hpp"

#include "auth/Token.hpp"
#include "utils/Base64.hpp"
#include "utils/Endpoint.hpp"

#include <utility>

namespace tbl::auth
{

namespace
{
std::string_view trim(std::string_view value)
{
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}
} // namespace

char const *describe(AuthFailure failure) noexcept
{
    switch (failure)
    {
    case AuthFailure::MissingCredential:
        return "missing credential";
    case AuthFailure::InvalidCredential:
        return "invalid credential";
    case AuthFailure::BasicAuthRequired:
        return "basic auth required";
    }
    return "unauthorized";
}

SessionGate::SessionGate(std::string token,
                         std::optional<StaticCredential> basic)
    : token_(std::move(token)), basic_(std::move(basic))
{
}

std::optional<AuthFailure>
SessionGate::redeem(std::optional<std::string_view> presented) const
{
    if (!presented)
    {
        return AuthFailure::MissingCredential;
    }
    if (!token_matches(*presented, token_))
    {
        return AuthFailure::InvalidCredential;
    }
    return std::nullopt;
}

std::optional<AuthFailure> SessionGate::authorize(
    std::optional<std::string_view> cookie_header,
    std::optional<std::string_view> authorization_header) const
{
    if (basic_ && !basic_matches(authorization_header))
    {
        return AuthFailure::BasicAuthRequired;
    }
    std::optional<std::string> cookie;
    if (cookie_header)
    {
        cookie = cookie_value(*cookie_header, kCookieName);
    }
    if (!cookie)
    {
        return AuthFailure::MissingCredential;
    }
    if (!token_matches(*cookie, token_))
    {
        return AuthFailure::InvalidCredential;
    }
    return std::nullopt;
}

bool SessionGate::basic_matches(std::optional<std::string_view> header) const
{
    if (!header)
    {
        return false;
    }
    auto credentials = decode_basic_credentials(*header);
    if (!credentials)
    {
        return false;
    }
    // Evaluate both halves so a wrong user costs the same as a wrong password.
    bool user_ok = token_matches(credentials->first, basic_->user);
    bool pass_ok = token_matches(credentials->second, basic_->password);
    return user_ok && pass_ok;
}

std::optional<std::string> cookie_value(std::string_view cookie_header,
                                        std::string_view name)
{
    std::string_view remaining = cookie_header;
    while (!remaining.empty())
    {
        auto semicolon = remaining.find(';');
        auto part = trim(remaining.substr(0, semicolon));
        auto eq = part.find('=');
        if (eq != std::string_view::npos && part.substr(0, eq) == name)
        {
            return std::string(part.substr(eq + 1));
        }
        if (semicolon == std::string_view::npos)
        {
            break;
        }
        remaining.remove_prefix(semicolon + 1);
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, std::string>>
decode_basic_credentials(std::string_view header)
{
    static constexpr std::string_view prefix = "Basic ";
    header = trim(header);
    if (!header.starts_with(prefix))
    {
        return std::nullopt;
    }
    auto decoded = tbl::utils::decode_base64(header.substr(prefix.size()));
    if (!decoded)
    {
        return std::nullopt;
    }
    auto colon = decoded->find(':');
    if (colon == std::string::npos)
    {
        return std::make_pair(*decoded, std::string());
    }
    return std::make_pair(decoded->substr(0, colon),
                          decoded->substr(colon + 1));
}

std::string bootstrap_link(bool secure, std::string_view host,
                           std::uint16_t port, std::string_view token)
{
    return tbl::net::format_url(secure, host, port) + kBootstrapPath +
           "?token=" + std::string(token);
}

std::string session_cookie(std::string_view token)
{
    return std::string(kCookieName) + "=" + std::string(token) +
           "; Path=/; SameSite=Lax";
}

} // namespace tbl::auth
