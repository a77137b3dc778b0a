#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tbl::auth
{

inline constexpr char kCookieName[] = "tbl_token";
inline constexpr char kBasicRealm[] = "tbl";
inline constexpr char kBootstrapPath[] = "/bootstrap";

enum class AuthFailure
{
    MissingCredential,
    InvalidCredential,
    BasicAuthRequired,
};

char const *describe(AuthFailure failure) noexcept;

struct StaticCredential
{
    std::string user;
    std::string password;
};

// Stateless session check: the per-run token is the session. There is no
// server-side session table; a restart (new token) logs everyone out.
class SessionGate
{
  public:
    SessionGate(std::string token,
                std::optional<StaticCredential> basic = std::nullopt);

    std::string const &token() const noexcept { return token_; }
    bool has_static_credential() const noexcept { return basic_.has_value(); }

    // Bootstrap link redemption. nullopt means the presented value matches
    // and a durable credential may be issued. An empty value counts as
    // presented.
    std::optional<AuthFailure>
    redeem(std::optional<std::string_view> presented) const;

    // Gate for protected routes. The Basic layer is checked first when
    // configured; both layers must pass.
    std::optional<AuthFailure>
    authorize(std::optional<std::string_view> cookie_header,
              std::optional<std::string_view> authorization_header) const;

  private:
    bool basic_matches(std::optional<std::string_view> header) const;

    std::string token_;
    std::optional<StaticCredential> basic_;
};

std::optional<std::string> cookie_value(std::string_view cookie_header,
                                        std::string_view name);
std::optional<std::pair<std::string, std::string>>
decode_basic_credentials(std::string_view header);

std::string bootstrap_link(bool secure, std::string_view host,
                           std::uint16_t port, std::string_view token);
// Set-Cookie value for the durable credential.
std::string session_cookie(std::string_view token);

} // namespace tbl::auth
