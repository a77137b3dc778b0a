#include "auth/Session.hpp"
#include "auth/Token.hpp"
#include "utils/Base64.hpp"

#include <optional>
#include <string>

#include <doctest/doctest.h>

using tbl::auth::AuthFailure;

namespace
{

std::string basic_header(std::string const &user, std::string const &pass)
{
    return "Basic " + tbl::utils::encode_base64(user + ":" + pass);
}

} // namespace

TEST_CASE("bootstrap redemption distinguishes missing and invalid tokens")
{
    auto token = tbl::auth::generate_token();
    tbl::auth::SessionGate gate(token);

    CHECK(gate.redeem(std::nullopt) == AuthFailure::MissingCredential);
    CHECK(gate.redeem(std::string_view{}) == AuthFailure::InvalidCredential);
    CHECK(gate.redeem(std::string_view(std::string(300, 'a'))) ==
          AuthFailure::InvalidCredential);
    CHECK(gate.redeem(std::string_view("deadbeef")) ==
          AuthFailure::InvalidCredential);
    CHECK(gate.redeem(std::string_view(tbl::auth::generate_token())) ==
          AuthFailure::InvalidCredential);
    CHECK_FALSE(gate.redeem(std::string_view(token)).has_value());
}

TEST_CASE("protected routes require the session cookie")
{
    auto token = tbl::auth::generate_token();
    tbl::auth::SessionGate gate(token);

    CHECK(gate.authorize(std::nullopt, std::nullopt) ==
          AuthFailure::MissingCredential);
    CHECK(gate.authorize(std::string_view("other=1"), std::nullopt) ==
          AuthFailure::MissingCredential);
    CHECK(gate.authorize(std::string_view("tbl_token=nope"), std::nullopt) ==
          AuthFailure::InvalidCredential);

    auto cookie = "theme=dark; tbl_token=" + token + "; lang=en";
    CHECK_FALSE(gate.authorize(std::string_view(cookie), std::nullopt));
}

TEST_CASE("static credential is an additional independent layer")
{
    auto token = tbl::auth::generate_token();
    tbl::auth::SessionGate gate(
        token, tbl::auth::StaticCredential{"operator", "s3cret"});
    REQUIRE(gate.has_static_credential());

    auto cookie = "tbl_token=" + token;
    auto good_basic = basic_header("operator", "s3cret");
    auto bad_basic = basic_header("operator", "wrong");

    SUBCASE("cookie alone is not enough")
    {
        CHECK(gate.authorize(std::string_view(cookie), std::nullopt) ==
              AuthFailure::BasicAuthRequired);
        CHECK(gate.authorize(std::string_view(cookie),
                             std::string_view(bad_basic)) ==
              AuthFailure::BasicAuthRequired);
    }
    SUBCASE("basic alone is not enough")
    {
        CHECK(gate.authorize(std::nullopt, std::string_view(good_basic)) ==
              AuthFailure::MissingCredential);
        CHECK(gate.authorize(std::string_view("tbl_token=bad"),
                             std::string_view(good_basic)) ==
              AuthFailure::InvalidCredential);
    }
    SUBCASE("both layers pass")
    {
        CHECK_FALSE(gate.authorize(std::string_view(cookie),
                                   std::string_view(good_basic)));
    }
}

TEST_CASE("cookie_value and decode_basic_credentials parse headers")
{
    CHECK(tbl::auth::cookie_value("a=1; tbl_token=abc", "tbl_token") == "abc");
    CHECK(tbl::auth::cookie_value(" tbl_token=xyz ", "tbl_token") == "xyz");
    CHECK_FALSE(tbl::auth::cookie_value("xtbl_token=abc", "tbl_token"));
    CHECK_FALSE(tbl::auth::cookie_value("", "tbl_token"));

    auto decoded = tbl::auth::decode_basic_credentials(basic_header("u", "p:q"));
    REQUIRE(decoded);
    CHECK(decoded->first == "u");
    CHECK(decoded->second == "p:q");
    CHECK_FALSE(tbl::auth::decode_basic_credentials("Bearer abc"));
}

TEST_CASE("bootstrap_link and session_cookie carry the token")
{
    std::string token(tbl::auth::kTokenHexLength, 'a');
    CHECK(tbl::auth::bootstrap_link(false, "127.0.0.1", 1234, token) ==
          "http://127.0.0.1:1234/bootstrap?token=" + token);
    CHECK(tbl::auth::bootstrap_link(true, "::1", 8443, token) ==
          "https://[::1]:8443/bootstrap?token=" + token);
    CHECK(tbl::auth::session_cookie(token) ==
          "tbl_token=" + token + "; Path=/; SameSite=Lax");
}
