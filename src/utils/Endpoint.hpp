#pragma once

#include "utils/Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace tbl::net
{

struct BindAddress
{
    std::string host;
    std::uint16_t port = 0;
};

constexpr std::array<std::string_view, 5> kLoopbackHosts = {
    "127.0.0.1", "localhost", "[::1]", "::1", "0:0:0:0:0:0:0:1"};

inline std::string lowercase(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return value;
}

inline bool is_ipv6_literal(std::string_view host)
{
    return host.find(':') != std::string_view::npos;
}

inline std::string strip_brackets(std::string_view host)
{
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    {
        host = host.substr(1, host.size() - 2);
    }
    return std::string(host);
}

inline bool is_loopback_host(std::string_view host)
{
    auto normalized = lowercase(std::string(host));
    return std::any_of(kLoopbackHosts.begin(), kLoopbackHosts.end(),
                       [&](std::string_view candidate)
                       { return normalized == candidate; });
}

inline bool is_wildcard_host(std::string_view host)
{
    auto bare = strip_brackets(host);
    return bare == "0.0.0.0" || bare == "::" || bare.empty();
}

// Parses "host:port" or "[v6]:port". Throws ConfigError on malformed input.
inline BindAddress parse_bind_address(std::string_view input)
{
    auto colon = input.rfind(':');
    if (colon == std::string_view::npos)
    {
        throw ConfigError("addr must be in host:port form, got: " +
                          std::string(input));
    }
    auto host = input.substr(0, colon);
    auto port_text = input.substr(colon + 1);
    if (host.find(':') != std::string_view::npos &&
        (host.empty() || host.front() != '['))
    {
        throw ConfigError("IPv6 addr must be bracketed, got: " +
                          std::string(input));
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(),
                                     port_text.data() + port_text.size(), value);
    if (port_text.empty() || ec != std::errc{} ||
        ptr != port_text.data() + port_text.size() || value == 0 ||
        value > 65535)
    {
        throw ConfigError("invalid port in addr: " + std::string(input));
    }
    return {std::string(host), static_cast<std::uint16_t>(value)};
}

inline std::string format_host_port(std::string_view host, std::uint16_t port)
{
    std::string rendered(host);
    if (is_ipv6_literal(rendered) && rendered.front() != '[')
    {
        rendered = "[" + rendered + "]";
    }
    return rendered + ":" + std::to_string(port);
}

inline std::string format_url(bool secure, std::string_view host,
                              std::uint16_t port)
{
    return std::string(secure ? "https://" : "http://") +
           format_host_port(host, port);
}

// Host to hand to the operator's browser for a given bind host.
inline std::string link_host(std::string_view bind_host)
{
    if (is_loopback_host(bind_host) || is_wildcard_host(bind_host))
    {
        return "127.0.0.1";
    }
    return std::string(bind_host);
}

} // namespace tbl::net
