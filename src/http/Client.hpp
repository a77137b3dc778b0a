#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tbl::http
{

struct ClientRequest
{
    std::string method = "GET";
    std::string url;
    // Extra request lines without the trailing CRLF, e.g. "Cookie: a=b".
    std::vector<std::string> headers;
    std::string body;
    std::string content_type;
    // Overrides the Host header derived from the URL.
    std::string host_header;
    std::chrono::milliseconds timeout{5000};
};

struct ClientResponse
{
    int status = 0;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    std::optional<std::string> header(std::string const &name) const;
};

// Single request/response exchange over a private mongoose manager.
// https URLs are accepted without certificate verification, which suits the
// self-signed certificates a local instance serves. Throws
// std::runtime_error on connect failure, abort or timeout.
ClientResponse send_request(ClientRequest const &request);

} // namespace tbl::http
