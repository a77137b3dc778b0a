#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tbl::app::console
{

void print_banner();
void print_url_box(std::string_view url);

struct InstanceSummary
{
    std::string heading;
    std::string address;
    long long pid = 0;
    std::uint16_t port = 0;
    bool tls = false;
};

// Heading, details and the bootstrap URL box.
void print_instance(InstanceSummary const &summary, std::string_view url);

// Opens the link or tells the operator to. Browser failures are reported
// and never fatal.
void surface_link(std::string const &url, bool open_browser);

} // namespace tbl::app::console
