#include "app/Console.hpp"

#include "app/Process.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <format>

namespace tbl::app::console
{
namespace
{

std::string repeat(std::string_view unit, std::size_t count)
{
    std::string out;
    out.reserve(unit.size() * count);
    for (std::size_t i = 0; i < count; ++i)
    {
        out.append(unit);
    }
    return out;
}

constexpr std::string_view kRule = "───────────────────────────────────────";

} // namespace

void print_banner()
{
    log::print_status("");
    log::print_status("  ╭─────────────────────────────────────────╮");
    log::print_status("  │                                         │");
    log::print_status("  │   tbl v{:<32} │", version::kSemanticVersion);
    log::print_status("  │   {:<37} │", version::kTagline);
    log::print_status("  │                                         │");
    log::print_status("  ╰─────────────────────────────────────────╯");
}

void print_url_box(std::string_view url)
{
    constexpr std::size_t padding = 4;
    auto const border = repeat("─", url.size() + padding * 2);
    auto const spaces = std::string(padding, ' ');
    log::print_status("  ╭{}╮", border);
    log::print_status("  │{}{}{}│", spaces, url, spaces);
    log::print_status("  ╰{}╯", border);
}

void print_instance(InstanceSummary const &summary, std::string_view url)
{
    log::print_status("");
    log::print_status("  {}", summary.heading);
    log::print_status("  {}", kRule);
    if (!summary.address.empty())
    {
        log::print_status("  Address: {}", summary.address);
    }
    else
    {
        log::print_status("  Port:    {}", summary.port);
    }
    log::print_status("  TLS:     {}", summary.tls ? "enabled" : "disabled");
    log::print_status("  PID:     {}", summary.pid);
    log::print_status("");
    print_url_box(url);
}

void surface_link(std::string const &url, bool open_browser)
{
    if (!open_browser)
    {
        log::print_status("\n  Open the URL above to authenticate.\n");
        return;
    }
    log::print_status("\n  Opening browser...");
    if (!open_with_default_app(url))
    {
        TBL_LOG_WARN("failed to open browser for bootstrap link");
        log::print_error("  Failed to open browser.");
        log::print_error("  Open the URL above manually to authenticate.");
    }
    log::print_status("");
}

} // namespace tbl::app::console
