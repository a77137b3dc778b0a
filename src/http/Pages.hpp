#pragma once

#include <string>
#include <string_view>

namespace tbl::http::pages
{

// Stores the durable credential cookie from script, then returns to "/".
std::string bootstrap_page(std::string_view token);
std::string setup_page();
std::string setup_error_page(std::string_view title, std::string_view detail);
std::string_view client_script();

std::string html_escape(std::string_view text);

} // namespace tbl::http::pages
