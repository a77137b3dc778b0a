#pragma once

#include <string>
#include <string_view>

namespace tbl::http
{

// {"status":"<status>"}
std::string serialize_status(std::string_view status);

} // namespace tbl::http
