#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tbl::auth
{

inline constexpr std::size_t kTokenBytes = 32;
inline constexpr std::size_t kTokenHexLength = kTokenBytes * 2;

// 32 bytes from the OS CSPRNG rendered as 64 lowercase hex characters.
// Throws LaunchError if no secure random source is available.
std::string generate_token();

// Equality without early exit on the first differing byte.
bool token_matches(std::string_view presented, std::string_view actual) noexcept;

bool is_well_formed_token(std::string_view token) noexcept;

} // namespace tbl::auth
