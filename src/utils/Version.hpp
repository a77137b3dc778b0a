#pragma once

#ifndef TBL_BUILD_VERSION
#define TBL_BUILD_VERSION "0.0.0-dev"
#endif

namespace tbl::version
{

inline constexpr char const kSemanticVersion[] = TBL_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "tbl v" TBL_BUILD_VERSION;
inline constexpr char const kTagline[] = "Tiny self-bootstrapping web launcher";

} // namespace tbl::version
