#pragma once

#include <cstdint>
#include <string_view>

#ifndef CRAFTIAX_APP_VERSION
#define CRAFTIAX_APP_VERSION "0.3.0"
#endif

#ifndef CRAFTIAX_BUILD_RELEASE
#define CRAFTIAX_BUILD_RELEASE "Ledger Phase 1"
#endif

namespace craftiax {

inline constexpr std::string_view kAppDisplayName = "Craftiax Ledger";
inline constexpr std::string_view kNativeCurrencyName = "ETH";
inline constexpr std::string_view kStableCurrencyName = "USDC";
inline constexpr std::string_view kAppVersion = CRAFTIAX_APP_VERSION;
inline constexpr std::string_view kBuildRelease = CRAFTIAX_BUILD_RELEASE;

inline constexpr std::uint32_t kMaxCommissionPercent = 100;
inline constexpr unsigned kMaxSupportedDecimals = 19;

}  // namespace craftiax
