#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace craftiax {

// Reads `key=value` lines over the defaults already present in `config`.
// Blank lines and lines starting with '#' are skipped; unknown keys fail.
Result load_engine_config(std::string_view path, EngineConfig& config);
Result apply_engine_config_entry(std::string_view key, std::string_view value, EngineConfig& config);

Result validate_payment_limits(const PaymentLimits& limits);
Result validate_engine_config(const EngineConfig& config);

}  // namespace craftiax
