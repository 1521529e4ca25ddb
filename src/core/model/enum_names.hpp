#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace craftiax {

enum class ErrorCategory {
  None,
  Validation,
  Authorization,
  StateConflict,
  TransferFailure,
  RateLimit,
  Internal,
};

ErrorCategory error_category(ErrorCode code);
std::string error_code_name(ErrorCode code);
std::string error_category_name(ErrorCategory category);

std::string currency_name(Currency currency);
std::optional<Currency> currency_from_string(std::string_view text);

std::string event_status_name(EventStatus status);
std::optional<EventStatus> event_status_from_string(std::string_view text);

std::string settlement_mode_name(SettlementMode mode);
std::optional<SettlementMode> settlement_mode_from_string(std::string_view text);

}  // namespace craftiax
