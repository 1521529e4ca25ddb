#include "core/model/enum_names.hpp"

#include "core/util/canonical.hpp"

namespace craftiax {

ErrorCategory error_category(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return ErrorCategory::None;
    case ErrorCode::InvalidArgument:
    case ErrorCode::ZeroAddress:
    case ErrorCode::PriceOutOfRange:
    case ErrorCode::CommissionOutOfRange:
    case ErrorCode::AmountOverflow:
    case ErrorCode::AmountTooSmallAfterScaling:
    case ErrorCode::BelowMinimum:
    case ErrorCode::AboveMaximum:
    case ErrorCode::IncorrectPayment:
      return ErrorCategory::Validation;
    case ErrorCode::ExpiredAuthorization:
    case ErrorCode::InvalidAuthorization:
    case ErrorCode::Unauthorized:
    case ErrorCode::NotTokenOwner:
      return ErrorCategory::Authorization;
    case ErrorCode::ReentrantCall:
    case ErrorCode::Paused:
    case ErrorCode::EventAlreadyExists:
    case ErrorCode::EventNotFound:
    case ErrorCode::EventNotActive:
    case ErrorCode::TierNotFound:
    case ErrorCode::TierInactive:
    case ErrorCode::TierSoldOut:
    case ErrorCode::InvalidStatusTransition:
    case ErrorCode::DuplicateVerificationStatus:
    case ErrorCode::MaxSupplyReached:
    case ErrorCode::TokenNotFound:
    case ErrorCode::NothingToWithdraw:
      return ErrorCategory::StateConflict;
    case ErrorCode::RateLimited:
      return ErrorCategory::RateLimit;
    case ErrorCode::TransferFailed:
      return ErrorCategory::TransferFailure;
    case ErrorCode::PersistenceFailed:
    case ErrorCode::NotInitialized:
      return ErrorCategory::Internal;
  }
  return ErrorCategory::Internal;
}

std::string error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::ZeroAddress:
      return "ZeroAddress";
    case ErrorCode::PriceOutOfRange:
      return "PriceOutOfRange";
    case ErrorCode::CommissionOutOfRange:
      return "CommissionOutOfRange";
    case ErrorCode::AmountOverflow:
      return "AmountOverflow";
    case ErrorCode::AmountTooSmallAfterScaling:
      return "AmountTooSmallAfterScaling";
    case ErrorCode::BelowMinimum:
      return "BelowMinimum";
    case ErrorCode::AboveMaximum:
      return "AboveMaximum";
    case ErrorCode::IncorrectPayment:
      return "IncorrectPayment";
    case ErrorCode::ExpiredAuthorization:
      return "ExpiredAuthorization";
    case ErrorCode::InvalidAuthorization:
      return "InvalidAuthorization";
    case ErrorCode::Unauthorized:
      return "Unauthorized";
    case ErrorCode::ReentrantCall:
      return "ReentrantCall";
    case ErrorCode::Paused:
      return "Paused";
    case ErrorCode::EventAlreadyExists:
      return "EventAlreadyExists";
    case ErrorCode::EventNotFound:
      return "EventNotFound";
    case ErrorCode::EventNotActive:
      return "EventNotActive";
    case ErrorCode::TierNotFound:
      return "TierNotFound";
    case ErrorCode::TierInactive:
      return "TierInactive";
    case ErrorCode::TierSoldOut:
      return "TierSoldOut";
    case ErrorCode::InvalidStatusTransition:
      return "InvalidStatusTransition";
    case ErrorCode::DuplicateVerificationStatus:
      return "DuplicateVerificationStatus";
    case ErrorCode::MaxSupplyReached:
      return "MaxSupplyReached";
    case ErrorCode::TokenNotFound:
      return "TokenNotFound";
    case ErrorCode::NotTokenOwner:
      return "NotTokenOwner";
    case ErrorCode::NothingToWithdraw:
      return "NothingToWithdraw";
    case ErrorCode::RateLimited:
      return "RateLimited";
    case ErrorCode::TransferFailed:
      return "TransferFailed";
    case ErrorCode::PersistenceFailed:
      return "PersistenceFailed";
    case ErrorCode::NotInitialized:
      return "NotInitialized";
  }
  return "Unknown";
}

std::string error_category_name(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::None:
      return "None";
    case ErrorCategory::Validation:
      return "ValidationError";
    case ErrorCategory::Authorization:
      return "AuthorizationError";
    case ErrorCategory::StateConflict:
      return "StateConflictError";
    case ErrorCategory::TransferFailure:
      return "TransferFailure";
    case ErrorCategory::RateLimit:
      return "RateLimitError";
    case ErrorCategory::Internal:
      return "InternalError";
  }
  return "InternalError";
}

std::string currency_name(Currency currency) {
  return currency == Currency::Stable ? "stable" : "native";
}

std::optional<Currency> currency_from_string(std::string_view text) {
  const std::string lowered = util::lowercase_copy(util::trim_copy(text));
  if (lowered == "native" || lowered == "eth" || lowered == "0") {
    return Currency::Native;
  }
  if (lowered == "stable" || lowered == "usdc" || lowered == "usd" || lowered == "1") {
    return Currency::Stable;
  }
  return std::nullopt;
}

std::string event_status_name(EventStatus status) {
  switch (status) {
    case EventStatus::Draft:
      return "Draft";
    case EventStatus::Published:
      return "Published";
    case EventStatus::Cancelled:
      return "Cancelled";
    case EventStatus::Completed:
      return "Completed";
  }
  return "Draft";
}

std::optional<EventStatus> event_status_from_string(std::string_view text) {
  if (text == "Draft") {
    return EventStatus::Draft;
  }
  if (text == "Published") {
    return EventStatus::Published;
  }
  if (text == "Cancelled") {
    return EventStatus::Cancelled;
  }
  if (text == "Completed") {
    return EventStatus::Completed;
  }
  return std::nullopt;
}

std::string settlement_mode_name(SettlementMode mode) {
  return mode == SettlementMode::Pooled ? "pooled" : "direct";
}

std::optional<SettlementMode> settlement_mode_from_string(std::string_view text) {
  const std::string lowered = util::lowercase_copy(util::trim_copy(text));
  if (lowered == "direct") {
    return SettlementMode::Direct;
  }
  if (lowered == "pooled") {
    return SettlementMode::Pooled;
  }
  return std::nullopt;
}

}  // namespace craftiax
