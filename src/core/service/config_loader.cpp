#include "core/service/config_loader.hpp"

#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <string>

#include "core/model/app_meta.hpp"
#include "core/model/enum_names.hpp"
#include "core/util/canonical.hpp"

namespace craftiax {
namespace {

using EntrySetter = std::function<bool(EngineConfig&, std::string_view)>;

bool parse_bool(std::string_view text, bool& out) {
  const std::string lowered = util::lowercase_copy(text);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    out = true;
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    out = false;
    return true;
  }
  return false;
}

template <typename T>
bool parse_unsigned(std::string_view text, T& out) {
  std::uint64_t value = 0;
  if (!util::parse_uint64(text, value) || value > std::numeric_limits<T>::max()) {
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

EntrySetter string_entry(std::string EngineConfig::*member) {
  return [member](EngineConfig& config, std::string_view value) {
    config.*member = std::string{value};
    return true;
  };
}

EntrySetter limit_entry(PaymentLimits EngineConfig::*limits, std::uint64_t PaymentLimits::*field) {
  return [limits, field](EngineConfig& config, std::string_view value) {
    return util::parse_uint64(value, (config.*limits).*field);
  };
}

const std::map<std::string, EntrySetter, std::less<>>& entry_setters() {
  static const std::map<std::string, EntrySetter, std::less<>> setters = {
      {"data_dir", string_entry(&EngineConfig::data_dir)},
      {"enable_snapshots",
       [](EngineConfig& c, std::string_view v) { return parse_bool(v, c.enable_snapshots); }},
      {"domain_name", string_entry(&EngineConfig::domain_name)},
      {"domain_version", string_entry(&EngineConfig::domain_version)},
      {"chain_id", string_entry(&EngineConfig::chain_id)},
      {"service_id", string_entry(&EngineConfig::service_id)},
      {"admin_identities",
       [](EngineConfig& c, std::string_view v) {
         c.admin_identities = util::split_csv(v);
         return true;
       }},
      {"trusted_verifier",
       [](EngineConfig& c, std::string_view v) {
         c.trusted_verifier = util::lowercase_copy(v);
         return true;
       }},
      {"escrow_identity", string_entry(&EngineConfig::escrow_identity)},
      {"platform_fee_recipient", string_entry(&EngineConfig::platform_fee_recipient)},
      {"platform_fee_percent",
       [](EngineConfig& c, std::string_view v) { return parse_unsigned(v, c.platform_fee_percent); }},
      {"max_platform_fee_percent",
       [](EngineConfig& c, std::string_view v) { return parse_unsigned(v, c.max_platform_fee_percent); }},
      {"payment_cooldown_seconds",
       [](EngineConfig& c, std::string_view v) { return util::parse_int64(v, c.payment_cooldown_seconds); }},
      {"native_min_payment", limit_entry(&EngineConfig::native_limits, &PaymentLimits::min_payment)},
      {"native_max_payment", limit_entry(&EngineConfig::native_limits, &PaymentLimits::max_payment)},
      {"native_verified_max_payment",
       limit_entry(&EngineConfig::native_limits, &PaymentLimits::verified_max_payment)},
      {"stable_min_payment", limit_entry(&EngineConfig::stable_limits, &PaymentLimits::min_payment)},
      {"stable_max_payment", limit_entry(&EngineConfig::stable_limits, &PaymentLimits::max_payment)},
      {"stable_verified_max_payment",
       limit_entry(&EngineConfig::stable_limits, &PaymentLimits::verified_max_payment)},
      {"min_tier_price",
       [](EngineConfig& c, std::string_view v) { return util::parse_uint64(v, c.min_tier_price); }},
      {"max_tier_price",
       [](EngineConfig& c, std::string_view v) { return util::parse_uint64(v, c.max_tier_price); }},
      {"max_tiers_per_event",
       [](EngineConfig& c, std::string_view v) { return parse_unsigned(v, c.max_tiers_per_event); }},
      {"canonical_decimals",
       [](EngineConfig& c, std::string_view v) { return parse_unsigned(v, c.canonical_decimals); }},
      {"native_decimals",
       [](EngineConfig& c, std::string_view v) { return parse_unsigned(v, c.native_decimals); }},
      {"stable_decimals",
       [](EngineConfig& c, std::string_view v) { return parse_unsigned(v, c.stable_decimals); }},
      {"payment_settlement_mode",
       [](EngineConfig& c, std::string_view v) {
         const auto mode = settlement_mode_from_string(v);
         if (!mode.has_value()) {
           return false;
         }
         c.payment_settlement_mode = *mode;
         return true;
       }},
      {"ticket_settlement_mode",
       [](EngineConfig& c, std::string_view v) {
         const auto mode = settlement_mode_from_string(v);
         if (!mode.has_value()) {
           return false;
         }
         c.ticket_settlement_mode = *mode;
         return true;
       }},
      {"publish_events_on_create",
       [](EngineConfig& c, std::string_view v) { return parse_bool(v, c.publish_events_on_create); }},
      {"nft_max_supply",
       [](EngineConfig& c, std::string_view v) { return util::parse_uint64(v, c.nft_max_supply); }},
      {"nft_base_uri", string_entry(&EngineConfig::nft_base_uri)},
  };
  return setters;
}

}  // namespace

Result apply_engine_config_entry(std::string_view key, std::string_view value, EngineConfig& config) {
  const auto& setters = entry_setters();
  const auto it = setters.find(key);
  if (it == setters.end()) {
    return Result::failure(ErrorCode::InvalidArgument, "Unknown config key `" + std::string{key} + "`.");
  }
  if (!it->second(config, value)) {
    return Result::failure(ErrorCode::InvalidArgument,
                           "Invalid value for `" + std::string{key} + "`: " + std::string{value});
  }
  return Result::success();
}

Result load_engine_config(std::string_view path, EngineConfig& config) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure(ErrorCode::InvalidArgument, "Failed to open config file: " + std::string{path});
  }

  EngineConfig loaded = config;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      return Result::failure(ErrorCode::InvalidArgument,
                             "Config line " + std::to_string(line_number) + " is not key=value.");
    }
    const std::string key = util::trim_copy(std::string_view{trimmed}.substr(0, eq));
    const std::string value = util::trim_copy(std::string_view{trimmed}.substr(eq + 1));
    if (const Result applied = apply_engine_config_entry(key, value, loaded); !applied.ok) {
      return Result::failure(applied.code,
                             "Config line " + std::to_string(line_number) + ": " + applied.message);
    }
  }

  if (const Result valid = validate_engine_config(loaded); !valid.ok) {
    return valid;
  }
  config = std::move(loaded);
  return Result::success("Config loaded.", std::string{path});
}

Result validate_payment_limits(const PaymentLimits& limits) {
  if (limits.min_payment == 0) {
    return Result::failure(ErrorCode::InvalidArgument, "Minimum payment must be positive.");
  }
  if (!(limits.min_payment < limits.max_payment && limits.max_payment < limits.verified_max_payment)) {
    return Result::failure(ErrorCode::InvalidArgument,
                           "Payment limits must satisfy min < max < verified max.");
  }
  return Result::success();
}

Result validate_engine_config(const EngineConfig& config) {
  if (config.domain_name.empty() || config.chain_id.empty()) {
    return Result::failure(ErrorCode::InvalidArgument, "Authorization domain name and chain id are required.");
  }
  if (config.escrow_identity.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "Escrow identity is required.");
  }
  for (const auto& admin : config.admin_identities) {
    if (admin.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "Administrator identities must not be empty.");
    }
  }
  if (config.max_platform_fee_percent > kMaxCommissionPercent) {
    return Result::failure(ErrorCode::CommissionOutOfRange, "Maximum platform fee exceeds 100 percent.");
  }
  if (config.platform_fee_percent > config.max_platform_fee_percent) {
    return Result::failure(ErrorCode::CommissionOutOfRange, "Platform fee exceeds the configured maximum.");
  }
  if (config.platform_fee_percent > 0 && config.platform_fee_recipient.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "A platform fee requires a fee recipient.");
  }
  if (config.payment_cooldown_seconds < 0) {
    return Result::failure(ErrorCode::InvalidArgument, "Payment cooldown cannot be negative.");
  }
  if (const Result native = validate_payment_limits(config.native_limits); !native.ok) {
    return Result::failure(native.code, "Native " + native.message);
  }
  if (const Result stable = validate_payment_limits(config.stable_limits); !stable.ok) {
    return Result::failure(stable.code, "Stable " + stable.message);
  }
  if (config.min_tier_price == 0 || config.min_tier_price > config.max_tier_price) {
    return Result::failure(ErrorCode::PriceOutOfRange, "Tier price bounds must satisfy 0 < min <= max.");
  }
  if (config.max_tiers_per_event == 0) {
    return Result::failure(ErrorCode::InvalidArgument, "At least one tier per event must be allowed.");
  }
  if (config.canonical_decimals > kMaxSupportedDecimals || config.native_decimals > kMaxSupportedDecimals ||
      config.stable_decimals > kMaxSupportedDecimals) {
    return Result::failure(ErrorCode::InvalidArgument,
                           "Currency decimals must not exceed " + std::to_string(kMaxSupportedDecimals) + ".");
  }
  if (config.nft_max_supply == 0) {
    return Result::failure(ErrorCode::InvalidArgument, "NFT max supply must be positive.");
  }
  return Result::success();
}

}  // namespace craftiax
