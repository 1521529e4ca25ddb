#include "core/ledger/currency.hpp"

#include <limits>
#include <string>

#include "core/model/app_meta.hpp"

namespace craftiax {
namespace {

std::uint64_t pow10(unsigned exponent) {
  std::uint64_t value = 1;
  for (unsigned i = 0; i < exponent; ++i) {
    value *= 10U;
  }
  return value;
}

}  // namespace

CurrencyNormalizer::CurrencyNormalizer(unsigned canonical_decimals, unsigned native_decimals,
                                       unsigned stable_decimals)
    : canonical_decimals_(canonical_decimals),
      native_decimals_(native_decimals),
      stable_decimals_(stable_decimals) {}

unsigned CurrencyNormalizer::decimals(Currency currency) const {
  return currency == Currency::Stable ? stable_decimals_ : native_decimals_;
}

Result CurrencyNormalizer::to_currency_units(std::uint64_t canonical_amount, Currency currency,
                                             std::uint64_t& out) const {
  return rescale(canonical_amount, canonical_decimals_, decimals(currency), out);
}

Result CurrencyNormalizer::to_canonical_units(std::uint64_t amount, Currency currency,
                                              std::uint64_t& out) const {
  return rescale(amount, decimals(currency), canonical_decimals_, out);
}

Result CurrencyNormalizer::rescale(std::uint64_t amount, unsigned from_decimals, unsigned to_decimals,
                                   std::uint64_t& out) {
  if (from_decimals > kMaxSupportedDecimals || to_decimals > kMaxSupportedDecimals) {
    return Result::failure(ErrorCode::InvalidArgument, "Currency precision exceeds supported decimals.");
  }

  if (from_decimals >= to_decimals) {
    const std::uint64_t divisor = pow10(from_decimals - to_decimals);
    const std::uint64_t scaled = amount / divisor;
    if (amount != 0 && scaled == 0) {
      return Result::failure(ErrorCode::AmountTooSmallAfterScaling,
                             "Scaled amount too small: " + std::to_string(amount) + " truncates to zero.");
    }
    out = scaled;
    return Result::success();
  }

  const std::uint64_t multiplier = pow10(to_decimals - from_decimals);
  if (amount > std::numeric_limits<std::uint64_t>::max() / multiplier) {
    return Result::failure(ErrorCode::AmountOverflow, "Scaled amount overflows 64-bit precision.");
  }
  out = amount * multiplier;
  return Result::success();
}

}  // namespace craftiax
