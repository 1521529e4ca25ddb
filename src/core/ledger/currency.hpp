#pragma once

#include <cstdint>

#include "core/model/types.hpp"

namespace craftiax {

// Rescales amounts between canonical precision and a settlement currency's
// native precision. Scaling down floors; a non-zero amount that floors to zero
// is rejected so a priced item can never settle for nothing.
class CurrencyNormalizer {
public:
  CurrencyNormalizer() = default;
  CurrencyNormalizer(unsigned canonical_decimals, unsigned native_decimals, unsigned stable_decimals);

  [[nodiscard]] unsigned decimals(Currency currency) const;
  [[nodiscard]] unsigned canonical_decimals() const { return canonical_decimals_; }

  Result to_currency_units(std::uint64_t canonical_amount, Currency currency, std::uint64_t& out) const;
  Result to_canonical_units(std::uint64_t amount, Currency currency, std::uint64_t& out) const;

  static Result rescale(std::uint64_t amount, unsigned from_decimals, unsigned to_decimals,
                        std::uint64_t& out);

private:
  unsigned canonical_decimals_ = 18;
  unsigned native_decimals_ = 18;
  unsigned stable_decimals_ = 6;
};

}  // namespace craftiax
