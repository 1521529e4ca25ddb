#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace craftiax {

// Collectible tokens with sequential ids and a bounded supply. Burned ids are
// never reissued.
class NftRegistry {
public:
  NftRegistry(Store& store, std::uint64_t max_supply);

  Result mint(std::string_view recipient, std::string_view uri, std::int64_t now_unix, NftRecord& out);
  Result burn(std::string_view caller, std::uint64_t token_id);
  void set_base_uri(std::string_view base_uri);

  [[nodiscard]] std::optional<NftRecord> token(std::uint64_t token_id) const;
  Result token_uri(std::uint64_t token_id, std::string& out) const;
  [[nodiscard]] std::optional<std::string> owner_of(std::uint64_t token_id) const;
  [[nodiscard]] std::uint64_t balance_of(std::string_view owner) const;
  [[nodiscard]] std::uint64_t minted_count() const;
  [[nodiscard]] std::uint64_t max_supply() const { return max_supply_; }

private:
  Store& store_;
  std::uint64_t max_supply_ = 0;
};

}  // namespace craftiax
