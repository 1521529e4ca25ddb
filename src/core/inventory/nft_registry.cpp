#include "core/inventory/nft_registry.hpp"

namespace craftiax {

NftRegistry::NftRegistry(Store& store, std::uint64_t max_supply) : store_(store), max_supply_(max_supply) {}

Result NftRegistry::mint(std::string_view recipient, std::string_view uri, std::int64_t now_unix, NftRecord& out) {
  if (recipient.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "NFT recipient is required.");
  }
  auto& tables = store_.tables();
  if (tables.next_nft_id >= max_supply_) {
    return Result::failure(ErrorCode::MaxSupplyReached, "Maximum NFT supply reached.");
  }

  NftRecord record{
      .token_id = tables.next_nft_id,
      .owner = std::string{recipient},
      .uri = std::string{uri},
      .minted_unix = now_unix,
  };
  tables.nfts[record.token_id] = record;
  ++tables.next_nft_id;
  out = std::move(record);
  return Result::success("NFT minted.", std::to_string(out.token_id));
}

Result NftRegistry::burn(std::string_view caller, std::uint64_t token_id) {
  auto& nfts = store_.tables().nfts;
  const auto it = nfts.find(token_id);
  if (it == nfts.end()) {
    return Result::failure(ErrorCode::TokenNotFound, "NFT " + std::to_string(token_id) + " does not exist.");
  }
  if (it->second.owner != caller) {
    return Result::failure(ErrorCode::NotTokenOwner, "Only the token owner may burn NFT " +
                                                         std::to_string(token_id) + ".");
  }
  nfts.erase(it);
  return Result::success("NFT burned.", std::to_string(token_id));
}

void NftRegistry::set_base_uri(std::string_view base_uri) {
  store_.tables().settings.nft_base_uri = std::string{base_uri};
}

std::optional<NftRecord> NftRegistry::token(std::uint64_t token_id) const {
  const auto& nfts = store_.tables().nfts;
  const auto it = nfts.find(token_id);
  if (it == nfts.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result NftRegistry::token_uri(std::uint64_t token_id, std::string& out) const {
  const auto record = token(token_id);
  if (!record.has_value()) {
    return Result::failure(ErrorCode::TokenNotFound, "NFT " + std::to_string(token_id) + " does not exist.");
  }
  out = store_.tables().settings.nft_base_uri + record->uri;
  return Result::success();
}

std::optional<std::string> NftRegistry::owner_of(std::uint64_t token_id) const {
  const auto record = token(token_id);
  if (!record.has_value()) {
    return std::nullopt;
  }
  return record->owner;
}

std::uint64_t NftRegistry::balance_of(std::string_view owner) const {
  std::uint64_t count = 0;
  for (const auto& [id, record] : store_.tables().nfts) {
    if (record.owner == owner) {
      ++count;
    }
  }
  return count;
}

std::uint64_t NftRegistry::minted_count() const {
  return store_.tables().next_nft_id;
}

}  // namespace craftiax
