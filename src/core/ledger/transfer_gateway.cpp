#include "core/ledger/transfer_gateway.hpp"

#include <limits>

#include "core/model/enum_names.hpp"
#include "core/util/canonical.hpp"

namespace craftiax {

std::int64_t SystemClock::now() const {
  return util::unix_timestamp_now();
}

Result InMemoryTransferGateway::transfer(Currency currency, std::string_view from, std::string_view to,
                                         std::uint64_t amount) {
  if (from.empty() || to.empty()) {
    return Result::failure(ErrorCode::TransferFailed, "Transfer requires both endpoints.");
  }

  const TransferRecord record{
      .currency = currency,
      .from = std::string{from},
      .to = std::string{to},
      .amount = amount,
  };
  if (hook_) {
    hook_(record);
  }

  if (rejected_recipients_.contains(record.to)) {
    return Result::failure(ErrorCode::TransferFailed,
                           "Transfer to `" + record.to + "` was rejected by the receiver.");
  }

  std::uint64_t& source = accounts_[{currency, record.from}];
  if (source < amount) {
    return Result::failure(ErrorCode::TransferFailed, "Insufficient " + currency_name(currency) +
                                                          " funds in `" + record.from + "`.");
  }
  std::uint64_t& target = accounts_[{currency, record.to}];
  if (record.from != record.to && target > std::numeric_limits<std::uint64_t>::max() - amount) {
    return Result::failure(ErrorCode::TransferFailed, "Transfer would overflow `" + record.to + "`.");
  }

  source -= amount;
  target += amount;
  history_.push_back(record);
  return Result::success();
}

void InMemoryTransferGateway::deposit(Currency currency, std::string_view owner, std::uint64_t amount) {
  accounts_[{currency, std::string{owner}}] += amount;
}

std::uint64_t InMemoryTransferGateway::balance_of(Currency currency, std::string_view owner) const {
  const auto it = accounts_.find({currency, std::string{owner}});
  return it == accounts_.end() ? 0 : it->second;
}

void InMemoryTransferGateway::reject_transfers_to(std::string_view identity) {
  rejected_recipients_.insert(std::string{identity});
}

void InMemoryTransferGateway::clear_rejections() {
  rejected_recipients_.clear();
}

}  // namespace craftiax
