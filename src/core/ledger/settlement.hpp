#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/ledger/transfer_gateway.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace craftiax {

struct CommissionSplit {
  std::uint64_t commission = 0;
  std::uint64_t remainder = 0;
};

struct SettlementRequest {
  std::string payer;
  std::string payee;
  std::string commission_recipient;
  Currency currency = Currency::Native;
  std::uint64_t amount = 0;
  std::uint32_t commission_percent = 0;
  SettlementMode mode = SettlementMode::Direct;
};

// Splits incoming payments, moves funds through the escrow identity and keeps
// the per-owner balance ledger. Every transfer issued during an operation is
// journaled so the caller can compensate it if the operation aborts.
class SettlementEngine {
public:
  SettlementEngine(Store& store, ITransferGateway& gateway, std::string escrow_identity);

  Result quote_and_validate(std::uint64_t amount, Currency currency, bool recipient_verified) const;
  static Result split(std::uint64_t amount, std::uint32_t commission_percent, CommissionSplit& out);

  Result settle(const SettlementRequest& request, std::int64_t now_unix, SettlementReceipt& out);
  Result credit_balance(std::string_view owner, Currency currency, std::uint64_t amount);
  Result withdraw(std::string_view owner, WithdrawalReceipt& out);

  Result check_rate_limit(std::string_view payer, std::int64_t now_unix, std::int64_t cooldown_seconds) const;
  void record_payment_time(std::string_view payer, std::int64_t now_unix);

  [[nodiscard]] std::uint64_t balance(std::string_view owner, Currency currency) const;
  [[nodiscard]] LedgerTotals totals(Currency currency) const;
  [[nodiscard]] const std::string& escrow_identity() const { return escrow_identity_; }

  void begin_operation();
  Result unwind_transfers();
  [[nodiscard]] std::size_t journaled_transfer_count() const { return journal_.size(); }

private:
  Result execute_transfer(Currency currency, std::string_view from, std::string_view to, std::uint64_t amount);

  Store& store_;
  ITransferGateway& gateway_;
  std::string escrow_identity_;
  std::vector<TransferRecord> journal_;
};

}  // namespace craftiax
