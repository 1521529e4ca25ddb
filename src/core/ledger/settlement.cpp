#include "core/ledger/settlement.hpp"

#include <limits>

#include "core/model/app_meta.hpp"
#include "core/model/enum_names.hpp"
#include "core/util/hash.hpp"

namespace craftiax {
namespace {

bool add_would_overflow(std::uint64_t lhs, std::uint64_t rhs) {
  return lhs > std::numeric_limits<std::uint64_t>::max() - rhs;
}

}  // namespace

SettlementEngine::SettlementEngine(Store& store, ITransferGateway& gateway, std::string escrow_identity)
    : store_(store), gateway_(gateway), escrow_identity_(std::move(escrow_identity)) {}

Result SettlementEngine::quote_and_validate(std::uint64_t amount, Currency currency,
                                            bool recipient_verified) const {
  const auto& limits_table = store_.tables().limits;
  const auto it = limits_table.find(currency);
  if (it == limits_table.end()) {
    return Result::failure(ErrorCode::InvalidArgument,
                           "No payment limits configured for " + currency_name(currency) + ".");
  }

  const PaymentLimits& limits = it->second;
  if (amount < limits.min_payment) {
    return Result::failure(ErrorCode::BelowMinimum, "Payment amount below minimum.");
  }
  const std::uint64_t ceiling = recipient_verified ? limits.verified_max_payment : limits.max_payment;
  if (amount > ceiling) {
    return Result::failure(ErrorCode::AboveMaximum, recipient_verified
                                                        ? "Payment amount exceeds verified maximum."
                                                        : "Payment amount exceeds maximum.");
  }
  return Result::success();
}

Result SettlementEngine::split(std::uint64_t amount, std::uint32_t commission_percent, CommissionSplit& out) {
  if (commission_percent > kMaxCommissionPercent) {
    return Result::failure(ErrorCode::CommissionOutOfRange, "Commission percentage exceeds 100.");
  }
  // floor(amount * pct / 100) without the 64-bit intermediate overflow.
  const std::uint64_t whole = (amount / 100U) * commission_percent;
  const std::uint64_t part = ((amount % 100U) * commission_percent) / 100U;
  out.commission = whole + part;
  out.remainder = amount - out.commission;
  return Result::success();
}

Result SettlementEngine::settle(const SettlementRequest& request, std::int64_t now_unix,
                                SettlementReceipt& out) {
  if (request.amount == 0) {
    return Result::failure(ErrorCode::InvalidArgument, "Settlement amount must be positive.");
  }
  if (request.payer.empty() || request.payee.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "Settlement requires a payer and a payee.");
  }

  CommissionSplit parts;
  if (const Result split_result = split(request.amount, request.commission_percent, parts); !split_result.ok) {
    return split_result;
  }
  if (parts.commission > 0 && request.commission_recipient.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "Commission recipient is not configured.");
  }

  if (const Result collected = execute_transfer(request.currency, request.payer, escrow_identity_, request.amount);
      !collected.ok) {
    return collected;
  }

  // Same payee and commission recipient collapse into one payout.
  const bool merged = parts.commission > 0 && request.commission_recipient == request.payee;
  const std::uint64_t payee_amount = merged ? request.amount : parts.remainder;
  if (request.mode == SettlementMode::Direct) {
    // Payee first: a failure on the commission leg never strands the payee's share.
    if (payee_amount > 0) {
      if (const Result paid = execute_transfer(request.currency, escrow_identity_, request.payee, payee_amount);
          !paid.ok) {
        return paid;
      }
    }
    if (!merged && parts.commission > 0) {
      if (const Result paid = execute_transfer(request.currency, escrow_identity_,
                                               request.commission_recipient, parts.commission);
          !paid.ok) {
        return paid;
      }
    }
  } else {
    if (payee_amount > 0) {
      if (const Result credited = credit_balance(request.payee, request.currency, payee_amount); !credited.ok) {
        return credited;
      }
    }
    if (!merged && parts.commission > 0) {
      if (const Result credited = credit_balance(request.commission_recipient, request.currency, parts.commission);
          !credited.ok) {
        return credited;
      }
    }
  }

  out.payer = request.payer;
  out.payee = request.payee;
  out.commission_recipient = request.commission_recipient;
  out.currency = request.currency;
  out.mode = request.mode;
  out.amount = request.amount;
  out.commission = parts.commission;
  out.payee_amount = payee_amount;
  out.settled_unix = now_unix;
  out.settlement_id =
      "stl-" + util::sha256_hex(std::to_string(store_.audit_records().size()) + "|" + request.payer + "|" +
                                request.payee + "|" + std::to_string(request.amount) + "|" +
                                currency_name(request.currency) + "|" + std::to_string(now_unix))
                   .substr(0, 24);
  return Result::success("Settlement completed.", out.settlement_id);
}

Result SettlementEngine::credit_balance(std::string_view owner, Currency currency, std::uint64_t amount) {
  if (owner.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "Cannot credit an empty identity.");
  }

  auto& tables = store_.tables();
  std::uint64_t& balance_ref = tables.balances[{std::string{owner}, currency}];
  LedgerTotals& totals_ref = tables.totals[currency];
  if (add_would_overflow(balance_ref, amount) || add_would_overflow(totals_ref.credited, amount)) {
    return Result::failure(ErrorCode::AmountOverflow, "Balance credit overflows 64-bit precision.");
  }
  balance_ref += amount;
  totals_ref.credited += amount;
  return Result::success();
}

Result SettlementEngine::withdraw(std::string_view owner, WithdrawalReceipt& out) {
  const std::uint64_t native_amount = balance(owner, Currency::Native);
  const std::uint64_t stable_amount = balance(owner, Currency::Stable);
  if (native_amount == 0 && stable_amount == 0) {
    return Result::failure(ErrorCode::NothingToWithdraw, "No funds to withdraw.");
  }

  // Zero the stored balances before any funds leave escrow.
  auto& tables = store_.tables();
  const std::string owner_key{owner};
  if (native_amount > 0) {
    tables.balances[{owner_key, Currency::Native}] = 0;
    tables.totals[Currency::Native].withdrawn += native_amount;
  }
  if (stable_amount > 0) {
    tables.balances[{owner_key, Currency::Stable}] = 0;
    tables.totals[Currency::Stable].withdrawn += stable_amount;
  }

  if (native_amount > 0) {
    if (const Result paid = execute_transfer(Currency::Native, escrow_identity_, owner, native_amount); !paid.ok) {
      return paid;
    }
  }
  if (stable_amount > 0) {
    if (const Result paid = execute_transfer(Currency::Stable, escrow_identity_, owner, stable_amount); !paid.ok) {
      return paid;
    }
  }

  out.owner = owner_key;
  out.native_amount = native_amount;
  out.stable_amount = stable_amount;
  return Result::success("Withdrawal completed.");
}

Result SettlementEngine::check_rate_limit(std::string_view payer, std::int64_t now_unix,
                                          std::int64_t cooldown_seconds) const {
  const auto& last_payments = store_.tables().last_payment_unix;
  const auto it = last_payments.find(std::string{payer});
  if (it == last_payments.end() || cooldown_seconds <= 0) {
    return Result::success();
  }
  if (now_unix - it->second < cooldown_seconds) {
    return Result::failure(ErrorCode::RateLimited, "Too many requests: payer `" + std::string{payer} +
                                                       "` is inside the payment cooldown.");
  }
  return Result::success();
}

void SettlementEngine::record_payment_time(std::string_view payer, std::int64_t now_unix) {
  store_.tables().last_payment_unix[std::string{payer}] = now_unix;
}

std::uint64_t SettlementEngine::balance(std::string_view owner, Currency currency) const {
  const auto& balances = store_.tables().balances;
  const auto it = balances.find({std::string{owner}, currency});
  return it == balances.end() ? 0 : it->second;
}

LedgerTotals SettlementEngine::totals(Currency currency) const {
  const auto& tables = store_.tables();
  LedgerTotals totals;
  if (const auto it = tables.totals.find(currency); it != tables.totals.end()) {
    totals = it->second;
  }
  totals.pending = 0;
  for (const auto& [key, amount] : tables.balances) {
    if (key.second == currency) {
      totals.pending += amount;
    }
  }
  return totals;
}

void SettlementEngine::begin_operation() {
  journal_.clear();
}

Result SettlementEngine::unwind_transfers() {
  std::size_t failed = 0;
  std::string first_failure;
  for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
    const Result reversed = gateway_.transfer(it->currency, it->to, it->from, it->amount);
    if (!reversed.ok) {
      if (failed == 0) {
        first_failure = reversed.message;
      }
      ++failed;
    }
  }
  journal_.clear();

  if (failed > 0) {
    return Result::failure(ErrorCode::TransferFailed, "Compensation failed for " + std::to_string(failed) +
                                                          " transfer(s): " + first_failure);
  }
  return Result::success();
}

Result SettlementEngine::execute_transfer(Currency currency, std::string_view from, std::string_view to,
                                          std::uint64_t amount) {
  const Result transferred = gateway_.transfer(currency, from, to, amount);
  if (!transferred.ok) {
    return Result::failure(ErrorCode::TransferFailed, "Transfer failed: " + transferred.message);
  }
  journal_.push_back({
      .currency = currency,
      .from = std::string{from},
      .to = std::string{to},
      .amount = amount,
  });
  return Result::success();
}

}  // namespace craftiax
