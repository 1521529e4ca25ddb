#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace craftiax {

enum class ErrorCode {
  None,
  InvalidArgument,
  ZeroAddress,
  PriceOutOfRange,
  CommissionOutOfRange,
  AmountOverflow,
  AmountTooSmallAfterScaling,
  BelowMinimum,
  AboveMaximum,
  IncorrectPayment,
  ExpiredAuthorization,
  InvalidAuthorization,
  Unauthorized,
  ReentrantCall,
  Paused,
  EventAlreadyExists,
  EventNotFound,
  EventNotActive,
  TierNotFound,
  TierInactive,
  TierSoldOut,
  InvalidStatusTransition,
  DuplicateVerificationStatus,
  MaxSupplyReached,
  TokenNotFound,
  NotTokenOwner,
  NothingToWithdraw,
  RateLimited,
  TransferFailed,
  PersistenceFailed,
  NotInitialized,
};

struct Result {
  bool ok = false;
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorCode::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorCode code, std::string msg) {
    return {false, code, std::move(msg), {}};
  }
};

enum class Currency {
  Native,
  Stable,
};

enum class EventStatus {
  Draft,
  Published,
  Cancelled,
  Completed,
};

// Direct pays both parties out immediately; Pooled credits balances that are
// paid out later through withdraw_balance.
enum class SettlementMode {
  Direct,
  Pooled,
};

struct CallerContext {
  std::string identity;
};

struct PaymentLimits {
  std::uint64_t min_payment = 0;
  std::uint64_t max_payment = 0;
  std::uint64_t verified_max_payment = 0;
};

struct SignedAuthorization {
  std::uint64_t nonce = 0;
  std::int64_t deadline_unix = 0;
  std::string signature;
};

struct EventDraft {
  std::string event_id;
  std::string name;
  std::string description;
  std::int64_t start_unix = 0;
  std::int64_t end_unix = 0;
  std::vector<std::string> tier_ids;
  std::vector<std::uint64_t> prices;
  std::vector<std::uint64_t> max_quantities;
  Currency currency = Currency::Native;
  std::uint32_t commission_percent = 0;
  std::string commission_recipient;
};

struct EventRecord {
  std::string event_id;
  std::string name;
  std::string description;
  std::int64_t start_unix = 0;
  std::int64_t end_unix = 0;
  std::string organizer;
  EventStatus status = EventStatus::Draft;
  Currency currency = Currency::Native;
  std::uint32_t commission_percent = 0;
  std::string commission_recipient;
  std::vector<std::string> tier_ids;
  std::int64_t created_unix = 0;
};

struct TierRecord {
  std::string event_id;
  std::string tier_id;
  std::uint64_t price = 0;  // canonical precision
  std::uint64_t max_quantity = 0;
  std::uint64_t sold_count = 0;
  bool active = true;
};

struct PaymentProof {
  std::string payer;
  std::uint64_t amount = 0;  // minor units of the event currency
};

struct TicketOrder {
  std::string event_id;
  std::string tier_id;
  std::string recipient;
  PaymentProof payment;
};

struct TicketReceipt {
  std::string token_id;
  std::string event_id;
  std::string tier_id;
  std::string recipient;
  Currency currency = Currency::Native;
  std::uint64_t amount_paid = 0;
  std::uint64_t commission = 0;
  std::uint64_t organizer_share = 0;  // same merge rule as SettlementReceipt::payee_amount
  std::uint64_t sold_count = 0;
};

struct PaymentDraft {
  std::string payer;
  std::string recipient;
  std::uint64_t amount = 0;
  Currency currency = Currency::Native;
  SignedAuthorization authorization;
};

struct SettlementReceipt {
  std::string settlement_id;
  std::string payer;
  std::string payee;
  std::string commission_recipient;
  Currency currency = Currency::Native;
  SettlementMode mode = SettlementMode::Direct;
  std::uint64_t amount = 0;
  std::uint64_t commission = 0;
  // Everything the payee receives; includes the commission when the payee is also its recipient.
  std::uint64_t payee_amount = 0;
  std::int64_t settled_unix = 0;
};

struct WithdrawalReceipt {
  std::string owner;
  std::uint64_t native_amount = 0;
  std::uint64_t stable_amount = 0;
};

struct NftMintDraft {
  std::string recipient;
  std::string uri;
  SignedAuthorization authorization;
};

struct NftRecord {
  std::uint64_t token_id = 0;
  std::string owner;
  std::string uri;
  std::int64_t minted_unix = 0;
};

struct AuditRecord {
  std::string record_id;
  std::string kind;
  std::string actor;
  std::int64_t unix_ts = 0;
  std::string payload;
};

struct LedgerTotals {
  std::uint64_t credited = 0;
  std::uint64_t withdrawn = 0;
  std::uint64_t pending = 0;
};

struct EngineConfig {
  std::string data_dir;
  bool enable_snapshots = true;

  std::string domain_name = "CraftiaxLedger";
  std::string domain_version = "1";
  std::string chain_id = "84532";
  std::string service_id = "craftiax-ledger-local";

  std::vector<std::string> admin_identities;
  std::string trusted_verifier;
  std::string escrow_identity = "craftiax-escrow";

  std::string platform_fee_recipient = "craftiax-treasury";
  std::uint32_t platform_fee_percent = 5;
  std::uint32_t max_platform_fee_percent = 20;
  std::int64_t payment_cooldown_seconds = 60;

  PaymentLimits native_limits{
      .min_payment = 10000000000000ULL,             // 0.00001
      .max_payment = 10000000000000000000ULL,       // 10
      .verified_max_payment = 15000000000000000000ULL,  // 15
  };
  PaymentLimits stable_limits{
      .min_payment = 1000000ULL,          // 1
      .max_payment = 10000000000ULL,      // 10,000
      .verified_max_payment = 50000000000ULL,  // 50,000
  };

  std::uint64_t min_tier_price = 100000000000000ULL;        // 0.0001 canonical
  std::uint64_t max_tier_price = 10000000000000000000ULL;   // 10 canonical
  std::size_t max_tiers_per_event = 10;

  unsigned canonical_decimals = 18;
  unsigned native_decimals = 18;
  unsigned stable_decimals = 6;

  SettlementMode payment_settlement_mode = SettlementMode::Direct;
  SettlementMode ticket_settlement_mode = SettlementMode::Pooled;
  bool publish_events_on_create = true;

  std::uint64_t nft_max_supply = 10000;
  std::string nft_base_uri;
};

struct LedgerStatusReport {
  bool initialized = false;
  bool paused = false;
  std::string data_dir;
  std::string chain_id;
  std::string trusted_verifier;
  std::string platform_fee_recipient;
  std::uint32_t platform_fee_percent = 0;
  std::size_t event_count = 0;
  std::size_t tier_count = 0;
  std::size_t verified_count = 0;
  std::size_t nft_count = 0;
  std::uint64_t nft_minted_count = 0;  // burned tokens included
  std::size_t audit_record_count = 0;
  std::size_t rejected_request_count = 0;
  LedgerTotals native_totals;
  LedgerTotals stable_totals;
};

}  // namespace craftiax
