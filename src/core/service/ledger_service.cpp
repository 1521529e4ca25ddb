#include "core/service/ledger_service.hpp"

#include <algorithm>
#include <set>

#include "core/model/enum_names.hpp"
#include "core/service/config_loader.hpp"
#include "core/util/canonical.hpp"

namespace craftiax {
namespace {

constexpr std::string_view kNotInitialized = "Ledger service is not initialized.";

// Clears the active-thread marker when an operation unwinds.
class ActiveThreadScope {
public:
  explicit ActiveThreadScope(std::atomic<std::thread::id>& slot) : slot_(slot) {
    slot_.store(std::this_thread::get_id());
  }
  ~ActiveThreadScope() { slot_.store(std::thread::id{}); }

  ActiveThreadScope(const ActiveThreadScope&) = delete;
  ActiveThreadScope& operator=(const ActiveThreadScope&) = delete;

private:
  std::atomic<std::thread::id>& slot_;
};

}  // namespace

Result LedgerService::init(const EngineConfig& config, std::shared_ptr<ITransferGateway> gateway,
                           std::shared_ptr<IClock> clock) {
  if (active_thread_.load() == std::this_thread::get_id()) {
    return Result::failure(ErrorCode::ReentrantCall, "Re-entrant call to init rejected.");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  initialized_ = false;

  if (!gateway || !clock) {
    return Result::failure(ErrorCode::InvalidArgument, "Init failed: transfer gateway and clock are required.");
  }
  if (const Result valid = validate_engine_config(config); !valid.ok) {
    return Result::failure(valid.code, "Init failed: " + valid.message);
  }

  config_ = config;
  config_.trusted_verifier = util::lowercase_copy(config_.trusted_verifier);
  gateway_ = std::move(gateway);
  clock_ = std::move(clock);

  if (const Result crypto_init = crypto_.initialize(); !crypto_init.ok) {
    return crypto_init;
  }
  if (const Result opened = store_.open(config_.data_dir, config_.enable_snapshots); !opened.ok) {
    return opened;
  }

  normalizer_ = CurrencyNormalizer(config_.canonical_decimals, config_.native_decimals, config_.stable_decimals);
  verifier_ = std::make_unique<AuthorizationVerifier>(store_, crypto_,
                                                      AuthorizationDomain{
                                                          .name = config_.domain_name,
                                                          .version = config_.domain_version,
                                                          .chain_id = config_.chain_id,
                                                          .service_id = config_.service_id,
                                                      });
  settlement_ = std::make_unique<SettlementEngine>(store_, *gateway_, config_.escrow_identity);
  events_ = std::make_unique<EventLedger>(store_, TierPolicy{
                                                      .min_price = config_.min_tier_price,
                                                      .max_price = config_.max_tier_price,
                                                      .max_tiers = config_.max_tiers_per_event,
                                                  });
  nfts_ = std::make_unique<NftRegistry>(store_, config_.nft_max_supply);

  // A restored snapshot keeps its administered settings; config only seeds a fresh store.
  if (!store_.restored_from_snapshot()) {
    if (const Result seeded = seed_settings(config_); !seeded.ok) {
      return seeded;
    }
  }

  initialized_ = true;
  return Result::success(store_.restored_from_snapshot() ? "Ledger restored from snapshot."
                                                         : "Ledger initialized.",
                         store_.data_dir());
}

Result LedgerService::seed_settings(const EngineConfig& config) {
  Store::Transaction tx(store_);
  auto& tables = store_.tables();
  tables.settings = Store::Settings{
      .trusted_verifier = config.trusted_verifier,
      .platform_fee_recipient = config.platform_fee_recipient,
      .platform_fee_percent = config.platform_fee_percent,
      .nft_base_uri = config.nft_base_uri,
      .paused = false,
  };
  tables.limits[Currency::Native] = config.native_limits;
  tables.limits[Currency::Stable] = config.stable_limits;
  store_.stage_audit("LedgerInitialized", "system", clock_->now(),
                     {{"chain_id", config.chain_id},
                      {"trusted_verifier", config.trusted_verifier},
                      {"platform_fee_percent", std::to_string(config.platform_fee_percent)}});
  return tx.commit();
}

Result LedgerService::run_atomic(std::string_view operation, const std::function<Result()>& body) {
  if (active_thread_.load() == std::this_thread::get_id()) {
    const Result rejected =
        Result::failure(ErrorCode::ReentrantCall, "Re-entrant call to " + std::string{operation} + " rejected.");
    store_.record_rejection(operation, rejected);
    return rejected;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    return Result::failure(ErrorCode::NotInitialized, std::string{kNotInitialized});
  }
  ActiveThreadScope active(active_thread_);

  Store::Transaction tx(store_);
  if (!tx.active()) {
    return Result::failure(ErrorCode::PersistenceFailed, "Failed to open store transaction.");
  }
  settlement_->begin_operation();

  Result result = body();
  if (result.ok) {
    const Result committed = tx.commit();
    if (committed.ok) {
      return result;
    }
    result = committed;
  }

  tx.rollback();
  if (const Result unwound = settlement_->unwind_transfers(); !unwound.ok) {
    result.message += " " + unwound.message;
  }
  store_.record_rejection(operation, result);
  return result;
}

std::unique_lock<std::mutex> LedgerService::read_lock() const {
  std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
  // Reads issued from inside a running operation on this thread already hold the lock.
  if (active_thread_.load() != std::this_thread::get_id()) {
    lock.lock();
  }
  return lock;
}

Result LedgerService::require_admin(const CallerContext& caller) const {
  const auto& admins = config_.admin_identities;
  if (caller.identity.empty() || std::find(admins.begin(), admins.end(), caller.identity) == admins.end()) {
    return Result::failure(ErrorCode::Unauthorized, "Caller `" + caller.identity + "` is not an administrator.");
  }
  return Result::success();
}

Result LedgerService::require_not_paused() const {
  if (store_.tables().settings.paused) {
    return Result::failure(ErrorCode::Paused, "Ledger is paused.");
  }
  return Result::success();
}

Result LedgerService::create_event(const CallerContext& caller, const EventDraft& draft, EventRecord& out) {
  return run_atomic("create_event", [&]() -> Result {
    const EventStatus initial = config_.publish_events_on_create ? EventStatus::Published : EventStatus::Draft;
    const std::int64_t now = clock_->now();
    EventRecord record;
    if (const Result created = events_->create_event(draft, caller.identity, initial, now, record);
        !created.ok) {
      return created;
    }

    store_.stage_audit("EventCreated", caller.identity, now,
                       {{"event_id", record.event_id},
                        {"name", record.name},
                        {"status", event_status_name(record.status)},
                        {"currency", currency_name(record.currency)},
                        {"commission_percent", std::to_string(record.commission_percent)},
                        {"commission_recipient", record.commission_recipient},
                        {"tiers", util::join_csv(record.tier_ids)}});
    out = std::move(record);
    return Result::success("Event created.", out.event_id);
  });
}

Result LedgerService::issue_ticket(const CallerContext& caller, const TicketOrder& order, TicketReceipt& out) {
  return run_atomic("issue_ticket", [&]() -> Result {
    if (const Result open = require_not_paused(); !open.ok) {
      return open;
    }
    if (order.recipient.empty() || order.payment.payer.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "Ticket issuance requires a recipient and a payer.");
    }

    const std::int64_t now = clock_->now();
    if (const Result issuable = events_->check_issuable(order.event_id, order.tier_id, now); !issuable.ok) {
      return issuable;
    }
    const EventRecord record = *events_->event(order.event_id);
    const TierRecord tier_record = *events_->tier(order.event_id, order.tier_id);

    std::uint64_t price = 0;
    if (const Result scaled = normalizer_.to_currency_units(tier_record.price, record.currency, price);
        !scaled.ok) {
      return scaled;
    }
    if (order.payment.amount != price) {
      return Result::failure(ErrorCode::IncorrectPayment,
                             "Incorrect payment: expected " + std::to_string(price) + " " +
                                 currency_name(record.currency) + " units, got " +
                                 std::to_string(order.payment.amount) + ".");
    }

    SettlementReceipt settlement;
    const Result settled = settlement_->settle(
        SettlementRequest{
            .payer = order.payment.payer,
            .payee = record.organizer,
            .commission_recipient = record.commission_recipient,
            .currency = record.currency,
            .amount = price,
            .commission_percent = record.commission_percent,
            .mode = config_.ticket_settlement_mode,
        },
        now, settlement);
    if (!settled.ok) {
      return settled;
    }

    std::uint64_t sold_count = 0;
    if (const Result issued = events_->record_issuance(order.event_id, order.tier_id, order.recipient, sold_count);
        !issued.ok) {
      return issued;
    }

    out = TicketReceipt{
        .token_id = EventLedger::ticket_token_id(order.event_id, order.tier_id),
        .event_id = order.event_id,
        .tier_id = order.tier_id,
        .recipient = order.recipient,
        .currency = record.currency,
        .amount_paid = price,
        .commission = settlement.commission,
        .organizer_share = settlement.payee_amount,
        .sold_count = sold_count,
    };
    store_.stage_audit("TicketIssued", caller.identity, now,
                       {{"event_id", out.event_id},
                        {"tier_id", out.tier_id},
                        {"token_id", out.token_id},
                        {"recipient", out.recipient},
                        {"payer", order.payment.payer},
                        {"amount", std::to_string(out.amount_paid)},
                        {"commission", std::to_string(out.commission)},
                        {"settlement_id", settlement.settlement_id},
                        {"sold_count", std::to_string(sold_count)}});
    return Result::success("Ticket issued.", out.token_id);
  });
}

Result LedgerService::pay_recipient(const CallerContext& caller, const PaymentDraft& draft,
                                    SettlementReceipt& out) {
  return run_atomic("pay_recipient", [&]() -> Result {
    if (const Result open = require_not_paused(); !open.ok) {
      return open;
    }
    if (draft.payer.empty() || draft.recipient.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "Payment requires a payer and a recipient.");
    }
    if (caller.identity != draft.payer) {
      return Result::failure(ErrorCode::Unauthorized, "Only the payer may submit this payment.");
    }
    if (draft.amount == 0) {
      return Result::failure(ErrorCode::InvalidArgument, "Payment amount must be positive.");
    }

    const std::int64_t now = clock_->now();
    if (const Result allowed = settlement_->check_rate_limit(draft.payer, now, config_.payment_cooldown_seconds);
        !allowed.ok) {
      return allowed;
    }
    if (const Result authorized = verifier_->verify_and_consume(payment_authorization_payload(draft),
                                                                draft.authorization.signature, now);
        !authorized.ok) {
      return authorized;
    }

    const bool verified = store_.tables().verified.count(draft.recipient) > 0;
    if (const Result quoted = settlement_->quote_and_validate(draft.amount, draft.currency, verified);
        !quoted.ok) {
      return quoted;
    }

    const auto& settings = store_.tables().settings;
    SettlementReceipt receipt;
    if (const Result settled = settlement_->settle(
            SettlementRequest{
                .payer = draft.payer,
                .payee = draft.recipient,
                .commission_recipient = settings.platform_fee_recipient,
                .currency = draft.currency,
                .amount = draft.amount,
                .commission_percent = settings.platform_fee_percent,
                .mode = config_.payment_settlement_mode,
            },
            now, receipt);
        !settled.ok) {
      return settled;
    }
    settlement_->record_payment_time(draft.payer, now);

    store_.stage_audit("PaymentSettled", caller.identity, now,
                       {{"settlement_id", receipt.settlement_id},
                        {"payer", receipt.payer},
                        {"recipient", receipt.payee},
                        {"currency", currency_name(receipt.currency)},
                        {"mode", settlement_mode_name(receipt.mode)},
                        {"amount", std::to_string(receipt.amount)},
                        {"fee", std::to_string(receipt.commission)},
                        {"nonce", std::to_string(draft.authorization.nonce)}});
    out = std::move(receipt);
    return Result::success("Payment settled.", out.settlement_id);
  });
}

Result LedgerService::withdraw_balance(const CallerContext& caller, WithdrawalReceipt& out) {
  return run_atomic("withdraw_balance", [&]() -> Result {
    if (const Result open = require_not_paused(); !open.ok) {
      return open;
    }
    if (caller.identity.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "Withdrawal requires a caller identity.");
    }

    WithdrawalReceipt receipt;
    if (const Result withdrawn = settlement_->withdraw(caller.identity, receipt); !withdrawn.ok) {
      return withdrawn;
    }
    store_.stage_audit("BalanceWithdrawn", caller.identity, clock_->now(),
                       {{"native_amount", std::to_string(receipt.native_amount)},
                        {"stable_amount", std::to_string(receipt.stable_amount)}});
    out = std::move(receipt);
    return Result::success("Balance withdrawn.");
  });
}

Result LedgerService::mint_nft(const CallerContext& caller, const NftMintDraft& draft, NftRecord& out) {
  return run_atomic("mint_nft", [&]() -> Result {
    if (const Result open = require_not_paused(); !open.ok) {
      return open;
    }
    if (draft.recipient.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "NFT recipient is required.");
    }

    const std::int64_t now = clock_->now();
    if (const Result authorized = verifier_->verify_and_consume(nft_mint_authorization_payload(draft),
                                                                draft.authorization.signature, now);
        !authorized.ok) {
      return authorized;
    }

    NftRecord record;
    if (const Result minted = nfts_->mint(draft.recipient, draft.uri, now, record); !minted.ok) {
      return minted;
    }
    store_.stage_audit("NftMinted", caller.identity, now,
                       {{"token_id", std::to_string(record.token_id)},
                        {"to", record.owner},
                        {"uri", record.uri}});
    out = std::move(record);
    return Result::success("NFT minted.", std::to_string(out.token_id));
  });
}

Result LedgerService::burn_nft(const CallerContext& caller, std::uint64_t token_id) {
  return run_atomic("burn_nft", [&]() -> Result {
    if (const Result burned = nfts_->burn(caller.identity, token_id); !burned.ok) {
      return burned;
    }
    store_.stage_audit("NftBurned", caller.identity, clock_->now(), {{"token_id", std::to_string(token_id)}});
    return Result::success("NFT burned.", std::to_string(token_id));
  });
}

Result LedgerService::update_tier_price(const CallerContext& caller, std::string_view event_id,
                                        std::string_view tier_id, std::uint64_t new_price) {
  return run_atomic("update_tier_price", [&]() -> Result {
    if (const Result allowed = events_->require_manager(event_id, caller.identity, require_admin(caller).ok);
        !allowed.ok) {
      return allowed;
    }
    if (const Result updated = events_->update_tier_price(event_id, tier_id, new_price); !updated.ok) {
      return updated;
    }
    store_.stage_audit("TierPriceUpdated", caller.identity, clock_->now(),
                       {{"event_id", std::string{event_id}},
                        {"tier_id", std::string{tier_id}},
                        {"price", std::to_string(new_price)}});
    return Result::success("Tier price updated.");
  });
}

Result LedgerService::set_tier_active(const CallerContext& caller, std::string_view event_id,
                                      std::string_view tier_id, bool active) {
  return run_atomic("set_tier_active", [&]() -> Result {
    if (const Result allowed = events_->require_manager(event_id, caller.identity, require_admin(caller).ok);
        !allowed.ok) {
      return allowed;
    }
    if (const Result updated = events_->set_tier_active(event_id, tier_id, active); !updated.ok) {
      return updated;
    }
    store_.stage_audit("TierActiveChanged", caller.identity, clock_->now(),
                       {{"event_id", std::string{event_id}},
                        {"tier_id", std::string{tier_id}},
                        {"active", active ? "1" : "0"}});
    return Result::success(active ? "Tier activated." : "Tier deactivated.");
  });
}

Result LedgerService::manage_event(std::string_view operation, const CallerContext& caller,
                                   std::string_view event_id, EventStatus target,
                                   std::optional<EventStatus> required_current) {
  return run_atomic(operation, [&]() -> Result {
    if (const Result allowed = events_->require_manager(event_id, caller.identity, require_admin(caller).ok);
        !allowed.ok) {
      return allowed;
    }
    if (required_current.has_value() && events_->event(event_id)->status != *required_current) {
      return Result::failure(ErrorCode::InvalidStatusTransition,
                             "Event must be " + event_status_name(*required_current) + " for " +
                                 std::string{operation} + ".");
    }
    const Result moved = events_->transition(event_id, target);
    if (!moved.ok) {
      return moved;
    }
    store_.stage_audit("EventStatusChanged", caller.identity, clock_->now(),
                       {{"event_id", std::string{event_id}}, {"status", event_status_name(target)}});
    return moved;
  });
}

Result LedgerService::publish_event(const CallerContext& caller, std::string_view event_id) {
  return manage_event("publish_event", caller, event_id, EventStatus::Published, EventStatus::Draft);
}

Result LedgerService::cancel_event(const CallerContext& caller, std::string_view event_id) {
  return manage_event("cancel_event", caller, event_id, EventStatus::Cancelled, std::nullopt);
}

Result LedgerService::complete_event(const CallerContext& caller, std::string_view event_id) {
  return manage_event("complete_event", caller, event_id, EventStatus::Completed, std::nullopt);
}

Result LedgerService::reactivate_event(const CallerContext& caller, std::string_view event_id) {
  return manage_event("reactivate_event", caller, event_id, EventStatus::Published, EventStatus::Cancelled);
}

Result LedgerService::apply_verification(std::string_view identity, bool verified) {
  if (identity.empty()) {
    return Result::failure(ErrorCode::ZeroAddress, "Verification requires an identity.");
  }
  auto& verified_set = store_.tables().verified;
  const std::string key{identity};
  if ((verified_set.count(key) > 0) == verified) {
    return Result::failure(ErrorCode::DuplicateVerificationStatus,
                           "Identity `" + key + "` already has verification status " + (verified ? "1" : "0") +
                               ".");
  }
  if (verified) {
    verified_set.insert(key);
  } else {
    verified_set.erase(key);
  }
  return Result::success();
}

Result LedgerService::set_verification_status(const CallerContext& caller, std::string_view identity,
                                              bool verified) {
  return run_atomic("set_verification_status", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    if (const Result applied = apply_verification(identity, verified); !applied.ok) {
      return applied;
    }
    store_.stage_audit("VerificationStatusUpdated", caller.identity, clock_->now(),
                       {{"identity", std::string{identity}}, {"verified", verified ? "1" : "0"}});
    return Result::success("Verification status updated.");
  });
}

Result LedgerService::set_verification_status_batch(const CallerContext& caller,
                                                    const std::vector<std::string>& identities, bool verified) {
  return run_atomic("set_verification_status_batch", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    if (identities.empty()) {
      return Result::failure(ErrorCode::InvalidArgument, "Verification batch is empty.");
    }
    for (const auto& identity : identities) {
      if (const Result applied = apply_verification(identity, verified); !applied.ok) {
        return applied;
      }
    }
    store_.stage_audit("VerificationStatusBatchUpdated", caller.identity, clock_->now(),
                       {{"identities", util::join_csv(identities)}, {"verified", verified ? "1" : "0"}});
    return Result::success("Verification status updated for " + std::to_string(identities.size()) +
                           " identities.");
  });
}

Result LedgerService::update_payment_limits(const CallerContext& caller, Currency currency,
                                            const PaymentLimits& limits) {
  return run_atomic("update_payment_limits", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    if (const Result valid = validate_payment_limits(limits); !valid.ok) {
      return valid;
    }
    store_.tables().limits[currency] = limits;
    store_.stage_audit("PaymentLimitsUpdated", caller.identity, clock_->now(),
                       {{"currency", currency_name(currency)},
                        {"min_payment", std::to_string(limits.min_payment)},
                        {"max_payment", std::to_string(limits.max_payment)},
                        {"verified_max_payment", std::to_string(limits.verified_max_payment)}});
    return Result::success("Payment limits updated.");
  });
}

Result LedgerService::update_fee_percentage(const CallerContext& caller, std::uint32_t percent) {
  return run_atomic("update_fee_percentage", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    if (percent > config_.max_platform_fee_percent) {
      return Result::failure(ErrorCode::CommissionOutOfRange,
                             "Fee percentage cannot exceed " + std::to_string(config_.max_platform_fee_percent) +
                                 ".");
    }
    if (percent > 0 && store_.tables().settings.platform_fee_recipient.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "A platform fee requires a fee recipient.");
    }
    store_.tables().settings.platform_fee_percent = percent;
    store_.stage_audit("FeePercentageUpdated", caller.identity, clock_->now(),
                       {{"percent", std::to_string(percent)}});
    return Result::success("Fee percentage updated.");
  });
}

Result LedgerService::update_fee_recipient(const CallerContext& caller, std::string_view recipient) {
  return run_atomic("update_fee_recipient", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    if (recipient.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "Fee recipient is required.");
    }
    store_.tables().settings.platform_fee_recipient = std::string{recipient};
    store_.stage_audit("FeeRecipientUpdated", caller.identity, clock_->now(),
                       {{"recipient", std::string{recipient}}});
    return Result::success("Fee recipient updated.");
  });
}

Result LedgerService::update_verifier(const CallerContext& caller, std::string_view verifier) {
  return run_atomic("update_verifier", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    if (verifier.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "Verifier identity is required.");
    }
    store_.tables().settings.trusted_verifier = util::lowercase_copy(verifier);
    store_.stage_audit("VerifierUpdated", caller.identity, clock_->now(),
                       {{"verifier", store_.tables().settings.trusted_verifier}});
    return Result::success("Trusted verifier updated.");
  });
}

Result LedgerService::invalidate_nonce(const CallerContext& caller, std::string_view subject) {
  return run_atomic("invalidate_nonce", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    if (subject.empty()) {
      return Result::failure(ErrorCode::ZeroAddress, "Nonce subject is required.");
    }
    verifier_->invalidate(subject);
    store_.stage_audit("NonceInvalidated", caller.identity, clock_->now(), {{"subject", std::string{subject}}});
    return Result::success("Nonce invalidated.");
  });
}

Result LedgerService::pause(const CallerContext& caller) {
  return run_atomic("pause", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    auto& settings = store_.tables().settings;
    if (settings.paused) {
      return Result::failure(ErrorCode::InvalidStatusTransition, "Ledger is already paused.");
    }
    settings.paused = true;
    store_.stage_audit("Paused", caller.identity, clock_->now(), {});
    return Result::success("Ledger paused.");
  });
}

Result LedgerService::unpause(const CallerContext& caller) {
  return run_atomic("unpause", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    auto& settings = store_.tables().settings;
    if (!settings.paused) {
      return Result::failure(ErrorCode::InvalidStatusTransition, "Ledger is not paused.");
    }
    settings.paused = false;
    store_.stage_audit("Unpaused", caller.identity, clock_->now(), {});
    return Result::success("Ledger unpaused.");
  });
}

Result LedgerService::set_base_uri(const CallerContext& caller, std::string_view base_uri) {
  return run_atomic("set_base_uri", [&]() -> Result {
    if (const Result admin = require_admin(caller); !admin.ok) {
      return admin;
    }
    nfts_->set_base_uri(base_uri);
    store_.stage_audit("BaseUriUpdated", caller.identity, clock_->now(), {{"base_uri", std::string{base_uri}}});
    return Result::success("Base URI updated.");
  });
}

std::optional<EventRecord> LedgerService::event(std::string_view event_id) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return std::nullopt;
  }
  return events_->event(event_id);
}

std::vector<EventRecord> LedgerService::events() const {
  const auto lock = read_lock();
  if (!initialized_) {
    return {};
  }
  return events_->events();
}

std::optional<TierRecord> LedgerService::tier(std::string_view event_id, std::string_view tier_id) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return std::nullopt;
  }
  return events_->tier(event_id, tier_id);
}

std::vector<TierRecord> LedgerService::tiers(std::string_view event_id) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return {};
  }
  return events_->tiers(event_id);
}

std::uint64_t LedgerService::balance(std::string_view owner, Currency currency) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return 0;
  }
  return settlement_->balance(owner, currency);
}

std::uint64_t LedgerService::tickets_owned(std::string_view owner, std::string_view event_id,
                                           std::string_view tier_id) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return 0;
  }
  return events_->tickets_owned(owner, EventLedger::ticket_token_id(event_id, tier_id));
}

std::uint64_t LedgerService::nonce(std::string_view subject) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return 0;
  }
  return verifier_->current_nonce(subject);
}

bool LedgerService::is_verified(std::string_view identity) const {
  const auto lock = read_lock();
  return initialized_ && store_.tables().verified.count(std::string{identity}) > 0;
}

std::optional<PaymentLimits> LedgerService::payment_limits(Currency currency) const {
  const auto lock = read_lock();
  const auto& limits = store_.tables().limits;
  const auto it = limits.find(currency);
  if (!initialized_ || it == limits.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<NftRecord> LedgerService::nft(std::uint64_t token_id) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return std::nullopt;
  }
  return nfts_->token(token_id);
}

Result LedgerService::nft_token_uri(std::uint64_t token_id, std::string& out) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return Result::failure(ErrorCode::NotInitialized, std::string{kNotInitialized});
  }
  return nfts_->token_uri(token_id, out);
}

std::uint64_t LedgerService::nft_balance(std::string_view owner) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return 0;
  }
  return nfts_->balance_of(owner);
}

std::optional<std::string> LedgerService::nft_owner(std::uint64_t token_id) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return std::nullopt;
  }
  return nfts_->owner_of(token_id);
}

LedgerTotals LedgerService::ledger_totals(Currency currency) const {
  const auto lock = read_lock();
  if (!initialized_) {
    return {};
  }
  return settlement_->totals(currency);
}

std::vector<AuditRecord> LedgerService::audit_records() const {
  const auto lock = read_lock();
  return store_.audit_records();
}

bool LedgerService::paused() const {
  const auto lock = read_lock();
  return store_.tables().settings.paused;
}

AuthorizationDomain LedgerService::authorization_domain() const {
  const auto lock = read_lock();
  return {
      .name = config_.domain_name,
      .version = config_.domain_version,
      .chain_id = config_.chain_id,
      .service_id = config_.service_id,
  };
}

LedgerStatusReport LedgerService::status() const {
  const auto lock = read_lock();
  LedgerStatusReport report;
  report.initialized = initialized_;
  report.data_dir = store_.data_dir();
  report.chain_id = config_.chain_id;
  if (!initialized_) {
    return report;
  }

  const auto& tables = store_.tables();
  report.paused = tables.settings.paused;
  report.trusted_verifier = tables.settings.trusted_verifier;
  report.platform_fee_recipient = tables.settings.platform_fee_recipient;
  report.platform_fee_percent = tables.settings.platform_fee_percent;
  report.event_count = tables.events.size();
  report.tier_count = tables.tiers.size();
  report.verified_count = tables.verified.size();
  report.nft_count = tables.nfts.size();
  report.nft_minted_count = nfts_->minted_count();
  report.audit_record_count = store_.audit_records().size();
  report.rejected_request_count = store_.rejected_request_count();
  report.native_totals = settlement_->totals(Currency::Native);
  report.stable_totals = settlement_->totals(Currency::Stable);
  return report;
}

}  // namespace craftiax
