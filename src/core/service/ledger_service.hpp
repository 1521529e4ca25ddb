#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/auth/authorization.hpp"
#include "core/crypto/crypto.hpp"
#include "core/inventory/event_ledger.hpp"
#include "core/inventory/nft_registry.hpp"
#include "core/ledger/currency.hpp"
#include "core/ledger/settlement.hpp"
#include "core/ledger/transfer_gateway.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace craftiax {

// Single-writer engine. Every mutating call runs under the service mutex
// inside one store transaction; a failure at any step rolls the tables back
// and reverses the transfers already issued. A call made back into the
// service from inside a transfer on the same thread fails with ReentrantCall.
class LedgerService {
public:
  Result init(const EngineConfig& config, std::shared_ptr<ITransferGateway> gateway,
              std::shared_ptr<IClock> clock);
  [[nodiscard]] bool initialized() const { return initialized_; }

  Result create_event(const CallerContext& caller, const EventDraft& draft, EventRecord& out);
  Result issue_ticket(const CallerContext& caller, const TicketOrder& order, TicketReceipt& out);
  Result pay_recipient(const CallerContext& caller, const PaymentDraft& draft, SettlementReceipt& out);
  Result withdraw_balance(const CallerContext& caller, WithdrawalReceipt& out);
  Result mint_nft(const CallerContext& caller, const NftMintDraft& draft, NftRecord& out);
  Result burn_nft(const CallerContext& caller, std::uint64_t token_id);

  Result update_tier_price(const CallerContext& caller, std::string_view event_id, std::string_view tier_id,
                           std::uint64_t new_price);
  Result set_tier_active(const CallerContext& caller, std::string_view event_id, std::string_view tier_id,
                         bool active);
  Result publish_event(const CallerContext& caller, std::string_view event_id);
  Result cancel_event(const CallerContext& caller, std::string_view event_id);
  Result complete_event(const CallerContext& caller, std::string_view event_id);
  Result reactivate_event(const CallerContext& caller, std::string_view event_id);

  Result set_verification_status(const CallerContext& caller, std::string_view identity, bool verified);
  Result set_verification_status_batch(const CallerContext& caller, const std::vector<std::string>& identities,
                                       bool verified);
  Result update_payment_limits(const CallerContext& caller, Currency currency, const PaymentLimits& limits);
  Result update_fee_percentage(const CallerContext& caller, std::uint32_t percent);
  Result update_fee_recipient(const CallerContext& caller, std::string_view recipient);
  Result update_verifier(const CallerContext& caller, std::string_view verifier);
  Result invalidate_nonce(const CallerContext& caller, std::string_view subject);
  Result pause(const CallerContext& caller);
  Result unpause(const CallerContext& caller);
  Result set_base_uri(const CallerContext& caller, std::string_view base_uri);

  [[nodiscard]] std::optional<EventRecord> event(std::string_view event_id) const;
  [[nodiscard]] std::vector<EventRecord> events() const;
  [[nodiscard]] std::optional<TierRecord> tier(std::string_view event_id, std::string_view tier_id) const;
  [[nodiscard]] std::vector<TierRecord> tiers(std::string_view event_id) const;
  [[nodiscard]] std::uint64_t balance(std::string_view owner, Currency currency) const;
  [[nodiscard]] std::uint64_t tickets_owned(std::string_view owner, std::string_view event_id,
                                            std::string_view tier_id) const;
  [[nodiscard]] std::uint64_t nonce(std::string_view subject) const;
  [[nodiscard]] bool is_verified(std::string_view identity) const;
  [[nodiscard]] std::optional<PaymentLimits> payment_limits(Currency currency) const;
  [[nodiscard]] std::optional<NftRecord> nft(std::uint64_t token_id) const;
  Result nft_token_uri(std::uint64_t token_id, std::string& out) const;
  [[nodiscard]] std::uint64_t nft_balance(std::string_view owner) const;
  [[nodiscard]] std::optional<std::string> nft_owner(std::uint64_t token_id) const;
  [[nodiscard]] LedgerTotals ledger_totals(Currency currency) const;
  [[nodiscard]] std::vector<AuditRecord> audit_records() const;
  [[nodiscard]] bool paused() const;
  [[nodiscard]] LedgerStatusReport status() const;
  [[nodiscard]] AuthorizationDomain authorization_domain() const;

  static std::string ticket_token_id(std::string_view event_id, std::string_view tier_id) {
    return EventLedger::ticket_token_id(event_id, tier_id);
  }

private:
  Result run_atomic(std::string_view operation, const std::function<Result()>& body);
  std::unique_lock<std::mutex> read_lock() const;

  Result require_admin(const CallerContext& caller) const;
  Result require_not_paused() const;
  Result manage_event(std::string_view operation, const CallerContext& caller, std::string_view event_id,
                      EventStatus target, std::optional<EventStatus> required_current);
  Result apply_verification(std::string_view identity, bool verified);
  Result seed_settings(const EngineConfig& config);

  EngineConfig config_;
  Store store_;
  CryptoEngine crypto_;
  std::shared_ptr<ITransferGateway> gateway_;
  std::shared_ptr<IClock> clock_;

  CurrencyNormalizer normalizer_;
  std::unique_ptr<AuthorizationVerifier> verifier_;
  std::unique_ptr<SettlementEngine> settlement_;
  std::unique_ptr<EventLedger> events_;
  std::unique_ptr<NftRegistry> nfts_;

  mutable std::mutex mutex_;
  std::atomic<std::thread::id> active_thread_{};
  bool initialized_ = false;
};

}  // namespace craftiax
