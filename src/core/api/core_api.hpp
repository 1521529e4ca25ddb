#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/ledger/transfer_gateway.hpp"
#include "core/model/types.hpp"
#include "core/service/ledger_service.hpp"

namespace craftiax {

class CoreApi {
public:
  Result init(const EngineConfig& config, std::shared_ptr<ITransferGateway> gateway,
              std::shared_ptr<IClock> clock);

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

  std::optional<EventRecord> event(std::string_view event_id) const;
  std::vector<EventRecord> events() const;
  std::vector<TierRecord> tiers(std::string_view event_id) const;
  std::uint64_t balance(std::string_view owner, Currency currency) const;
  std::uint64_t tickets_owned(std::string_view owner, std::string_view event_id, std::string_view tier_id) const;
  std::uint64_t nonce(std::string_view subject) const;
  Result nft_token_uri(std::uint64_t token_id, std::string& out) const;
  std::optional<std::string> nft_owner(std::uint64_t token_id) const;
  std::vector<AuditRecord> audit_records() const;
  LedgerStatusReport status() const;
  AuthorizationDomain authorization_domain() const;

private:
  LedgerService service_;
};

}  // namespace craftiax
