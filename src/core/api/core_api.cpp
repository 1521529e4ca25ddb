#include "core/api/core_api.hpp"

namespace craftiax {

Result CoreApi::init(const EngineConfig& config, std::shared_ptr<ITransferGateway> gateway,
                     std::shared_ptr<IClock> clock) {
  return service_.init(config, std::move(gateway), std::move(clock));
}

Result CoreApi::create_event(const CallerContext& caller, const EventDraft& draft, EventRecord& out) {
  return service_.create_event(caller, draft, out);
}

Result CoreApi::issue_ticket(const CallerContext& caller, const TicketOrder& order, TicketReceipt& out) {
  return service_.issue_ticket(caller, order, out);
}

Result CoreApi::pay_recipient(const CallerContext& caller, const PaymentDraft& draft,
                              SettlementReceipt& out) {
  return service_.pay_recipient(caller, draft, out);
}

Result CoreApi::withdraw_balance(const CallerContext& caller, WithdrawalReceipt& out) {
  return service_.withdraw_balance(caller, out);
}

Result CoreApi::mint_nft(const CallerContext& caller, const NftMintDraft& draft, NftRecord& out) {
  return service_.mint_nft(caller, draft, out);
}

Result CoreApi::burn_nft(const CallerContext& caller, std::uint64_t token_id) {
  return service_.burn_nft(caller, token_id);
}

Result CoreApi::update_tier_price(const CallerContext& caller, std::string_view event_id,
                                  std::string_view tier_id, std::uint64_t new_price) {
  return service_.update_tier_price(caller, event_id, tier_id, new_price);
}

Result CoreApi::set_tier_active(const CallerContext& caller, std::string_view event_id,
                                std::string_view tier_id, bool active) {
  return service_.set_tier_active(caller, event_id, tier_id, active);
}

Result CoreApi::publish_event(const CallerContext& caller, std::string_view event_id) {
  return service_.publish_event(caller, event_id);
}

Result CoreApi::cancel_event(const CallerContext& caller, std::string_view event_id) {
  return service_.cancel_event(caller, event_id);
}

Result CoreApi::complete_event(const CallerContext& caller, std::string_view event_id) {
  return service_.complete_event(caller, event_id);
}

Result CoreApi::reactivate_event(const CallerContext& caller, std::string_view event_id) {
  return service_.reactivate_event(caller, event_id);
}

Result CoreApi::set_verification_status(const CallerContext& caller, std::string_view identity,
                                        bool verified) {
  return service_.set_verification_status(caller, identity, verified);
}

Result CoreApi::set_verification_status_batch(const CallerContext& caller,
                                              const std::vector<std::string>& identities, bool verified) {
  return service_.set_verification_status_batch(caller, identities, verified);
}

Result CoreApi::update_payment_limits(const CallerContext& caller, Currency currency,
                                      const PaymentLimits& limits) {
  return service_.update_payment_limits(caller, currency, limits);
}

Result CoreApi::update_fee_percentage(const CallerContext& caller, std::uint32_t percent) {
  return service_.update_fee_percentage(caller, percent);
}

Result CoreApi::update_fee_recipient(const CallerContext& caller, std::string_view recipient) {
  return service_.update_fee_recipient(caller, recipient);
}

Result CoreApi::update_verifier(const CallerContext& caller, std::string_view verifier) {
  return service_.update_verifier(caller, verifier);
}

Result CoreApi::invalidate_nonce(const CallerContext& caller, std::string_view subject) {
  return service_.invalidate_nonce(caller, subject);
}

Result CoreApi::pause(const CallerContext& caller) {
  return service_.pause(caller);
}

Result CoreApi::unpause(const CallerContext& caller) {
  return service_.unpause(caller);
}

Result CoreApi::set_base_uri(const CallerContext& caller, std::string_view base_uri) {
  return service_.set_base_uri(caller, base_uri);
}

std::optional<EventRecord> CoreApi::event(std::string_view event_id) const {
  return service_.event(event_id);
}

std::vector<EventRecord> CoreApi::events() const {
  return service_.events();
}

std::vector<TierRecord> CoreApi::tiers(std::string_view event_id) const {
  return service_.tiers(event_id);
}

std::uint64_t CoreApi::balance(std::string_view owner, Currency currency) const {
  return service_.balance(owner, currency);
}

std::uint64_t CoreApi::tickets_owned(std::string_view owner, std::string_view event_id,
                                     std::string_view tier_id) const {
  return service_.tickets_owned(owner, event_id, tier_id);
}

std::uint64_t CoreApi::nonce(std::string_view subject) const {
  return service_.nonce(subject);
}

Result CoreApi::nft_token_uri(std::uint64_t token_id, std::string& out) const {
  return service_.nft_token_uri(token_id, out);
}

std::optional<std::string> CoreApi::nft_owner(std::uint64_t token_id) const {
  return service_.nft_owner(token_id);
}

std::vector<AuditRecord> CoreApi::audit_records() const {
  return service_.audit_records();
}

LedgerStatusReport CoreApi::status() const {
  return service_.status();
}

AuthorizationDomain CoreApi::authorization_domain() const {
  return service_.authorization_domain();
}

}  // namespace craftiax
