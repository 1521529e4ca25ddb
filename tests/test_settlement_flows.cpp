#include <atomic>
#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/auth/authorization.hpp"
#include "core/crypto/crypto.hpp"
#include "core/ledger/transfer_gateway.hpp"
#include "core/service/ledger_service.hpp"

namespace {

constexpr std::int64_t kNow = 1700000000;
constexpr std::uint64_t kEth = 1000000000000000000ULL;
constexpr std::uint64_t kUsdc = 1000000ULL;

const craftiax::CallerContext kAdmin{.identity = "admin"};
const craftiax::CallerContext kOrganizer{.identity = "organizer"};
const craftiax::CallerContext kBuyer{.identity = "buyer"};
const craftiax::CallerContext kFan{.identity = "fan"};
const craftiax::CallerContext kMallory{.identity = "mallory"};

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "craftiax-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

craftiax::EngineConfig base_config(const std::string& verifier) {
  craftiax::EngineConfig config;
  config.service_id = "craftiax-test";
  config.admin_identities = {"admin"};
  config.trusted_verifier = verifier;
  config.platform_fee_recipient = "treasury";
  return config;
}

struct Harness {
  explicit Harness(const std::function<void(craftiax::EngineConfig&)>& tweak = {}) {
    assert(crypto.initialize().ok);
    assert(crypto.generate_keypair(verifier_keys).ok);
    config = base_config(verifier_keys.public_key);
    if (tweak) {
      tweak(config);
    }
    const craftiax::Result init = service.init(config, gateway, clock);
    assert(init.ok);
    signer = std::make_unique<craftiax::AuthorizationSigner>(crypto, service.authorization_domain(),
                                                             verifier_keys.secret_key);
  }

  craftiax::PaymentDraft payment(const std::string& payer, const std::string& recipient, std::uint64_t amount,
                                 craftiax::Currency currency, std::uint64_t nonce) const {
    craftiax::PaymentDraft draft{
        .payer = payer,
        .recipient = recipient,
        .amount = amount,
        .currency = currency,
        .authorization = {.nonce = nonce, .deadline_unix = clock->now() + 600, .signature = {}},
    };
    draft.authorization.signature = signer->sign_payment(draft);
    return draft;
  }

  craftiax::NftMintDraft nft_mint(const std::string& recipient, const std::string& uri, std::uint64_t nonce) const {
    craftiax::NftMintDraft draft{
        .recipient = recipient,
        .uri = uri,
        .authorization = {.nonce = nonce, .deadline_unix = clock->now() + 600, .signature = {}},
    };
    draft.authorization.signature = signer->sign_nft_mint(draft);
    return draft;
  }

  void create_event(const std::string& event_id, craftiax::Currency currency, std::uint64_t ga_price,
                    std::uint64_t ga_quantity, std::uint32_t commission_percent,
                    const std::string& commission_recipient) {
    craftiax::EventRecord record;
    const craftiax::Result created = service.create_event(kOrganizer,
                                                          {
                                                              .event_id = event_id,
                                                              .name = "Show " + event_id,
                                                              .description = "Live set",
                                                              .start_unix = kNow - 100,
                                                              .end_unix = kNow + 86400,
                                                              .tier_ids = {"GA", "VIP"},
                                                              .prices = {ga_price, 5 * ga_price},
                                                              .max_quantities = {ga_quantity, 1},
                                                              .currency = currency,
                                                              .commission_percent = commission_percent,
                                                              .commission_recipient = commission_recipient,
                                                          },
                                                          record);
    assert(created.ok);
    assert(record.organizer == "organizer");
  }

  craftiax::Result buy(const std::string& event_id, const std::string& tier_id, std::uint64_t amount,
                       craftiax::TicketReceipt& receipt) {
    return service.issue_ticket(kBuyer,
                                {
                                    .event_id = event_id,
                                    .tier_id = tier_id,
                                    .recipient = "buyer",
                                    .payment = {.payer = "buyer", .amount = amount},
                                },
                                receipt);
  }

  std::shared_ptr<craftiax::InMemoryTransferGateway> gateway =
      std::make_shared<craftiax::InMemoryTransferGateway>();
  std::shared_ptr<craftiax::ManualClock> clock = std::make_shared<craftiax::ManualClock>(kNow);
  craftiax::CryptoEngine crypto;
  craftiax::SigningKeyPair verifier_keys;
  craftiax::EngineConfig config;
  craftiax::LedgerService service;
  std::unique_ptr<craftiax::AuthorizationSigner> signer;
};

void assert_conserved(const craftiax::LedgerTotals& totals) {
  assert(totals.pending + totals.withdrawn == totals.credited);
}

void test_ticket_issuance_pooled() {
  Harness h;
  h.create_event("launch", craftiax::Currency::Native, kEth / 10, 3, 10, "platform");
  h.gateway->deposit(craftiax::Currency::Native, "buyer", kEth);

  craftiax::TicketReceipt receipt;
  const craftiax::Result first = h.buy("launch", "GA", kEth / 10, receipt);
  assert(first.ok);
  assert(receipt.commission == kEth / 100);
  assert(receipt.organizer_share == 9 * kEth / 100);
  assert(receipt.commission + receipt.organizer_share == receipt.amount_paid);
  assert(receipt.sold_count == 1);
  assert(receipt.token_id == craftiax::LedgerService::ticket_token_id("launch", "GA"));

  assert(h.service.balance("organizer", craftiax::Currency::Native) == 9 * kEth / 100);
  assert(h.service.balance("platform", craftiax::Currency::Native) == kEth / 100);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "craftiax-escrow") == kEth / 10);
  assert(h.service.tickets_owned("buyer", "launch", "GA") == 1);

  const craftiax::Result underpaid = h.buy("launch", "GA", kEth / 10 - 1, receipt);
  assert(underpaid.code == craftiax::ErrorCode::IncorrectPayment);
  assert(h.service.tier("launch", "GA")->sold_count == 1);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "buyer") == 9 * kEth / 10);

  assert(h.buy("launch", "GA", kEth / 10, receipt).ok);
  assert(h.buy("launch", "GA", kEth / 10, receipt).ok);
  assert(receipt.sold_count == 3);

  const std::uint64_t buyer_before = h.gateway->balance_of(craftiax::Currency::Native, "buyer");
  const craftiax::Result sold_out = h.buy("launch", "GA", kEth / 10, receipt);
  assert(sold_out.code == craftiax::ErrorCode::TierSoldOut);
  assert(h.service.tier("launch", "GA")->sold_count == 3);
  assert(h.service.tickets_owned("buyer", "launch", "GA") == 3);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "buyer") == buyer_before);

  const craftiax::Result unknown_tier = h.buy("launch", "Balcony", kEth / 10, receipt);
  assert(unknown_tier.code == craftiax::ErrorCode::TierNotFound);

  craftiax::LedgerTotals totals = h.service.ledger_totals(craftiax::Currency::Native);
  assert(totals.credited == 3 * kEth / 10);
  assert_conserved(totals);

  craftiax::WithdrawalReceipt withdrawal;
  assert(h.service.withdraw_balance(kOrganizer, withdrawal).ok);
  assert(withdrawal.native_amount == 27 * kEth / 100);
  assert(withdrawal.stable_amount == 0);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "organizer") == 27 * kEth / 100);
  assert(h.service.balance("organizer", craftiax::Currency::Native) == 0);

  const std::size_t transfers_before = h.gateway->history().size();
  const craftiax::Result again = h.service.withdraw_balance(kOrganizer, withdrawal);
  assert(again.code == craftiax::ErrorCode::NothingToWithdraw);
  assert(h.gateway->history().size() == transfers_before);

  totals = h.service.ledger_totals(craftiax::Currency::Native);
  assert(totals.withdrawn == 27 * kEth / 100);
  assert(totals.pending == 3 * kEth / 100);
  assert_conserved(totals);
}

void test_scaled_underpayment_in_stable_currency() {
  Harness h;
  h.create_event("jazz", craftiax::Currency::Stable, kEth, 5, 20, "platform");
  h.gateway->deposit(craftiax::Currency::Stable, "buyer", 10 * kUsdc);

  craftiax::TicketReceipt receipt;
  assert(h.buy("jazz", "GA", kUsdc, receipt).ok);
  assert(receipt.currency == craftiax::Currency::Stable);
  assert(h.service.balance("organizer", craftiax::Currency::Stable) == 800000);
  assert(h.service.balance("platform", craftiax::Currency::Stable) == 200000);

  assert(h.service.update_tier_price(kMallory, "jazz", "GA", 100000000000ULL).code ==
         craftiax::ErrorCode::Unauthorized);
  assert(h.service.update_tier_price(kOrganizer, "jazz", "GA", 100000000000ULL).ok);

  const craftiax::Result zero_payment = h.buy("jazz", "GA", 0, receipt);
  assert(zero_payment.code == craftiax::ErrorCode::AmountTooSmallAfterScaling);
  assert(h.buy("jazz", "GA", 1, receipt).code == craftiax::ErrorCode::AmountTooSmallAfterScaling);
  assert(h.service.tier("jazz", "GA")->sold_count == 1);
  assert(h.gateway->balance_of(craftiax::Currency::Stable, "buyer") == 9 * kUsdc);

  assert(h.service.update_tier_price(kAdmin, "jazz", "GA", 2 * kEth).ok);
  assert(h.buy("jazz", "GA", 2 * kUsdc, receipt).ok);
  assert(receipt.sold_count == 2);
}

void test_event_lifecycle() {
  Harness h([](craftiax::EngineConfig& config) { config.publish_events_on_create = false; });
  h.create_event("tour", craftiax::Currency::Native, kEth / 10, 10, 5, "platform");
  h.gateway->deposit(craftiax::Currency::Native, "buyer", kEth);
  assert(h.service.event("tour")->status == craftiax::EventStatus::Draft);

  craftiax::TicketReceipt receipt;
  assert(h.buy("tour", "GA", kEth / 10, receipt).code == craftiax::ErrorCode::EventNotActive);

  assert(h.service.publish_event(kMallory, "tour").code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.reactivate_event(kOrganizer, "tour").code == craftiax::ErrorCode::InvalidStatusTransition);
  assert(h.service.publish_event(kOrganizer, "tour").ok);
  assert(h.service.publish_event(kOrganizer, "tour").code == craftiax::ErrorCode::InvalidStatusTransition);
  assert(h.buy("tour", "GA", kEth / 10, receipt).ok);

  assert(h.service.set_tier_active(kOrganizer, "tour", "GA", false).ok);
  assert(h.buy("tour", "GA", kEth / 10, receipt).code == craftiax::ErrorCode::TierInactive);
  assert(h.service.set_tier_active(kAdmin, "tour", "GA", true).ok);

  assert(h.service.cancel_event(kOrganizer, "tour").ok);
  assert(h.buy("tour", "GA", kEth / 10, receipt).code == craftiax::ErrorCode::EventNotActive);
  assert(h.service.reactivate_event(kOrganizer, "tour").ok);
  assert(h.buy("tour", "GA", kEth / 10, receipt).ok);

  h.clock->set(kNow + 86401);
  assert(h.buy("tour", "GA", kEth / 10, receipt).code == craftiax::ErrorCode::EventNotActive);

  assert(h.service.complete_event(kAdmin, "tour").ok);
  assert(h.service.cancel_event(kOrganizer, "tour").code == craftiax::ErrorCode::InvalidStatusTransition);
  assert(h.service.event("tour")->status == craftiax::EventStatus::Completed);
  assert(h.service.publish_event(kOrganizer, "missing").code == craftiax::ErrorCode::EventNotFound);
  assert(h.service.tier("tour", "GA")->sold_count == 2);
}

void test_artist_payment_replay_and_rate_limit() {
  Harness h;
  h.gateway->deposit(craftiax::Currency::Native, "fan", 10 * kEth);

  const craftiax::PaymentDraft first = h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 0);
  craftiax::SettlementReceipt receipt;
  assert(h.service.pay_recipient(kFan, first, receipt).ok);
  assert(receipt.mode == craftiax::SettlementMode::Direct);
  assert(receipt.commission == 5 * kEth / 1000);
  assert(receipt.commission + receipt.payee_amount == receipt.amount);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "artist") == 95 * kEth / 1000);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "treasury") == 5 * kEth / 1000);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "craftiax-escrow") == 0);
  assert(h.service.nonce("fan") == 1);

  // Inside the cooldown the rate limit fires before the signature is looked at.
  assert(h.service.pay_recipient(kFan, first, receipt).code == craftiax::ErrorCode::RateLimited);

  h.clock->advance(61);
  const craftiax::Result replay = h.service.pay_recipient(kFan, first, receipt);
  assert(replay.code == craftiax::ErrorCode::InvalidAuthorization);
  assert(h.service.nonce("fan") == 1);

  assert(h.service.pay_recipient(kFan, h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 1),
                                 receipt)
             .ok);
  const craftiax::PaymentDraft third = h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 2);
  assert(h.service.pay_recipient(kFan, third, receipt).code == craftiax::ErrorCode::RateLimited);
  assert(h.service.nonce("fan") == 2);
  h.clock->advance(59);
  assert(h.service.pay_recipient(kFan, third, receipt).code == craftiax::ErrorCode::RateLimited);
  h.clock->advance(2);
  assert(h.service.pay_recipient(kFan, third, receipt).ok);
  assert(h.service.nonce("fan") == 3);

  h.clock->advance(61);
  craftiax::PaymentDraft stale = h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 3);
  h.clock->advance(601);
  assert(h.service.pay_recipient(kFan, stale, receipt).code == craftiax::ErrorCode::ExpiredAuthorization);

  const craftiax::PaymentDraft other = h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 3);
  assert(h.service.pay_recipient(kMallory, other, receipt).code == craftiax::ErrorCode::Unauthorized);

  assert(h.service.pause(kAdmin).ok);
  assert(h.service.pay_recipient(kFan, other, receipt).code == craftiax::ErrorCode::Paused);
  craftiax::TicketReceipt ticket;
  assert(h.buy("any", "GA", 1, ticket).code == craftiax::ErrorCode::Paused);
  craftiax::WithdrawalReceipt withdrawal;
  assert(h.service.withdraw_balance(kOrganizer, withdrawal).code == craftiax::ErrorCode::Paused);
  assert(h.service.unpause(kAdmin).ok);
  assert(h.service.pay_recipient(kFan, other, receipt).ok);
}

void test_verified_limits_and_admin_settings() {
  Harness h;
  h.gateway->deposit(craftiax::Currency::Stable, "fan", 100000 * kUsdc);
  const std::uint64_t above_max = 10000 * kUsdc + 1;

  const craftiax::PaymentDraft big = h.payment("fan", "artist", above_max, craftiax::Currency::Stable, 0);
  craftiax::SettlementReceipt receipt;
  assert(h.service.pay_recipient(kFan, big, receipt).code == craftiax::ErrorCode::AboveMaximum);
  assert(h.service.nonce("fan") == 0);

  assert(h.service.set_verification_status(kMallory, "artist", true).code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.set_verification_status(kAdmin, "artist", true).ok);
  assert(h.service.set_verification_status(kAdmin, "artist", true).code ==
         craftiax::ErrorCode::DuplicateVerificationStatus);
  assert(h.service.is_verified("artist"));
  assert(h.service.pay_recipient(kFan, big, receipt).ok);
  assert(h.service.nonce("fan") == 1);

  h.clock->advance(61);
  const craftiax::PaymentDraft tiny = h.payment("fan", "artist", kUsdc - 1, craftiax::Currency::Stable, 1);
  assert(h.service.pay_recipient(kFan, tiny, receipt).code == craftiax::ErrorCode::BelowMinimum);

  const craftiax::PaymentDraft huge = h.payment("fan", "artist", 50000 * kUsdc + 1, craftiax::Currency::Stable, 1);
  assert(h.service.pay_recipient(kFan, huge, receipt).code == craftiax::ErrorCode::AboveMaximum);

  const craftiax::PaymentLimits raised{
      .min_payment = kUsdc / 2,
      .max_payment = 20000 * kUsdc,
      .verified_max_payment = 60000 * kUsdc,
  };
  assert(h.service.update_payment_limits(kMallory, craftiax::Currency::Stable, raised).code ==
         craftiax::ErrorCode::Unauthorized);
  assert(h.service.update_payment_limits(kAdmin, craftiax::Currency::Stable,
                                         {.min_payment = 5, .max_payment = 5, .verified_max_payment = 6})
             .code == craftiax::ErrorCode::InvalidArgument);
  assert(h.service.update_payment_limits(kAdmin, craftiax::Currency::Stable, raised).ok);
  assert(h.service.payment_limits(craftiax::Currency::Stable)->max_payment == 20000 * kUsdc);
  assert(h.service.pay_recipient(kFan, tiny, receipt).ok);

  assert(h.service.update_fee_percentage(kAdmin, 21).code == craftiax::ErrorCode::CommissionOutOfRange);
  assert(h.service.update_fee_percentage(kMallory, 10).code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.update_fee_percentage(kAdmin, 20).ok);
  assert(h.service.status().platform_fee_percent == 20);

  // One duplicate rejects the whole batch.
  const craftiax::Result batch = h.service.set_verification_status_batch(kAdmin, {"a", "b", "artist"}, true);
  assert(batch.code == craftiax::ErrorCode::DuplicateVerificationStatus);
  assert(!h.service.is_verified("a"));
  assert(!h.service.is_verified("b"));
  assert(h.service.set_verification_status_batch(kAdmin, {"a", "b"}, true).ok);
  assert(h.service.is_verified("a") && h.service.is_verified("b"));
  assert(h.service.set_verification_status_batch(kAdmin, {"a", "artist"}, false).ok);
  assert(!h.service.is_verified("artist"));
  assert(h.service.status().verified_count == 1);
}

void test_transfer_failures_roll_back() {
  Harness h([](craftiax::EngineConfig& config) { config.ticket_settlement_mode = craftiax::SettlementMode::Direct; });
  h.create_event("arena", craftiax::Currency::Native, kEth / 10, 5, 10, "platform");
  h.gateway->deposit(craftiax::Currency::Native, "buyer", kEth);
  h.gateway->deposit(craftiax::Currency::Native, "fan", kEth);
  const std::size_t audit_before = h.service.audit_records().size();

  // Organizer leg succeeds, commission leg fails: the organizer payout is reversed too.
  h.gateway->reject_transfers_to("platform");
  craftiax::TicketReceipt ticket;
  const craftiax::Result failed = h.buy("arena", "GA", kEth / 10, ticket);
  assert(failed.code == craftiax::ErrorCode::TransferFailed);
  assert(h.service.tier("arena", "GA")->sold_count == 0);
  assert(h.service.tickets_owned("buyer", "arena", "GA") == 0);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "buyer") == kEth);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "organizer") == 0);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "craftiax-escrow") == 0);
  assert(h.service.audit_records().size() == audit_before);

  h.gateway->clear_rejections();
  assert(h.buy("arena", "GA", kEth / 10, ticket).ok);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "organizer") == 9 * kEth / 100);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "platform") == kEth / 100);
  assert(h.service.balance("organizer", craftiax::Currency::Native) == 0);

  h.gateway->reject_transfers_to("artist");
  const craftiax::PaymentDraft draft = h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 0);
  craftiax::SettlementReceipt receipt;
  assert(h.service.pay_recipient(kFan, draft, receipt).code == craftiax::ErrorCode::TransferFailed);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "fan") == kEth);
  assert(h.service.nonce("fan") == 0);

  // A failed settlement leaves no cooldown behind.
  h.gateway->clear_rejections();
  assert(h.service.pay_recipient(kFan, draft, receipt).ok);
  assert(h.service.status().rejected_request_count >= 2);
}

void test_withdrawal_guards() {
  Harness h;
  h.create_event("club", craftiax::Currency::Native, kEth / 10, 5, 10, "platform");
  h.gateway->deposit(craftiax::Currency::Native, "buyer", kEth);
  craftiax::TicketReceipt ticket;
  assert(h.buy("club", "GA", kEth / 10, ticket).ok);

  h.gateway->reject_transfers_to("organizer");
  craftiax::WithdrawalReceipt withdrawal;
  assert(h.service.withdraw_balance(kOrganizer, withdrawal).code == craftiax::ErrorCode::TransferFailed);
  assert(h.service.balance("organizer", craftiax::Currency::Native) == 9 * kEth / 100);
  assert(h.service.ledger_totals(craftiax::Currency::Native).withdrawn == 0);
  h.gateway->clear_rejections();

  // The payout hook calls back into the service while the withdrawal is in flight.
  craftiax::Result inner = craftiax::Result::success();
  craftiax::Result reinit = craftiax::Result::success();
  std::uint64_t observed_balance = 1;
  h.gateway->set_transfer_hook([&](const craftiax::TransferRecord& record) {
    if (record.to != "organizer") {
      return;
    }
    craftiax::WithdrawalReceipt nested;
    inner = h.service.withdraw_balance(kOrganizer, nested);
    reinit = h.service.init(h.config, h.gateway, h.clock);
    observed_balance = h.service.balance("organizer", craftiax::Currency::Native);
  });

  assert(h.service.withdraw_balance(kOrganizer, withdrawal).ok);
  h.gateway->set_transfer_hook({});
  assert(inner.code == craftiax::ErrorCode::ReentrantCall);
  assert(reinit.code == craftiax::ErrorCode::ReentrantCall);
  assert(h.service.status().initialized);
  assert(observed_balance == 0);
  assert(withdrawal.native_amount == 9 * kEth / 100);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "organizer") == 9 * kEth / 100);
  assert(h.service.withdraw_balance(kOrganizer, withdrawal).code == craftiax::ErrorCode::NothingToWithdraw);
  assert_conserved(h.service.ledger_totals(craftiax::Currency::Native));
}

void test_commission_recipient_matching_payee() {
  Harness h;
  h.create_event("solo", craftiax::Currency::Native, kEth / 10, 5, 10, "organizer");
  h.gateway->deposit(craftiax::Currency::Native, "buyer", kEth);
  craftiax::TicketReceipt ticket;
  assert(h.buy("solo", "GA", kEth / 10, ticket).ok);
  assert(ticket.commission == kEth / 100);
  assert(ticket.organizer_share == kEth / 10);
  assert(h.service.balance("organizer", craftiax::Currency::Native) == kEth / 10);
  assert(h.service.ledger_totals(craftiax::Currency::Native).credited == kEth / 10);

  assert(h.service.update_fee_recipient(kAdmin, "").code == craftiax::ErrorCode::ZeroAddress);
  assert(h.service.update_fee_recipient(kAdmin, "artist").ok);
  h.gateway->deposit(craftiax::Currency::Native, "fan", kEth);
  const std::size_t history_before = h.gateway->history().size();
  craftiax::SettlementReceipt receipt;
  assert(h.service.pay_recipient(kFan, h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 0),
                                 receipt)
             .ok);
  // One collection leg and one merged payout.
  assert(h.gateway->history().size() == history_before + 2);
  assert(receipt.commission == 5 * kEth / 1000);
  assert(receipt.payee_amount == kEth / 10);
  assert(h.gateway->balance_of(craftiax::Currency::Native, "artist") == kEth / 10);

  Harness fee_free([](craftiax::EngineConfig& config) {
    config.platform_fee_percent = 0;
    config.platform_fee_recipient.clear();
  });
  assert(fee_free.service.update_fee_percentage(kAdmin, 5).code == craftiax::ErrorCode::ZeroAddress);
  assert(fee_free.service.status().platform_fee_percent == 0);
  assert(fee_free.service.update_fee_recipient(kAdmin, "treasury").ok);
  assert(fee_free.service.update_fee_percentage(kAdmin, 5).ok);
}

void test_nft_minting() {
  Harness h([](craftiax::EngineConfig& config) {
    config.nft_max_supply = 2;
    config.nft_base_uri = "ipfs://base/";
  });

  const craftiax::NftMintDraft first = h.nft_mint("collector", "a.json", 0);
  craftiax::NftRecord token;
  assert(h.service.mint_nft(kMallory, first, token).ok);
  assert(token.token_id == 0);
  assert(token.owner == "collector");
  std::string uri;
  assert(h.service.nft_token_uri(0, uri).ok);
  assert(uri == "ipfs://base/a.json");
  assert(h.service.nonce("collector") == 1);
  assert(h.service.mint_nft(kMallory, first, token).code == craftiax::ErrorCode::InvalidAuthorization);

  assert(h.service.mint_nft(kMallory, h.nft_mint("collector", "b.json", 1), token).ok);
  assert(token.token_id == 1);
  assert(h.service.nft_owner(0) == "collector");
  assert(!h.service.nft_owner(7).has_value());
  assert(h.service.mint_nft(kMallory, h.nft_mint("collector", "c.json", 2), token).code ==
         craftiax::ErrorCode::MaxSupplyReached);
  assert(h.service.nonce("collector") == 2);

  assert(h.service.burn_nft(kMallory, 0).code == craftiax::ErrorCode::NotTokenOwner);
  assert(h.service.burn_nft({.identity = "collector"}, 0).ok);
  assert(!h.service.nft(0).has_value());
  assert(h.service.nft_token_uri(0, uri).code == craftiax::ErrorCode::TokenNotFound);
  assert(h.service.burn_nft({.identity = "collector"}, 0).code == craftiax::ErrorCode::TokenNotFound);
  assert(h.service.nft_balance("collector") == 1);
  assert(!h.service.nft_owner(0).has_value());
  assert(h.service.status().nft_count == 1);
  assert(h.service.status().nft_minted_count == 2);
  assert(h.service.mint_nft(kMallory, h.nft_mint("collector", "c.json", 2), token).code ==
         craftiax::ErrorCode::MaxSupplyReached);

  assert(h.service.set_base_uri(kMallory, "ar://").code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.set_base_uri(kAdmin, "ar://").ok);
  assert(h.service.nft_token_uri(1, uri).ok);
  assert(uri == "ar://b.json");

  assert(h.service.pause(kAdmin).ok);
  assert(h.service.mint_nft(kMallory, h.nft_mint("fresh", "d.json", 0), token).code == craftiax::ErrorCode::Paused);
}

void test_admin_controls_and_revocation() {
  Harness h;
  h.gateway->deposit(craftiax::Currency::Native, "fan", kEth);

  assert(h.service.update_verifier(kMallory, "00").code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.update_fee_recipient(kMallory, "mallory").code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.invalidate_nonce(kMallory, "fan").code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.pause(kMallory).code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.unpause(kMallory).code == craftiax::ErrorCode::Unauthorized);
  assert(h.service.unpause(kAdmin).code == craftiax::ErrorCode::InvalidStatusTransition);
  assert(h.service.pause(kAdmin).ok);
  assert(h.service.pause(kAdmin).code == craftiax::ErrorCode::InvalidStatusTransition);
  assert(h.service.paused());
  assert(h.service.unpause(kAdmin).ok);

  assert(h.service.invalidate_nonce(kAdmin, "fan").ok);
  craftiax::SettlementReceipt receipt;
  assert(h.service.pay_recipient(kFan, h.payment("fan", "artist", kEth / 10, craftiax::Currency::Native, 0),
                                 receipt)
             .code == craftiax::ErrorCode::InvalidAuthorization);

  // Rotating the verifier invalidates signatures from the old key.
  craftiax::SigningKeyPair rotated;
  assert(h.crypto.generate_keypair(rotated).ok);
  assert(h.service.update_verifier(kAdmin, rotated.public_key).ok);
  assert(h.service.status().trusted_verifier == rotated.public_key);
  h.gateway->deposit(craftiax::Currency::Native, "fan2", kEth);
  const craftiax::CallerContext fan2{.identity = "fan2"};
  assert(h.service.pay_recipient(fan2, h.payment("fan2", "artist", kEth / 10, craftiax::Currency::Native, 0),
                                 receipt)
             .code == craftiax::ErrorCode::InvalidAuthorization);

  const craftiax::AuthorizationSigner rotated_signer(h.crypto, h.service.authorization_domain(),
                                                     rotated.secret_key);
  craftiax::PaymentDraft draft{
      .payer = "fan2",
      .recipient = "artist",
      .amount = kEth / 10,
      .currency = craftiax::Currency::Native,
      .authorization = {.nonce = 0, .deadline_unix = kNow + 600, .signature = {}},
  };
  draft.authorization.signature = rotated_signer.sign_payment(draft);
  assert(h.service.pay_recipient(fan2, draft, receipt).ok);

  const auto records = h.service.audit_records();
  assert(!records.empty());
  assert(records.front().kind == "LedgerInitialized");
  assert(records.back().kind == "PaymentSettled");
  assert(records.back().actor == "fan2");
}

void test_concurrent_issuance_respects_capacity() {
  Harness h;
  constexpr std::uint64_t kCapacity = 25;
  h.create_event("rush", craftiax::Currency::Native, kEth / 1000, kCapacity, 10, "platform");
  h.gateway->deposit(craftiax::Currency::Native, "buyer", kEth);

  std::atomic<int> successes{0};
  std::atomic<int> sold_out{0};
  std::vector<std::thread> workers;
  for (int worker = 0; worker < 8; ++worker) {
    workers.emplace_back([&h, &successes, &sold_out]() {
      for (int attempt = 0; attempt < 10; ++attempt) {
        craftiax::TicketReceipt receipt;
        const craftiax::Result result = h.buy("rush", "GA", kEth / 1000, receipt);
        if (result.ok) {
          ++successes;
        } else if (result.code == craftiax::ErrorCode::TierSoldOut) {
          ++sold_out;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(successes.load() == static_cast<int>(kCapacity));
  assert(sold_out.load() == 80 - static_cast<int>(kCapacity));
  assert(h.service.tier("rush", "GA")->sold_count == kCapacity);
  assert(h.service.tickets_owned("buyer", "rush", "GA") == kCapacity);
  assert(h.service.ledger_totals(craftiax::Currency::Native).credited == kCapacity * (kEth / 1000));
}

void test_core_api_persistence_round_trip() {
  const auto dir = temp_dir("flows-persistence");
  craftiax::CryptoEngine crypto;
  assert(crypto.initialize().ok);
  craftiax::SigningKeyPair keys;
  assert(crypto.generate_keypair(keys).ok);

  craftiax::EngineConfig config = base_config(keys.public_key);
  config.data_dir = dir.string();
  auto clock = std::make_shared<craftiax::ManualClock>(kNow);

  std::size_t audit_count = 0;
  {
    auto gateway = std::make_shared<craftiax::InMemoryTransferGateway>();
    gateway->deposit(craftiax::Currency::Native, "buyer", kEth);
    gateway->deposit(craftiax::Currency::Native, "fan", kEth);

    craftiax::CoreApi api;
    assert(api.init(config, gateway, clock).ok);

    craftiax::EventRecord record;
    assert(api.create_event(kOrganizer,
                            {
                                .event_id = "persisted",
                                .name = "Persisted Show",
                                .description = "Survives restarts",
                                .start_unix = kNow - 10,
                                .end_unix = kNow + 3600,
                                .tier_ids = {"GA"},
                                .prices = {kEth / 10},
                                .max_quantities = {50},
                                .currency = craftiax::Currency::Native,
                                .commission_percent = 10,
                                .commission_recipient = "platform",
                            },
                            record)
               .ok);

    craftiax::TicketReceipt ticket;
    assert(api.issue_ticket(kBuyer,
                            {
                                .event_id = "persisted",
                                .tier_id = "GA",
                                .recipient = "buyer",
                                .payment = {.payer = "buyer", .amount = kEth / 10},
                            },
                            ticket)
               .ok);

    const craftiax::AuthorizationSigner signer(crypto, api.authorization_domain(), keys.secret_key);
    craftiax::PaymentDraft draft{
        .payer = "fan",
        .recipient = "artist",
        .amount = kEth / 10,
        .currency = craftiax::Currency::Native,
        .authorization = {.nonce = 0, .deadline_unix = kNow + 600, .signature = {}},
    };
    draft.authorization.signature = signer.sign_payment(draft);
    craftiax::SettlementReceipt receipt;
    assert(api.pay_recipient(kFan, draft, receipt).ok);
    assert(api.set_verification_status(kAdmin, "artist", true).ok);

    // Identities are opaque; separators inside one must survive the audit log.
    const craftiax::CallerContext odd_organizer{.identity = "org\nan\tizer"};
    assert(api.create_event(odd_organizer,
                            {
                                .event_id = "odd",
                                .name = "Odd Show",
                                .description = "",
                                .start_unix = kNow - 10,
                                .end_unix = kNow + 3600,
                                .tier_ids = {"GA"},
                                .prices = {kEth / 10},
                                .max_quantities = {5},
                                .currency = craftiax::Currency::Native,
                                .commission_percent = 0,
                                .commission_recipient = "platform",
                            },
                            record)
               .ok);

    audit_count = api.audit_records().size();
    assert(audit_count == 6);
  }

  assert(std::filesystem::exists(dir / "state.snapshot"));
  assert(std::filesystem::exists(dir / "audit.log"));

  craftiax::CoreApi reopened;
  const craftiax::Result init =
      reopened.init(config, std::make_shared<craftiax::InMemoryTransferGateway>(), clock);
  assert(init.ok);
  assert(init.message == "Ledger restored from snapshot.");

  const craftiax::LedgerStatusReport status = reopened.status();
  assert(status.initialized);
  assert(status.event_count == 2);
  assert(status.verified_count == 1);
  assert(status.audit_record_count == audit_count);
  assert(status.native_totals.credited == kEth / 10);
  assert(reopened.event("persisted")->name == "Persisted Show");
  assert(reopened.event("odd")->organizer == "org\nan\tizer");
  const auto restored_audit = reopened.audit_records();
  assert(restored_audit.back().kind == "EventCreated");
  assert(restored_audit.back().actor == "org\nan\tizer");
  assert(reopened.tiers("persisted").front().sold_count == 1);
  assert(reopened.tickets_owned("buyer", "persisted", "GA") == 1);
  assert(reopened.balance("organizer", craftiax::Currency::Native) == 9 * kEth / 100);
  assert(reopened.nonce("fan") == 1);

  // The cooldown survives the restart as well.
  craftiax::CryptoEngine verify_crypto;
  assert(verify_crypto.initialize().ok);
  const craftiax::AuthorizationSigner signer(verify_crypto, reopened.authorization_domain(), keys.secret_key);
  craftiax::PaymentDraft next{
      .payer = "fan",
      .recipient = "artist",
      .amount = kEth / 10,
      .currency = craftiax::Currency::Native,
      .authorization = {.nonce = 1, .deadline_unix = kNow + 600, .signature = {}},
  };
  next.authorization.signature = signer.sign_payment(next);
  craftiax::SettlementReceipt receipt;
  assert(reopened.pay_recipient(kFan, next, receipt).code == craftiax::ErrorCode::RateLimited);
  assert(std::filesystem::exists(dir / "rejected-requests.log"));
}

}  // namespace

int main() {
  test_ticket_issuance_pooled();
  test_scaled_underpayment_in_stable_currency();
  test_event_lifecycle();
  test_artist_payment_replay_and_rate_limit();
  test_verified_limits_and_admin_settings();
  test_transfer_failures_roll_back();
  test_withdrawal_guards();
  test_commission_recipient_matching_payee();
  test_nft_minting();
  test_admin_controls_and_revocation();
  test_concurrent_issuance_respects_capacity();
  test_core_api_persistence_round_trip();

  std::cout << "craftiax_settlement_flow_tests passed\n";
  return 0;
}
