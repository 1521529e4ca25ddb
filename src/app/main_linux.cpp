#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/auth/authorization.hpp"
#include "core/crypto/crypto.hpp"
#include "core/ledger/transfer_gateway.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/enum_names.hpp"
#include "core/service/config_loader.hpp"
#include "core/util/canonical.hpp"

namespace {

void print_usage() {
  std::cout << craftiax::kAppDisplayName << ' ' << craftiax::kAppVersion << " (" << craftiax::kBuildRelease
            << ")\n\n"
            << "Usage:\n"
            << "  craftiax-ledger keygen\n"
            << "  craftiax-ledger status [config]\n"
            << "  craftiax-ledger audit [config]\n"
            << "  craftiax-ledger sign-payment <secret> <payer> <recipient> <amount> <currency> <nonce> "
               "<deadline> [config]\n"
            << "  craftiax-ledger sign-mint <secret> <recipient> <uri> <nonce> <deadline> [config]\n";
}

craftiax::Result load_config(const std::vector<std::string>& args, std::size_t index,
                             craftiax::EngineConfig& config) {
  if (args.size() <= index) {
    return craftiax::validate_engine_config(config);
  }
  return craftiax::load_engine_config(args[index], config);
}

craftiax::AuthorizationDomain domain_from(const craftiax::EngineConfig& config) {
  return {
      .name = config.domain_name,
      .version = config.domain_version,
      .chain_id = config.chain_id,
      .service_id = config.service_id,
  };
}

void print_totals(std::string_view label, const craftiax::LedgerTotals& totals) {
  std::cout << label << ": credited=" << totals.credited << " withdrawn=" << totals.withdrawn
            << " pending=" << totals.pending << '\n';
}

int fail(std::string_view context, const craftiax::Result& result) {
  std::cerr << context << " failed [" << craftiax::error_code_name(result.code) << "]: " << result.message
            << '\n';
  return 1;
}

int run_keygen() {
  craftiax::CryptoEngine crypto;
  if (const craftiax::Result ready = crypto.initialize(); !ready.ok) {
    return fail("keygen", ready);
  }
  craftiax::SigningKeyPair keys;
  if (const craftiax::Result generated = crypto.generate_keypair(keys); !generated.ok) {
    return fail("keygen", generated);
  }
  std::cout << "public_key=" << keys.public_key << '\n';
  std::cout << "secret_key=" << keys.secret_key << '\n';
  return 0;
}

int run_status(const std::vector<std::string>& args, bool audit_only) {
  craftiax::EngineConfig config;
  if (const craftiax::Result loaded = load_config(args, 2, config); !loaded.ok) {
    return fail("config", loaded);
  }

  craftiax::CoreApi api;
  const craftiax::Result init = api.init(config, std::make_shared<craftiax::InMemoryTransferGateway>(),
                                         std::make_shared<craftiax::SystemClock>());
  if (!init.ok) {
    return fail("init", init);
  }

  if (audit_only) {
    for (const auto& record : api.audit_records()) {
      std::cout << record.record_id << '\t' << record.unix_ts << '\t' << record.kind << '\t' << record.actor
                << '\n';
    }
    return 0;
  }

  const craftiax::LedgerStatusReport report = api.status();
  std::cout << craftiax::kAppDisplayName << ' ' << craftiax::kAppVersion << '\n';
  std::cout << "Data Dir: " << (report.data_dir.empty() ? "(memory)" : report.data_dir) << '\n';
  std::cout << "Chain Id: " << report.chain_id << '\n';
  std::cout << "Paused: " << (report.paused ? "yes" : "no") << '\n';
  std::cout << "Trusted Verifier: " << (report.trusted_verifier.empty() ? "(none)" : report.trusted_verifier)
            << '\n';
  std::cout << "Platform Fee: " << report.platform_fee_percent << "% -> "
            << (report.platform_fee_recipient.empty() ? "(none)" : report.platform_fee_recipient) << '\n';
  std::cout << "Events: " << report.event_count << " (tiers " << report.tier_count << ")\n";
  std::cout << "Verified Identities: " << report.verified_count << '\n';
  std::cout << "NFTs: " << report.nft_count << " live, " << report.nft_minted_count << " minted\n";
  std::cout << "Audit Records: " << report.audit_record_count << '\n';
  std::cout << "Rejected Requests: " << report.rejected_request_count << '\n';
  print_totals(craftiax::kNativeCurrencyName, report.native_totals);
  print_totals(craftiax::kStableCurrencyName, report.stable_totals);
  return 0;
}

int run_sign_payment(const std::vector<std::string>& args) {
  if (args.size() < 9) {
    print_usage();
    return 2;
  }
  craftiax::EngineConfig config;
  if (const craftiax::Result loaded = load_config(args, 9, config); !loaded.ok) {
    return fail("config", loaded);
  }

  craftiax::PaymentDraft draft;
  draft.payer = args[3];
  draft.recipient = args[4];
  const auto currency = craftiax::currency_from_string(args[6]);
  if (!craftiax::util::parse_uint64(args[5], draft.amount) || !currency.has_value() ||
      !craftiax::util::parse_uint64(args[7], draft.authorization.nonce) ||
      !craftiax::util::parse_int64(args[8], draft.authorization.deadline_unix)) {
    std::cerr << "sign-payment: amount, currency, nonce or deadline is malformed.\n";
    return 2;
  }
  draft.currency = *currency;

  craftiax::CryptoEngine crypto;
  if (const craftiax::Result ready = crypto.initialize(); !ready.ok) {
    return fail("sign-payment", ready);
  }
  const craftiax::AuthorizationSigner signer(crypto, domain_from(config), args[2]);
  const std::string signature = signer.sign_payment(draft);
  if (signature.empty()) {
    std::cerr << "sign-payment: secret key is malformed.\n";
    return 1;
  }
  std::cout << signature << '\n';
  return 0;
}

int run_sign_mint(const std::vector<std::string>& args) {
  if (args.size() < 7) {
    print_usage();
    return 2;
  }
  craftiax::EngineConfig config;
  if (const craftiax::Result loaded = load_config(args, 7, config); !loaded.ok) {
    return fail("config", loaded);
  }

  craftiax::NftMintDraft draft;
  draft.recipient = args[3];
  draft.uri = args[4];
  if (!craftiax::util::parse_uint64(args[5], draft.authorization.nonce) ||
      !craftiax::util::parse_int64(args[6], draft.authorization.deadline_unix)) {
    std::cerr << "sign-mint: nonce or deadline is malformed.\n";
    return 2;
  }

  craftiax::CryptoEngine crypto;
  if (const craftiax::Result ready = crypto.initialize(); !ready.ok) {
    return fail("sign-mint", ready);
  }
  const craftiax::AuthorizationSigner signer(crypto, domain_from(config), args[2]);
  const std::string signature = signer.sign_nft_mint(draft);
  if (signature.empty()) {
    std::cerr << "sign-mint: secret key is malformed.\n";
    return 1;
  }
  std::cout << signature << '\n';
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv, argv + argc);
  if (args.size() < 2) {
    print_usage();
    return 2;
  }

  const std::string& command = args[1];
  if (command == "keygen") {
    return run_keygen();
  }
  if (command == "status") {
    return run_status(args, false);
  }
  if (command == "audit") {
    return run_status(args, true);
  }
  if (command == "sign-payment") {
    return run_sign_payment(args);
  }
  if (command == "sign-mint") {
    return run_sign_mint(args);
  }

  std::cerr << "Unknown command: " << command << '\n';
  print_usage();
  return 2;
}
