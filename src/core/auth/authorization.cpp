#include "core/auth/authorization.hpp"

#include "core/model/enum_names.hpp"
#include "core/util/canonical.hpp"

namespace craftiax {
namespace {

constexpr std::string_view kDigestPrefix = "craftiax-typed-v1";

std::string domain_separator(const CryptoEngine& crypto, const AuthorizationDomain& domain) {
  return crypto.hash_bytes(util::canonical_join({
      {"name", domain.name},
      {"version", domain.version},
      {"chain_id", domain.chain_id},
      {"service_id", domain.service_id},
  }));
}

}  // namespace

TypedPayload payment_authorization_payload(const PaymentDraft& draft) {
  return {
      .type_name = "PayRecipient",
      .nonce_subject = draft.payer,
      .nonce = draft.authorization.nonce,
      .deadline_unix = draft.authorization.deadline_unix,
      .fields =
          {
              {"payer", draft.payer},
              {"recipient", draft.recipient},
              {"amount", std::to_string(draft.amount)},
              {"currency", currency_name(draft.currency)},
          },
  };
}

TypedPayload nft_mint_authorization_payload(const NftMintDraft& draft) {
  return {
      .type_name = "SafeMint",
      .nonce_subject = draft.recipient,
      .nonce = draft.authorization.nonce,
      .deadline_unix = draft.authorization.deadline_unix,
      .fields =
          {
              {"to", draft.recipient},
              {"uri", draft.uri},
          },
  };
}

std::string typed_digest(const CryptoEngine& crypto, const AuthorizationDomain& domain,
                         const TypedPayload& payload) {
  auto fields = payload.fields;
  fields.emplace_back("@type", payload.type_name);
  fields.emplace_back("@nonce", std::to_string(payload.nonce));
  fields.emplace_back("@deadline", std::to_string(payload.deadline_unix));
  fields.emplace_back("@chain_id", domain.chain_id);
  const std::string struct_hash = crypto.hash_bytes(util::canonical_join(std::move(fields)));

  return crypto.hash_bytes(std::string{kDigestPrefix} + "|" + domain_separator(crypto, domain) + "|" +
                           struct_hash);
}

AuthorizationVerifier::AuthorizationVerifier(Store& store, const CryptoEngine& crypto,
                                             AuthorizationDomain domain)
    : store_(store), crypto_(crypto), domain_(std::move(domain)) {}

std::string AuthorizationVerifier::digest(const TypedPayload& payload) const {
  return typed_digest(crypto_, domain_, payload);
}

Result AuthorizationVerifier::verify_and_consume(const TypedPayload& payload, std::string_view signature,
                                                 std::int64_t now_unix) {
  if (now_unix > payload.deadline_unix) {
    return Result::failure(ErrorCode::ExpiredAuthorization, "Signature expired.");
  }
  if (payload.nonce_subject.empty()) {
    return Result::failure(ErrorCode::InvalidAuthorization, "Authorization has no nonce subject.");
  }

  const std::uint64_t expected_nonce = current_nonce(payload.nonce_subject);
  if (expected_nonce == kRevokedNonce) {
    return Result::failure(ErrorCode::InvalidAuthorization,
                           "Authorizations for `" + payload.nonce_subject + "` have been revoked.");
  }
  if (payload.nonce != expected_nonce) {
    return Result::failure(ErrorCode::InvalidAuthorization,
                           "Invalid signature: nonce " + std::to_string(payload.nonce) + " does not match " +
                               std::to_string(expected_nonce) + ".");
  }

  const std::string& trusted = store_.tables().settings.trusted_verifier;
  if (trusted.empty()) {
    return Result::failure(ErrorCode::InvalidAuthorization, "No trusted verifier is configured.");
  }
  const auto signer = crypto_.recover_signer(digest(payload), signature);
  if (!signer.has_value() || *signer != trusted) {
    return Result::failure(ErrorCode::InvalidAuthorization, "Invalid signature.");
  }

  store_.tables().nonces[payload.nonce_subject] = expected_nonce + 1U;
  return Result::success("Authorization accepted.", *signer);
}

std::uint64_t AuthorizationVerifier::current_nonce(std::string_view subject) const {
  const auto& nonces = store_.tables().nonces;
  const auto it = nonces.find(std::string{subject});
  return it == nonces.end() ? 0 : it->second;
}

void AuthorizationVerifier::invalidate(std::string_view subject) {
  store_.tables().nonces[std::string{subject}] = kRevokedNonce;
}

AuthorizationSigner::AuthorizationSigner(const CryptoEngine& crypto, AuthorizationDomain domain,
                                         std::string secret_key)
    : crypto_(crypto), domain_(std::move(domain)), secret_key_(std::move(secret_key)) {}

std::string AuthorizationSigner::sign(const TypedPayload& payload) const {
  return crypto_.sign(typed_digest(crypto_, domain_, payload), secret_key_);
}

std::string AuthorizationSigner::sign_payment(const PaymentDraft& draft) const {
  return sign(payment_authorization_payload(draft));
}

std::string AuthorizationSigner::sign_nft_mint(const NftMintDraft& draft) const {
  return sign(nft_mint_authorization_payload(draft));
}

}  // namespace craftiax
