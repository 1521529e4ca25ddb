#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/crypto/crypto.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace craftiax {

struct AuthorizationDomain {
  std::string name;
  std::string version;
  std::string chain_id;
  std::string service_id;
};

// Structured message a trusted off-chain signer approves. `nonce_subject` is
// the identity whose counter the nonce is checked against.
struct TypedPayload {
  std::string type_name;
  std::string nonce_subject;
  std::uint64_t nonce = 0;
  std::int64_t deadline_unix = 0;
  std::vector<std::pair<std::string, std::string>> fields;
};

TypedPayload payment_authorization_payload(const PaymentDraft& draft);
TypedPayload nft_mint_authorization_payload(const NftMintDraft& draft);

std::string typed_digest(const CryptoEngine& crypto, const AuthorizationDomain& domain,
                         const TypedPayload& payload);

class AuthorizationVerifier {
public:
  static constexpr std::uint64_t kRevokedNonce = std::numeric_limits<std::uint64_t>::max();

  AuthorizationVerifier(Store& store, const CryptoEngine& crypto, AuthorizationDomain domain);

  [[nodiscard]] const AuthorizationDomain& domain() const { return domain_; }
  [[nodiscard]] std::string digest(const TypedPayload& payload) const;

  // Checks deadline, nonce and signer, then consumes the nonce. Nothing is
  // mutated unless every check passes.
  Result verify_and_consume(const TypedPayload& payload, std::string_view signature,
                            std::int64_t now_unix);

  [[nodiscard]] std::uint64_t current_nonce(std::string_view subject) const;
  void invalidate(std::string_view subject);

private:
  Store& store_;
  const CryptoEngine& crypto_;
  AuthorizationDomain domain_;
};

class AuthorizationSigner {
public:
  AuthorizationSigner(const CryptoEngine& crypto, AuthorizationDomain domain, std::string secret_key);

  [[nodiscard]] std::string sign(const TypedPayload& payload) const;
  [[nodiscard]] std::string sign_payment(const PaymentDraft& draft) const;
  [[nodiscard]] std::string sign_nft_mint(const NftMintDraft& draft) const;

private:
  const CryptoEngine& crypto_;
  AuthorizationDomain domain_;
  std::string secret_key_;
};

}  // namespace craftiax
