#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace craftiax {

struct SigningKeyPair {
  std::string public_key;  // hex, doubles as the signer identity
  std::string secret_key;  // hex
};

// Ed25519 signing and SHA-256 hashing on top of libsodium. Signatures are
// self-describing: hex(public key) followed by hex(detached signature), so the
// signer identity can be recovered from the signature alone.
class CryptoEngine {
public:
  Result initialize();

  [[nodiscard]] bool ready() const { return ready_; }

  [[nodiscard]] std::string hash_bytes(std::string_view payload) const;

  Result generate_keypair(SigningKeyPair& out) const;
  [[nodiscard]] std::string sign(std::string_view payload, std::string_view secret_key) const;
  [[nodiscard]] bool verify(std::string_view payload, std::string_view signature,
                            std::string_view public_key) const;
  [[nodiscard]] std::optional<std::string> recover_signer(std::string_view payload,
                                                          std::string_view signature) const;

private:
  bool ready_ = false;
};

}  // namespace craftiax
