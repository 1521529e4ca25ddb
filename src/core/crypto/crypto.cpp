#include "core/crypto/crypto.hpp"

#include <array>

#include <sodium.h>

#include "core/util/hash.hpp"

namespace craftiax {
namespace {

constexpr std::size_t kPublicKeyHexChars = crypto_sign_PUBLICKEYBYTES * 2U;
constexpr std::size_t kSignatureHexChars = crypto_sign_BYTES * 2U;

std::string bytes_to_hex(const unsigned char* data, std::size_t size) {
  return util::to_hex(std::string_view{reinterpret_cast<const char*>(data), size});
}

}  // namespace

Result CryptoEngine::initialize() {
  if (sodium_init() < 0) {
    ready_ = false;
    return Result::failure(ErrorCode::NotInitialized, "libsodium initialization failed.");
  }
  ready_ = true;
  return Result::success("Crypto engine ready (Ed25519 + SHA-256/libsodium).");
}

std::string CryptoEngine::hash_bytes(std::string_view payload) const {
  return util::sha256_hex(payload);
}

Result CryptoEngine::generate_keypair(SigningKeyPair& out) const {
  if (!ready_) {
    return Result::failure(ErrorCode::NotInitialized, "Crypto engine is not initialized.");
  }

  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  std::array<unsigned char, crypto_sign_SECRETKEYBYTES> secret_key{};
  if (crypto_sign_keypair(public_key.data(), secret_key.data()) != 0) {
    return Result::failure(ErrorCode::NotInitialized, "Ed25519 key generation failed.");
  }

  out.public_key = bytes_to_hex(public_key.data(), public_key.size());
  out.secret_key = bytes_to_hex(secret_key.data(), secret_key.size());
  sodium_memzero(secret_key.data(), secret_key.size());
  return Result::success("Signing key pair generated.", out.public_key);
}

std::string CryptoEngine::sign(std::string_view payload, std::string_view secret_key) const {
  const std::string secret_bytes = util::from_hex(secret_key);
  if (secret_bytes.size() != crypto_sign_SECRETKEYBYTES) {
    return {};
  }

  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  if (crypto_sign_ed25519_sk_to_pk(public_key.data(),
                                   reinterpret_cast<const unsigned char*>(secret_bytes.data())) != 0) {
    return {};
  }

  std::array<unsigned char, crypto_sign_BYTES> signature{};
  crypto_sign_detached(signature.data(), nullptr,
                       reinterpret_cast<const unsigned char*>(payload.data()),
                       static_cast<unsigned long long>(payload.size()),
                       reinterpret_cast<const unsigned char*>(secret_bytes.data()));
  return bytes_to_hex(public_key.data(), public_key.size()) +
         bytes_to_hex(signature.data(), signature.size());
}

bool CryptoEngine::verify(std::string_view payload, std::string_view signature,
                          std::string_view public_key) const {
  const auto signer = recover_signer(payload, signature);
  return signer.has_value() && *signer == public_key;
}

std::optional<std::string> CryptoEngine::recover_signer(std::string_view payload,
                                                        std::string_view signature) const {
  if (signature.size() != kPublicKeyHexChars + kSignatureHexChars) {
    return std::nullopt;
  }

  const std::string public_key_hex{signature.substr(0, kPublicKeyHexChars)};
  const std::string public_key_bytes = util::from_hex(public_key_hex);
  const std::string sig_bytes = util::from_hex(signature.substr(kPublicKeyHexChars));
  if (public_key_bytes.size() != crypto_sign_PUBLICKEYBYTES || sig_bytes.size() != crypto_sign_BYTES) {
    return std::nullopt;
  }

  const bool valid =
      crypto_sign_verify_detached(reinterpret_cast<const unsigned char*>(sig_bytes.data()),
                                  reinterpret_cast<const unsigned char*>(payload.data()),
                                  static_cast<unsigned long long>(payload.size()),
                                  reinterpret_cast<const unsigned char*>(public_key_bytes.data())) == 0;
  if (!valid) {
    return std::nullopt;
  }
  // Normalize case so the identity compares equal to the configured verifier.
  return util::to_hex(public_key_bytes);
}

}  // namespace craftiax
