#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// Caller address of a key: the last 20 bytes of BLAKE2b-256(public key).
common::Address derive_address(const PublicKey& public_key);

class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  // Verifies the signature and that nonce is above the last nonce accepted for the
  // signer. Returns the signer's address and records the nonce on success.
  std::optional<common::Address> authenticate(const PublicKey& public_key,
                                              std::uint64_t nonce,
                                              std::span<const std::byte> message,
                                              const Signature& signature);

  [[nodiscard]] std::optional<std::uint64_t> last_nonce(const common::Address& address) const;

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  // Sign a message with a secret key (for testing/client use)
  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);

  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::Address, std::uint64_t, common::AddressHash> nonces_;
};

}  // namespace auth
}  // namespace unitledger
