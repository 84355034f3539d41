#include "unitledger/auth/authenticator.hpp"

#include <sodium.h>

#include <algorithm>
#include <stdexcept>

namespace unitledger {
namespace auth {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

common::Address derive_address(const PublicKey& public_key) {
  ensure_sodium_init();

  std::array<std::uint8_t, 32> digest{};
  if (crypto_generichash(digest.data(), digest.size(), public_key.data(), public_key.size(), nullptr, 0) != 0) {
    throw std::runtime_error("address derivation hash failed");
  }
  common::Address addr;
  std::copy(digest.end() - common::kAddressSize, digest.end(), addr.bytes.begin());
  return addr;
}

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

std::optional<common::Address> Authenticator::authenticate(const PublicKey& public_key,
                                                           std::uint64_t nonce,
                                                           std::span<const std::byte> message,
                                                           const Signature& signature) {
  if (!verify_with_key(public_key, message, signature)) {
    return std::nullopt;
  }
  const common::Address address = derive_address(public_key);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nonces_.find(address);
  if (it != nonces_.end() && nonce <= it->second) {
    return std::nullopt;
  }
  nonces_[address] = nonce;
  return address;
}

std::optional<std::uint64_t> Authenticator::last_nonce(const common::Address& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nonces_.find(address);
  if (it == nonces_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

void Authenticator::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  if (crypto_sign_keypair(out_public.data(), out_secret.data()) != 0) {
    throw std::runtime_error("ed25519 keypair generation failed");
  }
}

}  // namespace auth
}  // namespace unitledger
