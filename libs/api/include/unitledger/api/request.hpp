#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "unitledger/auth/authenticator.hpp"
#include "unitledger/common/types.hpp"

namespace unitledger {
namespace api {

enum class RequestKind : std::uint8_t {
  kSponsor = 1,
  kConsume = 2,
  kClearIfEmpty = 3,
  kClearAndForfeit = 4,
  kSetEngine = 5,
  kTransferOwnership = 6,
  kAcceptOwnership = 7,
};

// Fields a kind does not use are neither encoded nor decoded.
struct Request {
  RequestKind kind{RequestKind::kSponsor};
  std::uint64_t nonce{0};
  common::Address beneficiary{};
  common::AssetId asset{};
  common::Units amount{0};
  std::vector<common::AssetId> assets{};
  common::Address target{};  // engine or nominated owner
};

// Signature covers the encoded body.
struct SignedRequest {
  auth::PublicKey public_key{};
  auth::Signature signature{};
  std::vector<std::byte> body{};
};

// Body layout: [kind:1][nonce:8][kind-specific fields].
std::vector<std::byte> encode_request(const Request& request);
// Throws std::runtime_error on malformed bodies.
Request decode_request(std::span<const std::byte> body);

SignedRequest sign_request(const Request& request, const auth::PublicKey& public_key, const auth::SecretKey& secret_key);

}  // namespace api
}  // namespace unitledger
