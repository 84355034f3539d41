#include "unitledger/api/request.hpp"

#include <stdexcept>

#include "unitledger/common/byte_codec.hpp"

namespace unitledger {
namespace api {

namespace codec = common::codec;

namespace {
constexpr std::uint32_t kMaxForfeitAssets = 1024;
}  // namespace

std::vector<std::byte> encode_request(const Request& request) {
  std::vector<std::byte> buffer;
  codec::append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(request.kind));
  codec::append_primitive<std::uint64_t>(buffer, request.nonce);

  switch (request.kind) {
    case RequestKind::kSponsor:
    case RequestKind::kConsume:
      codec::append_address(buffer, request.beneficiary);
      codec::append_address(buffer, request.asset);
      codec::append_primitive<common::Units>(buffer, request.amount);
      break;
    case RequestKind::kClearAndForfeit:
      codec::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(request.assets.size()));
      for (const auto& asset : request.assets) {
        codec::append_address(buffer, asset);
      }
      break;
    case RequestKind::kSetEngine:
    case RequestKind::kTransferOwnership:
      codec::append_address(buffer, request.target);
      break;
    case RequestKind::kClearIfEmpty:
    case RequestKind::kAcceptOwnership:
      break;
  }
  return buffer;
}

Request decode_request(std::span<const std::byte> body) {
  std::size_t offset = 0;
  Request request;
  request.kind = static_cast<RequestKind>(codec::read_primitive<std::uint8_t>(body, offset));
  request.nonce = codec::read_primitive<std::uint64_t>(body, offset);

  switch (request.kind) {
    case RequestKind::kSponsor:
    case RequestKind::kConsume:
      request.beneficiary = codec::read_address(body, offset);
      request.asset = codec::read_address(body, offset);
      request.amount = codec::read_primitive<common::Units>(body, offset);
      break;
    case RequestKind::kClearAndForfeit: {
      const auto count = codec::read_primitive<std::uint32_t>(body, offset);
      if (count > kMaxForfeitAssets) {
        throw std::runtime_error("too many assets in forfeit request");
      }
      request.assets.reserve(count);
      for (std::uint32_t i = 0; i < count; ++i) {
        request.assets.push_back(codec::read_address(body, offset));
      }
      break;
    }
    case RequestKind::kSetEngine:
    case RequestKind::kTransferOwnership:
      request.target = codec::read_address(body, offset);
      break;
    case RequestKind::kClearIfEmpty:
    case RequestKind::kAcceptOwnership:
      break;
    default:
      throw std::runtime_error("unknown request kind");
  }

  if (offset != body.size()) {
    throw std::runtime_error("trailing bytes after request");
  }
  return request;
}

SignedRequest sign_request(const Request& request, const auth::PublicKey& public_key, const auth::SecretKey& secret_key) {
  SignedRequest signed_request;
  signed_request.public_key = public_key;
  signed_request.body = encode_request(request);
  if (!auth::Authenticator::sign(secret_key, signed_request.body, signed_request.signature)) {
    throw std::runtime_error("failed to sign request");
  }
  return signed_request;
}

}  // namespace api
}  // namespace unitledger
