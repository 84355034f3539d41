#include "unitledger/sink/asset_book.hpp"

#include <algorithm>
#include <limits>

#include "unitledger/common/byte_codec.hpp"

namespace unitledger {
namespace sink {

namespace {
constexpr std::uint32_t kBasisPointDenominator = 10'000;
constexpr std::uint32_t kBookMagic = 0x42414c55;  // 'ULAB'
constexpr std::uint16_t kBookVersion = 1;

template <typename Map>
std::vector<typename Map::key_type> sorted_keys(const Map& map) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(map.size());
  for (const auto& [key, value] : map) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

}  // namespace

void InMemoryAssetBook::mint(const common::AssetId& asset, const common::Address& holder, common::Units amount) {
  auto& balance = balances_[asset][holder];
  if (balance > std::numeric_limits<common::Units>::max() - amount) {
    throw std::overflow_error("mint overflows holder balance");
  }
  balance += amount;
}

void InMemoryAssetBook::apply_settled_transfer(const common::AssetId& asset,
                                               const common::Address& from,
                                               const common::Address& to,
                                               common::Units debited,
                                               common::Units delivered) {
  if (delivered > debited) {
    throw std::invalid_argument("settled transfer delivers more than it debits");
  }
  auto& holders = balances_[asset];
  auto& source = holders[from];
  if (source < debited) {
    throw TransferError("settled transfer exceeds balance of " + from.to_hex() + " in " + asset.to_hex());
  }
  auto& destination = holders[to];
  if (destination > std::numeric_limits<common::Units>::max() - delivered) {
    throw std::overflow_error("settled transfer overflows destination balance");
  }
  source -= debited;
  destination += delivered;
}

void InMemoryAssetBook::set_fee_basis_points(const common::AssetId& asset, std::uint32_t basis_points) {
  if (basis_points > kBasisPointDenominator) {
    throw std::invalid_argument("fee basis points must be <= 10000");
  }
  fees_bp_[asset] = basis_points;
}

void InMemoryAssetBook::set_transfer_hook(TransferHook hook) {
  hook_ = std::move(hook);
}

common::Units InMemoryAssetBook::balance_of(const common::AssetId& asset, const common::Address& holder) const {
  auto asset_it = balances_.find(asset);
  if (asset_it == balances_.end()) {
    return 0;
  }
  auto holder_it = asset_it->second.find(holder);
  return holder_it == asset_it->second.end() ? 0 : holder_it->second;
}

void InMemoryAssetBook::transfer(const common::AssetId& asset,
                                 const common::Address& from,
                                 const common::Address& to,
                                 common::Units amount) {
  auto& holders = balances_[asset];
  auto& source = holders[from];
  if (source < amount) {
    throw TransferError("insufficient balance for transfer of " + asset.to_hex() + " from " + from.to_hex());
  }

  common::Units fee = 0;
  if (auto it = fees_bp_.find(asset); it != fees_bp_.end() && it->second != 0) {
    // Rounded up so a nonzero fee rate never rounds down to a free transfer.
    const common::Units bp = it->second;
    fee = (amount / kBasisPointDenominator) * bp +
          ((amount % kBasisPointDenominator) * bp + kBasisPointDenominator - 1) / kBasisPointDenominator;
  }
  const common::Units delivered = amount - fee;

  source -= amount;
  auto& destination = holders[to];
  if (destination > std::numeric_limits<common::Units>::max() - delivered) {
    source += amount;
    throw TransferError("transfer overflows destination balance");
  }
  destination += delivered;

  if (hook_) {
    hook_(TransferContext{.asset = asset, .from = from, .to = to, .amount = amount, .delivered = delivered});
  }
}

std::uint64_t InMemoryAssetBook::checkpoint() {
  const std::uint64_t id = next_checkpoint_++;
  checkpoints_.emplace_back(id, balances_);
  return id;
}

void InMemoryAssetBook::rollback(std::uint64_t checkpoint_id) {
  auto it = std::find_if(checkpoints_.begin(), checkpoints_.end(),
                         [&](const auto& entry) { return entry.first == checkpoint_id; });
  if (it == checkpoints_.end()) {
    throw std::logic_error("unknown asset book checkpoint");
  }
  balances_ = std::move(it->second);
  // Checkpoints taken after this one are discarded with it.
  checkpoints_.erase(it, checkpoints_.end());
}

void InMemoryAssetBook::release(std::uint64_t checkpoint_id) {
  auto it = std::find_if(checkpoints_.begin(), checkpoints_.end(),
                         [&](const auto& entry) { return entry.first == checkpoint_id; });
  if (it == checkpoints_.end()) {
    throw std::logic_error("unknown asset book checkpoint");
  }
  checkpoints_.erase(it);
}

std::vector<std::byte> InMemoryAssetBook::encode() const {
  namespace codec = common::codec;
  std::vector<std::byte> buffer;
  codec::append_primitive<std::uint32_t>(buffer, kBookMagic);
  codec::append_primitive<std::uint16_t>(buffer, kBookVersion);

  std::vector<std::pair<common::AssetId, std::vector<common::Address>>> assets;
  for (const auto& asset : sorted_keys(balances_)) {
    const auto& holders = balances_.at(asset);
    std::vector<common::Address> funded;
    for (const auto& holder : sorted_keys(holders)) {
      if (holders.at(holder) != 0) {
        funded.push_back(holder);
      }
    }
    if (!funded.empty()) {
      assets.emplace_back(asset, std::move(funded));
    }
  }

  codec::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(assets.size()));
  for (const auto& [asset, holders] : assets) {
    codec::append_address(buffer, asset);
    codec::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(holders.size()));
    for (const auto& holder : holders) {
      codec::append_address(buffer, holder);
      codec::append_primitive<common::Units>(buffer, balances_.at(asset).at(holder));
    }
  }
  return buffer;
}

void InMemoryAssetBook::restore(std::span<const std::byte> data) {
  namespace codec = common::codec;
  if (!checkpoints_.empty()) {
    throw std::logic_error("cannot restore asset book with open checkpoints");
  }
  std::size_t offset = 0;
  if (codec::read_primitive<std::uint32_t>(data, offset) != kBookMagic) {
    throw std::runtime_error("invalid asset book magic");
  }
  if (codec::read_primitive<std::uint16_t>(data, offset) != kBookVersion) {
    throw std::runtime_error("unsupported asset book version");
  }

  BalanceMap restored;
  const auto asset_count = codec::read_primitive<std::uint32_t>(data, offset);
  for (std::uint32_t i = 0; i < asset_count; ++i) {
    const auto asset = codec::read_address(data, offset);
    auto& holders = restored[asset];
    const auto holder_count = codec::read_primitive<std::uint32_t>(data, offset);
    for (std::uint32_t j = 0; j < holder_count; ++j) {
      const auto holder = codec::read_address(data, offset);
      holders[holder] = codec::read_primitive<common::Units>(data, offset);
    }
  }
  if (offset != data.size()) {
    throw std::runtime_error("trailing bytes after asset book");
  }
  balances_ = std::move(restored);
}

}  // namespace sink
}  // namespace unitledger
