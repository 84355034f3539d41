#include "unitledger/ledger/ledger_store.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "unitledger/common/byte_codec.hpp"

namespace unitledger {
namespace ledger {

namespace {
constexpr std::uint32_t kStateMagic = 0x54534c55;  // 'ULST'
constexpr std::uint16_t kStateVersion = 1;

common::Units checked_add(common::Units lhs, common::Units rhs, const char* what) {
  if (lhs > std::numeric_limits<common::Units>::max() - rhs) {
    throw std::overflow_error(what);
  }
  return lhs + rhs;
}

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

std::optional<common::Address> LedgerStore::sponsor_of(const common::Address& beneficiary) const {
  const auto* account = find_account(beneficiary);
  return account ? account->sponsor : std::nullopt;
}

common::Units LedgerStore::balance_of(const common::Address& beneficiary, const common::AssetId& asset) const {
  const auto* account = find_account(beneficiary);
  if (!account) {
    return 0;
  }
  auto it = account->balances.find(asset);
  return it == account->balances.end() ? 0 : it->second;
}

std::uint32_t LedgerStore::active_asset_count(const common::Address& beneficiary) const {
  const auto* account = find_account(beneficiary);
  return account ? account->active_assets : 0;
}

common::Units LedgerStore::lifetime_allocated(const common::Address& beneficiary) const {
  const auto* account = find_account(beneficiary);
  return account ? account->lifetime_allocated : 0;
}

common::Units LedgerStore::cumulative_sponsored(const common::AssetId& asset) const {
  auto it = cumulative_sponsored_.find(asset);
  return it == cumulative_sponsored_.end() ? 0 : it->second;
}

std::vector<common::AssetId> LedgerStore::held_assets(const common::Address& beneficiary) const {
  const auto* account = find_account(beneficiary);
  if (!account) {
    return {};
  }
  return sorted_keys(account->balances);
}

std::vector<common::Address> LedgerStore::beneficiaries() const {
  return sorted_keys(accounts_);
}

void LedgerStore::assign_sponsor(const common::Address& beneficiary, const common::Address& sponsor) {
  if (beneficiary == sponsor) {
    throw std::logic_error("beneficiary cannot sponsor itself");
  }
  ensure_account(beneficiary).sponsor = sponsor;
}

void LedgerStore::clear_sponsor(const common::Address& beneficiary) {
  if (auto it = accounts_.find(beneficiary); it != accounts_.end()) {
    it->second.sponsor.reset();
  }
}

common::Units LedgerStore::credit(const common::Address& beneficiary, const common::AssetId& asset, common::Units amount) {
  const common::Units current = balance_of(beneficiary, asset);
  const common::Units updated = checked_add(current, amount, "beneficiary balance overflow");
  set_balance(beneficiary, asset, updated);
  return updated;
}

common::Units LedgerStore::debit(const common::Address& beneficiary, const common::AssetId& asset, common::Units amount) {
  const common::Units current = balance_of(beneficiary, asset);
  if (amount > current) {
    throw std::logic_error("debit exceeds beneficiary balance");
  }
  set_balance(beneficiary, asset, current - amount);
  return current - amount;
}

common::Units LedgerStore::set_balance(const common::Address& beneficiary, const common::AssetId& asset, common::Units value) {
  auto& account = ensure_account(beneficiary);
  auto it = account.balances.find(asset);
  const common::Units previous = it == account.balances.end() ? 0 : it->second;

  if (value == 0) {
    if (it != account.balances.end()) {
      account.balances.erase(it);
      --account.active_assets;
    }
  } else if (it == account.balances.end()) {
    account.balances.emplace(asset, value);
    ++account.active_assets;
  } else {
    it->second = value;
  }
  return previous;
}

void LedgerStore::add_lifetime_allocated(const common::Address& beneficiary, common::Units amount) {
  auto& account = ensure_account(beneficiary);
  account.lifetime_allocated = checked_add(account.lifetime_allocated, amount, "lifetime allocation overflow");
}

void LedgerStore::add_cumulative_sponsored(const common::AssetId& asset, common::Units amount) {
  auto& total = cumulative_sponsored_[asset];
  total = checked_add(total, amount, "cumulative sponsored overflow");
}

void LedgerStore::set_consuming_engine(const common::Address& engine) {
  consuming_engine_ = engine;
}

bool LedgerStore::check_invariants() const {
  for (const auto& [beneficiary, account] : accounts_) {
    const auto positive = std::count_if(account.balances.begin(), account.balances.end(),
                                        [](const auto& entry) { return entry.second > 0; });
    if (static_cast<std::size_t>(positive) != account.balances.size()) {
      return false;
    }
    if (account.active_assets != account.balances.size()) {
      return false;
    }
    if (account.sponsor && *account.sponsor == beneficiary) {
      return false;
    }
  }
  return true;
}

void LedgerStore::reset() {
  accounts_.clear();
  cumulative_sponsored_.clear();
  consuming_engine_.reset();
}

std::vector<std::byte> LedgerStore::encode() const {
  namespace codec = common::codec;
  std::vector<std::byte> buffer;
  codec::append_primitive<std::uint32_t>(buffer, kStateMagic);
  codec::append_primitive<std::uint16_t>(buffer, kStateVersion);

  codec::append_primitive<std::uint8_t>(buffer, consuming_engine_ ? 1 : 0);
  if (consuming_engine_) {
    codec::append_address(buffer, *consuming_engine_);
  }

  codec::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(cumulative_sponsored_.size()));
  for (const auto& asset : sorted_keys(cumulative_sponsored_)) {
    codec::append_address(buffer, asset);
    codec::append_primitive<common::Units>(buffer, cumulative_sponsored_.at(asset));
  }

  codec::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(accounts_.size()));
  for (const auto& beneficiary : sorted_keys(accounts_)) {
    const auto& account = accounts_.at(beneficiary);
    codec::append_address(buffer, beneficiary);
    codec::append_primitive<std::uint8_t>(buffer, account.sponsor ? 1 : 0);
    if (account.sponsor) {
      codec::append_address(buffer, *account.sponsor);
    }
    codec::append_primitive<common::Units>(buffer, account.lifetime_allocated);
    codec::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(account.balances.size()));
    for (const auto& asset : sorted_keys(account.balances)) {
      codec::append_address(buffer, asset);
      codec::append_primitive<common::Units>(buffer, account.balances.at(asset));
    }
  }
  return buffer;
}

LedgerStore LedgerStore::decode(std::span<const std::byte> data) {
  namespace codec = common::codec;
  std::size_t offset = 0;
  if (codec::read_primitive<std::uint32_t>(data, offset) != kStateMagic) {
    throw std::runtime_error("invalid ledger state magic");
  }
  if (codec::read_primitive<std::uint16_t>(data, offset) != kStateVersion) {
    throw std::runtime_error("unsupported ledger state version");
  }

  LedgerStore store;
  if (codec::read_primitive<std::uint8_t>(data, offset) != 0) {
    store.consuming_engine_ = codec::read_address(data, offset);
  }

  const auto asset_count = codec::read_primitive<std::uint32_t>(data, offset);
  for (std::uint32_t i = 0; i < asset_count; ++i) {
    const auto asset = codec::read_address(data, offset);
    store.cumulative_sponsored_[asset] = codec::read_primitive<common::Units>(data, offset);
  }

  const auto account_count = codec::read_primitive<std::uint32_t>(data, offset);
  for (std::uint32_t i = 0; i < account_count; ++i) {
    const auto beneficiary = codec::read_address(data, offset);
    auto& account = store.ensure_account(beneficiary);
    if (codec::read_primitive<std::uint8_t>(data, offset) != 0) {
      account.sponsor = codec::read_address(data, offset);
    }
    account.lifetime_allocated = codec::read_primitive<common::Units>(data, offset);
    const auto balance_count = codec::read_primitive<std::uint32_t>(data, offset);
    for (std::uint32_t j = 0; j < balance_count; ++j) {
      const auto asset = codec::read_address(data, offset);
      store.set_balance(beneficiary, asset, codec::read_primitive<common::Units>(data, offset));
    }
  }

  if (offset != data.size()) {
    throw std::runtime_error("trailing bytes after ledger state");
  }
  if (!store.check_invariants()) {
    throw std::runtime_error("decoded ledger state violates invariants");
  }
  return store;
}

AccountRecord& LedgerStore::ensure_account(const common::Address& beneficiary) {
  return accounts_[beneficiary];
}

const AccountRecord* LedgerStore::find_account(const common::Address& beneficiary) const {
  auto it = accounts_.find(beneficiary);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace ledger
}  // namespace unitledger
