#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace ledger {

struct AccountRecord {
  std::optional<common::Address> sponsor{};
  // Only strictly positive balances are stored.
  std::unordered_map<common::AssetId, common::Units, common::AddressHash> balances{};
  std::uint32_t active_assets{0};
  common::Units lifetime_allocated{0};
};

// All mutable accounting state of one ledger. Accounts are implicit: reading an unknown
// beneficiary yields an empty account.
class LedgerStore {
 public:
  [[nodiscard]] std::optional<common::Address> sponsor_of(const common::Address& beneficiary) const;
  [[nodiscard]] common::Units balance_of(const common::Address& beneficiary, const common::AssetId& asset) const;
  [[nodiscard]] std::uint32_t active_asset_count(const common::Address& beneficiary) const;
  [[nodiscard]] common::Units lifetime_allocated(const common::Address& beneficiary) const;
  [[nodiscard]] common::Units cumulative_sponsored(const common::AssetId& asset) const;
  [[nodiscard]] std::vector<common::AssetId> held_assets(const common::Address& beneficiary) const;
  [[nodiscard]] std::vector<common::Address> beneficiaries() const;
  [[nodiscard]] const std::optional<common::Address>& consuming_engine() const noexcept { return consuming_engine_; }

  void assign_sponsor(const common::Address& beneficiary, const common::Address& sponsor);
  void clear_sponsor(const common::Address& beneficiary);

  // Returns the new balance. Throws std::overflow_error.
  common::Units credit(const common::Address& beneficiary, const common::AssetId& asset, common::Units amount);
  // Returns the new balance. Throws std::logic_error if amount exceeds the balance.
  common::Units debit(const common::Address& beneficiary, const common::AssetId& asset, common::Units amount);
  // Returns the previous balance.
  common::Units set_balance(const common::Address& beneficiary, const common::AssetId& asset, common::Units value);

  void add_lifetime_allocated(const common::Address& beneficiary, common::Units amount);
  void add_cumulative_sponsored(const common::AssetId& asset, common::Units amount);
  void set_consuming_engine(const common::Address& engine);

  // active_assets matches the positive balances and nobody sponsors itself.
  [[nodiscard]] bool check_invariants() const;
  void reset();

  [[nodiscard]] std::vector<std::byte> encode() const;
  static LedgerStore decode(std::span<const std::byte> data);

 private:
  std::unordered_map<common::Address, AccountRecord, common::AddressHash> accounts_{};
  std::unordered_map<common::AssetId, common::Units, common::AddressHash> cumulative_sponsored_{};
  std::optional<common::Address> consuming_engine_{};

  AccountRecord& ensure_account(const common::Address& beneficiary);
  const AccountRecord* find_account(const common::Address& beneficiary) const;
};

}  // namespace ledger
}  // namespace unitledger
