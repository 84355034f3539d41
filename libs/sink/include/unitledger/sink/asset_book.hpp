#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace sink {

class TransferError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Balance-queryable view of the assets the ledger sweeps into the sink. Checkpoints model
// the host discarding every effect of a call that fails after its transfer went out.
class AssetBook {
 public:
  virtual ~AssetBook() = default;

  [[nodiscard]] virtual common::Units balance_of(const common::AssetId& asset,
                                                 const common::Address& holder) const = 0;

  // Throws TransferError when `from` cannot cover `amount`.
  virtual void transfer(const common::AssetId& asset,
                        const common::Address& from,
                        const common::Address& to,
                        common::Units amount) = 0;

  virtual std::uint64_t checkpoint() = 0;
  virtual void rollback(std::uint64_t checkpoint_id) = 0;
  virtual void release(std::uint64_t checkpoint_id) = 0;
};

class InMemoryAssetBook final : public AssetBook {
 public:
  struct TransferContext {
    common::AssetId asset{};
    common::Address from{};
    common::Address to{};
    common::Units amount{0};
    common::Units delivered{0};
  };

  // Runs after balances have moved, before transfer() returns.
  using TransferHook = std::function<void(const TransferContext&)>;

  void mint(const common::AssetId& asset, const common::Address& holder, common::Units amount);

  // Re-applies a transfer already measured in an earlier run: `debited` leaves `from`,
  // `delivered` reaches `to`. No fee is recomputed and no hook runs.
  void apply_settled_transfer(const common::AssetId& asset,
                              const common::Address& from,
                              const common::Address& to,
                              common::Units debited,
                              common::Units delivered);

  // Portion of every transfer of `asset` destroyed in transit, in basis points.
  void set_fee_basis_points(const common::AssetId& asset, std::uint32_t basis_points);
  void set_transfer_hook(TransferHook hook);

  [[nodiscard]] common::Units balance_of(const common::AssetId& asset,
                                         const common::Address& holder) const override;
  void transfer(const common::AssetId& asset,
                const common::Address& from,
                const common::Address& to,
                common::Units amount) override;

  std::uint64_t checkpoint() override;
  void rollback(std::uint64_t checkpoint_id) override;
  void release(std::uint64_t checkpoint_id) override;

  [[nodiscard]] std::size_t open_checkpoints() const noexcept { return checkpoints_.size(); }

  // Holder balances only; fee rates come from configuration. Zero balances are omitted.
  [[nodiscard]] std::vector<std::byte> encode() const;
  // Replaces every balance. Throws std::runtime_error on malformed input and
  // std::logic_error while a checkpoint is open.
  void restore(std::span<const std::byte> data);

 private:
  using HolderMap = std::unordered_map<common::Address, common::Units, common::AddressHash>;
  using BalanceMap = std::unordered_map<common::AssetId, HolderMap, common::AddressHash>;

  BalanceMap balances_{};
  std::unordered_map<common::AssetId, std::uint32_t, common::AddressHash> fees_bp_{};
  std::vector<std::pair<std::uint64_t, BalanceMap>> checkpoints_{};
  std::uint64_t next_checkpoint_{1};
  TransferHook hook_{};
};

}  // namespace sink
}  // namespace unitledger
