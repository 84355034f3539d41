#pragma once

#include <cstdint>

#include "unitledger/common/types.hpp"
#include "unitledger/sink/asset_book.hpp"

namespace unitledger {
namespace sink {

struct TransferReceipt {
  common::Address from{};
  common::AssetId asset{};
  common::Units requested{0};
  common::Units sink_before{0};
  common::Units sink_after{0};
  std::uint64_t checkpoint{0};

  // What the sink actually gained, which is what gets credited.
  [[nodiscard]] common::Units received() const noexcept {
    return sink_after > sink_before ? sink_after - sink_before : 0;
  }
};

// Moves an asset from a payer into the sink and reports the measured receipt. A receipt
// stays pending until it is committed or reverted.
class TransferMeter {
 public:
  virtual ~TransferMeter() = default;

  virtual TransferReceipt transfer_and_measure(const common::Address& from,
                                               const common::AssetId& asset,
                                               common::Units amount) = 0;
  virtual void commit(const TransferReceipt& receipt) = 0;
  virtual void revert(const TransferReceipt& receipt) = 0;
};

class SinkTransferMeter final : public TransferMeter {
 public:
  SinkTransferMeter(AssetBook& book, common::Address sink_address);

  TransferReceipt transfer_and_measure(const common::Address& from,
                                       const common::AssetId& asset,
                                       common::Units amount) override;
  void commit(const TransferReceipt& receipt) override;
  void revert(const TransferReceipt& receipt) override;

  [[nodiscard]] const common::Address& sink_address() const noexcept { return sink_address_; }

 private:
  AssetBook& book_;
  common::Address sink_address_;
};

}  // namespace sink
}  // namespace unitledger
