#include "unitledger/sink/transfer_meter.hpp"

#include <stdexcept>

namespace unitledger {
namespace sink {

SinkTransferMeter::SinkTransferMeter(AssetBook& book, common::Address sink_address)
    : book_(book), sink_address_(sink_address) {
  if (sink_address_.is_null()) {
    throw std::invalid_argument("sink address cannot be null");
  }
}

TransferReceipt SinkTransferMeter::transfer_and_measure(const common::Address& from,
                                                        const common::AssetId& asset,
                                                        common::Units amount) {
  TransferReceipt receipt{.from = from, .asset = asset, .requested = amount};
  receipt.checkpoint = book_.checkpoint();
  receipt.sink_before = book_.balance_of(asset, sink_address_);
  try {
    book_.transfer(asset, from, sink_address_, amount);
  } catch (...) {
    book_.rollback(receipt.checkpoint);
    throw;
  }
  receipt.sink_after = book_.balance_of(asset, sink_address_);
  return receipt;
}

void SinkTransferMeter::commit(const TransferReceipt& receipt) {
  book_.release(receipt.checkpoint);
}

void SinkTransferMeter::revert(const TransferReceipt& receipt) {
  book_.rollback(receipt.checkpoint);
}

}  // namespace sink
}  // namespace unitledger
