#include "test_sink.hpp"

#include <cassert>
#include <cstddef>
#include <stdexcept>

#include "unitledger/common/types.hpp"
#include "unitledger/registry/eligibility_registry.hpp"
#include "unitledger/sink/asset_book.hpp"
#include "unitledger/sink/transfer_meter.hpp"

namespace unitledger::tests {

namespace {

const common::Address kPayer = common::Address::from_id(0x51);
const common::Address kSinkAddress = common::Address::from_id(0xdead);
const common::AssetId kToken = common::Address::from_id(0xaa01);

}  // namespace

void test_meter_measures_fee_on_transfer() {
  sink::InMemoryAssetBook book;
  book.mint(kToken, kPayer, 10'000);
  book.mint(kToken, kSinkAddress, 7);
  book.set_fee_basis_points(kToken, 100);
  sink::SinkTransferMeter meter{book, kSinkAddress};

  const auto receipt = meter.transfer_and_measure(kPayer, kToken, 1'001);
  assert(receipt.requested == 1'001);
  assert(receipt.sink_before == 7);
  // 1% of 1001 rounds up to 11.
  assert(receipt.received() == 990);
  assert(book.open_checkpoints() == 1);
  meter.commit(receipt);
  assert(book.open_checkpoints() == 0);
  assert(book.balance_of(kToken, kSinkAddress) == 997);
  assert(book.balance_of(kToken, kPayer) == 10'000 - 1'001);

  const auto undone = meter.transfer_and_measure(kPayer, kToken, 100);
  assert(undone.received() == 99);
  meter.revert(undone);
  assert(book.open_checkpoints() == 0);
  assert(book.balance_of(kToken, kSinkAddress) == 997);
  assert(book.balance_of(kToken, kPayer) == 10'000 - 1'001);

  bool threw = false;
  try {
    book.set_fee_basis_points(kToken, 10'001);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    const sink::SinkTransferMeter bad{book, common::Address{}};
    (void)bad;
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void test_meter_failed_transfer_leaves_book() {
  sink::InMemoryAssetBook book;
  book.mint(kToken, kPayer, 50);
  sink::SinkTransferMeter meter{book, kSinkAddress};

  bool threw = false;
  try {
    (void)meter.transfer_and_measure(kPayer, kToken, 51);
  } catch (const sink::TransferError&) {
    threw = true;
  }
  assert(threw);
  assert(book.open_checkpoints() == 0);
  assert(book.balance_of(kToken, kPayer) == 50);

  // A throwing hook undoes the transfer it observed.
  book.set_transfer_hook([](const sink::InMemoryAssetBook::TransferContext& ctx) {
    if (ctx.delivered > 10) {
      throw std::runtime_error("hook rejected transfer");
    }
  });
  threw = false;
  try {
    (void)meter.transfer_and_measure(kPayer, kToken, 20);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(book.open_checkpoints() == 0);
  assert(book.balance_of(kToken, kPayer) == 50);
  assert(book.balance_of(kToken, kSinkAddress) == 0);

  const auto small = meter.transfer_and_measure(kPayer, kToken, 10);
  meter.commit(small);
  assert(book.balance_of(kToken, kSinkAddress) == 10);
}

void test_book_checkpoints_nest() {
  sink::InMemoryAssetBook book;
  book.mint(kToken, kPayer, 100);

  const auto outer = book.checkpoint();
  book.transfer(kToken, kPayer, kSinkAddress, 10);
  const auto inner = book.checkpoint();
  book.transfer(kToken, kPayer, kSinkAddress, 20);
  assert(book.open_checkpoints() == 2);

  book.rollback(inner);
  assert(book.balance_of(kToken, kSinkAddress) == 10);
  assert(book.open_checkpoints() == 1);

  const auto again = book.checkpoint();
  book.transfer(kToken, kPayer, kSinkAddress, 5);
  // Rolling back the outer checkpoint discards the later one too.
  book.rollback(outer);
  assert(book.open_checkpoints() == 0);
  assert(book.balance_of(kToken, kPayer) == 100);
  assert(book.balance_of(kToken, kSinkAddress) == 0);

  bool threw = false;
  try {
    book.release(again);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  const auto kept = book.checkpoint();
  book.transfer(kToken, kPayer, kSinkAddress, 40);
  book.release(kept);
  assert(book.open_checkpoints() == 0);
  assert(book.balance_of(kToken, kSinkAddress) == 40);
}

void test_registry_eligibility() {
  registry::StaticRegistry reg;
  const auto other = common::Address::from_id(0xaa02);

  assert(!reg.lookup(kToken).listed);
  reg.list_asset(kToken, {.listed = false, .enabled = true, .decimals = 18, .units_per_reference_amount = 1});
  auto info = reg.lookup(kToken);
  assert(info.listed && info.eligible());
  assert(!info.cap_units.has_value());

  reg.set_enabled(kToken, false);
  assert(!reg.lookup(kToken).eligible());
  reg.set_enabled(kToken, true);

  reg.set_cap(kToken, registry::cap_from_raw(0));
  assert(!reg.lookup(kToken).cap_units.has_value());
  reg.set_cap(kToken, registry::cap_from_raw(250));
  assert(reg.lookup(kToken).cap_units == 250u);

  reg.list_asset(other, {.enabled = false});
  assert(reg.size() == 2);
  assert(!reg.lookup(other).eligible());
  reg.set_enabled(other, true);
  assert(reg.lookup(other).eligible());
  reg.delist_asset(other);
  assert(!reg.lookup(other).listed);
  assert(!reg.lookup(other).eligible());

  bool threw = false;
  try {
    reg.set_cap(common::Address::from_id(0xaa03), 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    reg.list_asset(common::Address{}, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void test_book_encoding_restores_balances() {
  const auto kOther = common::Address::from_id(0xaa02);
  sink::InMemoryAssetBook book;
  book.mint(kToken, kPayer, 500);
  book.mint(kOther, kPayer, 40);
  book.set_fee_basis_points(kToken, 1'000);
  book.transfer(kToken, kPayer, kSinkAddress, 200);
  book.transfer(kOther, kPayer, kSinkAddress, 40);
  assert(book.balance_of(kToken, kSinkAddress) == 180);

  const auto bytes = book.encode();
  sink::InMemoryAssetBook restored;
  restored.mint(kToken, kPayer, 1);
  restored.restore(bytes);
  assert(restored.balance_of(kToken, kPayer) == 300);
  assert(restored.balance_of(kToken, kSinkAddress) == 180);
  assert(restored.balance_of(kOther, kPayer) == 0);
  assert(restored.balance_of(kOther, kSinkAddress) == 40);
  assert(restored.encode() == bytes);

  // Settled transfers replay the measured amounts without charging the fee again.
  sink::InMemoryAssetBook replayed;
  replayed.mint(kToken, kPayer, 500);
  replayed.mint(kOther, kPayer, 40);
  replayed.apply_settled_transfer(kToken, kPayer, kSinkAddress, 200, 180);
  replayed.apply_settled_transfer(kOther, kPayer, kSinkAddress, 40, 40);
  assert(replayed.encode() == bytes);

  bool threw = false;
  try {
    replayed.apply_settled_transfer(kOther, kPayer, kSinkAddress, 1, 1);
  } catch (const sink::TransferError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    replayed.apply_settled_transfer(kToken, kPayer, kSinkAddress, 5, 6);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(replayed.encode() == bytes);

  threw = false;
  auto trailing = bytes;
  trailing.push_back(std::byte{0});
  try {
    restored.restore(trailing);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(restored.encode() == bytes);

  threw = false;
  const auto id = restored.checkpoint();
  try {
    restored.restore(bytes);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  restored.release(id);
}

}  // namespace unitledger::tests
