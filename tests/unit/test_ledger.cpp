#include "test_ledger.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <vector>

#include "ledger_fixture.hpp"

namespace unitledger::tests {

using ledger::Status;

void test_sponsor_credits_new_beneficiary() {
  LedgerFixture f;
  assert(!f.core.sponsor_of(kBeneficiary).has_value());

  const auto result = f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 100);
  assert(result.status == Status::kOk);
  assert(result.reject_code == 0);
  assert(result.received == 100);
  assert(result.new_balance == 100);

  assert(f.core.balance_of(kBeneficiary, kAssetA) == 100);
  assert(f.core.active_asset_count(kBeneficiary) == 1);
  assert(f.core.sponsor_of(kBeneficiary) == kSponsor);
  assert(f.core.cumulative_sponsored(kAssetA) == 100);
  assert(f.core.lifetime_allocated(kBeneficiary) == 100);
  assert(f.book.balance_of(kAssetA, kSink) == 100);
  assert(f.book.balance_of(kAssetA, kSponsor) == kStartingFunds - 100);
  assert(f.book.open_checkpoints() == 0);

  const auto sponsored = f.events.of_type<audit::Sponsored>();
  const auto received = f.events.of_type<audit::SponsoredReceived>();
  assert(f.events.events().size() == 2);
  assert(sponsored.size() == 1 && sponsored[0].requested == 100 && sponsored[0].new_balance == 100);
  assert(received.size() == 1 && received[0].requested == 100 && received[0].received == 100);
  assert(received[0].sponsor == kSponsor);

  // Topping up the same asset keeps the active count at one.
  const auto top_up = f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 50);
  assert(top_up.status == Status::kOk);
  assert(top_up.new_balance == 150);
  assert(f.core.active_asset_count(kBeneficiary) == 1);
  assert(f.core.lifetime_allocated(kBeneficiary) == 150);
}

void test_sponsor_locked_for_other_sponsor() {
  LedgerFixture f;
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 100).status == Status::kOk);
  f.events.drain();

  const auto result = f.core.sponsor(kSponsor2, kBeneficiary, kAssetB, 40);
  assert(result.status == Status::kSponsorLocked);
  assert(result.reject_code == ledger::reject_code(Status::kSponsorLocked));
  assert(f.core.sponsor_of(kBeneficiary) == kSponsor);
  assert(f.core.balance_of(kBeneficiary, kAssetB) == 0);
  assert(f.core.active_asset_count(kBeneficiary) == 1);
  assert(f.core.cumulative_sponsored(kAssetB) == 0);
  assert(f.book.balance_of(kAssetB, kSponsor2) == kStartingFunds);
  assert(f.events.events().empty());
}

void test_consume_then_clear_if_empty() {
  LedgerFixture f;
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 100).status == Status::kOk);
  f.events.drain();

  assert(f.core.consume(kSponsor, kBeneficiary, kAssetA, 10).status == Status::kUnauthorizedCaller);
  assert(f.core.consume(kEngine, kBeneficiary, kAssetA, 0).status == Status::kInvalidAmount);
  assert(f.core.consume(kEngine, kBeneficiary, kAssetA, 101).status == Status::kInsufficientBalance);
  assert(f.core.balance_of(kBeneficiary, kAssetA) == 100);

  // Not empty yet.
  assert(f.core.clear_sponsor_if_empty(kBeneficiary).status == Status::kNotEmpty);

  const auto consumed = f.core.consume(kEngine, kBeneficiary, kAssetA, 100);
  assert(consumed.status == Status::kOk);
  assert(consumed.consumed == 100);
  assert(consumed.remaining == 0);
  assert(f.core.balance_of(kBeneficiary, kAssetA) == 0);
  assert(f.core.active_asset_count(kBeneficiary) == 0);

  assert(f.core.consume(kEngine, kBeneficiary, kAssetA, 1).status == Status::kInsufficientBalance);

  // Lifetime analytics survive consumption.
  assert(f.core.cumulative_sponsored(kAssetA) == 100);
  assert(f.core.lifetime_allocated(kBeneficiary) == 100);

  const auto cleared = f.core.clear_sponsor_if_empty(kBeneficiary);
  assert(cleared.status == Status::kOk);
  assert(cleared.previous_sponsor == kSponsor);
  assert(!f.core.sponsor_of(kBeneficiary).has_value());
  assert(f.core.clear_sponsor_if_empty(kBeneficiary).status == Status::kNothingToForfeit);

  const auto consumed_events = f.events.of_type<audit::Consumed>();
  assert(consumed_events.size() == 1);
  assert(consumed_events[0].amount == 100 && consumed_events[0].remaining == 0);
  const auto cleared_events = f.events.of_type<audit::SponsorCleared>();
  assert(cleared_events.size() == 1 && cleared_events[0].previous_sponsor == kSponsor);
}

void test_emptied_beneficiary_adoptable() {
  LedgerFixture f;
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 100).status == Status::kOk);
  assert(f.core.consume(kEngine, kBeneficiary, kAssetA, 100).status == Status::kOk);

  // Sponsor still assigned but nothing held: anyone may take over.
  assert(f.core.sponsor_of(kBeneficiary) == kSponsor);
  const auto adopted = f.core.sponsor(kSponsor2, kBeneficiary, kAssetB, 25);
  assert(adopted.status == Status::kOk);
  assert(f.core.sponsor_of(kBeneficiary) == kSponsor2);
  assert(f.core.active_asset_count(kBeneficiary) == 1);

  // And the previous sponsor is now locked out.
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 5).status == Status::kSponsorLocked);
}

void test_partial_then_full_forfeit() {
  LedgerFixture f;
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 50).status == Status::kOk);
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetB, 30).status == Status::kOk);
  assert(f.core.active_asset_count(kBeneficiary) == 2);
  f.events.drain();

  const std::array<common::AssetId, 1> first{kAssetA};
  const auto partial = f.core.clear_sponsor_and_forfeit(kBeneficiary, first);
  assert(partial.status == Status::kOk);
  assert(partial.assets_cleared == 1);
  assert(partial.total_forfeited == 50);
  assert(!partial.sponsor_cleared);
  assert(f.core.balance_of(kBeneficiary, kAssetA) == 0);
  assert(f.core.active_asset_count(kBeneficiary) == 1);
  assert(f.core.sponsor_of(kBeneficiary) == kSponsor);

  auto summaries = f.events.of_type<audit::ForfeitSummary>();
  assert(summaries.size() == 1);
  assert(summaries[0].assets_cleared == 1 && summaries[0].total_forfeited == 50 && !summaries[0].sponsor_cleared);
  assert(f.events.of_type<audit::SponsorCleared>().empty());
  f.events.drain();

  // Nothing left among the listed assets.
  assert(f.core.clear_sponsor_and_forfeit(kBeneficiary, first).status == Status::kNothingToForfeit);
  assert(f.core.clear_sponsor_and_forfeit(kBeneficiary, {}).status == Status::kNothingToForfeit);
  assert(f.events.events().empty());

  // Already-zero and repeated entries are skipped.
  const std::array<common::AssetId, 3> second{kAssetA, kAssetB, kAssetB};
  const auto full = f.core.clear_sponsor_and_forfeit(kBeneficiary, second);
  assert(full.status == Status::kOk);
  assert(full.assets_cleared == 1);
  assert(full.total_forfeited == 30);
  assert(full.sponsor_cleared);
  assert(f.core.balance_of(kBeneficiary, kAssetB) == 0);
  assert(f.core.active_asset_count(kBeneficiary) == 0);
  assert(!f.core.sponsor_of(kBeneficiary).has_value());

  const auto forfeited = f.events.of_type<audit::Forfeited>();
  assert(forfeited.size() == 1 && forfeited[0].asset == kAssetB && forfeited[0].amount == 30);
  assert(f.events.of_type<audit::SponsorCleared>().size() == 1);
  summaries = f.events.of_type<audit::ForfeitSummary>();
  assert(summaries.size() == 1 && summaries[0].sponsor_cleared);
  assert(audit::kind_of(f.events.events().back()) == audit::EventKind::kForfeitSummary);

  // Forfeited units remain in the lifetime totals.
  assert(f.core.cumulative_sponsored(kAssetA) == 50);
  assert(f.core.lifetime_allocated(kBeneficiary) == 80);
}

void test_fee_on_transfer_credits_received() {
  LedgerFixture f;
  f.book.set_fee_basis_points(kAssetA, 250);

  const auto result = f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 1'000);
  assert(result.status == Status::kOk);
  assert(result.requested == 1'000);
  assert(result.received == 975);
  assert(f.core.balance_of(kBeneficiary, kAssetA) == 975);
  assert(f.core.cumulative_sponsored(kAssetA) == 975);
  assert(f.core.lifetime_allocated(kBeneficiary) == 975);
  assert(f.book.balance_of(kAssetA, kSponsor) == kStartingFunds - 1'000);

  const auto received = f.events.of_type<audit::SponsoredReceived>();
  assert(received.size() == 1 && received[0].requested == 1'000 && received[0].received == 975);
  const auto sponsored = f.events.of_type<audit::Sponsored>();
  assert(sponsored.size() == 1 && sponsored[0].new_balance == 975);
}

void test_zero_received_rolls_back() {
  LedgerFixture f;
  f.book.set_fee_basis_points(kAssetA, 10'000);

  const auto result = f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 500);
  assert(result.status == Status::kZeroReceived);
  assert(!f.core.sponsor_of(kBeneficiary).has_value());
  assert(f.core.balance_of(kBeneficiary, kAssetA) == 0);
  assert(f.core.cumulative_sponsored(kAssetA) == 0);
  assert(f.book.balance_of(kAssetA, kSponsor) == kStartingFunds);
  assert(f.book.open_checkpoints() == 0);
  assert(f.events.events().empty());
}

void test_cap_boundary() {
  LedgerFixture f;
  f.registry.set_cap(kAssetA, 500);

  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 300).status == Status::kOk);
  assert(f.core.sponsor(kSponsor2, kBeneficiary2, kAssetA, 200).status == Status::kOk);
  assert(f.core.cumulative_sponsored(kAssetA) == 500);

  const auto sponsor_funds = f.book.balance_of(kAssetA, kSponsor);
  f.events.drain();
  const auto over = f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 1);
  assert(over.status == Status::kCapExceeded);
  assert(f.core.cumulative_sponsored(kAssetA) == 500);
  assert(f.core.balance_of(kBeneficiary, kAssetA) == 300);
  assert(f.book.balance_of(kAssetA, kSponsor) == sponsor_funds);
  assert(f.book.balance_of(kAssetA, kSink) == 500);
  assert(f.events.events().empty());

  // A fee can bring an over-cap request back under the cap.
  f.registry.set_cap(kAssetB, 100);
  f.book.set_fee_basis_points(kAssetB, 5'000);
  const auto under = f.core.sponsor(kSponsor, kBeneficiary, kAssetB, 200);
  assert(under.status == Status::kOk);
  assert(under.received == 100);
  assert(f.core.cumulative_sponsored(kAssetB) == 100);

  // Lifting the cap lets totals grow again.
  f.registry.set_cap(kAssetA, std::nullopt);
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 1).status == Status::kOk);
  assert(f.core.cumulative_sponsored(kAssetA) == 501);
}

void test_sponsor_preconditions() {
  LedgerFixture f;
  const common::Address null_address{};
  const auto unlisted = common::Address::from_id(0xbad);

  assert(f.core.sponsor(kSponsor, null_address, kAssetA, 10).status == Status::kInvalidAddress);
  assert(f.core.sponsor(kSponsor, kBeneficiary, null_address, 10).status == Status::kInvalidAddress);
  // Checks run in order: self-sponsorship before the amount.
  assert(f.core.sponsor(kSponsor, kSponsor, kAssetA, 0).status == Status::kSelfSponsorship);
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 0).status == Status::kInvalidAmount);
  assert(f.core.sponsor(kSponsor, kBeneficiary, unlisted, 10).status == Status::kAssetNotEligible);

  f.registry.set_enabled(kAssetB, false);
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetB, 10).status == Status::kAssetNotEligible);
  f.registry.set_enabled(kAssetB, true);
  f.registry.delist_asset(kAssetB);
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetB, 10).status == Status::kAssetNotEligible);

  // Payer cannot cover the transfer.
  const auto broke = f.core.sponsor(kSponsor, kBeneficiary, kAssetA, kStartingFunds + 1);
  assert(broke.status == Status::kTransferFailed);
  assert(f.book.balance_of(kAssetA, kSponsor) == kStartingFunds);
  assert(f.book.open_checkpoints() == 0);

  assert(!f.core.sponsor_of(kBeneficiary).has_value());
  assert(f.core.active_asset_count(kBeneficiary) == 0);
  assert(f.events.events().empty());
}

void test_reentrant_calls_rejected() {
  LedgerFixture f;
  assert(f.core.sponsor(kSponsor, kBeneficiary2, kAssetB, 10).status == Status::kOk);

  std::vector<Status> nested;
  f.book.set_transfer_hook([&](const sink::InMemoryAssetBook::TransferContext& ctx) {
    if (ctx.asset != kAssetA) {
      return;
    }
    nested.push_back(f.core.sponsor(kSponsor2, kBeneficiary, kAssetA, 10).status);
    nested.push_back(f.core.sponsor(kSponsor, kBeneficiary2, kAssetB, 10).status);
    nested.push_back(f.core.consume(kEngine, kBeneficiary2, kAssetB, 1).status);
    nested.push_back(f.core.clear_sponsor_and_forfeit(kBeneficiary2, std::array<common::AssetId, 1>{kAssetB}).status);
    nested.push_back(f.core.clear_sponsor_if_empty(kBeneficiary).status);
    nested.push_back(f.core.set_consuming_engine(kOwner, kSponsor2).status);
  });

  const auto outer = f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 100);
  assert(outer.status == Status::kOk);
  assert(nested.size() == 6);
  for (const auto status : nested) {
    assert(status == Status::kReentrantCall);
  }
  assert(f.core.sponsor_of(kBeneficiary) == kSponsor);
  assert(f.core.balance_of(kBeneficiary, kAssetA) == 100);
  assert(f.core.balance_of(kBeneficiary2, kAssetB) == 10);
  assert(f.core.consuming_engine() == kEngine);

  // The guard is released once the call returns.
  f.book.set_transfer_hook({});
  assert(f.core.consume(kEngine, kBeneficiary2, kAssetB, 1).status == Status::kOk);
}

void test_engine_and_ownership() {
  LedgerFixture f;
  const auto new_owner = common::Address::from_id(0xa2);
  const auto new_engine = common::Address::from_id(0xe2);

  assert(f.core.set_consuming_engine(kSponsor, new_engine).status == Status::kUnauthorizedCaller);
  assert(f.core.set_consuming_engine(kOwner, common::Address{}).status == Status::kInvalidAddress);
  assert(f.core.consuming_engine() == kEngine);
  assert(f.events.events().empty());

  assert(!f.ownership.transfer_ownership(kSponsor, new_owner));
  assert(f.ownership.transfer_ownership(kOwner, new_owner));
  assert(f.ownership.pending_owner() == new_owner);
  assert(!f.ownership.accept_ownership(kSponsor));
  // Until accepted the old owner stays in charge.
  assert(f.core.set_consuming_engine(new_owner, new_engine).status == Status::kUnauthorizedCaller);
  assert(f.ownership.accept_ownership(new_owner));
  assert(f.ownership.owner() == new_owner);
  assert(!f.ownership.pending_owner().has_value());

  assert(f.core.set_consuming_engine(kOwner, new_engine).status == Status::kUnauthorizedCaller);
  assert(f.core.set_consuming_engine(new_owner, new_engine).status == Status::kOk);
  assert(f.core.consuming_engine() == new_engine);

  const auto configured = f.events.of_type<audit::EngineConfigured>();
  assert(configured.size() == 1);
  assert(configured[0].previous_engine == kEngine && configured[0].engine == new_engine);
  assert(f.events.of_type<audit::OwnershipTransferStarted>().size() == 1);
  assert(f.events.of_type<audit::OwnershipTransferred>().size() == 1);

  // The old engine lost its capability.
  assert(f.core.sponsor(kSponsor, kBeneficiary, kAssetA, 10).status == Status::kOk);
  assert(f.core.consume(kEngine, kBeneficiary, kAssetA, 1).status == Status::kUnauthorizedCaller);
  assert(f.core.consume(new_engine, kBeneficiary, kAssetA, 1).status == Status::kOk);

  // Nominating null cancels a pending handoff.
  assert(f.ownership.transfer_ownership(new_owner, kSponsor));
  assert(f.ownership.transfer_ownership(new_owner, common::Address{}));
  assert(!f.ownership.accept_ownership(kSponsor));
}

void test_invariants_hold_across_operations() {
  LedgerFixture f;
  f.book.set_fee_basis_points(kAssetB, 100);
  f.registry.set_cap(kAssetB, 20'000);

  const std::array<common::Address, 3> beneficiaries{kBeneficiary, kBeneficiary2, common::Address::from_id(0xb3)};
  const std::array<common::Address, 2> sponsors{kSponsor, kSponsor2};
  const std::array<common::AssetId, 2> assets{kAssetA, kAssetB};

  std::uint64_t seed = 0x2545f4914f6cdd1dull;
  auto next = [&](std::uint64_t bound) {
    seed ^= seed << 13;
    seed ^= seed >> 7;
    seed ^= seed << 17;
    return seed % bound;
  };

  for (int step = 0; step < 400; ++step) {
    const auto& beneficiary = beneficiaries[next(beneficiaries.size())];
    const auto& asset = assets[next(assets.size())];
    const auto sponsor_before = f.core.sponsor_of(beneficiary);
    const auto active_before = f.core.active_asset_count(beneficiary);
    const auto cumulative_before = f.core.cumulative_sponsored(asset);

    switch (next(4)) {
      case 0:
        f.core.sponsor(sponsors[next(sponsors.size())], beneficiary, asset, 1 + next(400));
        break;
      case 1:
        f.core.consume(kEngine, beneficiary, asset, 1 + next(300));
        break;
      case 2:
        f.core.clear_sponsor_and_forfeit(beneficiary, std::array<common::AssetId, 1>{asset});
        break;
      default:
        f.core.clear_sponsor_if_empty(beneficiary);
        break;
    }

    assert(f.store.check_invariants());
    assert(f.core.cumulative_sponsored(asset) >= cumulative_before);
    if (asset == kAssetB) {
      assert(f.core.cumulative_sponsored(kAssetB) <= 20'000);
    }
    const auto sponsor_after = f.core.sponsor_of(beneficiary);
    if (active_before > 0 && sponsor_after != sponsor_before) {
      // Only a call that emptied the beneficiary may release the sponsor.
      assert(!sponsor_after.has_value());
      assert(f.core.active_asset_count(beneficiary) == 0);
    }
    if (sponsor_after) {
      assert(*sponsor_after != beneficiary);
    }
    std::uint32_t positive = 0;
    for (const auto& a : assets) {
      positive += f.core.balance_of(beneficiary, a) > 0 ? 1 : 0;
    }
    assert(positive == f.core.active_asset_count(beneficiary));
  }
  assert(f.book.open_checkpoints() == 0);
}

}  // namespace unitledger::tests
