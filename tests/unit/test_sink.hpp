#pragma once

namespace unitledger::tests {

void test_meter_measures_fee_on_transfer();
void test_meter_failed_transfer_leaves_book();
void test_book_checkpoints_nest();
void test_registry_eligibility();
void test_book_encoding_restores_balances();

}  // namespace unitledger::tests
