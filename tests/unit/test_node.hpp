#pragma once

namespace unitledger::tests {

void test_node_restart_keeps_book_and_ownership();
void test_node_seeds_engine_only_when_unset();

}  // namespace unitledger::tests
