#include "common/logging.h"
#include "ledger/store.h"
#include "ledger/transaction.h"
#include "svm/program_ids.h"
#include "svm/system_instruction.h"
#include "test_framework.h"
#include "test_helpers.h"

using namespace localnet;
using namespace localnet::ledger;
using namespace test_helpers;

namespace {

Hash some_blockhash() { return common::CryptoUtils::sha256({1, 2, 3}); }

bool has_tx_error(const common::Result<bool> &result, svm::TransactionError expected) {
  return result.is_err() && is_tx_error(result.error_info(), expected);
}

} // namespace

void test_message_compile_ordering() {
  auto ix = svm::system_instruction::transfer(alice().pubkey(), bob().pubkey(), 100);
  auto message = Message::compile({ix}, alice().pubkey(), some_blockhash());

  ASSERT_EQ(static_cast<size_t>(3), message.account_keys.size());
  ASSERT_EQ(alice().pubkey(), message.account_keys[0]);
  ASSERT_EQ(bob().pubkey(), message.account_keys[1]);
  ASSERT_EQ(svm::program_ids::system_program(), message.account_keys[2]);

  ASSERT_EQ(1, message.header.num_required_signatures);
  ASSERT_EQ(0, message.header.num_readonly_signed_accounts);
  ASSERT_EQ(1, message.header.num_readonly_unsigned_accounts);

  ASSERT_TRUE(message.is_signer(0));
  ASSERT_FALSE(message.is_signer(1));
  ASSERT_TRUE(message.is_writable(1));
  ASSERT_FALSE(message.is_writable(2));
  ASSERT_TRUE(message.is_invoked(2));
  ASSERT_FALSE(message.is_invoked(1));
}

void test_message_compile_merges_flags() {
  // Carol is read-only in one instruction and a writable signer in the other
  Instruction first{svm::program_ids::memo_program(),
                    {AccountMeta::readonly(carol().pubkey(), false)},
                    {'h', 'i'}};
  auto second = svm::system_instruction::transfer(carol().pubkey(), bob().pubkey(), 1);
  auto message = Message::compile({first, second}, alice().pubkey(), some_blockhash());

  ASSERT_EQ(alice().pubkey(), message.account_keys[0]);
  ASSERT_EQ(carol().pubkey(), message.account_keys[1]);
  ASSERT_EQ(2, message.header.num_required_signatures);
  ASSERT_TRUE(message.is_writable(1));
  ASSERT_EQ(static_cast<size_t>(2), message.program_ids().size());
}

void test_transaction_sign_and_verify() {
  auto tx = make_transfer(alice(), bob().pubkey(), 100, some_blockhash());
  ASSERT_EQ(static_cast<size_t>(1), tx.signatures.size());
  ASSERT_TRUE(tx.verify_signatures());
  ASSERT_OK(tx.sanitize());

  auto tampered = tx;
  tampered.message.instructions[0].data[4] ^= 0x01;
  ASSERT_FALSE(tampered.verify_signatures());
}

void test_transaction_missing_signer() {
  auto ix = svm::system_instruction::transfer(carol().pubkey(), bob().pubkey(), 1);
  auto tx = Transaction::create_signed({ix}, alice(), {}, some_blockhash());
  ASSERT_TRUE(tx.is_err());
  ASSERT_TRUE(is_tx_error(tx.error_info(), svm::TransactionError::SIGNATURE_FAILURE));

  const Keypair *carol_key = &carol();
  auto signed_tx = Transaction::create_signed({ix}, alice(), {carol_key}, some_blockhash());
  ASSERT_OK(signed_tx);
  ASSERT_EQ(static_cast<size_t>(2), signed_tx.value().signatures.size());
  ASSERT_TRUE(signed_tx.value().verify_signatures());
}

void test_transaction_wire_format() {
  auto tx = make_transfer(alice(), bob().pubkey(), 100, some_blockhash());
  auto bytes = tx.serialize();
  // compact-u16 count, one signature, then the message
  ASSERT_EQ(1, bytes[0]);
  ASSERT_EQ(1 + common::SIGNATURE_BYTES + tx.message.serialize().size(), bytes.size());

  auto decoded = Transaction::deserialize(bytes);
  ASSERT_OK(decoded);
  ASSERT_EQ(tx.signature(), decoded.value().signature());
  ASSERT_EQ(tx.message.serialize(), decoded.value().message.serialize());
  ASSERT_TRUE(decoded.value().verify_signatures());

  auto truncated = bytes;
  truncated.resize(bytes.size() - 5);
  ASSERT_TRUE(Transaction::deserialize(truncated).is_err());

  auto trailing = bytes;
  trailing.push_back(0);
  ASSERT_TRUE(Transaction::deserialize(trailing).is_err());
}

void test_transaction_sanitize_failures() {
  auto base = make_transfer(alice(), bob().pubkey(), 100, some_blockhash());

  auto no_instructions = base;
  no_instructions.message.instructions.clear();
  ASSERT_TRUE(has_tx_error(no_instructions.sanitize(), svm::TransactionError::SANITIZE_FAILURE));

  auto missing_signature = base;
  missing_signature.signatures.clear();
  ASSERT_TRUE(
      has_tx_error(missing_signature.sanitize(), svm::TransactionError::SANITIZE_FAILURE));

  auto duplicate_key = base;
  duplicate_key.message.account_keys[1] = alice().pubkey();
  ASSERT_TRUE(
      has_tx_error(duplicate_key.sanitize(), svm::TransactionError::ACCOUNT_LOADED_TWICE));

  auto payer_as_program = base;
  payer_as_program.message.instructions[0].program_id_index = 0;
  ASSERT_TRUE(
      has_tx_error(payer_as_program.sanitize(), svm::TransactionError::INVALID_ACCOUNT_INDEX));

  auto bad_account_index = base;
  bad_account_index.message.instructions[0].accounts.push_back(9);
  ASSERT_TRUE(
      has_tx_error(bad_account_index.sanitize(), svm::TransactionError::INVALID_ACCOUNT_INDEX));

  auto oversized = Transaction::create_signed(
      {svm::memo_instruction::build(std::string(PACKET_DATA_SIZE, 'x'))}, alice(), {},
      some_blockhash());
  ASSERT_OK(oversized);
  ASSERT_TRUE(has_tx_error(oversized.value().sanitize(), svm::TransactionError::SANITIZE_FAILURE));
}

void test_ledger_store_append_in_order() {
  LedgerStore store;
  ASSERT_FALSE(store.latest_slot().has_value());
  ASSERT_TRUE(store.latest() == nullptr);

  auto genesis = make_genesis_bank();
  auto slot1 = next_bank(genesis);
  ASSERT_OK(store.append(genesis->freeze()));

  auto open = store.append(slot1);
  ASSERT_ERROR_KIND(open, common::ErrorKind::STATE);
  ASSERT_FALSE(store.is_halted());

  auto slot2 = next_bank(slot1);
  ASSERT_OK(store.append(slot1->freeze()));
  ASSERT_EQ(static_cast<size_t>(2), store.size());
  ASSERT_EQ(static_cast<Slot>(1), *store.latest_slot());
  ASSERT_TRUE(store.get(1) == slot1);
  ASSERT_TRUE(store.get(5) == nullptr);
  (void)slot2;

  auto null_append = store.append(nullptr);
  ASSERT_ERROR_KIND(null_append, common::ErrorKind::INVALID_ARGUMENT);
}

void test_ledger_store_sequence_halt() {
  LogCapture capture;
  LedgerStore store;
  auto genesis = make_genesis_bank();
  auto slot1 = next_bank(genesis);
  auto slot2 = next_bank(slot1);
  ASSERT_OK(store.append(genesis->freeze()));

  // Skipping slot 1 is a sequence violation and halts the store
  auto skipped = store.append(slot2->freeze());
  ASSERT_ERROR_KIND(skipped, common::ErrorKind::SEQUENCE);
  ASSERT_TRUE(store.is_halted());

  // Even the correct next slot is refused while halted
  auto refused = store.append(slot1->freeze());
  ASSERT_ERROR_KIND(refused, common::ErrorKind::SEQUENCE);
  ASSERT_EQ(static_cast<size_t>(1), store.size());

  store.reset();
  ASSERT_FALSE(store.is_halted());
  ASSERT_EQ(static_cast<size_t>(0), store.size());
  ASSERT_OK(store.append(genesis->freeze()));
  ASSERT_CONTAINS(capture.text(), "LEDGER_SEQUENCE_VIOLATION");
}

void test_ledger_store_transactions() {
  LedgerStore store;
  auto genesis = make_genesis_bank();
  auto frozen_genesis = genesis->freeze();
  ASSERT_OK(store.append(frozen_genesis));

  auto slot1 = next_bank(genesis);
  auto tx = make_transfer(alice(), bob().pubkey(), 100, frozen_genesis->blockhash());
  ASSERT_OK(slot1->apply(tx));
  ASSERT_OK(store.append(slot1->freeze()));

  auto record = store.get_transaction(tx.signature());
  ASSERT_TRUE(record.has_value());
  ASSERT_EQ(static_cast<Slot>(1), record->slot);
  ASSERT_TRUE(record->receipt.is_success());
  ASSERT_EQ(static_cast<common::Lamports>(5), record->receipt.fee);

  ASSERT_FALSE(store.get_transaction(Signature(64, 7)).has_value());
  ASSERT_EQ(static_cast<uint64_t>(1), store.transaction_count());

  auto entry = store.get_entry(1);
  ASSERT_TRUE(entry.has_value());
  ASSERT_EQ(static_cast<size_t>(1), entry->transactions.size());
  ASSERT_TRUE(entry->parent_slot == std::optional<Slot>(0));
  ASSERT_EQ(frozen_genesis->blockhash(), entry->parent_blockhash);
  ASSERT_EQ(slot1->blockhash(), entry->blockhash);

  auto genesis_entry = store.get_entry(0);
  ASSERT_TRUE(genesis_entry.has_value());
  ASSERT_FALSE(genesis_entry->parent_slot.has_value());
}

void test_ledger_store_get_blocks() {
  LedgerStore store;
  auto bank = make_genesis_bank();
  for (int i = 0; i < 5; ++i) {
    auto next = next_bank(bank);
    ASSERT_OK(store.append(bank->freeze()));
    bank = next;
  }

  auto blocks = store.get_blocks(1, 3);
  ASSERT_EQ(static_cast<size_t>(3), blocks.size());
  ASSERT_EQ(static_cast<Slot>(1), blocks.front());
  ASSERT_EQ(static_cast<Slot>(3), blocks.back());

  ASSERT_EQ(static_cast<size_t>(2), store.get_blocks(3, 100).size());
  ASSERT_TRUE(store.get_blocks(10, 20).empty());
  ASSERT_TRUE(store.get_blocks(3, 1).empty());
}

void run_ledger_tests(TestRunner &runner) {
  std::cout << "\n=== Ledger Tests ===" << std::endl;

  runner.run_test("Message Compile Ordering", test_message_compile_ordering);
  runner.run_test("Message Compile Merges Flags", test_message_compile_merges_flags);
  runner.run_test("Transaction Sign And Verify", test_transaction_sign_and_verify);
  runner.run_test("Transaction Missing Signer", test_transaction_missing_signer);
  runner.run_test("Transaction Wire Format", test_transaction_wire_format);
  runner.run_test("Transaction Sanitize Failures", test_transaction_sanitize_failures);
  runner.run_test("Ledger Store Append In Order", test_ledger_store_append_in_order);
  runner.run_test("Ledger Store Sequence Halt", test_ledger_store_sequence_halt);
  runner.run_test("Ledger Store Transactions", test_ledger_store_transactions);
  runner.run_test("Ledger Store Get Blocks", test_ledger_store_get_blocks);
}

#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Ledger Test Suite ===" << std::endl;
  common::Logger::instance().set_level(common::LogLevel::WARN);
  TestRunner runner;
  run_ledger_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
