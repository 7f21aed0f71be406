#include "../include/balance_reconciler.hpp"
#include "../include/statement_renderer.hpp"
#include "../include/transaction_grouper.hpp"

#include <gtest/gtest.h>

#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace {

statements::Transaction makeTransaction(statements::TransactionType type, std::optional<int> account,
                                        double amount, size_t sequence) {
  statements::Transaction tx;
  tx.type = type;
  tx.type_tag = statements::toString(type);
  tx.account_number = account;
  tx.amount = amount;
  tx.sequence_number = sequence;
  tx.payment_method = type == statements::TransactionType::PAYMENT
                          ? statements::PaymentMethod::CASH
                          : statements::PaymentMethod::PURCHASE;
  return tx;
}

}  // namespace

// Test fixture with a small registry and interleaved transactions
class ReconciliationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    using statements::TransactionType;
    accounts_[100] = statements::Account{100, "Jane Doe", 250.0, 250.0};
    accounts_[200] = statements::Account{200, "Bob", 100.0, 100.0};
    accounts_[300] = statements::Account{300, "Idle", 5.5, 5.5};

    transactions_ = {
        makeTransaction(TransactionType::PURCHASE, 200, 25.0, 0),
        makeTransaction(TransactionType::PAYMENT, 100, 10.0, 1),
        makeTransaction(TransactionType::PAYMENT, 200, 40.0, 2),
        makeTransaction(TransactionType::UNKNOWN, 200, 999.0, 3),
        makeTransaction(TransactionType::PURCHASE, 999, 1.0, 4),
        makeTransaction(TransactionType::PURCHASE, std::nullopt, 2.0, 5),
        makeTransaction(TransactionType::PURCHASE, 100, 60.25, 6),
    };
    groups_ = statements::groupByAccount(transactions_);
  }

  statements::AccountRegistry accounts_;
  std::vector<statements::Transaction> transactions_;
  statements::TransactionsByAccount groups_;
};

// Grouper tests
TEST_F(ReconciliationTest, GroupingIsAnExactPartition) {
  size_t total = 0;
  std::set<size_t> seen;
  for (const auto& [key, group] : groups_) {
    for (const auto& tx : group) {
      EXPECT_EQ(tx.account_number, key);
      EXPECT_TRUE(seen.insert(tx.sequence_number).second) << "duplicate " << tx.sequence_number;
    }
    total += group.size();
  }
  EXPECT_EQ(total, transactions_.size());
  EXPECT_EQ(seen.size(), transactions_.size());
}

TEST_F(ReconciliationTest, GroupsKeepFileOrder) {
  const auto& bob = statements::transactionsFor(groups_, 200);
  ASSERT_EQ(bob.size(), 3);
  EXPECT_EQ(bob[0].sequence_number, 0u);
  EXPECT_EQ(bob[1].sequence_number, 2u);
  EXPECT_EQ(bob[2].sequence_number, 3u);
}

TEST_F(ReconciliationTest, MissingGroupIsEmpty) {
  EXPECT_TRUE(statements::transactionsFor(groups_, 300).empty());
  EXPECT_TRUE(statements::transactionsFor(groups_, 12345).empty());
}

// Reconciler tests
TEST_F(ReconciliationTest, PaymentsAddPurchasesSubtractOthersIgnored) {
  auto result = statements::reconcileAccount(accounts_.at(200), groups_);

  EXPECT_DOUBLE_EQ(result.account.balance, 115.0);
  EXPECT_DOUBLE_EQ(result.account.starting_balance, 100.0);
  EXPECT_DOUBLE_EQ(result.totals.total_purchases, 25.0);
  EXPECT_DOUBLE_EQ(result.totals.total_payments, 40.0);
  EXPECT_EQ(result.totals.transaction_count, 3u);
}

TEST_F(ReconciliationTest, ReconcileDoesNotModifyInputs) {
  const statements::Account before = accounts_.at(100);
  const auto groups_before = groups_.at(100).size();

  auto result = statements::reconcileAccount(accounts_.at(100), groups_);

  EXPECT_DOUBLE_EQ(result.account.balance, 250.0 + 10.0 - 60.25);
  EXPECT_DOUBLE_EQ(accounts_.at(100).balance, before.balance);
  EXPECT_DOUBLE_EQ(accounts_.at(100).starting_balance, before.starting_balance);
  EXPECT_EQ(groups_.at(100).size(), groups_before);
}

TEST_F(ReconciliationTest, BalanceMatchesStartingPlusPaymentsMinusPurchases) {
  auto all = statements::reconcileAll(accounts_, groups_);
  ASSERT_EQ(all.accounts.size(), accounts_.size());

  for (const auto& [number, account] : all.accounts) {
    double payments = 0.0, purchases = 0.0;
    for (const auto& tx : statements::transactionsFor(groups_, number)) {
      if (tx.type == statements::TransactionType::PAYMENT) payments += tx.amount;
      if (tx.type == statements::TransactionType::PURCHASE) purchases += tx.amount;
    }
    EXPECT_DOUBLE_EQ(account.balance, account.starting_balance + payments - purchases) << number;
  }
  EXPECT_DOUBLE_EQ(all.accounts.at(300).balance, 5.5);
  EXPECT_EQ(all.totals.at(300).transaction_count, 0u);
}

TEST_F(ReconciliationTest, UnrecognisedTypeMatchesOmittingIt) {
  std::vector<statements::Transaction> without_unknown;
  for (const auto& tx : transactions_) {
    if (tx.type != statements::TransactionType::UNKNOWN) without_unknown.push_back(tx);
  }
  auto with = statements::reconcileAccount(accounts_.at(200), groups_);
  auto without = statements::reconcileAccount(accounts_.at(200),
                                              statements::groupByAccount(without_unknown));

  EXPECT_DOUBLE_EQ(with.account.balance, without.account.balance);
}

TEST_F(ReconciliationTest, UnmatchedTransactionsInFileOrder) {
  auto unmatched = statements::unmatchedTransactions(accounts_, groups_);

  ASSERT_EQ(unmatched.size(), 2);
  EXPECT_EQ(unmatched[0].sequence_number, 4u);
  EXPECT_EQ(unmatched[1].sequence_number, 5u);
}

// Renderer / reconciler agreement
TEST_F(ReconciliationTest, RendererTotalsAgreeWithReconciler) {
  for (const auto& [number, account] : accounts_) {
    std::ostringstream out;
    auto rendered = statements::renderStatement(out, account, statements::transactionsFor(groups_, number));
    auto reconciled = statements::reconcileAccount(account, groups_);

    EXPECT_DOUBLE_EQ(rendered.final_balance, reconciled.account.balance) << number;
    EXPECT_DOUBLE_EQ(rendered.total_purchases, reconciled.totals.total_purchases) << number;
    EXPECT_DOUBLE_EQ(rendered.total_payments, reconciled.totals.total_payments) << number;
  }
}

TEST(StatementRendererTest, LayoutOfOneBlock) {
  statements::Account account{200, "Bob", 100.0, 100.0};

  statements::Transaction purchase;
  purchase.type = statements::TransactionType::PURCHASE;
  purchase.account_number = 200;
  purchase.timestamp = "2024-01-05";
  purchase.merchant = "Mart";
  purchase.payment_method = statements::PaymentMethod::PURCHASE;
  purchase.amount = 25.0;
  purchase.sequence_number = 4;

  statements::Transaction payment;
  payment.type = statements::TransactionType::PAYMENT;
  payment.account_number = 200;
  payment.timestamp = "2024-01-06";
  payment.merchant = "credit";
  payment.payment_method = statements::PaymentMethod::CREDIT;
  payment.card_or_check_number = "1234";
  payment.amount = 40.0;
  payment.sequence_number = 1;

  std::ostringstream out;
  statements::renderStatement(out, account, {purchase, payment});

  const std::string expected =
      "Account 200 - Bob - Starting balance: 100.00\n"
      "  2024-01-06  Credit  1234  40.00\n"
      "  2024-01-05  Mart  Purchase  25.00\n"
      "Total purchases: 25.00\n"
      "Total payments: 40.00\n"
      "Final balance: 115.00\n"
      "----------------------------------------\n";
  EXPECT_EQ(out.str(), expected);
}
