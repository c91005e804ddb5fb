/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "storage/storage_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/storage/base_rocksdb_test.hpp"

using kv::storage::StorageError;
using namespace testing;

struct RocksDb_Integration_Test : public test::BaseRocksDB_Test {
  RocksDb_Integration_Test()
      : BaseRocksDB_Test("/tmp/kv-test-rocksdb-integration") {}

  Buffer key_ = "some_key"_buf;
  Buffer value_ = "some_value"_buf;
};

/**
 * @given opened database, with {key}
 * @when read {key}
 * @then {value} is correct
 */
TEST_F(RocksDb_Integration_Test, Put_Get) {
  ASSERT_OUTCOME_SUCCESS(db_->put(key_, BufferView{value_}));
  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_TRUE(contains);
  ASSERT_OUTCOME_SUCCESS(val, db_->tryGet(key_));
  EXPECT_EQ(val, std::make_optional(value_));
}

/**
 * @given empty database
 * @when read {key}
 * @then nothing is found
 */
TEST_F(RocksDb_Integration_Test, Get_NonExistent) {
  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_FALSE(contains);
  ASSERT_OUTCOME_SUCCESS(db_->remove(key_));
  ASSERT_OUTCOME_SUCCESS(val, db_->tryGet(key_));
  EXPECT_EQ(val, std::nullopt);
}

/**
 * @given empty key
 * @when put and read it
 * @then the empty key is an ordinary key
 */
TEST_F(RocksDb_Integration_Test, EmptyKey) {
  ASSERT_OUTCOME_SUCCESS(db_->put(Buffer{}, BufferView{value_}));
  ASSERT_OUTCOME_SUCCESS(val, db_->tryGet(Buffer{}));
  EXPECT_EQ(val, std::make_optional(value_));
}

/**
 * @given database with {key}
 * @when exchange the value twice and then delete it
 * @then every exchange returns the value it replaced
 */
TEST_F(RocksDb_Integration_Test, Exchange) {
  ASSERT_OUTCOME_SUCCESS(first, db_->exchange(key_, BufferView{value_}));
  EXPECT_EQ(first, std::nullopt);

  auto other = "other"_buf;
  ASSERT_OUTCOME_SUCCESS(second, db_->exchange(key_, BufferView{other}));
  EXPECT_EQ(second, std::make_optional(value_));

  ASSERT_OUTCOME_SUCCESS(third, db_->exchange(key_, std::nullopt));
  EXPECT_EQ(third, std::make_optional(other));

  ASSERT_OUTCOME_SUCCESS(val, db_->tryGet(key_));
  EXPECT_EQ(val, std::nullopt);
}

/**
 * @given database with {key}
 * @when compare-and-swap with a wrong and with a right expectation
 * @then only the right one swaps
 */
TEST_F(RocksDb_Integration_Test, CompareAndSwap) {
  auto next = "next"_buf;

  ASSERT_OUTCOME_SUCCESS(
      absent_ok,
      db_->compareAndSwap(key_, std::nullopt, BufferView{value_}));
  EXPECT_TRUE(absent_ok);

  ASSERT_OUTCOME_SUCCESS(
      wrong, db_->compareAndSwap(key_, BufferView{next}, BufferView{next}));
  EXPECT_FALSE(wrong);
  ASSERT_OUTCOME_SUCCESS(
      not_absent, db_->compareAndSwap(key_, std::nullopt, BufferView{next}));
  EXPECT_FALSE(not_absent);

  ASSERT_OUTCOME_SUCCESS(
      right, db_->compareAndSwap(key_, BufferView{value_}, BufferView{next}));
  EXPECT_TRUE(right);
  ASSERT_OUTCOME_SUCCESS(val, db_->tryGet(key_));
  EXPECT_EQ(val, std::make_optional(next));

  ASSERT_OUTCOME_SUCCESS(
      removed, db_->compareAndSwap(key_, BufferView{next}, std::nullopt));
  EXPECT_TRUE(removed);
  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key_));
  EXPECT_FALSE(contains);
}

/**
 * @given database with keys inserted out of order
 * @when iterate with a cursor
 * @then keys come in ascending byte order, seek and seekLast position
 * correctly
 */
TEST_F(RocksDb_Integration_Test, CursorOrder) {
  for (auto &key : {"b"_buf, "c"_buf, "a"_buf}) {
    ASSERT_OUTCOME_SUCCESS(db_->put(key, BufferView{value_}));
  }

  ASSERT_OUTCOME_SUCCESS(cursor, db_->cursor());
  std::vector<Buffer> keys;
  ASSERT_OUTCOME_SUCCESS(valid, cursor->seekFirst());
  while (valid) {
    keys.push_back(cursor->key().value());
    ASSERT_OUTCOME_SUCCESS(cursor->next());
    valid = cursor->isValid();
  }
  EXPECT_THAT(keys, ElementsAre("a"_buf, "b"_buf, "c"_buf));

  ASSERT_OUTCOME_SUCCESS(found, cursor->seek("bb"_buf));
  EXPECT_TRUE(found);
  EXPECT_EQ(cursor->key(), std::make_optional("c"_buf));

  ASSERT_OUTCOME_SUCCESS(last, cursor->seekLast());
  EXPECT_TRUE(last);
  EXPECT_EQ(cursor->key(), std::make_optional("c"_buf));
  ASSERT_OUTCOME_SUCCESS(cursor->prev());
  EXPECT_EQ(cursor->key(), std::make_optional("b"_buf));
}

/**
 * @given cursor created over one entry
 * @when another entry is written afterwards
 * @then the cursor does not see it
 */
TEST_F(RocksDb_Integration_Test, CursorIsSnapshot) {
  ASSERT_OUTCOME_SUCCESS(db_->put("a"_buf, BufferView{value_}));
  ASSERT_OUTCOME_SUCCESS(cursor, db_->cursor());
  ASSERT_OUTCOME_SUCCESS(db_->put("b"_buf, BufferView{value_}));

  ASSERT_OUTCOME_SUCCESS(valid, cursor->seekFirst());
  EXPECT_TRUE(valid);
  ASSERT_OUTCOME_SUCCESS(cursor->next());
  EXPECT_FALSE(cursor->isValid());
}

/**
 * @given cursor over a space
 * @when every other reference to the database is released
 * @then the cursor still walks its entries, and the database is closed
 * only when the cursor goes away
 */
TEST_F(RocksDb_Integration_Test, CursorOutlivesDatabase) {
  ASSERT_OUTCOME_SUCCESS(db_->put("a"_buf, "1"_buf));
  ASSERT_OUTCOME_SUCCESS(db_->put("b"_buf, "2"_buf));
  ASSERT_OUTCOME_SUCCESS(cursor, db_->cursor());

  std::weak_ptr<RocksDB> weak = rocks_;
  db_.reset();
  rocks_.reset();
  EXPECT_FALSE(weak.expired());

  ASSERT_OUTCOME_SUCCESS(valid, cursor->seekFirst());
  EXPECT_TRUE(valid);
  EXPECT_EQ(cursor->key(), std::make_optional("a"_buf));
  ASSERT_OUTCOME_SUCCESS(cursor->next());
  EXPECT_EQ(cursor->value(), std::make_optional("2"_buf));
  ASSERT_OUTCOME_SUCCESS(cursor->next());
  EXPECT_FALSE(cursor->isValid());

  cursor.reset();
  EXPECT_TRUE(weak.expired());
}

/**
 * @given cursor over a space which is dropped afterwards
 * @when the cursor is used and the space is created again
 * @then the cursor still shows the old entries, the new space is empty
 */
TEST_F(RocksDb_Integration_Test, CursorSurvivesDrop) {
  ASSERT_OUTCOME_SUCCESS(users, rocks_->getSpace("users"));
  ASSERT_OUTCOME_SUCCESS(users->put("k"_buf, "u"_buf));
  ASSERT_OUTCOME_SUCCESS(cursor, users->cursor());

  ASSERT_OUTCOME_SUCCESS(dropped, rocks_->dropSpace("users"));
  EXPECT_TRUE(dropped);

  ASSERT_OUTCOME_SUCCESS(valid, cursor->seekFirst());
  EXPECT_TRUE(valid);
  EXPECT_EQ(cursor->key(), std::make_optional("k"_buf));
  cursor.reset();

  ASSERT_OUTCOME_SUCCESS(recreated, rocks_->getSpace("users"));
  ASSERT_OUTCOME_SUCCESS(value, recreated->tryGet("k"_buf));
  EXPECT_EQ(value, std::nullopt);
}

/**
 * @given batch with puts and a removal of the same key
 * @when it is committed
 * @then the later operation on a key wins, nothing is visible before commit
 */
TEST_F(RocksDb_Integration_Test, Batch) {
  auto batch = db_->batch();
  ASSERT_OUTCOME_SUCCESS(batch->put("a"_buf, "1"_buf));
  ASSERT_OUTCOME_SUCCESS(batch->put("b"_buf, "2"_buf));
  ASSERT_OUTCOME_SUCCESS(batch->remove("a"_buf));
  ASSERT_OUTCOME_SUCCESS(batch->put("b"_buf, "3"_buf));
  EXPECT_EQ(batch->size(), 4);

  ASSERT_OUTCOME_SUCCESS(before, db_->tryGet("b"_buf));
  EXPECT_EQ(before, std::nullopt);

  ASSERT_OUTCOME_SUCCESS(batch->commit());

  ASSERT_OUTCOME_SUCCESS(a, db_->tryGet("a"_buf));
  EXPECT_EQ(a, std::nullopt);
  ASSERT_OUTCOME_SUCCESS(b, db_->tryGet("b"_buf));
  EXPECT_EQ(b, std::make_optional("3"_buf));

  batch->clear();
  EXPECT_EQ(batch->size(), 0);
}

/**
 * @given two spaces
 * @when the same key is written to both
 * @then the spaces are independent
 */
TEST_F(RocksDb_Integration_Test, SpacesAreIndependent) {
  ASSERT_OUTCOME_SUCCESS(users, rocks_->getSpace("users"));
  ASSERT_OUTCOME_SUCCESS(users->put(key_, "users"_buf));
  ASSERT_OUTCOME_SUCCESS(db_->put(key_, "default"_buf));

  ASSERT_OUTCOME_SUCCESS(in_users, users->tryGet(key_));
  EXPECT_EQ(in_users, std::make_optional("users"_buf));
  ASSERT_OUTCOME_SUCCESS(in_default, db_->tryGet(key_));
  EXPECT_EQ(in_default, std::make_optional("default"_buf));

  EXPECT_OUTCOME_ERROR(rocks_->getSpace(""), StorageError::INVALID_ARGUMENT);
}

/**
 * @given space with data
 * @when it is dropped
 * @then its data is gone, the old handle sees an empty space, dropping it
 * again reports absence, the default space can not be dropped
 */
TEST_F(RocksDb_Integration_Test, DropSpace) {
  ASSERT_OUTCOME_SUCCESS(users, rocks_->getSpace("users"));
  ASSERT_OUTCOME_SUCCESS(users->put(key_, BufferView{value_}));

  ASSERT_OUTCOME_SUCCESS(dropped, rocks_->dropSpace("users"));
  EXPECT_TRUE(dropped);
  ASSERT_OUTCOME_SUCCESS(names, rocks_->spaceNames());
  EXPECT_THAT(names, Not(Contains("users")));

  ASSERT_OUTCOME_SUCCESS(again, rocks_->dropSpace("users"));
  EXPECT_FALSE(again);

  ASSERT_OUTCOME_SUCCESS(val, users->tryGet(key_));
  EXPECT_EQ(val, std::nullopt);

  EXPECT_OUTCOME_ERROR(rocks_->dropSpace("default"),
                       StorageError::INVALID_ARGUMENT);
}

/**
 * @given transaction writing into two spaces
 * @when it commits
 * @then both writes become visible together
 */
TEST_F(RocksDb_Integration_Test, TransactionCommit) {
  ASSERT_OUTCOME_SUCCESS(users, rocks_->getSpace("users"));
  ASSERT_OUTCOME_SUCCESS(txn, rocks_->beginTransaction());
  ASSERT_OUTCOME_SUCCESS(txn->put("users", key_, "u"_buf));
  ASSERT_OUTCOME_SUCCESS(txn->put("default", key_, "d"_buf));

  ASSERT_OUTCOME_SUCCESS(own, txn->tryGet("users", key_));
  EXPECT_EQ(own, std::make_optional("u"_buf));
  ASSERT_OUTCOME_SUCCESS(outside, users->tryGet(key_));
  EXPECT_EQ(outside, std::nullopt);

  ASSERT_OUTCOME_SUCCESS(txn->commit());

  ASSERT_OUTCOME_SUCCESS(u, users->tryGet(key_));
  EXPECT_EQ(u, std::make_optional("u"_buf));
  ASSERT_OUTCOME_SUCCESS(d, db_->tryGet(key_));
  EXPECT_EQ(d, std::make_optional("d"_buf));
}

/**
 * @given transaction which read {key}
 * @when {key} is modified outside before the commit
 * @then the commit reports a conflict and applies nothing
 */
TEST_F(RocksDb_Integration_Test, TransactionConflict) {
  ASSERT_OUTCOME_SUCCESS(db_->put(key_, "0"_buf));

  ASSERT_OUTCOME_SUCCESS(txn, rocks_->beginTransaction());
  ASSERT_OUTCOME_SUCCESS(seen, txn->tryGet("default", key_));
  EXPECT_EQ(seen, std::make_optional("0"_buf));
  ASSERT_OUTCOME_SUCCESS(txn->put("default", "other"_buf, "1"_buf));

  ASSERT_OUTCOME_SUCCESS(db_->put(key_, "2"_buf));

  EXPECT_OUTCOME_ERROR(txn->commit(), StorageError::CONFLICT);

  ASSERT_OUTCOME_SUCCESS(other, db_->tryGet("other"_buf));
  EXPECT_EQ(other, std::nullopt);
}

/**
 * @given transaction with a write
 * @when it is rolled back
 * @then nothing is applied and further use is refused
 */
TEST_F(RocksDb_Integration_Test, TransactionRollback) {
  ASSERT_OUTCOME_SUCCESS(txn, rocks_->beginTransaction());
  ASSERT_OUTCOME_SUCCESS(txn->put("default", key_, BufferView{value_}));
  txn->rollback();
  txn->rollback();

  ASSERT_OUTCOME_SUCCESS(val, db_->tryGet(key_));
  EXPECT_EQ(val, std::nullopt);
  EXPECT_OUTCOME_ERROR(txn->put("default", key_, BufferView{value_}),
                       StorageError::INVALID_ARGUMENT);
}

/**
 * @given space handle
 * @when the engine is released
 * @then the handle reports the storage is gone
 */
TEST_F(RocksDb_Integration_Test, StorageGone) {
  auto space = db_;
  db_.reset();
  rocks_.reset();
  EXPECT_OUTCOME_ERROR(space->tryGet(key_), StorageError::STORAGE_GONE);
}
