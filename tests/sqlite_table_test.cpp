#include <lshpp/error.hpp>
#include <lshpp/table/sqlite_table.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <utility>

using namespace std;
namespace fs = std::filesystem;

namespace lshpp {

class SqliteTableTest : public testing::Test {
protected:
    SqliteTable table_{3, ":memory:"};
    Signature sig_a_ = {1, 0, 1};
    Signature sig_b_ = {0, 0, 1};
};

class SqliteTableFileTest : public testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("lshpp_" + string(testing::UnitTest::GetInstance()->current_test_info()->name()) +
                 ".db");
        RemoveFiles();
    }

    void TearDown() override { RemoveFiles(); }

    void RemoveFiles() {
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            fs::remove(path_.string() + suffix);
        }
    }

    fs::path path_;
};

TEST_F(SqliteTableTest, PushPoint) {
    EXPECT_EQ(table_.n_hash_tables(), 3);
    EXPECT_EQ(table_.push_point({1.0f, 2.0f}), 0u);
    EXPECT_EQ(table_.push_point({3.0f, -4.5f}), 1u);
    EXPECT_EQ(table_.n_points(), 2u);
    EXPECT_EQ(table_.index_to_point(1), (DataPoint{3.0f, -4.5f}));
}

TEST_F(SqliteTableTest, PutIsIdempotent) {
    PointIndex idx = table_.push_point({1.0f, 2.0f});
    table_.put(sig_a_, idx, 0);
    table_.put(sig_a_, idx, 0);

    optional<Bucket> bucket = table_.query_bucket(sig_a_, 0);
    ASSERT_TRUE(bucket.has_value());
    EXPECT_EQ(*bucket, Bucket{idx});
}

TEST_F(SqliteTableTest, MissingBucket) {
    PointIndex idx = table_.push_point({1.0f, 2.0f});
    table_.put(sig_a_, idx, 0);

    EXPECT_FALSE(table_.query_bucket(sig_b_, 0).has_value());
    EXPECT_FALSE(table_.query_bucket(sig_a_, 1).has_value());
}

TEST_F(SqliteTableTest, Remove) {
    PointIndex a = table_.push_point({1.0f, 2.0f});
    PointIndex b = table_.push_point({5.0f, 6.0f});
    PointIndex c = table_.push_point({1.0f, 2.0f});
    table_.put(sig_a_, a, 0);
    table_.put(sig_a_, b, 0);
    table_.put(sig_a_, c, 0);
    table_.put(sig_a_, a, 1);

    table_.remove(sig_a_, {1.0f, 2.0f}, 0);
    EXPECT_EQ(*table_.query_bucket(sig_a_, 0), Bucket{b});
    EXPECT_EQ(*table_.query_bucket(sig_a_, 1), Bucket{a});

    table_.remove(sig_a_, {9.0f, 9.0f}, 0);
    table_.remove(sig_b_, {5.0f, 6.0f}, 0);
    EXPECT_EQ(*table_.query_bucket(sig_a_, 0), Bucket{b});

    table_.remove(sig_a_, {5.0f, 6.0f}, 0);
    EXPECT_FALSE(table_.query_bucket(sig_a_, 0).has_value());
    EXPECT_EQ(table_.n_points(), 3u);
}

TEST_F(SqliteTableTest, Batch) {
    table_.increase_storage(100);
    for (int i = 0; i < 100; ++i) {
        PointIndex idx = table_.push_point({static_cast<float>(i)});
        table_.put({i % 4}, idx, 2);
    }
    table_.commit();
    // committing twice is harmless
    table_.commit();

    optional<Bucket> bucket = table_.query_bucket({3}, 2);
    ASSERT_TRUE(bucket.has_value());
    EXPECT_EQ(bucket->size(), 25u);
    EXPECT_EQ(bucket->count(99), 1u);
}

TEST_F(SqliteTableTest, Errors) {
    try {
        table_.put(sig_a_, 0, 3);
        FAIL() << "expected lshpp::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kBackendFault);
    }
    EXPECT_THROW(table_.query_bucket(sig_a_, -1), Error);
    EXPECT_THROW(table_.index_to_point(0), Error);
    EXPECT_THROW(SqliteTable(0, ":memory:"), Error);
}

TEST_F(SqliteTableTest, Describe) {
    PointIndex a = table_.push_point({1.0f, 2.0f});
    PointIndex b = table_.push_point({5.0f, 6.0f});
    table_.put(sig_a_, a, 0);
    table_.put(sig_a_, b, 0);
    table_.put(sig_b_, b, 1);

    ostringstream os;
    table_.describe(os);
    string out = os.str();
    EXPECT_NE(out.find("3 hash tables, 2 points"), string::npos) << out;
    EXPECT_NE(out.find("table 0: 1 buckets, 2 entries, largest bucket 2"), string::npos) << out;
    EXPECT_NE(out.find("table 1: 1 buckets, 1 entries, largest bucket 1"), string::npos) << out;
    EXPECT_NE(out.find("table 2: 0 buckets, 0 entries, largest bucket 0"), string::npos) << out;
}

TEST_F(SqliteTableFileTest, Reopen) {
    {
        SqliteTable table(2, path_.string());
        table.increase_storage(2);
        PointIndex a = table.push_point({1.0f, 2.0f});
        PointIndex b = table.push_point({3.0f, 4.0f});
        table.put({7}, a, 0);
        table.put({7}, b, 1);
        // left uncommitted, closing the table commits
    }

    SqliteTable table(2, path_.string());
    EXPECT_EQ(table.n_points(), 2u);
    EXPECT_EQ(*table.query_bucket({7}, 0), Bucket{0});
    EXPECT_EQ(*table.query_bucket({7}, 1), Bucket{1});
    EXPECT_EQ(table.index_to_point(1), (DataPoint{3.0f, 4.0f}));

    // numbering continues after the stored points
    EXPECT_EQ(table.push_point({5.0f, 6.0f}), 2u);
}

TEST_F(SqliteTableFileTest, TableCountMismatch) {
    { SqliteTable table(2, path_.string()); }

    try {
        SqliteTable table(3, path_.string());
        FAIL() << "expected lshpp::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kInvalidParameter);
    }
}

TEST_F(SqliteTableFileTest, ShapeMismatch) {
    {
        SqliteTable table(2, path_.string());
        table.bind_shape(3, 4);
        table.push_point({1.0f, 2.0f, 3.0f});
    }

    SqliteTable table(2, path_.string());
    table.bind_shape(3, 4);
    try {
        table.bind_shape(5, 4);
        FAIL() << "expected lshpp::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kInvalidParameter);
    }
    EXPECT_THROW(table.bind_shape(3, 6), Error);
    EXPECT_EQ(table.index_to_point(0).size(), 3u);
}

TEST_F(SqliteTableFileTest, Move) {
    SqliteTable table(1, SqliteTable::Options{path_.string(), true});
    PointIndex idx = table.push_point({1.0f});
    table.put({1}, idx, 0);

    SqliteTable moved(std::move(table));
    EXPECT_EQ(moved.n_points(), 1u);
    EXPECT_EQ(*moved.query_bucket({1}, 0), Bucket{idx});
}

} // namespace lshpp
