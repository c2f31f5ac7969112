#include <lshpp/error.hpp>
#include <lshpp/lsh.hpp>
#include <lshpp/lsh_impl.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <iostream>
#include <filesystem>
#include <functional>
#include <new>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace std;
namespace fs = std::filesystem;

namespace lshpp {

namespace {

template <typename Storage> Storage make_storage(int n_hash_tables);

template <> MemoryTable make_storage<MemoryTable>(int n_hash_tables) {
    return MemoryTable(n_hash_tables);
}

template <> SqliteTable make_storage<SqliteTable>(int n_hash_tables) {
    return SqliteTable(n_hash_tables, ":memory:");
}

vector<DataPoint> random_vecs(int n, int dim, unsigned seed = 13) {
    mt19937 rng(seed);
    normal_distribution<float> normal_dist(0.0f, 1.0f);
    vector<DataPoint> vs(n, DataPoint(dim));
    for (DataPoint& v : vs) {
        for (float& x : v) {
            x = normal_dist(rng);
        }
    }
    return vs;
}

bool contains(const vector<DataPoint>& vs, const DataPoint& v) {
    return find(vs.begin(), vs.end(), v) != vs.end();
}

set<PointIndex> as_set(const vector<PointIndex>& ids) {
    return set<PointIndex>(ids.begin(), ids.end());
}

// Hashes on the first coordinate and runs out of memory on the fail_after-th stored vector.
class FailingHasher {
public:
    FailingHasher(int dim, int fail_after) : dim_(dim), fail_after_(fail_after) {}

    Signature hash_vec_put(const DataPoint& v) const {
        if (calls_++ == fail_after_) {
            throw std::bad_alloc();
        }
        return hash_vec_query(v);
    }

    Signature hash_vec_query(const DataPoint& v) const { return {static_cast<int32_t>(v[0])}; }

    int dim() const { return dim_; }
    int n_projections() const { return 1; }

private:
    int dim_;
    int fail_after_;
    mutable int calls_ = 0;
};

} // namespace

template <typename Storage> class LSHTest : public testing::Test {
protected:
    LSH<SignRandomProjections, Storage> srp(int n_projections, int n_hash_tables, int dim,
                                            uint64_t seed) {
        return Builder(n_projections, n_hash_tables, dim)
            .seed(seed)
            .srp(make_storage<Storage>(n_hash_tables));
    }

    LSH<L2, Storage> l2(int n_projections, int n_hash_tables, int dim, float r, uint64_t seed) {
        return Builder(n_projections, n_hash_tables, dim)
            .seed(seed)
            .l2(r, make_storage<Storage>(n_hash_tables));
    }

    LSH<MIPS, Storage> mips(int n_projections, int n_hash_tables, int dim, uint64_t seed,
                            const vector<DataPoint>& sample) {
        return Builder(n_projections, n_hash_tables, dim)
            .seed(seed)
            .fit(sample)
            .mips(2.0f, 0.83f, 3, make_storage<Storage>(n_hash_tables));
    }
};

using Backends = testing::Types<MemoryTable, SqliteTable>;
TYPED_TEST_SUITE(LSHTest, Backends);

TYPED_TEST(LSHTest, StoreQueryDelete) {
    auto lsh = this->srp(5, 10, 3, 1);
    DataPoint v1 = {2.0f, 3.0f, 4.0f};
    DataPoint v2 = {-1.0f, -1.0f, 1.0f};
    lsh.store_vec(v1);
    lsh.store_vec(v2);

    vector<DataPoint> result = lsh.query_bucket(v2);
    EXPECT_FALSE(result.empty());
    EXPECT_TRUE(contains(result, v2));

    size_t bucket_len_before = lsh.query_bucket(v1).size();
    lsh.delete_vec(v1);
    size_t bucket_len_after = lsh.query_bucket(v1).size();
    EXPECT_GT(bucket_len_before, bucket_len_after);
    EXPECT_FALSE(contains(lsh.query_bucket(v1), v1));
}

TYPED_TEST(LSHTest, Deterministic) {
    vector<DataPoint> vs = random_vecs(50, 8);
    auto a = this->l2(4, 6, 8, 2.0f, 99);
    auto b = this->l2(4, 6, 8, 2.0f, 99);
    a.store_vecs(vs);
    b.store_vecs(vs);

    for (int i = 0; i < a.n_hash_tables(); ++i) {
        for (const DataPoint& v : vs) {
            EXPECT_EQ(a.hashers()[i].hash_vec_put(v), b.hashers()[i].hash_vec_put(v));
        }
    }
    for (const DataPoint& q : random_vecs(10, 8, 5)) {
        EXPECT_EQ(as_set(a.query_bucket_ids(q)), as_set(b.query_bucket_ids(q)));
    }
}

TYPED_TEST(LSHTest, StoredVectorIsFound) {
    vector<DataPoint> vs = random_vecs(100, 16);
    auto srp = this->srp(12, 4, 16, 3);
    auto l2 = this->l2(6, 4, 16, 0.5f, 3);
    srp.store_vecs(vs);
    l2.store_vecs(vs);

    for (size_t i = 0; i < vs.size(); ++i) {
        EXPECT_TRUE(contains(srp.query_bucket(vs[i]), vs[i]));
        EXPECT_TRUE(contains(l2.query_bucket(vs[i]), vs[i]));
        EXPECT_EQ(as_set(l2.query_bucket_ids(vs[i])).count(static_cast<PointIndex>(i)), 1u);
    }
}

TYPED_TEST(LSHTest, UnionGrowsWithTables) {
    vector<DataPoint> vs = random_vecs(200, 8);
    vector<DataPoint> queries = random_vecs(20, 8, 77);

    vector<size_t> previous(queries.size(), 0);
    for (int n_hash_tables = 1; n_hash_tables <= 8; ++n_hash_tables) {
        auto lsh = this->srp(6, n_hash_tables, 8, 21);
        lsh.store_vecs(vs);
        for (size_t q = 0; q < queries.size(); ++q) {
            size_t n_candidates = lsh.query_bucket(queries[q]).size();
            EXPECT_GE(n_candidates, previous[q]) << "n_hash_tables=" << n_hash_tables;
            previous[q] = n_candidates;
        }
    }
}

TYPED_TEST(LSHTest, StoringTwiceKeepsBothIndices) {
    auto lsh = this->l2(4, 5, 3, 1.0f, 8);
    DataPoint v = {0.5f, -1.0f, 2.0f};
    lsh.store_vec(v);
    lsh.store_vec(v);

    vector<PointIndex> ids = lsh.query_bucket_ids(v);
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_EQ(as_set(ids), (set<PointIndex>{0, 1}));

    // deleting by value removes both copies
    lsh.delete_vec(v);
    EXPECT_TRUE(lsh.query_bucket_ids(v).empty());
}

TYPED_TEST(LSHTest, EmptyIndex) {
    auto lsh = this->srp(5, 10, 3, 1);
    EXPECT_TRUE(lsh.query_bucket({1.0f, 2.0f, 3.0f}).empty());
    EXPECT_TRUE(lsh.query_bucket_ids({1.0f, 2.0f, 3.0f}).empty());

    // deleting from an empty index is a no-op
    lsh.delete_vec({1.0f, 2.0f, 3.0f});
    EXPECT_TRUE(lsh.query_bucket({1.0f, 2.0f, 3.0f}).empty());
}

TYPED_TEST(LSHTest, DimensionMismatch) {
    auto lsh = this->srp(5, 3, 3, 1);
    try {
        lsh.store_vec({1.0f, 2.0f});
        FAIL() << "expected lshpp::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kDimensionMismatch);
    }
    EXPECT_EQ(lsh.storage().n_points(), 0u);

    // a batch with one bad vector stores nothing
    EXPECT_THROW(lsh.store_vecs({{1.0f, 2.0f, 3.0f}, {1.0f}}), Error);
    EXPECT_EQ(lsh.storage().n_points(), 0u);

    EXPECT_THROW(lsh.query_bucket({1.0f}), Error);
    EXPECT_THROW(lsh.query_bucket_ids({1.0f, 2.0f, 3.0f, 4.0f}), Error);
    EXPECT_THROW(lsh.delete_vec({}), Error);
}

TYPED_TEST(LSHTest, QueryResolvesVectors) {
    vector<DataPoint> vs = random_vecs(50, 4);
    auto lsh = this->l2(3, 4, 4, 4.0f, 17);
    lsh.store_vecs(vs);

    for (const DataPoint& q : random_vecs(10, 4, 3)) {
        vector<PointIndex> ids = lsh.query_bucket_ids(q);
        vector<DataPoint> points = lsh.query_bucket(q);
        ASSERT_EQ(ids.size(), points.size());
        for (PointIndex idx : ids) {
            ASSERT_LT(idx, vs.size());
            EXPECT_TRUE(contains(points, vs[idx]));
        }
    }
}

TYPED_TEST(LSHTest, Mips) {
    vector<DataPoint> vs = random_vecs(100, 6);
    auto lsh = this->mips(4, 8, 6, 4, vs);
    lsh.store_vecs(vs);
    EXPECT_EQ(lsh.storage().n_points(), vs.size());

    size_t total = 0;
    for (const DataPoint& q : random_vecs(20, 6, 9)) {
        for (PointIndex idx : lsh.query_bucket_ids(q)) {
            EXPECT_LT(idx, vs.size());
            ++total;
        }
    }
    EXPECT_GT(total, 0u);

    ostringstream os;
    lsh.describe(os);
    EXPECT_NE(os.str().find("100 points"), string::npos) << os.str();
}

TYPED_TEST(LSHTest, ConcurrentQueries) {
    vector<DataPoint> vs = random_vecs(300, 8);
    auto lsh = this->srp(4, 8, 8, 5);
    lsh.store_vecs(vs);

    vector<set<PointIndex>> expected;
    for (const DataPoint& v : vs) {
        expected.push_back(as_set(lsh.query_bucket_ids(v)));
    }

    // readers share the index without any synchronization
    auto read_all = [&](int& mismatches, int& errors) {
        for (int pass = 0; pass < 10; ++pass) {
            for (size_t i = 0; i < vs.size(); ++i) {
                try {
                    if (as_set(lsh.query_bucket_ids(vs[i])) != expected[i]) {
                        ++mismatches;
                    }
                    if (lsh.query_bucket(vs[i]).size() != expected[i].size()) {
                        ++mismatches;
                    }
                } catch (const Error&) {
                    ++errors;
                }
            }
        }
    };

    int mismatches[2] = {0, 0};
    int errors[2] = {0, 0};
    thread a(read_all, ref(mismatches[0]), ref(errors[0]));
    thread b(read_all, ref(mismatches[1]), ref(errors[1]));
    a.join();
    b.join();

    EXPECT_EQ(mismatches[0] + mismatches[1], 0);
    EXPECT_EQ(errors[0] + errors[1], 0);
}

TEST(LshLogTest, StoreVecsReportsDuration) {
    auto lsh = Builder(4, 2, 3).seed(1).srp();

    ostringstream log;
    streambuf* saved = clog.rdbuf(log.rdbuf());
    lsh.store_vecs({{1.0f, 2.0f, 3.0f}, {3.0f, 2.0f, 1.0f}, {0.0f, 1.0f, 0.0f}});
    clog.rdbuf(saved);

    EXPECT_EQ(log.str().rfind("Store completed in ", 0), 0u) << log.str();
    EXPECT_NE(log.str().find(" sec (3 vectors)"), string::npos) << log.str();
}

TEST(BuilderTest, InvalidParameters) {
    auto kind_of = [](auto&& f) {
        try {
            f();
        } catch (const Error& e) {
            return e.kind();
        }
        return ErrorKind::kBackendFault;
    };
    EXPECT_EQ(kind_of([] { Builder(5, 10, 0); }), ErrorKind::kInvalidParameter);
    EXPECT_EQ(kind_of([] { Builder(0, 10, 3); }), ErrorKind::kInvalidParameter);
    EXPECT_EQ(kind_of([] { Builder(5, 0, 3); }), ErrorKind::kInvalidParameter);
    EXPECT_EQ(kind_of([] { Builder(5, 10, 3).l2(0.0f); }), ErrorKind::kInvalidParameter);
    EXPECT_EQ(kind_of([] { Builder(5, 10, 3).mips(1.0f, 1.5f, 3); }),
              ErrorKind::kInvalidParameter);
    EXPECT_EQ(kind_of([] { Builder(5, 10, 3).fit({{0.0f, 0.0f, 0.0f}}); }),
              ErrorKind::kInvalidParameter);
    EXPECT_EQ(kind_of([] { Builder(5, 10, 3).srp(MemoryTable(4)); }),
              ErrorKind::kInvalidParameter);
}

TEST(BuilderTest, SeedDerivation) {
    // hasher i is seeded with the i-th draw of the index generator
    mt19937_64 rng(1);
    auto lsh = Builder(5, 3, 3).seed(1).srp();
    DataPoint v = {2.0f, 3.0f, 4.0f};
    for (int i = 0; i < 3; ++i) {
        SignRandomProjections expected(5, 3, rng());
        EXPECT_EQ(lsh.hashers()[i].hash_vec_put(v), expected.hash_vec_put(v));
    }
}

TEST(BuilderTest, Fit) {
    vector<DataPoint> vs = {{3.0f, 4.0f}, {0.0f, 10.0f}};
    auto lsh = Builder(4, 2, 2).seed(3).fit(vs).mips(1.0f, 0.5f, 2);
    for (const MIPS& hasher : lsh.hashers()) {
        EXPECT_FLOAT_EQ(hasher.max_norm(), 10.0f);
    }
}

class LshSqlFileTest : public testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() / "lshpp_lsh_test.db";
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

TEST_F(LshSqlFileTest, ReopenWithSameSeed) {
    vector<DataPoint> vs = random_vecs(30, 5);
    {
        LshSql<SignRandomProjections> lsh =
            Builder(6, 4, 5).seed(12).srp(SqliteTable(4, path_.string()));
        lsh.store_vecs(vs);
    }

    // the same seed reproduces the hashers, so the stored buckets are found again
    LshSql<SignRandomProjections> lsh =
        Builder(6, 4, 5).seed(12).srp(SqliteTable(4, path_.string()));
    EXPECT_EQ(lsh.storage().n_points(), vs.size());
    for (const DataPoint& v : vs) {
        EXPECT_TRUE(contains(lsh.query_bucket(v), v));
    }
}

TEST_F(LshSqlFileTest, ReopenWithOtherShape) {
    { Builder(6, 4, 5).seed(12).srp(SqliteTable(4, path_.string())); }

    auto kind_of = [](auto&& f) {
        try {
            f();
        } catch (const Error& e) {
            return e.kind();
        }
        return ErrorKind::kBackendFault;
    };
    EXPECT_EQ(kind_of([&] { Builder(6, 4, 3).seed(12).srp(SqliteTable(4, path_.string())); }),
              ErrorKind::kInvalidParameter);
    EXPECT_EQ(kind_of([&] { Builder(7, 4, 5).seed(12).srp(SqliteTable(4, path_.string())); }),
              ErrorKind::kInvalidParameter);

    LshSql<SignRandomProjections> lsh =
        Builder(6, 4, 5).seed(12).srp(SqliteTable(4, path_.string()));
    EXPECT_EQ(lsh.dim(), 5);
}

TEST_F(LshSqlFileTest, FailedBatchIsCommitted) {
    LSH<FailingHasher, SqliteTable> lsh(LSHParams{1, 1, 2}, {FailingHasher(2, 2)},
                                        SqliteTable(1, path_.string()));
    EXPECT_THROW(lsh.store_vecs({{1.0f, 0.0f}, {2.0f, 0.0f}, {3.0f, 0.0f}}), std::bad_alloc);

    // a second connection only sees committed rows, and could not write under an open batch
    SqliteTable reader(1, path_.string());
    EXPECT_EQ(reader.n_points(), 2u);
    EXPECT_EQ(*reader.query_bucket({2}, 0), Bucket{1});
}

} // namespace lshpp
