#include <lshpp/error.hpp>
#include <lshpp/table/sqlite_table.hpp>

#include <chrono>
#include <iostream>
#include <sqlite3.h>
#include <string>
#include <vector>

using namespace std;

namespace lshpp {

namespace {

/**
 * @brief Resets a cached statement and clears its bindings when leaving scope, so it can be
 * reused by the next call whether or not the current one throws.
 */
class StmtGuard {
public:
    explicit StmtGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StmtGuard() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;

private:
    sqlite3_stmt* stmt_;
};

DataPoint column_point(sqlite3_stmt* stmt, int col) {
    const auto* data = static_cast<const float*>(sqlite3_column_blob(stmt, col));
    size_t n = static_cast<size_t>(sqlite3_column_bytes(stmt, col)) / sizeof(float);
    return data ? DataPoint(data, data + n) : DataPoint();
}

} // namespace

SqliteTable::SqliteTable(int n_hash_tables, const Options& options)
    : n_hash_tables_(n_hash_tables), path_(options.path) {
    if (n_hash_tables <= 0) {
        throw Error(ErrorKind::kInvalidParameter,
                    "n_hash_tables must be positive, got " + std::to_string(n_hash_tables));
    }
    auto start_time = chrono::high_resolution_clock::now();

    // the handle is allocated even when opening fails and carries the error message
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    db_.reset(db);
    if (rc != SQLITE_OK) {
        fail("could not open '" + path_ + "'");
    }

    exec(options.synchronous ? "PRAGMA synchronous = FULL" : "PRAGMA synchronous = NORMAL");
    exec("PRAGMA journal_mode = WAL");
    exec("CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value INTEGER NOT NULL)");
    exec("CREATE TABLE IF NOT EXISTS points (id INTEGER PRIMARY KEY, vec BLOB NOT NULL)");
    exec("CREATE TABLE IF NOT EXISTS buckets ("
         "table_id INTEGER NOT NULL, hash BLOB NOT NULL, id INTEGER NOT NULL, "
         "PRIMARY KEY (table_id, hash, id)) WITHOUT ROWID");

    // a database keeps the table count it was created with
    check_meta("n_hash_tables", n_hash_tables_);

    StmtPtr count_points = prepare("SELECT COALESCE(MAX(id) + 1, 0) FROM points");
    if (sqlite3_step(count_points.get()) != SQLITE_ROW) {
        fail("could not count points");
    }
    n_points_ = static_cast<size_t>(sqlite3_column_int64(count_points.get(), 0));

    insert_point_ = prepare("INSERT INTO points (id, vec) VALUES (?, ?)");
    insert_entry_ = prepare("INSERT OR IGNORE INTO buckets (table_id, hash, id) VALUES (?, ?, ?)");
    select_bucket_points_ = prepare("SELECT b.id, p.vec FROM buckets b JOIN points p ON p.id = b.id "
                                    "WHERE b.table_id = ? AND b.hash = ?");
    delete_entry_ = prepare("DELETE FROM buckets WHERE table_id = ? AND hash = ? AND id = ?");

    auto end_time = chrono::high_resolution_clock::now();
    chrono::duration<double> open_time = end_time - start_time;
    clog << "SQLite table opened at " << path_ << " (" << n_points_ << " points) in "
         << open_time.count() << " sec" << endl;
}

SqliteTable::SqliteTable(int n_hash_tables, const string& path)
    : SqliteTable(n_hash_tables, Options{path, false}) {}

SqliteTable::~SqliteTable() {
    if (db_ && in_transaction_) {
        char* err = nullptr;
        if (sqlite3_exec(db_.get(), "COMMIT", nullptr, nullptr, &err) != SQLITE_OK) {
            clog << "SQLite table " << path_ << ": commit on close failed: "
                 << (err ? err : "unknown error") << endl;
        }
        sqlite3_free(err);
    }
}

void SqliteTable::fail(const string& what) const {
    string reason = db_ ? sqlite3_errmsg(db_.get()) : "out of memory";
    throw Error(ErrorKind::kBackendFault, "SQLite table " + path_ + ": " + what + ": " + reason);
}

void SqliteTable::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        string reason = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw Error(ErrorKind::kBackendFault,
                    "SQLite table " + path_ + ": '" + sql + "' failed: " + reason);
    }
}

SqliteTable::StmtPtr SqliteTable::prepare(const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail(string("could not prepare '") + sql + "'");
    }
    return StmtPtr(stmt);
}

void SqliteTable::bind_int64(sqlite3_stmt* stmt, int col, int64_t value) const {
    if (sqlite3_bind_int64(stmt, col, value) != SQLITE_OK) {
        fail("could not bind parameter " + std::to_string(col));
    }
}

void SqliteTable::bind_text(sqlite3_stmt* stmt, int col, const char* text) const {
    if (sqlite3_bind_text(stmt, col, text, -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        fail("could not bind parameter " + std::to_string(col));
    }
}

void SqliteTable::bind_blob(sqlite3_stmt* stmt, int col, const void* data, size_t n_bytes) const {
    if (sqlite3_bind_blob(stmt, col, data, static_cast<int>(n_bytes), SQLITE_TRANSIENT) !=
        SQLITE_OK) {
        fail("could not bind parameter " + std::to_string(col));
    }
}

void SqliteTable::check_meta(const char* key, int64_t value) {
    StmtPtr insert_meta = prepare("INSERT OR IGNORE INTO meta (key, value) VALUES (?, ?)");
    bind_text(insert_meta.get(), 1, key);
    bind_int64(insert_meta.get(), 2, value);
    if (sqlite3_step(insert_meta.get()) != SQLITE_DONE) {
        fail(string("could not write ") + key);
    }

    StmtPtr select_meta = prepare("SELECT value FROM meta WHERE key = ?");
    bind_text(select_meta.get(), 1, key);
    if (sqlite3_step(select_meta.get()) != SQLITE_ROW) {
        fail(string("could not read ") + key);
    }
    int64_t stored = sqlite3_column_int64(select_meta.get(), 0);
    if (stored != value) {
        throw Error(ErrorKind::kInvalidParameter, "'" + path_ + "' was created with " + key +
                                                      " = " + std::to_string(stored) +
                                                      ", requested " + std::to_string(value));
    }
}

void SqliteTable::bind_shape(int dim, int n_projections) {
    check_meta("dim", dim);
    check_meta("n_projections", n_projections);
}

void SqliteTable::check_table(int table_id) const {
    if (table_id < 0 || table_id >= n_hash_tables_) {
        throw Error(ErrorKind::kBackendFault,
                    "hash table " + std::to_string(table_id) + " does not exist");
    }
}

PointIndex SqliteTable::push_point(const DataPoint& v) {
    sqlite3_stmt* stmt = insert_point_.get();
    StmtGuard guard(stmt);

    bind_int64(stmt, 1, static_cast<int64_t>(n_points_));
    bind_blob(stmt, 2, v.data(), v.size() * sizeof(float));
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        fail("could not store point " + std::to_string(n_points_));
    }
    return static_cast<PointIndex>(n_points_++);
}

void SqliteTable::put(const Signature& hash, PointIndex idx, int table_id) {
    check_table(table_id);
    sqlite3_stmt* stmt = insert_entry_.get();
    StmtGuard guard(stmt);

    bind_int64(stmt, 1, table_id);
    bind_blob(stmt, 2, hash.data(), hash.size() * sizeof(int32_t));
    bind_int64(stmt, 3, idx);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        fail("could not insert point " + std::to_string(idx) + " into table " +
             std::to_string(table_id));
    }
}

optional<Bucket> SqliteTable::query_bucket(const Signature& hash, int table_id) const {
    check_table(table_id);

    // prepared per call, concurrent readers may be in here at once
    StmtPtr select_bucket = prepare("SELECT id FROM buckets WHERE table_id = ? AND hash = ?");
    sqlite3_stmt* stmt = select_bucket.get();

    bind_int64(stmt, 1, table_id);
    bind_blob(stmt, 2, hash.data(), hash.size() * sizeof(int32_t));

    Bucket bucket;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        bucket.insert(static_cast<PointIndex>(sqlite3_column_int64(stmt, 0)));
    }
    if (rc != SQLITE_DONE) {
        fail("could not query table " + std::to_string(table_id));
    }

    // rows are bucket entries, so a bucket without rows does not exist
    if (bucket.empty()) {
        return nullopt;
    }
    return bucket;
}

void SqliteTable::remove(const Signature& hash, const DataPoint& v, int table_id) {
    check_table(table_id);

    vector<int64_t> matches;
    {
        sqlite3_stmt* stmt = select_bucket_points_.get();
        StmtGuard guard(stmt);

        bind_int64(stmt, 1, table_id);
        bind_blob(stmt, 2, hash.data(), hash.size() * sizeof(int32_t));

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            if (column_point(stmt, 1) == v) {
                matches.push_back(sqlite3_column_int64(stmt, 0));
            }
        }
        if (rc != SQLITE_DONE) {
            fail("could not scan table " + std::to_string(table_id));
        }
    }

    sqlite3_stmt* stmt = delete_entry_.get();
    for (int64_t idx : matches) {
        StmtGuard guard(stmt);
        bind_int64(stmt, 1, table_id);
        bind_blob(stmt, 2, hash.data(), hash.size() * sizeof(int32_t));
        bind_int64(stmt, 3, idx);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            fail("could not remove point " + std::to_string(idx) + " from table " +
                 std::to_string(table_id));
        }
    }
}

void SqliteTable::increase_storage(size_t) {
    if (!in_transaction_) {
        exec("BEGIN");
        in_transaction_ = true;
    }
}

void SqliteTable::commit() {
    if (in_transaction_) {
        exec("COMMIT");
        in_transaction_ = false;
    }
}

DataPoint SqliteTable::index_to_point(PointIndex idx) const {
    StmtPtr select_point = prepare("SELECT vec FROM points WHERE id = ?");
    sqlite3_stmt* stmt = select_point.get();

    bind_int64(stmt, 1, idx);
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        throw Error(ErrorKind::kBackendFault, "point " + std::to_string(idx) + " does not exist");
    }
    if (rc != SQLITE_ROW) {
        fail("could not read point " + std::to_string(idx));
    }
    return column_point(stmt, 0);
}

void SqliteTable::describe(ostream& os) const {
    StmtPtr stmt = prepare("SELECT table_id, COUNT(*), SUM(n), MAX(n) FROM "
                           "(SELECT table_id, COUNT(*) AS n FROM buckets GROUP BY table_id, hash) "
                           "GROUP BY table_id");

    vector<int64_t> n_buckets(n_hash_tables_, 0);
    vector<int64_t> n_entries(n_hash_tables_, 0);
    vector<int64_t> largest(n_hash_tables_, 0);

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        int64_t table_id = sqlite3_column_int64(stmt.get(), 0);
        if (table_id < 0 || table_id >= n_hash_tables_) {
            continue;
        }
        n_buckets[table_id] = sqlite3_column_int64(stmt.get(), 1);
        n_entries[table_id] = sqlite3_column_int64(stmt.get(), 2);
        largest[table_id] = sqlite3_column_int64(stmt.get(), 3);
    }
    if (rc != SQLITE_DONE) {
        fail("could not summarize tables");
    }

    os << "SqliteTable " << path_ << ": " << n_hash_tables_ << " hash tables, " << n_points_
       << " points" << endl;
    for (int i = 0; i < n_hash_tables_; ++i) {
        os << "  table " << i << ": " << n_buckets[i] << " buckets, " << n_entries[i]
           << " entries, largest bucket " << largest[i] << endl;
    }
}

} // namespace lshpp
