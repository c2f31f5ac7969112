#pragma once

#include <lshpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace lshpp {

/**
 * @class SqliteTable
 * @brief Durable storage backend kept in a SQLite database.
 *
 * Schema:
 *
 *     meta(key TEXT PRIMARY KEY, value INTEGER)                    -- n_hash_tables, dim, ...
 *     points(id INTEGER PRIMARY KEY, vec BLOB)                      -- float32, native order
 *     buckets(table_id, hash BLOB, id, PRIMARY KEY(table_id, hash, id)) -- int32 signature
 *
 * Write statements are prepared once and cached. Read paths (query_bucket, index_to_point,
 * describe) prepare a statement per call on a serialized connection, so concurrent readers
 * are safe as long as no write runs at the same time.
 *
 * The database can be inspected with any SQLite client while the index is closed, or while
 * it is open if no batch transaction is in flight.
 */
class SqliteTable {
public:
    struct Options {
        /**
         * @brief Database file. ":memory:" keeps the database in memory.
         */
        std::string path = ":memory:";

        /**
         * @brief Wait for the file system on every commit (PRAGMA synchronous = FULL).
         */
        bool synchronous = false;
    };

    /**
     * @brief Open or create the database at options.path with n_hash_tables tables. An
     * existing database continues its point numbering.
     * @throws Error(kInvalidParameter) if n_hash_tables is not positive or the database was
     * created with a different number of tables.
     * @throws Error(kBackendFault) if the database cannot be opened.
     */
    SqliteTable(int n_hash_tables, const Options& options);

    SqliteTable(int n_hash_tables, const std::string& path);

    ~SqliteTable();

    SqliteTable(SqliteTable&&) noexcept = default;
    SqliteTable& operator=(SqliteTable&&) noexcept = default;

    /**
     * @brief Record the vector and signature lengths of the index using this table.
     * @throws Error(kInvalidParameter) if the database was created for different lengths.
     */
    void bind_shape(int dim, int n_projections);

    PointIndex push_point(const DataPoint& v);
    void put(const Signature& hash, PointIndex idx, int table_id);
    std::optional<Bucket> query_bucket(const Signature& hash, int table_id) const;
    void remove(const Signature& hash, const DataPoint& v, int table_id);

    /**
     * @brief Begin a transaction that lasts until commit(), so that a batch of inserts is
     * written at once. No room is reserved; SQLite grows the file as needed.
     */
    void increase_storage(std::size_t size);

    /**
     * @brief Commit the transaction opened by increase_storage(), if any.
     */
    void commit();

    DataPoint index_to_point(PointIndex idx) const;
    void describe(std::ostream& os = std::cout) const;

    std::size_t n_points() const { return n_points_; }
    int n_hash_tables() const { return n_hash_tables_; }
    const std::string& path() const { return path_; }

private:
    struct DbCloser {
        void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
    };
    struct StmtFinalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using DbPtr = std::unique_ptr<sqlite3, DbCloser>;
    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

    int n_hash_tables_;
    std::size_t n_points_ = 0;
    bool in_transaction_ = false;
    std::string path_;

    // declared before the statements so it is closed after they are finalized
    DbPtr db_;
    StmtPtr insert_point_;
    StmtPtr insert_entry_;
    StmtPtr select_bucket_points_;
    StmtPtr delete_entry_;

    void exec(const char* sql);
    StmtPtr prepare(const char* sql) const;
    void bind_int64(sqlite3_stmt* stmt, int col, int64_t value) const;
    void bind_text(sqlite3_stmt* stmt, int col, const char* text) const;
    void bind_blob(sqlite3_stmt* stmt, int col, const void* data, std::size_t n_bytes) const;
    void check_meta(const char* key, int64_t value);
    void check_table(int table_id) const;
    [[noreturn]] void fail(const std::string& what) const;
};

} // namespace lshpp
