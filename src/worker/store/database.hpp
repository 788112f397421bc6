// SPDX-License-Identifier: Apache-2.0
// database.hpp
// Thin RAII layer over the SQLite C API. Every failure surfaces as StorageError.
#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hdw::store {

class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class Database;

class Statement
{
public:
    Statement(Database &db, std::string_view sql);
    ~Statement();
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    // 1-based parameter index, matching sqlite3_bind_*
    Statement &bind(int idx, int64_t v);
    Statement &bind(int idx, int v) { return bind(idx, static_cast<int64_t>(v)); }
    Statement &bind(int idx, double v);
    Statement &bind(int idx, const std::string &v);
    Statement &bind_null(int idx);
    template <typename T>
    Statement &bind(int idx, const std::optional<T> &v)
    {
        if (v)
            return bind(idx, *v);
        return bind_null(idx);
    }

    // Returns true while a row is available.
    bool step();
    // Runs to completion; for statements that return no rows.
    void run();

    bool is_null(int col) const;
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    std::string column_text(int col) const;
    std::optional<std::string> column_opt_text(int col) const;
    std::optional<int64_t> column_opt_int64(int col) const;
    std::optional<double> column_opt_double(int col) const;

private:
    Database &m_db;
    sqlite3_stmt *m_stmt{nullptr};
};

class Database
{
public:
    explicit Database(const std::string &path);
    ~Database();
    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    void exec(std::string_view sql);
    int changes() const noexcept;
    bool is_open() const noexcept { return m_db != nullptr; }
    void close();
    sqlite3 *handle() noexcept { return m_db; }
    [[noreturn]] void raise(std::string_view what) const;

private:
    sqlite3 *m_db{nullptr};
};

// Scoped BEGIN IMMEDIATE; rolls back on destruction unless commit() was called.
class Transaction
{
public:
    explicit Transaction(Database &db);
    ~Transaction();
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;
    void commit();

private:
    Database &m_db;
    bool m_done{false};
};

} // namespace hdw::store
