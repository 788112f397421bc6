// SPDX-License-Identifier: Apache-2.0
#include "worker/store/database.hpp"

#include "common/logger.hpp"

namespace hdw::store {

Database::Database(const std::string &path)
{
    int rc = sqlite3_open_v2(
        path.c_str(), &m_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("open '" + path + "': " + msg);
    }
    // Dashboard readers may hold the file briefly; wait instead of failing the tick.
    sqlite3_busy_timeout(m_db, 5000);
}

Database::~Database()
{
    close();
}

void Database::close()
{
    if (!m_db)
        return;
    if (sqlite3_close(m_db) != SQLITE_OK) {
        log::warn("[store] close with unfinalized statements: {}", sqlite3_errmsg(m_db));
        sqlite3_close_v2(m_db);
    }
    m_db = nullptr;
}

void Database::raise(std::string_view what) const
{
    std::string msg(what);
    msg += ": ";
    msg += m_db ? sqlite3_errmsg(m_db) : "database closed";
    throw StorageError(msg);
}

void Database::exec(std::string_view sql)
{
    if (!m_db)
        throw StorageError("exec on closed database");
    char *err = nullptr;
    std::string s(sql);
    if (sqlite3_exec(m_db, s.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("exec '" + s + "': " + msg);
    }
}

int Database::changes() const noexcept
{
    return m_db ? sqlite3_changes(m_db) : 0;
}

Statement::Statement(Database &db, std::string_view sql) : m_db(db)
{
    if (!db.is_open())
        throw StorageError("prepare on closed database");
    if (sqlite3_prepare_v2(db.handle(), sql.data(), static_cast<int>(sql.size()), &m_stmt, nullptr) != SQLITE_OK)
        db.raise("prepare '" + std::string(sql) + "'");
}

Statement::~Statement()
{
    sqlite3_finalize(m_stmt);
}

Statement &Statement::bind(int idx, int64_t v)
{
    if (sqlite3_bind_int64(m_stmt, idx, v) != SQLITE_OK)
        m_db.raise("bind");
    return *this;
}

Statement &Statement::bind(int idx, double v)
{
    if (sqlite3_bind_double(m_stmt, idx, v) != SQLITE_OK)
        m_db.raise("bind");
    return *this;
}

Statement &Statement::bind(int idx, const std::string &v)
{
    if (sqlite3_bind_text(m_stmt, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT) != SQLITE_OK)
        m_db.raise("bind");
    return *this;
}

Statement &Statement::bind_null(int idx)
{
    if (sqlite3_bind_null(m_stmt, idx) != SQLITE_OK)
        m_db.raise("bind");
    return *this;
}

bool Statement::step()
{
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    m_db.raise("step");
}

void Statement::run()
{
    while (step()) {
    }
}

bool Statement::is_null(int col) const
{
    return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
}

int64_t Statement::column_int64(int col) const
{
    return sqlite3_column_int64(m_stmt, col);
}

double Statement::column_double(int col) const
{
    return sqlite3_column_double(m_stmt, col);
}

std::string Statement::column_text(int col) const
{
    auto *p = reinterpret_cast<const char *>(sqlite3_column_text(m_stmt, col));
    if (!p)
        return {};
    return std::string(p, static_cast<size_t>(sqlite3_column_bytes(m_stmt, col)));
}

std::optional<std::string> Statement::column_opt_text(int col) const
{
    if (is_null(col))
        return std::nullopt;
    return column_text(col);
}

std::optional<int64_t> Statement::column_opt_int64(int col) const
{
    if (is_null(col))
        return std::nullopt;
    return column_int64(col);
}

std::optional<double> Statement::column_opt_double(int col) const
{
    if (is_null(col))
        return std::nullopt;
    return column_double(col);
}

Transaction::Transaction(Database &db) : m_db(db)
{
    m_db.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction()
{
    if (m_done)
        return;
    try {
        m_db.exec("ROLLBACK");
    } catch (const StorageError &ex) {
        log::error("[store] rollback failed: {}", ex.what());
    }
}

void Transaction::commit()
{
    m_db.exec("COMMIT");
    m_done = true;
}

} // namespace hdw::store
