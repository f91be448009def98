#include "sqlitedatabase.h"
#include "diagnosticslog.h"
#include <sqlite3.h>

namespace {

PersistenceError::Code codeForResult(int rc)
{
    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            return PersistenceError::Code::ConstraintViolation;
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
            return PersistenceError::Code::OpenFailed;
        default:
            return PersistenceError::Code::QueryFailed;
    }
}

} // namespace

const char* PersistenceError::codeName(Code code)
{
    switch (code) {
        case Code::OpenFailed: return "open_failed";
        case Code::QueryFailed: return "query_failed";
        case Code::ChunkNotFound: return "chunk_not_found";
        case Code::BatchNotFound: return "batch_not_found";
        case Code::InvalidTransition: return "invalid_transition";
        case Code::ConstraintViolation: return "constraint_violation";
        case Code::FileSystem: return "file_system";
        default: return "unknown";
    }
}

// ============================================================================
// SqliteStatement Implementation
// ============================================================================

SqliteStatement::SqliteStatement(sqlite3* db, const char* sql)
    : m_db(db), m_stmt(nullptr)
{
    int rc = sqlite3_prepare_v2(m_db, sql, -1, &m_stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = std::string("Failed to prepare statement: ") + sqlite3_errmsg(m_db) +
                              " [" + sql + "]";
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        throw PersistenceError(codeForResult(rc), message);
    }
}

SqliteStatement::~SqliteStatement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

void SqliteStatement::bind(int index, qint64 value)
{
    check(sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value)), "bind");
}

void SqliteStatement::bind(int index, double value)
{
    check(sqlite3_bind_double(m_stmt, index, value), "bind");
}

void SqliteStatement::bind(int index, const QString& value)
{
    QByteArray utf8 = value.toUtf8();
    check(sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT), "bind");
}

void SqliteStatement::bindNull(int index)
{
    check(sqlite3_bind_null(m_stmt, index), "bind");
}

bool SqliteStatement::step()
{
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    check(rc, "step");
    return false;
}

void SqliteStatement::reset()
{
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

qint64 SqliteStatement::columnInt64(int column) const
{
    return static_cast<qint64>(sqlite3_column_int64(m_stmt, column));
}

double SqliteStatement::columnDouble(int column) const
{
    return sqlite3_column_double(m_stmt, column);
}

QString SqliteStatement::columnText(int column) const
{
    const unsigned char* text = sqlite3_column_text(m_stmt, column);
    if (!text) {
        return QString();
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(text), sqlite3_column_bytes(m_stmt, column));
}

bool SqliteStatement::columnIsNull(int column) const
{
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

void SqliteStatement::check(int rc, const char* what) const
{
    if (rc == SQLITE_OK) {
        return;
    }
    throw PersistenceError(codeForResult(rc),
                           std::string("SQLite ") + what + " failed: " + sqlite3_errmsg(m_db));
}

// ============================================================================
// SqliteConnection Implementation
// ============================================================================

SqliteConnection::SqliteConnection(const QString& path, bool readOnly)
    : m_readOnly(readOnly)
{
    int flags = readOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    flags |= SQLITE_OPEN_NOMUTEX;

    int rc = sqlite3_open_v2(path.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = std::string("Failed to open database ") + path.toStdString() + ": " +
                              (m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc));
        sqlite3_close(m_db);
        m_db = nullptr;
        throw PersistenceError(PersistenceError::Code::OpenFailed, message);
    }

    try {
        sqlite3_busy_timeout(m_db, BUSY_TIMEOUT_MS);
        if (!readOnly) {
            exec("PRAGMA journal_mode=WAL");
            exec("PRAGMA synchronous=NORMAL");
        }
        exec("PRAGMA foreign_keys=ON");
    } catch (const PersistenceError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
}

SqliteConnection::~SqliteConnection()
{
    if (m_db) {
        int rc = sqlite3_close(m_db);
        if (rc != SQLITE_OK) {
            LOG_WARNING("Persistence", std::string("sqlite3_close returned ") + sqlite3_errstr(rc));
        }
    }
}

void SqliteConnection::exec(const char* sql)
{
    char* error = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = std::string("SQLite exec failed: ") + (error ? error : sqlite3_errstr(rc)) +
                              " [" + sql + "]";
        sqlite3_free(error);
        throw PersistenceError(codeForResult(rc), message);
    }
}

qint64 SqliteConnection::lastInsertRowId() const
{
    return static_cast<qint64>(sqlite3_last_insert_rowid(m_db));
}

int SqliteConnection::changes() const
{
    return sqlite3_changes(m_db);
}

// ============================================================================
// SqliteTransaction Implementation
// ============================================================================

SqliteTransaction::SqliteTransaction(SqliteConnection& connection)
    : m_connection(connection)
{
    m_connection.exec("BEGIN IMMEDIATE");
}

SqliteTransaction::~SqliteTransaction()
{
    if (m_finished) {
        return;
    }

    try {
        m_connection.exec("ROLLBACK");
    } catch (const PersistenceError& e) {
        LOG_ERROR("Persistence", std::string("Rollback failed: ") + e.what());
    }
}

void SqliteTransaction::commit()
{
    m_connection.exec("COMMIT");
    m_finished = true;
}
