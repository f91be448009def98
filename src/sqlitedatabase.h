#ifndef SQLITEDATABASE_H
#define SQLITEDATABASE_H

#include <stdexcept>
#include <string>
#include <QString>

struct sqlite3;
struct sqlite3_stmt;

/**
 * Typed store failure. Any write that throws has left the store unchanged.
 */
class PersistenceError : public std::runtime_error
{
public:
    enum class Code {
        OpenFailed,
        QueryFailed,
        ChunkNotFound,
        BatchNotFound,
        InvalidTransition,
        ConstraintViolation,
        FileSystem
    };

    PersistenceError(Code code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    Code code() const { return m_code; }

    static const char* codeName(Code code);

private:
    Code m_code;
};

/**
 * RAII prepared statement. Bind indices are 1-based, column indices 0-based.
 */
class SqliteStatement
{
public:
    SqliteStatement(sqlite3* db, const char* sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    void bind(int index, qint64 value);
    void bind(int index, double value);
    void bind(int index, const QString& value);
    void bindNull(int index);

    /**
     * Advance the statement
     * @return true if a row is available, false when done
     * @throws PersistenceError on any other result
     */
    bool step();

    void reset();

    qint64 columnInt64(int column) const;
    double columnDouble(int column) const;
    QString columnText(int column) const;
    bool columnIsNull(int column) const;

private:
    void check(int rc, const char* what) const;

    sqlite3* m_db;
    sqlite3_stmt* m_stmt;
};

/**
 * RAII connection with the pragmas every ScreenChronicle connection uses
 * (WAL, synchronous=NORMAL, busy_timeout, foreign keys)
 */
class SqliteConnection
{
public:
    static constexpr int BUSY_TIMEOUT_MS = 5000;

    /**
     * @throws PersistenceError(OpenFailed)
     */
    SqliteConnection(const QString& path, bool readOnly);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    void exec(const char* sql);
    qint64 lastInsertRowId() const;
    int changes() const;
    bool isReadOnly() const { return m_readOnly; }
    sqlite3* handle() const { return m_db; }

private:
    sqlite3* m_db = nullptr;
    bool m_readOnly;
};

/**
 * BEGIN IMMEDIATE ... COMMIT, rolled back on destruction unless committed
 */
class SqliteTransaction
{
public:
    explicit SqliteTransaction(SqliteConnection& connection);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteConnection& m_connection;
    bool m_finished = false;
};

#endif // SQLITEDATABASE_H
