#include "persistencecoordinator.h"
#include "chunkfilename.h"
#include "diagnosticslog.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

const char* const kSchema[] = {
    "CREATE TABLE IF NOT EXISTS chunks ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  start_ts INTEGER NOT NULL,"
    "  end_ts INTEGER NOT NULL,"
    "  file_url TEXT NOT NULL UNIQUE,"
    "  status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending', 'completed', 'failed')),"
    "  CHECK (start_ts <= end_ts)"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_chunks_start_ts ON chunks(start_ts)",
    "CREATE INDEX IF NOT EXISTS idx_chunks_status ON chunks(status)",

    "CREATE TABLE IF NOT EXISTS analysis_batches ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  batch_start_ts INTEGER NOT NULL,"
    "  batch_end_ts INTEGER NOT NULL,"
    "  status TEXT NOT NULL DEFAULT 'pending',"
    "  reason TEXT,"
    "  llm_metadata TEXT,"
    "  created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_analysis_batches_status ON analysis_batches(status)",

    "CREATE TABLE IF NOT EXISTS batch_chunks ("
    "  batch_id INTEGER NOT NULL REFERENCES analysis_batches(id) ON DELETE CASCADE,"
    "  chunk_id INTEGER NOT NULL REFERENCES chunks(id) ON DELETE RESTRICT,"
    "  PRIMARY KEY (batch_id, chunk_id)"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_batch_chunks_chunk ON batch_chunks(chunk_id)",

    "CREATE TABLE IF NOT EXISTS timeline_cards ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  batch_id INTEGER REFERENCES analysis_batches(id) ON DELETE CASCADE,"
    "  start_ts INTEGER NOT NULL,"
    "  end_ts INTEGER NOT NULL,"
    "  title TEXT NOT NULL,"
    "  summary TEXT,"
    "  video_summary_url TEXT,"
    "  created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_timeline_cards_start_ts ON timeline_cards(start_ts)",

    "CREATE TABLE IF NOT EXISTS settings ("
    "  key TEXT PRIMARY KEY,"
    "  value TEXT NOT NULL,"
    "  updated_at INTEGER NOT NULL"
    ")"
};

constexpr qint64 kSecondsPerDay = 86400;

const char* const kChunkColumns = "id, file_url, start_ts, end_ts, status";

std::string chunkIdText(qint64 chunkId)
{
    return std::to_string(chunkId);
}

} // namespace

QString PersistenceCoordinator::statusName(ChunkStatus status)
{
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::Completed: return "completed";
        case ChunkStatus::Failed: return "failed";
        default: return "pending";
    }
}

ChunkStatus PersistenceCoordinator::statusFromName(const QString& name)
{
    if (name == "completed") return ChunkStatus::Completed;
    if (name == "failed") return ChunkStatus::Failed;
    return ChunkStatus::Pending;
}

// ============================================================================
// Reader pool
// ============================================================================

PersistenceCoordinator::ReaderLease::ReaderLease(const PersistenceCoordinator& owner,
                                                 std::unique_ptr<SqliteConnection> connection)
    : m_owner(owner), m_connection(std::move(connection))
{
}

PersistenceCoordinator::ReaderLease::~ReaderLease()
{
    if (m_connection) {
        m_owner.returnReader(std::move(m_connection));
    }
}

PersistenceCoordinator::ReaderLease PersistenceCoordinator::checkoutReader() const
{
    std::unique_lock<std::mutex> lock(m_readerMutex);
    m_readerAvailable.wait(lock, [this] { return !m_idleReaders.empty() || !m_isOpen.load(); });

    if (!m_isOpen.load()) {
        throw PersistenceError(PersistenceError::Code::OpenFailed, "Store is not open");
    }

    std::unique_ptr<SqliteConnection> connection = std::move(m_idleReaders.back());
    m_idleReaders.pop_back();
    return ReaderLease(*this, std::move(connection));
}

void PersistenceCoordinator::returnReader(std::unique_ptr<SqliteConnection> connection) const
{
    {
        std::lock_guard<std::mutex> lock(m_readerMutex);
        if (m_isOpen.load()) {
            m_idleReaders.push_back(std::move(connection));
        }
    }

    if (connection) {
        // Store closed while this reader was checked out
        connection.reset();
        m_connectionCount.fetch_sub(1);
    }
    m_readerAvailable.notify_one();
}

SqliteConnection& PersistenceCoordinator::writer()
{
    if (!m_writer) {
        throw PersistenceError(PersistenceError::Code::OpenFailed, "Store is not open");
    }
    return *m_writer;
}

// ============================================================================
// Lifecycle
// ============================================================================

PersistenceCoordinator::PersistenceCoordinator(const QString& databasePath, int readerCount)
    : m_databasePath(databasePath),
      m_readerCount(readerCount > 0 ? readerCount : DEFAULT_READER_COUNT)
{
}

PersistenceCoordinator::~PersistenceCoordinator()
{
    close();
}

void PersistenceCoordinator::open()
{
    std::lock_guard<std::mutex> writerLock(m_writerMutex);
    if (m_isOpen.load()) {
        return;
    }

    QFileInfo info(m_databasePath);
    if (!QDir().mkpath(info.absolutePath())) {
        throw PersistenceError(PersistenceError::Code::OpenFailed,
                               "Cannot create database directory " + info.absolutePath().toStdString());
    }

    int backoffMs = OPEN_BACKOFF_MS;
    for (int attempt = 1; ; ++attempt) {
        try {
            m_writer = std::make_unique<SqliteConnection>(m_databasePath, false);
            createSchema();
            break;
        } catch (const PersistenceError& e) {
            m_writer.reset();
            if (attempt >= OPEN_ATTEMPTS) {
                LOG_CRITICAL("Persistence", std::string("Giving up opening store: ") + e.what());
                throw PersistenceError(PersistenceError::Code::OpenFailed, e.what());
            }
            LOG_WARNING("Persistence", "Open attempt " + std::to_string(attempt) + " failed (" + e.what() +
                        "), retrying in " + std::to_string(backoffMs) + " ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
            backoffMs *= 2;
        }
    }

    std::vector<std::unique_ptr<SqliteConnection>> readers;
    try {
        for (int i = 0; i < m_readerCount; ++i) {
            readers.push_back(std::make_unique<SqliteConnection>(m_databasePath, true));
        }
    } catch (const PersistenceError&) {
        m_writer.reset();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_readerMutex);
        m_idleReaders = std::move(readers);
        m_connectionCount.store(1 + m_readerCount);
        m_isOpen.store(true);
    }

    LOG_INFO("Persistence", "Opened store " + m_databasePath.toStdString() + " with " +
             std::to_string(m_readerCount) + " readers");
}

void PersistenceCoordinator::close()
{
    std::lock_guard<std::mutex> writerLock(m_writerMutex);
    if (!m_isOpen.load()) {
        return;
    }

    int dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_readerMutex);
        m_isOpen.store(false);
        dropped = static_cast<int>(m_idleReaders.size());
        m_idleReaders.clear();
    }
    m_readerAvailable.notify_all();

    m_writer.reset();
    m_connectionCount.fetch_sub(dropped + 1);
    LOG_INFO("Persistence", "Closed store " + m_databasePath.toStdString());
}

bool PersistenceCoordinator::isOpen() const
{
    return m_isOpen.load();
}

void PersistenceCoordinator::createSchema()
{
    SqliteTransaction transaction(*m_writer);
    for (const char* statement : kSchema) {
        m_writer->exec(statement);
    }
    transaction.commit();
}

// ============================================================================
// Chunk lifecycle
// ============================================================================

RecordingChunk PersistenceCoordinator::readChunk(const SqliteStatement& stmt)
{
    RecordingChunk chunk;
    chunk.id = stmt.columnInt64(0);
    chunk.fileRef = stmt.columnText(1);
    chunk.startTs = stmt.columnInt64(2);
    chunk.endTs = stmt.columnInt64(3);
    chunk.status = statusFromName(stmt.columnText(4));
    return chunk;
}

qint64 PersistenceCoordinator::registerChunk(const QString& fileRef, qint64 startTs, qint64 endTs)
{
    PERF_TIMER_WARN("Persistence::registerChunk", "Persistence", SLOW_OPERATION_MS);

    if (startTs > endTs) {
        throw PersistenceError(PersistenceError::Code::ConstraintViolation,
                               "Chunk start " + std::to_string(startTs) + " is after end " + std::to_string(endTs));
    }

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteConnection& db = writer();

    SqliteStatement stmt(db.handle(),
                         "INSERT INTO chunks (start_ts, end_ts, file_url, status) VALUES (?, ?, ?, 'pending')");
    stmt.bind(1, startTs);
    stmt.bind(2, endTs);
    stmt.bind(3, fileRef);
    stmt.step();

    qint64 id = db.lastInsertRowId();
    LOG_DEBUG("Persistence", "Registered chunk " + chunkIdText(id) + " " + fileRef.toStdString());
    return id;
}

void PersistenceCoordinator::requirePendingChunk(qint64 chunkId, const char* operation)
{
    SqliteStatement stmt(writer().handle(), "SELECT status FROM chunks WHERE id = ?");
    stmt.bind(1, chunkId);
    if (!stmt.step()) {
        throw PersistenceError(PersistenceError::Code::ChunkNotFound,
                               std::string(operation) + ": chunk " + chunkIdText(chunkId) + " not found");
    }

    QString status = stmt.columnText(0);
    if (status != "pending") {
        throw PersistenceError(PersistenceError::Code::InvalidTransition,
                               std::string(operation) + ": chunk " + chunkIdText(chunkId) + " is " +
                               status.toStdString() + ", expected pending");
    }
}

void PersistenceCoordinator::markCompleted(qint64 chunkId)
{
    PERF_TIMER_WARN("Persistence::markCompleted", "Persistence", SLOW_OPERATION_MS);

    std::lock_guard<std::mutex> lock(m_writerMutex);
    requirePendingChunk(chunkId, "markCompleted");

    SqliteStatement stmt(writer().handle(),
                         "UPDATE chunks SET status = 'completed' WHERE id = ? AND status = 'pending'");
    stmt.bind(1, chunkId);
    stmt.step();
}

void PersistenceCoordinator::markFailed(qint64 chunkId)
{
    PERF_TIMER_WARN("Persistence::markFailed", "Persistence", SLOW_OPERATION_MS);

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteConnection& db = writer();
    requirePendingChunk(chunkId, "markFailed");

    QString fileRef;
    {
        SqliteStatement select(db.handle(), "SELECT file_url FROM chunks WHERE id = ?");
        select.bind(1, chunkId);
        if (select.step()) {
            fileRef = select.columnText(0);
        }
    }

    SqliteTransaction transaction(db);
    SqliteStatement remove(db.handle(), "DELETE FROM chunks WHERE id = ? AND status = 'pending'");
    remove.bind(1, chunkId);
    remove.step();
    transaction.commit();

    if (!fileRef.isEmpty() && QFile::exists(fileRef) && !QFile::remove(fileRef)) {
        LOG_WARNING("Persistence", "Failed chunk " + chunkIdText(chunkId) + " record deleted but file remains: " +
                    fileRef.toStdString());
    }
    LOG_INFO("Persistence", "Discarded failed chunk " + chunkIdText(chunkId));
}

void PersistenceCoordinator::updateChunkSpan(qint64 chunkId, qint64 endTs, const QString& fileRef)
{
    PERF_TIMER_WARN("Persistence::updateChunkSpan", "Persistence", SLOW_OPERATION_MS);

    std::lock_guard<std::mutex> lock(m_writerMutex);
    requirePendingChunk(chunkId, "updateChunkSpan");

    SqliteStatement stmt(writer().handle(),
                         "UPDATE chunks SET end_ts = ?, file_url = ? WHERE id = ? AND status = 'pending'");
    stmt.bind(1, endTs);
    stmt.bind(2, fileRef);
    stmt.bind(3, chunkId);
    stmt.step();
}

std::optional<RecordingChunk> PersistenceCoordinator::chunkById(qint64 chunkId) const
{
    PERF_TIMER_WARN("Persistence::chunkById", "Persistence", SLOW_OPERATION_MS);

    ReaderLease reader = checkoutReader();
    SqliteStatement stmt(reader->handle(),
                         (std::string("SELECT ") + kChunkColumns + " FROM chunks WHERE id = ?").c_str());
    stmt.bind(1, chunkId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readChunk(stmt);
}

std::vector<RecordingChunk> PersistenceCoordinator::fetchChunksInRange(qint64 startTs, qint64 endTs) const
{
    PERF_TIMER_WARN("Persistence::fetchChunksInRange", "Persistence", SLOW_OPERATION_MS);

    ReaderLease reader = checkoutReader();
    SqliteStatement stmt(reader->handle(),
                         (std::string("SELECT ") + kChunkColumns +
                          " FROM chunks WHERE end_ts > ? AND start_ts < ? ORDER BY start_ts").c_str());
    stmt.bind(1, startTs);
    stmt.bind(2, endTs);

    std::vector<RecordingChunk> chunks;
    while (stmt.step()) {
        chunks.push_back(readChunk(stmt));
    }
    return chunks;
}

std::vector<RecordingChunk> PersistenceCoordinator::fetchUnprocessedChunks(qint64 oldestAllowedTs) const
{
    PERF_TIMER_WARN("Persistence::fetchUnprocessedChunks", "Persistence", SLOW_OPERATION_MS);

    ReaderLease reader = checkoutReader();
    SqliteStatement stmt(reader->handle(),
                         (std::string("SELECT ") + kChunkColumns +
                          " FROM chunks WHERE start_ts >= ? AND status = 'completed'"
                          " AND id NOT IN (SELECT chunk_id FROM batch_chunks)"
                          " ORDER BY start_ts ASC").c_str());
    stmt.bind(1, oldestAllowedTs);

    std::vector<RecordingChunk> chunks;
    while (stmt.step()) {
        chunks.push_back(readChunk(stmt));
    }
    return chunks;
}

// ============================================================================
// Batches and timeline cards
// ============================================================================

std::optional<qint64> PersistenceCoordinator::saveBatch(qint64 startTs, qint64 endTs,
                                                        const std::vector<qint64>& chunkIds)
{
    PERF_TIMER_WARN("Persistence::saveBatch", "Persistence", SLOW_OPERATION_MS);

    if (chunkIds.empty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteConnection& db = writer();
    SqliteTransaction transaction(db);

    SqliteStatement insertBatch(db.handle(),
                                "INSERT INTO analysis_batches (batch_start_ts, batch_end_ts, status) "
                                "VALUES (?, ?, 'pending')");
    insertBatch.bind(1, startTs);
    insertBatch.bind(2, endTs);
    insertBatch.step();
    qint64 batchId = db.lastInsertRowId();

    SqliteStatement exists(db.handle(), "SELECT 1 FROM chunks WHERE id = ?");
    SqliteStatement link(db.handle(), "INSERT INTO batch_chunks (batch_id, chunk_id) VALUES (?, ?)");
    for (qint64 chunkId : chunkIds) {
        exists.reset();
        exists.bind(1, chunkId);
        if (!exists.step()) {
            LOG_WARNING("Persistence", "saveBatch rolled back: chunk " + chunkIdText(chunkId) + " not found");
            throw PersistenceError(PersistenceError::Code::ChunkNotFound,
                                   "saveBatch: chunk " + chunkIdText(chunkId) + " not found");
        }

        link.reset();
        link.bind(1, batchId);
        link.bind(2, chunkId);
        link.step();
    }

    transaction.commit();
    LOG_INFO("Persistence", "Saved batch " + std::to_string(batchId) + " with " +
             std::to_string(chunkIds.size()) + " chunks");
    return batchId;
}

void PersistenceCoordinator::updateBatchStatus(qint64 batchId, const QString& status, const QString& reason)
{
    PERF_TIMER_WARN("Persistence::updateBatchStatus", "Persistence", SLOW_OPERATION_MS);

    static const QStringList validStatuses = {"pending", "processing", "completed", "failed"};
    if (!validStatuses.contains(status)) {
        throw PersistenceError(PersistenceError::Code::ConstraintViolation,
                               "Unknown batch status: " + status.toStdString());
    }

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteConnection& db = writer();
    SqliteStatement stmt(db.handle(), "UPDATE analysis_batches SET status = ?, reason = ? WHERE id = ?");
    stmt.bind(1, status);
    if (reason.isEmpty()) {
        stmt.bindNull(2);
    } else {
        stmt.bind(2, reason);
    }
    stmt.bind(3, batchId);
    stmt.step();

    if (db.changes() == 0) {
        throw PersistenceError(PersistenceError::Code::BatchNotFound,
                               "updateBatchStatus: batch " + std::to_string(batchId) + " not found");
    }
}

std::optional<AnalysisBatch> PersistenceCoordinator::batchById(qint64 batchId) const
{
    PERF_TIMER_WARN("Persistence::batchById", "Persistence", SLOW_OPERATION_MS);

    ReaderLease reader = checkoutReader();
    SqliteStatement stmt(reader->handle(),
                         "SELECT id, batch_start_ts, batch_end_ts, status, reason FROM analysis_batches WHERE id = ?");
    stmt.bind(1, batchId);
    if (!stmt.step()) {
        return std::nullopt;
    }

    AnalysisBatch batch;
    batch.id = stmt.columnInt64(0);
    batch.startTs = stmt.columnInt64(1);
    batch.endTs = stmt.columnInt64(2);
    batch.status = stmt.columnText(3);
    batch.reason = stmt.columnText(4);

    SqliteStatement members(reader->handle(),
                            "SELECT bc.chunk_id FROM batch_chunks bc JOIN chunks c ON c.id = bc.chunk_id "
                            "WHERE bc.batch_id = ? ORDER BY c.start_ts");
    members.bind(1, batchId);
    while (members.step()) {
        batch.chunkIds.push_back(members.columnInt64(0));
    }
    return batch;
}

std::vector<RecordingChunk> PersistenceCoordinator::chunksForBatch(qint64 batchId) const
{
    PERF_TIMER_WARN("Persistence::chunksForBatch", "Persistence", SLOW_OPERATION_MS);

    ReaderLease reader = checkoutReader();
    SqliteStatement stmt(reader->handle(),
                         "SELECT c.id, c.file_url, c.start_ts, c.end_ts, c.status FROM batch_chunks bc "
                         "JOIN chunks c ON c.id = bc.chunk_id WHERE bc.batch_id = ? ORDER BY c.start_ts");
    stmt.bind(1, batchId);

    std::vector<RecordingChunk> chunks;
    while (stmt.step()) {
        chunks.push_back(readChunk(stmt));
    }
    return chunks;
}

qint64 PersistenceCoordinator::saveTimelineCard(const TimelineCard& card)
{
    PERF_TIMER_WARN("Persistence::saveTimelineCard", "Persistence", SLOW_OPERATION_MS);

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteConnection& db = writer();
    SqliteStatement stmt(db.handle(),
                         "INSERT INTO timeline_cards (batch_id, start_ts, end_ts, title, summary, video_summary_url) "
                         "VALUES (?, ?, ?, ?, ?, ?)");
    if (card.batchId > 0) {
        stmt.bind(1, card.batchId);
    } else {
        stmt.bindNull(1);
    }
    stmt.bind(2, card.startTs);
    stmt.bind(3, card.endTs);
    stmt.bind(4, card.title);
    stmt.bind(5, card.summary);
    if (card.videoSummaryRef) {
        stmt.bind(6, *card.videoSummaryRef);
    } else {
        stmt.bindNull(6);
    }
    stmt.step();
    return db.lastInsertRowId();
}

std::optional<TimelineCard> PersistenceCoordinator::timelineCardById(qint64 cardId) const
{
    PERF_TIMER_WARN("Persistence::timelineCardById", "Persistence", SLOW_OPERATION_MS);

    ReaderLease reader = checkoutReader();
    SqliteStatement stmt(reader->handle(),
                         "SELECT id, batch_id, start_ts, end_ts, title, summary, video_summary_url "
                         "FROM timeline_cards WHERE id = ?");
    stmt.bind(1, cardId);
    if (!stmt.step()) {
        return std::nullopt;
    }

    TimelineCard card;
    card.id = stmt.columnInt64(0);
    card.batchId = stmt.columnIsNull(1) ? 0 : stmt.columnInt64(1);
    card.startTs = stmt.columnInt64(2);
    card.endTs = stmt.columnInt64(3);
    card.title = stmt.columnText(4);
    card.summary = stmt.columnText(5);
    if (!stmt.columnIsNull(6)) {
        card.videoSummaryRef = stmt.columnText(6);
    }
    return card;
}

// ============================================================================
// Retention
// ============================================================================

CleanupStats PersistenceCoordinator::cleanupOldChunks(int retentionDays, std::optional<qint64> nowTs)
{
    PERF_TIMER_WARN("Persistence::cleanupOldChunks", "Persistence", SLOW_OPERATION_MS);

    if (retentionDays < 1) {
        throw std::invalid_argument("cleanupOldChunks: retentionDays must be at least 1, got " +
                                    std::to_string(retentionDays));
    }

    qint64 now = nowTs.value_or(QDateTime::currentSecsSinceEpoch());
    qint64 cutoff = now - static_cast<qint64>(retentionDays) * kSecondsPerDay;

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteConnection& db = writer();

    std::vector<RecordingChunk> expired;
    {
        SqliteStatement select(db.handle(),
                               (std::string("SELECT ") + kChunkColumns +
                                " FROM chunks WHERE end_ts < ? ORDER BY start_ts").c_str());
        select.bind(1, cutoff);
        while (select.step()) {
            expired.push_back(readChunk(select));
        }
    }

    CleanupStats stats;
    stats.chunksFound = static_cast<int>(expired.size());
    if (expired.empty()) {
        return stats;
    }

    // Records go first; files are only touched once the deletion is committed
    struct Removal {
        const RecordingChunk* chunk;
        bool fileExists;
        qint64 size;
    };
    std::vector<Removal> removals;
    for (const RecordingChunk& chunk : expired) {
        QFileInfo info(chunk.fileRef);
        if (!info.exists()) {
            LOG_WARNING("Persistence", "Chunk file already missing: " + chunk.fileRef.toStdString());
            removals.push_back({&chunk, false, 0});
            continue;
        }
        if (!QFileInfo(info.absolutePath()).isWritable()) {
            // Keep the record so the next pass retries the file
            LOG_ERROR("Persistence", "Cannot delete chunk file in read-only directory: " + chunk.fileRef.toStdString());
            continue;
        }
        removals.push_back({&chunk, true, info.size()});
    }

    {
        SqliteTransaction transaction(db);
        SqliteStatement unlink(db.handle(), "DELETE FROM batch_chunks WHERE chunk_id = ?");
        SqliteStatement detach(db.handle(),
                               "UPDATE timeline_cards SET video_summary_url = NULL WHERE video_summary_url = ?");
        SqliteStatement remove(db.handle(), "DELETE FROM chunks WHERE id = ?");
        int deleted = 0;
        for (const Removal& removal : removals) {
            unlink.reset();
            unlink.bind(1, removal.chunk->id);
            unlink.step();

            detach.reset();
            detach.bind(1, removal.chunk->fileRef);
            detach.step();

            remove.reset();
            remove.bind(1, removal.chunk->id);
            remove.step();
            deleted += db.changes();
        }
        transaction.commit();
        stats.recordsDeleted = deleted;
    }

    for (const Removal& removal : removals) {
        if (!removal.fileExists) {
            continue;
        }
        if (QFile::remove(removal.chunk->fileRef)) {
            stats.filesDeleted++;
            stats.bytesFreed += removal.size;
        } else {
            // Unreferenced now; recoverChunksFromDirectory picks it up on the next start
            LOG_ERROR("Persistence", "Could not delete chunk file: " + removal.chunk->fileRef.toStdString());
        }
    }

    LOG_INFO("Persistence", "Cleanup removed " + std::to_string(stats.recordsDeleted) + " chunks, " +
             std::to_string(stats.filesDeleted) + " files, " + std::to_string(stats.bytesFreed / (1024 * 1024)) +
             " MB freed");
    return stats;
}

qint64 PersistenceCoordinator::totalChunkBytes() const
{
    PERF_TIMER_WARN("Persistence::totalChunkBytes", "Persistence", SLOW_OPERATION_MS);

    ReaderLease reader = checkoutReader();
    SqliteStatement stmt(reader->handle(), "SELECT file_url FROM chunks");

    qint64 total = 0;
    while (stmt.step()) {
        QFileInfo info(stmt.columnText(0));
        if (info.exists()) {
            total += info.size();
        }
    }
    return total;
}

int PersistenceCoordinator::recoverChunksFromDirectory(const QString& directory)
{
    PERF_TIMER_WARN("Persistence::recoverChunksFromDirectory", "Persistence", SLOW_OPERATION_MS);

    QDir dir(directory);
    if (!dir.exists()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteConnection& db = writer();
    SqliteTransaction transaction(db);

    SqliteStatement known(db.handle(), "SELECT 1 FROM chunks WHERE file_url = ?");
    SqliteStatement insert(db.handle(),
                           "INSERT INTO chunks (start_ts, end_ts, file_url, status) VALUES (?, ?, ?, 'completed')");

    int recovered = 0;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files, QDir::Name);
    for (const QFileInfo& entry : entries) {
        std::optional<ChunkTimeRange> range = ChunkFileName::parse(entry.fileName());
        if (!range) {
            continue;
        }

        QString fileRef = entry.absoluteFilePath();
        known.reset();
        known.bind(1, fileRef);
        if (known.step()) {
            continue;
        }

        if (entry.size() == 0) {
            LOG_WARNING("Persistence", "Skipping empty orphaned chunk file " + fileRef.toStdString());
            continue;
        }

        insert.reset();
        insert.bind(1, range->startTs);
        insert.bind(2, range->endTs);
        insert.bind(3, fileRef);
        insert.step();
        recovered++;
    }

    transaction.commit();
    if (recovered > 0) {
        LOG_INFO("Persistence", "Recovered " + std::to_string(recovered) + " orphaned chunk files from " +
                 directory.toStdString());
    }
    return recovered;
}

// ============================================================================
// Settings
// ============================================================================

void PersistenceCoordinator::saveSetting(const QString& key, const QJsonValue& value)
{
    PERF_TIMER_WARN("Persistence::saveSetting", "Persistence", SLOW_OPERATION_MS);

    QJsonObject wrapper;
    wrapper["value"] = value;
    QString encoded = QString::fromUtf8(QJsonDocument(wrapper).toJson(QJsonDocument::Compact));

    std::lock_guard<std::mutex> lock(m_writerMutex);
    SqliteStatement stmt(writer().handle(),
                         "INSERT INTO settings (key, value, updated_at) VALUES (?, ?, ?) "
                         "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at");
    stmt.bind(1, key);
    stmt.bind(2, encoded);
    stmt.bind(3, QDateTime::currentSecsSinceEpoch());
    stmt.step();
}

QJsonValue PersistenceCoordinator::loadSetting(const QString& key, const QJsonValue& defaultValue) const
{
    PERF_TIMER_WARN("Persistence::loadSetting", "Persistence", SLOW_OPERATION_MS);

    QString encoded;
    {
        ReaderLease reader = checkoutReader();
        SqliteStatement stmt(reader->handle(), "SELECT value FROM settings WHERE key = ?");
        stmt.bind(1, key);
        if (!stmt.step()) {
            return defaultValue;
        }
        encoded = stmt.columnText(0);
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(encoded.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject() || !doc.object().contains("value")) {
        LOG_WARNING("Persistence", "Setting '" + key.toStdString() + "' is not decodable, using default");
        return defaultValue;
    }
    return doc.object().value("value");
}
