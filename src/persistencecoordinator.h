#ifndef PERSISTENCECOORDINATOR_H
#define PERSISTENCECOORDINATOR_H

#include <QString>
#include <QJsonValue>
#include <QMetaType>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "sqlitedatabase.h"

enum class ChunkStatus {
    Pending,
    Completed,
    Failed
};

struct RecordingChunk {
    qint64 id = 0;
    QString fileRef;
    qint64 startTs = 0;
    qint64 endTs = 0;
    ChunkStatus status = ChunkStatus::Pending;

    qint64 durationSeconds() const { return endTs - startTs; }
};

struct AnalysisBatch {
    qint64 id = 0;
    qint64 startTs = 0;
    qint64 endTs = 0;
    QString status;     // pending, processing, completed, failed
    QString reason;
    std::vector<qint64> chunkIds;
};

/**
 * Downstream summary record produced by the analysis consumer
 */
struct TimelineCard {
    qint64 id = 0;
    qint64 batchId = 0;
    qint64 startTs = 0;
    qint64 endTs = 0;
    QString title;
    QString summary;
    std::optional<QString> videoSummaryRef;
};

struct CleanupStats {
    int chunksFound = 0;
    int filesDeleted = 0;
    int recordsDeleted = 0;
    qint64 bytesFreed = 0;
};

Q_DECLARE_METATYPE(CleanupStats)

/**
 * Durable store for chunk, batch, summary and settings records.
 *
 * Mutations are serialized through a single writer connection; reads check out
 * one of several read-only connections and run concurrently with the writer.
 * Every write either commits fully or throws PersistenceError with the store
 * unchanged.
 */
class PersistenceCoordinator
{
public:
    static constexpr int DEFAULT_READER_COUNT = 4;
    static constexpr double SLOW_OPERATION_MS = 100.0;
    static constexpr int OPEN_ATTEMPTS = 4;
    static constexpr int OPEN_BACKOFF_MS = 100;

    explicit PersistenceCoordinator(const QString& databasePath, int readerCount = DEFAULT_READER_COUNT);
    ~PersistenceCoordinator();

    PersistenceCoordinator(const PersistenceCoordinator&) = delete;
    PersistenceCoordinator& operator=(const PersistenceCoordinator&) = delete;

    /**
     * Open the writer, create the schema and open the reader pool.
     * Retries with exponential backoff before giving up.
     * @throws PersistenceError(OpenFailed)
     */
    void open();
    void close();
    bool isOpen() const;

    QString databasePath() const { return m_databasePath; }

    // Chunk lifecycle
    qint64 registerChunk(const QString& fileRef, qint64 startTs, qint64 endTs);
    void markCompleted(qint64 chunkId);

    /**
     * Delete a pending chunk's record and its file.
     * @throws PersistenceError(ChunkNotFound | InvalidTransition)
     */
    void markFailed(qint64 chunkId);

    /**
     * Shorten a pending chunk whose segment closed before its planned end
     */
    void updateChunkSpan(qint64 chunkId, qint64 endTs, const QString& fileRef);

    std::optional<RecordingChunk> chunkById(qint64 chunkId) const;
    std::vector<RecordingChunk> fetchChunksInRange(qint64 startTs, qint64 endTs) const;

    /**
     * Completed chunks not yet assigned to a batch
     * @param oldestAllowedTs Chunks starting before this are skipped
     * @return Chunks ordered by start time
     */
    std::vector<RecordingChunk> fetchUnprocessedChunks(qint64 oldestAllowedTs) const;

    // Batches
    /**
     * Create a batch over the given chunks in one transaction
     * @return Batch id, or std::nullopt for an empty chunk list
     * @throws PersistenceError(ChunkNotFound) if any chunk is missing; nothing is written
     */
    std::optional<qint64> saveBatch(qint64 startTs, qint64 endTs, const std::vector<qint64>& chunkIds);
    void updateBatchStatus(qint64 batchId, const QString& status, const QString& reason = QString());
    std::optional<AnalysisBatch> batchById(qint64 batchId) const;
    std::vector<RecordingChunk> chunksForBatch(qint64 batchId) const;

    // Timeline cards
    qint64 saveTimelineCard(const TimelineCard& card);
    std::optional<TimelineCard> timelineCardById(qint64 cardId) const;

    // Retention
    /**
     * Delete chunks that ended before now - retentionDays.
     * Missing files are logged and do not block record deletion.
     * @throws std::invalid_argument if retentionDays < 1
     */
    CleanupStats cleanupOldChunks(int retentionDays, std::optional<qint64> nowTs = std::nullopt);
    qint64 totalChunkBytes() const;

    /**
     * Register chunk files in a directory that have no record, as completed
     * @return Number of chunks recovered
     */
    int recoverChunksFromDirectory(const QString& directory);

    // Settings
    void saveSetting(const QString& key, const QJsonValue& value);
    QJsonValue loadSetting(const QString& key, const QJsonValue& defaultValue = QJsonValue()) const;

    /**
     * Open connections (writer plus idle and checked-out readers). Lock-free.
     */
    int connectionCount() const { return m_connectionCount.load(std::memory_order_relaxed); }

    static QString statusName(ChunkStatus status);
    static ChunkStatus statusFromName(const QString& name);

private:
    class ReaderLease
    {
    public:
        ReaderLease(const PersistenceCoordinator& owner, std::unique_ptr<SqliteConnection> connection);
        ~ReaderLease();
        SqliteConnection& operator*() const { return *m_connection; }
        SqliteConnection* operator->() const { return m_connection.get(); }

    private:
        const PersistenceCoordinator& m_owner;
        std::unique_ptr<SqliteConnection> m_connection;
    };

    void createSchema();
    SqliteConnection& writer();
    ReaderLease checkoutReader() const;
    void returnReader(std::unique_ptr<SqliteConnection> connection) const;

    void requirePendingChunk(qint64 chunkId, const char* operation);
    static RecordingChunk readChunk(const SqliteStatement& stmt);

    QString m_databasePath;
    int m_readerCount;

    std::unique_ptr<SqliteConnection> m_writer;
    std::mutex m_writerMutex;

    mutable std::vector<std::unique_ptr<SqliteConnection>> m_idleReaders;
    mutable std::mutex m_readerMutex;
    mutable std::condition_variable m_readerAvailable;

    mutable std::atomic<int> m_connectionCount{0};
    std::atomic<bool> m_isOpen{false};
};

#endif // PERSISTENCECOORDINATOR_H
