#ifndef CHUNKFILENAME_H
#define CHUNKFILENAME_H

#include <optional>
#include <QString>

struct ChunkTimeRange {
    qint64 startTs = 0;
    qint64 endTs = 0;
    QString extension;
};

/**
 * Chunk files are named "<startEpochSeconds>_<endEpochSeconds>.<ext>" so the
 * time range survives even if the database is rebuilt from the directory.
 */
class ChunkFileName
{
public:
    static QString format(qint64 startTs, qint64 endTs, const QString& extension = "mp4");

    /**
     * Parse a file name (directory components are ignored)
     * @param fileName File name or path
     * @return Time range, or std::nullopt if the name does not follow the convention
     */
    static std::optional<ChunkTimeRange> parse(const QString& fileName);
};

#endif // CHUNKFILENAME_H
