#include "chunkfilename.h"
#include <QFileInfo>
#include <QRegularExpression>

QString ChunkFileName::format(qint64 startTs, qint64 endTs, const QString& extension)
{
    return QString("%1_%2.%3").arg(startTs).arg(endTs).arg(extension);
}

std::optional<ChunkTimeRange> ChunkFileName::parse(const QString& fileName)
{
    static const QRegularExpression pattern("^(\\d{1,18})_(\\d{1,18})\\.([A-Za-z0-9]+)$");

    QRegularExpressionMatch match = pattern.match(QFileInfo(fileName).fileName());
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    bool startOk = false;
    bool endOk = false;
    ChunkTimeRange range;
    range.startTs = match.captured(1).toLongLong(&startOk);
    range.endTs = match.captured(2).toLongLong(&endOk);
    range.extension = match.captured(3);

    if (!startOk || !endOk || range.startTs > range.endTs) {
        return std::nullopt;
    }
    return range;
}
