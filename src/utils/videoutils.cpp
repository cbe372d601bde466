#include "videoutils.h"

#include <QHash>
#include <QRegularExpression>

namespace {

const QHash<int, QString> &videoQualityLabels()
{
    static const QHash<int, QString> labels = {
        {116, QStringLiteral("1080p60")},
        {74, QStringLiteral("720p60")},
        {112, QStringLiteral("1080p+")},
        {80, QStringLiteral("1080p")},
        {64, QStringLiteral("720p")},
        {32, QStringLiteral("480p")},
        {16, QStringLiteral("360p")},
    };
    return labels;
}

const QHash<int, QString> &audioQualityLabels()
{
    static const QHash<int, QString> labels = {
        {30216, QStringLiteral("64K")},
        {30232, QStringLiteral("132K")},
        {30280, QStringLiteral("192K")},
        {30250, QStringLiteral("Dolby Atmos")},
        {30251, QStringLiteral("Hi-Res Lossless")},
    };
    return labels;
}

} // namespace

namespace VideoUtils {

QString extractVideoId(const QString &url)
{
    static const QRegularExpression re(QStringLiteral("/video/([a-zA-Z0-9]+)"));
    QRegularExpressionMatch match = re.match(url);
    return match.hasMatch() ? match.captured(1) : QString();
}

QString normalizeFilename(const QString &name)
{
    QString result = name.trimmed().toCaseFolded();
    for (const char *c = ForbiddenFilenameChars; *c; ++c) {
        result.remove(QLatin1Char(*c));
    }
    return result;
}

bool containsForbiddenChars(const QString &name)
{
    for (const char *c = ForbiddenFilenameChars; *c; ++c) {
        if (name.contains(QLatin1Char(*c))) {
            return true;
        }
    }
    return name.contains(QChar(0));
}

QList<int> duplicateIndices(const QStringList &titles, const QList<int> &considered)
{
    // Preserve first-occurrence order of each group
    QStringList order;
    QHash<QString, QList<int>> groups;

    for (int i = 0; i < titles.size(); ++i) {
        if (!considered.isEmpty() && !considered.contains(i)) {
            continue;
        }
        QString key = normalizeFilename(titles.at(i));
        if (!groups.contains(key)) {
            order.append(key);
        }
        groups[key].append(i);
    }

    QList<int> result;
    for (const QString &key : order) {
        const QList<int> &group = groups.value(key);
        if (group.size() > 1) {
            result.append(group);
        }
    }
    return result;
}

int partOrdinalFromDownloadId(const QString &downloadId)
{
    static const QRegularExpression re(QStringLiteral("-p(\\d+)$"));
    QRegularExpressionMatch match = re.match(downloadId);
    if (!match.hasMatch()) {
        return -1;
    }
    bool ok = false;
    int ordinal = match.captured(1).toInt(&ok);
    return ok ? ordinal : -1;
}

QString videoQualityLabel(int qualityId)
{
    return videoQualityLabels().value(qualityId, QString::number(qualityId));
}

QString audioQualityLabel(int qualityId)
{
    return audioQualityLabels().value(qualityId, QString::number(qualityId));
}

const QList<int> &audioQualityOrder()
{
    // Hi-Res Lossless > Dolby Atmos > 192K > 132K > 64K
    static const QList<int> order = {30251, 30250, 30280, 30232, 30216};
    return order;
}

} // namespace VideoUtils
