#include "progressstore.h"

#include <algorithm>

#include "utils/logging.h"

ProgressStore::ProgressStore(QObject *parent)
    : QAbstractListModel(parent)
{
}

ProgressStore::~ProgressStore() = default;

QString ProgressStore::internalIdFor(const QString &downloadId, DownloadStage stage)
{
    if (stage == DownloadStage::None) {
        return downloadId;
    }
    return downloadId + QLatin1Char(':') + stageToString(stage);
}

int ProgressStore::findIndex(const QString &internalId) const
{
    for (int i = 0; i < entries_.size(); ++i) {
        if (entries_[i].entry.internalId == internalId) {
            return i;
        }
    }
    return -1;
}

bool ProgressStore::ingest(const ProgressEntry &event)
{
    if (event.downloadId.isEmpty()) {
        qWarning() << "ProgressStore: Ignoring progress event without downloadId";
        return false;
    }

    ProgressEntry incoming = event;
    incoming.internalId = internalIdFor(event.downloadId, event.stage);

    int idx = findIndex(incoming.internalId);
    if (idx < 0) {
        beginInsertRows(QModelIndex(), entries_.size(), entries_.size());
        entries_.append({incoming, nextSequence_++});
        endInsertRows();
        emit progressChanged(incoming.downloadId);
        return true;
    }

    StoredEntry &stored = entries_[idx];

    // Keep the batch link once known, late events may arrive without it
    if (incoming.parentId.isEmpty()) {
        incoming.parentId = stored.entry.parentId;
    }

    if (stored.entry == incoming) {
        return false;
    }

    // A completed stage never moves backwards
    if (stored.entry.isComplete) {
        if (!incoming.isComplete || incoming.percentage < stored.entry.percentage) {
            LOG_VERBOSE() << "ProgressStore: Dropping stale event for" << incoming.internalId;
            return false;
        }
    }

    stored.entry = incoming;
    stored.sequence = nextSequence_++;

    QModelIndex modelIndex = index(idx);
    emit dataChanged(modelIndex, modelIndex);
    emit progressChanged(incoming.downloadId);
    return true;
}

QList<ProgressEntry> ProgressStore::entriesFor(const QString &downloadId) const
{
    QList<ProgressEntry> result;
    for (const StoredEntry &stored : entries_) {
        if (stored.entry.downloadId == downloadId) {
            result.append(stored.entry);
        }
    }
    return result;
}

std::optional<ProgressEntry> ProgressStore::entry(const QString &downloadId,
                                                  DownloadStage stage) const
{
    int idx = findIndex(internalIdFor(downloadId, stage));
    if (idx < 0) {
        return std::nullopt;
    }
    return entries_[idx].entry;
}

int ProgressStore::stageRank(DownloadStage stage)
{
    switch (stage) {
    case DownloadStage::Video:
    case DownloadStage::Audio:
        return 1;
    case DownloadStage::Merge:
        return 2;
    case DownloadStage::Complete:
        return 3;
    case DownloadStage::None:
    case DownloadStage::WarnVideoQualityFallback:
    case DownloadStage::WarnAudioQualityFallback:
        return 0;
    }
    return 0;
}

double ProgressStore::stageWeight(DownloadStage stage)
{
    switch (stage) {
    case DownloadStage::Video:
        return VideoStageWeight;
    case DownloadStage::Audio:
        return AudioStageWeight;
    case DownloadStage::Merge:
        return MergeStageWeight;
    default:
        return 0.0;
    }
}

DownloadStage ProgressStore::currentStage(const QString &downloadId) const
{
    DownloadStage best = DownloadStage::None;
    int bestRank = 0;
    quint64 bestSequence = 0;

    for (const StoredEntry &stored : entries_) {
        if (stored.entry.downloadId != downloadId) {
            continue;
        }
        int rank = stageRank(stored.entry.stage);
        if (rank == 0) {
            continue;
        }
        if (rank > bestRank || (rank == bestRank && stored.sequence > bestSequence)) {
            best = stored.entry.stage;
            bestRank = rank;
            bestSequence = stored.sequence;
        }
    }
    return best;
}

double ProgressStore::childRatio(const QString &downloadId) const
{
    const QList<ProgressEntry> entries = entriesFor(downloadId);

    std::optional<double> stagelessRatio;
    double weighted = 0.0;
    double totalDownloaded = 0.0;
    double totalFilesize = 0.0;
    bool sawStage = false;

    for (const ProgressEntry &e : entries) {
        if (isWarningStage(e.stage)) {
            continue;
        }

        // Terminal observation: the child is done whatever else was seen
        if (e.stage == DownloadStage::Complete
            || (e.isComplete && (e.stage == DownloadStage::Merge || e.stage == DownloadStage::None))) {
            return 1.0;
        }

        if (e.hasByteTotals()) {
            totalDownloaded += *e.downloaded;
            totalFilesize += *e.filesize;
        }

        if (e.stage == DownloadStage::None) {
            stagelessRatio = std::clamp(e.percentage / 100.0, 0.0, 1.0);
            continue;
        }

        sawStage = true;
        weighted += stageWeight(e.stage);
    }

    // Byte totals give the exact ratio; stage weights only stand in without them
    if (totalFilesize > 0.0) {
        return std::clamp(totalDownloaded / totalFilesize, 0.0, 1.0);
    }
    if (!sawStage) {
        return stagelessRatio.value_or(0.0);
    }
    return std::clamp(weighted, 0.0, 1.0);
}

QStringList ProgressStore::childrenOf(const QString &parentId) const
{
    QStringList children;
    if (parentId.isEmpty()) {
        return children;
    }
    for (const StoredEntry &stored : entries_) {
        if (stored.entry.parentId == parentId && !children.contains(stored.entry.downloadId)) {
            children.append(stored.entry.downloadId);
        }
    }
    return children;
}

double ProgressStore::aggregateParent(const QString &parentId) const
{
    const QStringList children = childrenOf(parentId);
    if (children.isEmpty()) {
        return 0.0;
    }

    double sum = 0.0;
    for (const QString &child : children) {
        sum += childRatio(child);
    }
    return std::clamp(sum / children.size(), 0.0, 1.0);
}

void ProgressStore::clearFor(const QString &downloadId)
{
    bool removed = false;
    for (int i = entries_.size() - 1; i >= 0; --i) {
        if (entries_[i].entry.downloadId == downloadId) {
            beginRemoveRows(QModelIndex(), i, i);
            entries_.removeAt(i);
            endRemoveRows();
            removed = true;
        }
    }
    if (removed) {
        emit progressChanged(downloadId);
    }
}

void ProgressStore::clearAll()
{
    if (entries_.isEmpty()) {
        return;
    }
    beginResetModel();
    entries_.clear();
    endResetModel();
    emit progressCleared();
}

int ProgressStore::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return entries_.size();
}

QVariant ProgressStore::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= entries_.size()) {
        return QVariant();
    }

    const ProgressEntry &e = entries_.at(index.row()).entry;

    switch (role) {
    case Qt::DisplayRole:
        return QStringLiteral("%1 %2%").arg(e.internalId).arg(e.percentage, 0, 'f', 0);
    case DownloadIdRole:
        return e.downloadId;
    case ParentIdRole:
        return e.parentId;
    case InternalIdRole:
        return e.internalId;
    case StageRole:
        return stageToString(e.stage);
    case PercentageRole:
        return e.percentage;
    case FilesizeRole:
        return e.filesize ? QVariant(*e.filesize) : QVariant();
    case DownloadedRole:
        return e.downloaded ? QVariant(*e.downloaded) : QVariant();
    case TransferRateRole:
        return e.transferRate;
    case ElapsedTimeRole:
        return e.elapsedTime;
    case IsCompleteRole:
        return e.isComplete;
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> ProgressStore::roleNames() const
{
    return {
        {DownloadIdRole, "downloadId"},
        {ParentIdRole, "parentId"},
        {InternalIdRole, "internalId"},
        {StageRole, "stage"},
        {PercentageRole, "percentage"},
        {FilesizeRole, "filesize"},
        {DownloadedRole, "downloaded"},
        {TransferRateRole, "transferRate"},
        {ElapsedTimeRole, "elapsedTime"},
        {IsCompleteRole, "isComplete"}
    };
}
