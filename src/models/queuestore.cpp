#include "queuestore.h"

#include "utils/logging.h"
#include "utils/videoutils.h"

QueueStore::QueueStore(ProgressStore *progress, QObject *parent)
    : QAbstractListModel(parent)
    , progress_(progress)
{
}

QueueStore::~QueueStore() = default;

int QueueStore::indexOf(const QString &downloadId) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].downloadId == downloadId) {
            return i;
        }
    }
    return -1;
}

void QueueStore::setStatus(int row, QueueItem::Status status)
{
    QueueItem &target = items_[row];
    if (target.status == status) {
        return;
    }

    LOG_VERBOSE() << "QueueStore:" << target.downloadId << queueStatusToString(target.status)
                  << "->" << queueStatusToString(status);
    target.status = status;
    if (status != QueueItem::Status::Error) {
        target.errorMessage.clear();
    }

    // Copies, listeners may modify the queue
    const QString downloadId = target.downloadId;
    const QString parentId = target.parentId;

    QModelIndex modelIndex = index(row);
    emit dataChanged(modelIndex, modelIndex);
    emit itemStatusChanged(downloadId);

    if (!parentId.isEmpty()) {
        refreshParent(parentId);
    }
}

void QueueStore::refreshParent(const QString &parentId)
{
    int parentRow = indexOf(parentId);
    if (parentRow < 0) {
        return;
    }

    bool anyError = false;
    bool anyRunning = false;
    bool anyCancelling = false;
    bool anyPending = false;
    bool anyDone = false;
    bool anyChild = false;
    QString firstError;

    for (const QueueItem &child : items_) {
        if (child.parentId != parentId) {
            continue;
        }
        anyChild = true;
        switch (child.status) {
        case QueueItem::Status::Error:
            if (!anyError) {
                firstError = child.errorMessage;
            }
            anyError = true;
            break;
        case QueueItem::Status::Running:
            anyRunning = true;
            break;
        case QueueItem::Status::Cancelling:
            anyCancelling = true;
            break;
        case QueueItem::Status::Pending:
            anyPending = true;
            break;
        case QueueItem::Status::Done:
            anyDone = true;
            break;
        case QueueItem::Status::Cancelled:
            break;
        }
    }

    // A batch without children keeps whatever it was given
    if (!anyChild) {
        return;
    }

    QueueItem::Status status;
    if (anyError) {
        status = QueueItem::Status::Error;
    } else if (anyRunning) {
        status = QueueItem::Status::Running;
    } else if (anyCancelling) {
        status = QueueItem::Status::Cancelling;
    } else if (anyPending) {
        status = QueueItem::Status::Pending;
    } else if (anyDone) {
        status = QueueItem::Status::Done;
    } else {
        status = QueueItem::Status::Cancelled;
    }

    setStatus(parentRow, status);
    parentRow = indexOf(parentId);
    if (parentRow >= 0 && status == QueueItem::Status::Error
        && items_[parentRow].errorMessage != firstError) {
        items_[parentRow].errorMessage = firstError;
        QModelIndex modelIndex = index(parentRow);
        emit dataChanged(modelIndex, modelIndex);
    }
}

bool QueueStore::enqueue(const QueueItem &item)
{
    if (item.downloadId.isEmpty()) {
        qWarning() << "QueueStore: Refusing to enqueue an item without downloadId";
        return false;
    }
    if (indexOf(item.downloadId) >= 0) {
        LOG_VERBOSE() << "QueueStore: Item already queued" << item.downloadId;
        return false;
    }

    QueueItem entry = item;
    entry.status = QueueItem::Status::Pending;
    entry.outputPath.clear();
    entry.errorMessage.clear();

    beginInsertRows(QModelIndex(), items_.size(), items_.size());
    items_.append(entry);
    endInsertRows();

    if (!entry.isParent()) {
        refreshParent(entry.parentId);
    }

    emit queueChanged();
    return true;
}

bool QueueStore::markObserved(const QString &downloadId)
{
    int row = indexOf(downloadId);
    if (row < 0 || items_[row].status != QueueItem::Status::Pending) {
        return false;
    }
    setStatus(row, QueueItem::Status::Running);
    emit queueChanged();
    return true;
}

void QueueStore::updateOnSuccess(const QString &downloadId, const QString &outputPath,
                                 const QString &title)
{
    int row = indexOf(downloadId);
    if (row < 0) {
        return;
    }

    QueueItem &target = items_[row];
    target.outputPath = outputPath;
    if (!title.isEmpty()) {
        target.title = title;
    }
    if (target.status == QueueItem::Status::Done) {
        QModelIndex modelIndex = index(row);
        emit dataChanged(modelIndex, modelIndex);
    } else {
        setStatus(row, QueueItem::Status::Done);
    }
    emit queueChanged();
}

bool QueueStore::markCompleted(const QString &downloadId)
{
    int row = indexOf(downloadId);
    if (row < 0) {
        return false;
    }

    QueueItem::Status current = items_[row].status;
    if (current == QueueItem::Status::Done || current == QueueItem::Status::Error
        || current == QueueItem::Status::Cancelled) {
        return false;
    }

    setStatus(row, QueueItem::Status::Done);
    emit queueChanged();
    return true;
}

void QueueStore::setError(const QString &downloadId, const QString &message)
{
    int row = indexOf(downloadId);
    if (row < 0) {
        return;
    }

    items_[row].errorMessage = message;
    if (items_[row].status == QueueItem::Status::Error) {
        QModelIndex modelIndex = index(row);
        emit dataChanged(modelIndex, modelIndex);
    } else {
        setStatus(row, QueueItem::Status::Error);
    }
    emit queueChanged();
}

bool QueueStore::requestCancel(const QString &downloadId)
{
    int row = indexOf(downloadId);
    if (row < 0) {
        return false;
    }

    QueueItem::Status current = items_[row].status;
    if (current != QueueItem::Status::Pending && current != QueueItem::Status::Running) {
        return false;
    }

    if (progress_ && progress_->currentStage(downloadId) == DownloadStage::Merge) {
        qInfo() << "QueueStore: Cannot cancel" << downloadId << "while merging";
        return false;
    }

    setStatus(row, QueueItem::Status::Cancelling);
    emit queueChanged();
    return true;
}

bool QueueStore::confirmCancelled(const QString &downloadId)
{
    int row = indexOf(downloadId);
    if (row < 0) {
        return false;
    }

    QueueItem::Status current = items_[row].status;
    if (current == QueueItem::Status::Done || current == QueueItem::Status::Cancelled) {
        return false;
    }

    setStatus(row, QueueItem::Status::Cancelled);
    emit queueChanged();
    return true;
}

void QueueStore::clear(const QString &downloadId)
{
    int row = indexOf(downloadId);
    if (row < 0) {
        return;
    }

    QString parentId = items_[row].parentId;

    beginRemoveRows(QModelIndex(), row, row);
    items_.removeAt(row);
    endRemoveRows();

    if (!parentId.isEmpty()) {
        refreshParent(parentId);
    }
    emit queueChanged();
}

void QueueStore::clearAll()
{
    beginResetModel();
    items_.clear();
    endResetModel();

    emit queueChanged();
}

std::optional<QueueItem> QueueStore::findCompletedForPart(int ordinal) const
{
    for (const QueueItem &entry : items_) {
        if (!entry.isParent() && entry.status == QueueItem::Status::Done
            && VideoUtils::partOrdinalFromDownloadId(entry.downloadId) == ordinal) {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<QueueItem> QueueStore::findForPart(int ordinal) const
{
    for (int i = items_.size() - 1; i >= 0; --i) {
        const QueueItem &entry = items_[i];
        if (!entry.isParent() && VideoUtils::partOrdinalFromDownloadId(entry.downloadId) == ordinal) {
            return entry;
        }
    }
    return std::nullopt;
}

bool QueueStore::hasActive() const
{
    for (const QueueItem &entry : items_) {
        if (entry.isActive()) {
            return true;
        }
    }
    return false;
}

std::optional<QueueItem> QueueStore::item(const QString &downloadId) const
{
    int row = indexOf(downloadId);
    if (row < 0) {
        return std::nullopt;
    }
    return items_[row];
}

QList<QueueItem> QueueStore::childrenOf(const QString &parentId) const
{
    QList<QueueItem> children;
    if (parentId.isEmpty()) {
        return children;
    }
    for (const QueueItem &entry : items_) {
        if (entry.parentId == parentId) {
            children.append(entry);
        }
    }
    return children;
}

int QueueStore::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return items_.size();
}

QVariant QueueStore::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= items_.size()) {
        return QVariant();
    }

    const QueueItem &entry = items_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case TitleRole:
        return entry.title;
    case DownloadIdRole:
        return entry.downloadId;
    case ParentIdRole:
        return entry.parentId;
    case FilenameRole:
        return entry.filename;
    case OutputPathRole:
        return entry.outputPath;
    case StatusRole:
        return QString::fromLatin1(queueStatusToString(entry.status));
    case ErrorMessageRole:
        return entry.errorMessage;
    case OrdinalRole:
        return entry.ordinal;
    case ProgressRole:
        if (!progress_) {
            return 0.0;
        }
        return entry.isParent() ? progress_->aggregateParent(entry.downloadId)
                                : progress_->childRatio(entry.downloadId);
    }

    return QVariant();
}

QHash<int, QByteArray> QueueStore::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[DownloadIdRole] = "downloadId";
    roles[ParentIdRole] = "parentId";
    roles[TitleRole] = "title";
    roles[FilenameRole] = "filename";
    roles[OutputPathRole] = "outputPath";
    roles[StatusRole] = "status";
    roles[ErrorMessageRole] = "errorMessage";
    roles[OrdinalRole] = "ordinal";
    roles[ProgressRole] = "progress";
    return roles;
}
