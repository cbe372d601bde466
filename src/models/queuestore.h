#ifndef QUEUESTORE_H
#define QUEUESTORE_H

#include <QAbstractListModel>
#include <QList>
#include <QPointer>
#include <QString>

#include <optional>

#include "progressstore.h"

/**
 * @brief One record of the download queue.
 *
 * A batch is represented by a parent record (empty parentId) grouping the
 * per-part child records dispatched for it.
 */
struct QueueItem {
    enum class Status { Pending, Running, Done, Error, Cancelling, Cancelled };

    QString downloadId;
    QString parentId;      // Empty for the batch record itself
    QString title;
    QString filename;
    QString outputPath;    // Set only on success
    Status status = Status::Pending;
    QString errorMessage;  // Set only when status is Error
    int ordinal = 0;       // Part ordinal, 0 for batch records

    [[nodiscard]] bool isParent() const { return parentId.isEmpty(); }
    [[nodiscard]] bool isActive() const
    {
        return status == Status::Pending || status == Status::Running
            || status == Status::Cancelling;
    }
};

/// @brief Convert QueueItem::Status to its lower-case name
[[nodiscard]] inline const char* queueStatusToString(QueueItem::Status status) {
    switch (status) {
        case QueueItem::Status::Pending: return "pending";
        case QueueItem::Status::Running: return "running";
        case QueueItem::Status::Done: return "done";
        case QueueItem::Status::Error: return "error";
        case QueueItem::Status::Cancelling: return "cancelling";
        case QueueItem::Status::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Queue of parent and child download records.
 *
 * Every operation is synchronous and total: an unknown id is a no-op.
 * After each change to a child the status of its parent is recomputed from
 * its children (error > running > cancelling > pending > done/cancelled).
 */
class QueueStore : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        DownloadIdRole = Qt::UserRole + 1,
        ParentIdRole,
        TitleRole,
        FilenameRole,
        OutputPathRole,
        StatusRole,
        ErrorMessageRole,
        OrdinalRole,
        ProgressRole
    };

    /**
     * @brief Constructs the queue.
     * @param progress Progress store consulted for cancellation and the
     *        ProgressRole. Not owned.
     * @param parent Optional parent QObject.
     */
    explicit QueueStore(ProgressStore *progress, QObject *parent = nullptr);
    ~QueueStore() override;

    /**
     * @brief Inserts a record with status pending.
     * @return False if a record with the same id already exists.
     */
    bool enqueue(const QueueItem &item);

    /// Moves a pending record to running. Idempotent.
    bool markObserved(const QString &downloadId);

    void updateOnSuccess(const QString &downloadId, const QString &outputPath,
                         const QString &title);

    /**
     * @brief Marks a record done after a terminal progress event.
     *
     * Unlike updateOnSuccess() no output path is known. Records that already
     * failed or were cancelled keep their status.
     */
    bool markCompleted(const QString &downloadId);

    void setError(const QString &downloadId, const QString &message);

    /**
     * @brief Moves a pending or running record to cancelling.
     *
     * Refused while the download is merging, since the merge cannot be
     * interrupted once started.
     *
     * @return True if the record is now cancelling.
     */
    bool requestCancel(const QString &downloadId);

    bool confirmCancelled(const QString &downloadId);

    void clear(const QString &downloadId);
    void clearAll();

    /// Finished child record whose id ends in "-p<ordinal>".
    [[nodiscard]] std::optional<QueueItem> findCompletedForPart(int ordinal) const;

    /// Most recently enqueued child record for a part ordinal, any status.
    [[nodiscard]] std::optional<QueueItem> findForPart(int ordinal) const;

    [[nodiscard]] bool hasActive() const;

    [[nodiscard]] std::optional<QueueItem> item(const QString &downloadId) const;
    [[nodiscard]] bool contains(const QString &downloadId) const { return indexOf(downloadId) >= 0; }
    [[nodiscard]] QList<QueueItem> items() const { return items_; }
    [[nodiscard]] QList<QueueItem> childrenOf(const QString &parentId) const;
    [[nodiscard]] int count() const { return items_.size(); }

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

signals:
    void queueChanged();
    void itemStatusChanged(const QString &downloadId);

private:
    [[nodiscard]] int indexOf(const QString &downloadId) const;
    void setStatus(int row, QueueItem::Status status);
    void refreshParent(const QString &parentId);

    QPointer<ProgressStore> progress_;
    QList<QueueItem> items_;
};

#endif // QUEUESTORE_H
