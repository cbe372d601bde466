#ifndef PROGRESSSTORE_H
#define PROGRESSSTORE_H

#include <QAbstractListModel>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "services/downloadtypes.h"

/**
 * @brief Latest progress observation per (download, stage).
 *
 * Entries are upserted, never appended without bound: a new event for the
 * same key replaces the previous one. Two rules keep the store stable under
 * duplicate and out-of-order delivery:
 * - re-delivering an identical event changes nothing;
 * - an event never replaces a completed entry with a less complete one.
 *
 * The store is written only by the ProgressBridge and read by the
 * orchestrator and presentation.
 */
class ProgressStore : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        DownloadIdRole = Qt::UserRole + 1,
        ParentIdRole,
        InternalIdRole,
        StageRole,
        PercentageRole,
        FilesizeRole,
        DownloadedRole,
        TransferRateRole,
        ElapsedTimeRole,
        IsCompleteRole
    };

    /// Fallback weights for parent aggregation when byte totals are unknown
    static constexpr double VideoStageWeight = 0.33;
    static constexpr double AudioStageWeight = 0.33;
    static constexpr double MergeStageWeight = 0.34;

    explicit ProgressStore(QObject *parent = nullptr);
    ~ProgressStore() override;

    /**
     * @brief Upserts an event keyed by (downloadId, stage).
     * @return True if the stored state changed.
     */
    bool ingest(const ProgressEntry &event);

    [[nodiscard]] QList<ProgressEntry> entriesFor(const QString &downloadId) const;
    [[nodiscard]] std::optional<ProgressEntry> entry(const QString &downloadId,
                                                     DownloadStage stage) const;

    /**
     * @brief Most advanced lifecycle stage observed for a download.
     *
     * Video and audio rank below merge, which ranks below complete. Between
     * video and audio the most recently updated wins. Warning stages never
     * count. Returns DownloadStage::None when nothing was observed.
     */
    [[nodiscard]] DownloadStage currentStage(const QString &downloadId) const;

    /**
     * @brief Completion ratio of one child download in [0, 1].
     */
    [[nodiscard]] double childRatio(const QString &downloadId) const;

    /**
     * @brief Overall completion of a batch in [0, 1].
     *
     * Averages childRatio() over every download whose entries carry
     * @p parentId. Returns 0 when the batch has no children yet.
     */
    [[nodiscard]] double aggregateParent(const QString &parentId) const;

    /// Download ids that reported progress for a batch, in first-seen order.
    [[nodiscard]] QStringList childrenOf(const QString &parentId) const;

    void clearFor(const QString &downloadId);
    void clearAll();

    [[nodiscard]] int count() const { return entries_.size(); }

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    /// Key under which an event is stored: "<downloadId>:<stage>" or "<downloadId>".
    [[nodiscard]] static QString internalIdFor(const QString &downloadId, DownloadStage stage);

signals:
    void progressChanged(const QString &downloadId);
    void progressCleared();

private:
    struct StoredEntry {
        ProgressEntry entry;
        quint64 sequence = 0;  ///< Ingest order, used to break stage ties
    };

    [[nodiscard]] int findIndex(const QString &internalId) const;
    [[nodiscard]] static int stageRank(DownloadStage stage);
    [[nodiscard]] static double stageWeight(DownloadStage stage);

    QList<StoredEntry> entries_;
    quint64 nextSequence_ = 1;
};

#endif // PROGRESSSTORE_H
