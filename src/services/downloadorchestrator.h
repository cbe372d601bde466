/**
 * @file downloadorchestrator.h
 * @brief Turns a part selection into sequenced backend downloads.
 */

#ifndef DOWNLOADORCHESTRATOR_H
#define DOWNLOADORCHESTRATOR_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QSet>
#include <QString>

#include <functional>

#include "downloadtypes.h"
#include "models/partinputmodel.h"

class IDownloadBackend;
class QueueStore;
class ProgressStore;
class DownloadStatus;
class ErrorHandler;
class SettingsStore;

/**
 * @brief Validates selections and drives per-part downloads through the backend.
 *
 * A download() creates one batch: a parent queue record with id
 * "<videoId>-<timestamp>" and one child per selected part with id
 * "<parentId>-p<ordinal>". Children are dispatched strictly one after the
 * other. The next part is dispatched only once the previous dispatch settled.
 *
 * Settlement policy:
 * - success marks the child done with its output path;
 * - an `ERR::CANCELLED` rejection confirms the cancellation and the batch
 *   moves on to the next part;
 * - any other rejection marks the child failed, sets the error banner,
 *   raises a toast and stops the batch. Parts already running on the backend
 *   are left alone.
 *
 * Redownloads and retries dispatch a single part as an independent run under
 * the same parent, with id "<parentId>-r<attempt>-p<ordinal>".
 *
 * Dispatch results are processed through a deferred event queue to avoid
 * re-entrancy; tests call flushEventQueue() to process them synchronously.
 *
 * @par Example usage:
 * @code
 * DownloadOrchestrator *orchestrator = new DownloadOrchestrator(
 *     inputs, queue, progress, status, errorHandler, settings, this);
 * orchestrator->setBackend(backend);
 *
 * orchestrator->fetchVideoInfo("https://www.bilibili.com/video/BV1xx411c7XD");
 * // ... once videoInfoReady() was emitted:
 * orchestrator->download();
 * @endcode
 */
class DownloadOrchestrator : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an orchestrator.
     *
     * None of the collaborators are owned. @p errorHandler and @p settings
     * may be null.
     */
    DownloadOrchestrator(PartInputModel *inputs,
                         QueueStore *queue,
                         ProgressStore *progress,
                         DownloadStatus *status,
                         ErrorHandler *errorHandler,
                         SettingsStore *settings,
                         QObject *parent = nullptr);
    ~DownloadOrchestrator() override;

    /**
     * @brief Sets the backend that performs downloads (not owned).
     */
    void setBackend(IDownloadBackend *backend);

    /**
     * @brief Replaces the millisecond clock used for parent ids.
     */
    void setClock(std::function<qint64()> clock);

    /// @name Metadata
    /// @{

    /**
     * @brief Fetches video information and seeds the part inputs from it.
     * @param url Watch URL.
     * @return False if the URL is invalid, downloads are still active or no
     *         backend is set.
     *
     * Clears the queue, the progress and the error banner. Emits
     * videoInfoReady() or videoInfoFailed().
     */
    bool fetchVideoInfo(const QString &url);

    [[nodiscard]] bool isFetching() const { return !pendingVideoId_.isEmpty(); }
    /// @}

    /// @name Downloads
    /// @{

    /**
     * @brief Starts a batch for every selected part.
     * @return False, without calling the backend, if the URL or a selected
     *         part is invalid, titles collide or nothing is selected.
     */
    bool download();

    /**
     * @brief Downloads one part again, independent of any batch.
     * @param index Part index in the input model.
     * @return False if the part is invalid or still active.
     *
     * Any finished record of the part is removed first.
     */
    bool handleRedownload(int index);

    /**
     * @brief Like handleRedownload() but only for a part whose last attempt failed.
     */
    bool retry(int index);

    /**
     * @brief Reason why download() would refuse, or an empty string.
     */
    [[nodiscard]] QString validationError() const;

    /// Indices of selected parts whose normalized titles collide.
    [[nodiscard]] QList<int> duplicateIndices() const;

    /// True while any batch or redownload run has parts left to settle.
    [[nodiscard]] bool isBusy() const { return !runs_.isEmpty(); }
    /// @}

    /// @name Cancellation
    /// @{

    /**
     * @brief Requests cancellation of a download.
     * @param downloadId A child id, or a parent id to cancel its whole batch.
     * @return True if a cancellation was sent to the backend.
     *
     * Refused while the download is merging. Cancelling a batch also drops
     * its parts that were not dispatched yet.
     */
    bool cancelDownload(const QString &downloadId);

    /**
     * @brief Cancels every active download and drops all undispatched parts.
     */
    void cancelAll();

    /**
     * @brief Selects or deselects a part.
     *
     * Deselecting a cancelled part removes its record and progress. If it is
     * still cancelling, the record is removed once the cancellation is
     * confirmed.
     */
    bool setPartSelected(int index, bool selected);
    /// @}

    // For testing: immediately process all pending events
    void flushEventQueue();

signals:
    void videoInfoReady(const VideoInfo &info);
    void videoInfoFailed(const QString &message);

    void batchStarted(const QString &parentId);
    void partDispatched(const QString &downloadId);

    /**
     * @brief Emitted when a run has no parts left to dispatch or settle.
     * @param parentId The batch the run belonged to.
     * @param failed True if the run stopped on an error.
     */
    void batchFinished(const QString &parentId, bool failed);

    void allRunsFinished();

private slots:
    void onVideoInfoReceived(const VideoInfo &info);
    void onVideoInfoFailed(const QString &videoId, const QString &error);
    void onDispatchSucceeded(const QString &downloadId, const QString &outputPath);
    void onDispatchFailed(const QString &downloadId, const QString &error);
    void onItemStatusChanged(const QString &downloadId);

private:
    struct PlannedPart {
        PartInput input;
        QString downloadId;
    };

    struct BatchRun {
        int runId = 0;
        QString parentId;
        QString sourceId;
        QQueue<PlannedPart> remaining;
        QString inFlight;
        bool failed = false;
    };

    [[nodiscard]] QString makeParentId(const QString &videoId) const;
    bool ensureParent(const QString &parentId);
    int startRun(const QString &parentId, const QString &sourceId,
                 const QList<PlannedPart> &parts);
    void dispatchNext(int runId);
    void finishRun(int runId);
    void settleSuccess(const QString &downloadId, const QString &outputPath);
    void settleFailure(const QString &downloadId, const QString &error);
    void clearRecord(const QString &downloadId, bool pruneParent);
    [[nodiscard]] QString clearFinishedRecordsForPart(int ordinal);
    bool redownload(int index, bool onlyFailed);

    void scheduleEvent(std::function<void()> event);
    void processEventQueue();

    QPointer<PartInputModel> inputs_;
    QPointer<QueueStore> queue_;
    QPointer<ProgressStore> progress_;
    QPointer<DownloadStatus> status_;
    QPointer<ErrorHandler> errorHandler_;
    QPointer<SettingsStore> settings_;
    QPointer<IDownloadBackend> backend_;

    std::function<qint64()> clock_;

    QHash<int, BatchRun> runs_;
    QHash<QString, int> runByDownload_;
    int nextRunId_ = 1;
    QHash<QString, int> attempts_;       // "<parentId>-p<ordinal>" -> last redownload attempt
    QSet<QString> clearWhenCancelled_;   // Deselected while cancelling

    QString pendingVideoId_;

    // Event queue for deferred processing (prevents re-entrancy)
    QQueue<std::function<void()>> eventQueue_;
    bool processingEvents_ = false;
    bool eventProcessingScheduled_ = false;
};

#endif // DOWNLOADORCHESTRATOR_H
