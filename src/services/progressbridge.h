/**
 * @file progressbridge.h
 * @brief Reconciles the backend progress stream into the queue and progress stores.
 */

#ifndef PROGRESSBRIDGE_H
#define PROGRESSBRIDGE_H

#include <QObject>
#include <QPointer>
#include <QString>

#include "downloadtypes.h"

class IDownloadBackend;
class QueueStore;
class ProgressStore;
class ErrorHandler;

/**
 * @brief The single subscriber to the backend progress stream.
 *
 * Progress events are not causally ordered with respect to dispatch results,
 * so every update applied here is an idempotent, key-scoped upsert:
 * - the event is stored in the ProgressStore, with its parentId filled in
 *   from the queue when the backend left it out;
 * - the first event of a download moves it from pending to running;
 * - a completed "complete" stage marks the download done;
 * - quality fallback stages raise a warning toast, never a failure.
 *
 * Cancellation acknowledgements from the backend confirm the cancellation
 * in the queue.
 *
 * @par Example usage:
 * @code
 * ProgressBridge *bridge = new ProgressBridge(queue, progress, errorHandler, this);
 * bridge->setBackend(backend);
 * @endcode
 */
class ProgressBridge : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a bridge.
     * @param queue Queue store to update (not owned).
     * @param progress Progress store to update (not owned).
     * @param errorHandler Receives quality fallback warnings (not owned, may be null).
     * @param parent Optional parent QObject for memory management.
     */
    ProgressBridge(QueueStore *queue,
                   ProgressStore *progress,
                   ErrorHandler *errorHandler,
                   QObject *parent = nullptr);
    ~ProgressBridge() override;

    /**
     * @brief Subscribes to a backend, replacing any previous subscription.
     * @param backend The backend (not owned).
     */
    void setBackend(IDownloadBackend *backend);

public slots:
    /**
     * @brief Applies one progress observation.
     * @param event The event as emitted by the backend.
     */
    void onProgressReceived(const ProgressEntry &event);

    /**
     * @brief Applies a cancellation acknowledgement.
     * @param downloadId The cancelled download.
     */
    void onDownloadCancelled(const QString &downloadId);

signals:
    /**
     * @brief Emitted when a quality fallback stage was seen for a download.
     * @param downloadId The affected download.
     * @param stage The warning stage.
     */
    void qualityFallback(const QString &downloadId, DownloadStage stage);

private:
    [[nodiscard]] QString describe(const QString &downloadId) const;

    QPointer<IDownloadBackend> backend_;
    QPointer<QueueStore> queue_;
    QPointer<ProgressStore> progress_;
    QPointer<ErrorHandler> errorHandler_;
};

#endif // PROGRESSBRIDGE_H
