/**
 * @file idownloadbackend.h
 * @brief Interface for the external download/merge backend.
 *
 * This interface allows dependency injection of backends, enabling runtime
 * swapping between the process-based production backend and mock
 * implementations for testing.
 */

#ifndef IDOWNLOADBACKEND_H
#define IDOWNLOADBACKEND_H

#include <QObject>
#include <QString>

#include "downloadtypes.h"

/**
 * @brief Abstract interface for download backends.
 *
 * Every command is asynchronous. Results arrive through signals that are not
 * causally ordered with respect to the progress stream: a "complete" progress
 * event for a download may be emitted before or after dispatchSucceeded() for
 * the same download.
 *
 * Failures are reported as strings following the grammar `ERR::<CODE>` or
 * `ERR::NETWORK::<detail>`; see ErrorClassifier.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IDownloadBackend *backend = new ProcessBackend(this);
 *
 * // Test code
 * IDownloadBackend *backend = new MockDownloadBackend(this);
 *
 * connect(backend, &IDownloadBackend::dispatchSucceeded, ...);
 * backend->dispatch(options);
 * @endcode
 */
class IDownloadBackend : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a backend interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IDownloadBackend(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~IDownloadBackend() override = default;

    /// @name Metadata
    /// @{

    /**
     * @brief Requests metadata for a video.
     * @param videoId The video identifier extracted from the URL.
     *
     * Emits videoInfoReceived() or videoInfoFailed().
     */
    virtual void fetchVideoInfo(const QString &videoId) = 0;
    /// @}

    /// @name Downloads
    /// @{

    /**
     * @brief Starts fetching and merging one part.
     * @param options Part, quality and identity of the child download.
     *
     * Settles exactly once with dispatchSucceeded() or dispatchFailed()
     * carrying options.downloadId. Progress events are emitted meanwhile.
     */
    virtual void dispatch(const DispatchOptions &options) = 0;

    /**
     * @brief Asks the backend to stop a download.
     * @param downloadId The download to cancel.
     *
     * Fire and forget. Confirmation arrives later through downloadCancelled()
     * and/or an `ERR::CANCELLED` rejection of the dispatch, or never.
     */
    virtual void cancel(const QString &downloadId) = 0;

    /**
     * @brief Asks the backend to stop every active download.
     */
    virtual void cancelAll() = 0;
    /// @}

signals:
    /// @name Metadata Signals
    /// @{

    /**
     * @brief Emitted when video metadata was fetched.
     * @param info The video and its parts.
     */
    void videoInfoReceived(const VideoInfo &info);

    /**
     * @brief Emitted when the metadata request failed.
     * @param videoId The requested video.
     * @param error Backend error string.
     */
    void videoInfoFailed(const QString &videoId, const QString &error);
    /// @}

    /// @name Download Signals
    /// @{

    /**
     * @brief Emitted when a dispatched download finished successfully.
     * @param downloadId The child download id.
     * @param outputPath Path of the written output file.
     */
    void dispatchSucceeded(const QString &downloadId, const QString &outputPath);

    /**
     * @brief Emitted when a dispatched download was rejected.
     * @param downloadId The child download id.
     * @param error Backend error string.
     */
    void dispatchFailed(const QString &downloadId, const QString &error);

    /**
     * @brief Emitted for every progress observation of the backend.
     * @param entry The observation.
     */
    void progressReceived(const ProgressEntry &entry);

    /**
     * @brief Emitted when the backend acknowledged a cancellation.
     * @param downloadId The cancelled download.
     */
    void downloadCancelled(const QString &downloadId);
    /// @}
};

#endif // IDOWNLOADBACKEND_H
