/**
 * @file mockdownloadbackend.h
 * @brief Mock download backend for testing.
 *
 * This mock implements IDownloadBackend and can be injected at runtime for
 * testing components that depend on the backend.
 */

#ifndef MOCKDOWNLOADBACKEND_H
#define MOCKDOWNLOADBACKEND_H

#include <QList>
#include <QQueue>
#include <QStringList>

#include "services/idownloadbackend.h"

/**
 * @brief Mock backend implementing IDownloadBackend for testing.
 *
 * @par Features:
 * - Queue-based settlement (manual, one operation at a time or all)
 * - Configurable video metadata
 * - Error simulation
 * - Request tracking for test assertions
 *
 * @par Example usage:
 * @code
 * MockDownloadBackend *mock = new MockDownloadBackend(this);
 * mock->mockSetVideoInfo(info);
 *
 * orchestrator->setBackend(mock);
 * orchestrator->download();
 *
 * mock->mockProcessNextOperation();
 * orchestrator->flushEventQueue();
 *
 * QCOMPARE(mock->mockGetDispatchRequests().size(), 2);
 * @endcode
 */
class MockDownloadBackend : public IDownloadBackend
{
    Q_OBJECT

public:
    explicit MockDownloadBackend(QObject *parent = nullptr);
    ~MockDownloadBackend() override = default;

    /// @name IDownloadBackend Implementation
    /// @{
    void fetchVideoInfo(const QString &videoId) override;
    void dispatch(const DispatchOptions &options) override;
    void cancel(const QString &downloadId) override;
    void cancelAll() override;
    /// @}

    /// @name Mock Control Methods
    /// @{

    /**
     * @brief Configures the metadata returned by fetchVideoInfo().
     *
     * An empty videoId in @p info is replaced by the requested id.
     */
    void mockSetVideoInfo(const VideoInfo &info) { videoInfo_ = info; }

    /**
     * @brief Settles the oldest pending operation.
     *
     * Dispatches succeed with "/downloads/<outputName>.mp4" unless a failure
     * was configured.
     */
    void mockProcessNextOperation();

    /**
     * @brief Settles all pending operations, including ones queued meanwhile.
     */
    void mockProcessAllOperations();

    /**
     * @brief Configures the next settled operation to fail with @p error.
     */
    void mockSetNextOperationFails(const QString &error);

    /// Emits progressReceived() for @p entry.
    void mockEmitProgress(const ProgressEntry &entry);

    /// Emits downloadCancelled() for @p downloadId.
    void mockEmitCancelled(const QString &downloadId);

    /**
     * @brief Resets all mock state.
     */
    void mockReset();
    /// @}

    /// @name Test Inspection Methods
    /// @{
    [[nodiscard]] int mockPendingOperationCount() const { return pendingOps_.size(); }
    [[nodiscard]] QStringList mockGetFetchRequests() const { return fetchRequests_; }
    [[nodiscard]] QList<DispatchOptions> mockGetDispatchRequests() const { return dispatchRequests_; }
    [[nodiscard]] QStringList mockGetDispatchedIds() const;
    [[nodiscard]] QStringList mockGetCancelRequests() const { return cancelRequests_; }
    [[nodiscard]] int mockGetCancelAllCount() const { return cancelAllCount_; }
    /// @}

private:
    struct PendingOp {
        enum Type { FetchVideoInfo, Dispatch };
        Type type = Dispatch;
        QString key;
        QString outputName;
    };

    QQueue<PendingOp> pendingOps_;
    VideoInfo videoInfo_;

    // Track requests for assertions
    QStringList fetchRequests_;
    QList<DispatchOptions> dispatchRequests_;
    QStringList cancelRequests_;
    int cancelAllCount_ = 0;

    // Error simulation
    bool nextOpFails_ = false;
    QString nextOpError_;
};

#endif // MOCKDOWNLOADBACKEND_H
