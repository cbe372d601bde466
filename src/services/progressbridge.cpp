#include "progressbridge.h"

#include "errorhandler.h"
#include "idownloadbackend.h"
#include "models/progressstore.h"
#include "models/queuestore.h"
#include "utils/logging.h"

ProgressBridge::ProgressBridge(QueueStore *queue,
                               ProgressStore *progress,
                               ErrorHandler *errorHandler,
                               QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , progress_(progress)
    , errorHandler_(errorHandler)
{
}

ProgressBridge::~ProgressBridge() = default;

void ProgressBridge::setBackend(IDownloadBackend *backend)
{
    if (backend_) {
        disconnect(backend_, nullptr, this, nullptr);
    }

    backend_ = backend;

    if (backend_) {
        connect(backend_, &IDownloadBackend::progressReceived,
                this, &ProgressBridge::onProgressReceived);
        connect(backend_, &IDownloadBackend::downloadCancelled,
                this, &ProgressBridge::onDownloadCancelled);
    }
}

void ProgressBridge::onProgressReceived(const ProgressEntry &event)
{
    if (!queue_ || !progress_) {
        return;
    }

    // Late events for cleared or replaced downloads must not rejoin a batch
    auto queued = queue_->item(event.downloadId);
    if (!queued) {
        LOG_VERBOSE() << "ProgressBridge: dropping event for unknown download" << event.downloadId
                      << stageToString(event.stage);
        return;
    }

    ProgressEntry entry = event;
    if (entry.parentId.isEmpty()) {
        entry.parentId = queued->parentId;
    }

    bool changed = progress_->ingest(entry);
    LOG_VERBOSE() << "ProgressBridge:" << entry.downloadId << stageToString(entry.stage)
                  << entry.percentage << (changed ? "applied" : "unchanged");

    queue_->markObserved(entry.downloadId);

    if (entry.stage == DownloadStage::Complete && entry.isComplete) {
        queue_->markCompleted(entry.downloadId);
    }

    // Re-delivered warnings must not raise a second toast
    if (changed && isWarningStage(entry.stage)) {
        emit qualityFallback(entry.downloadId, entry.stage);
        if (errorHandler_) {
            QString message = entry.stage == DownloadStage::WarnVideoQualityFallback
                ? tr("The selected video quality is not available for %1. "
                     "The best available quality is used instead.")
                : tr("The selected audio quality is not available for %1. "
                     "The best available quality is used instead.");
            errorHandler_->handleQualityFallback(message.arg(describe(entry.downloadId)));
        }
    }
}

void ProgressBridge::onDownloadCancelled(const QString &downloadId)
{
    if (!queue_) {
        return;
    }
    qInfo() << "ProgressBridge: Backend confirmed cancellation of" << downloadId;
    queue_->confirmCancelled(downloadId);
}

QString ProgressBridge::describe(const QString &downloadId) const
{
    if (queue_) {
        if (auto queued = queue_->item(downloadId)) {
            if (!queued->title.isEmpty()) {
                return queued->title;
            }
        }
    }
    return downloadId;
}
