#include "downloadorchestrator.h"

#include <QDateTime>
#include <QStringList>
#include <QTimer>

#include "errorclassifier.h"
#include "errorhandler.h"
#include "idownloadbackend.h"
#include "settingsstore.h"
#include "models/downloadstatus.h"
#include "models/progressstore.h"
#include "models/queuestore.h"
#include "utils/logging.h"
#include "utils/videoutils.h"

DownloadOrchestrator::DownloadOrchestrator(PartInputModel *inputs,
                                           QueueStore *queue,
                                           ProgressStore *progress,
                                           DownloadStatus *status,
                                           ErrorHandler *errorHandler,
                                           SettingsStore *settings,
                                           QObject *parent)
    : QObject(parent)
    , inputs_(inputs)
    , queue_(queue)
    , progress_(progress)
    , status_(status)
    , errorHandler_(errorHandler)
    , settings_(settings)
    , clock_([]() { return QDateTime::currentMSecsSinceEpoch(); })
{
    connect(queue_, &QueueStore::itemStatusChanged,
            this, &DownloadOrchestrator::onItemStatusChanged);
}

DownloadOrchestrator::~DownloadOrchestrator()
{
    // Disconnect before members are destroyed, settlements may still arrive
    if (backend_) {
        disconnect(backend_, nullptr, this, nullptr);
    }
}

void DownloadOrchestrator::setBackend(IDownloadBackend *backend)
{
    if (backend_) {
        disconnect(backend_, nullptr, this, nullptr);
    }

    backend_ = backend;

    if (backend_) {
        connect(backend_, &IDownloadBackend::videoInfoReceived,
                this, &DownloadOrchestrator::onVideoInfoReceived);
        connect(backend_, &IDownloadBackend::videoInfoFailed,
                this, &DownloadOrchestrator::onVideoInfoFailed);
        connect(backend_, &IDownloadBackend::dispatchSucceeded,
                this, &DownloadOrchestrator::onDispatchSucceeded);
        connect(backend_, &IDownloadBackend::dispatchFailed,
                this, &DownloadOrchestrator::onDispatchFailed);
    }
}

void DownloadOrchestrator::setClock(std::function<qint64()> clock)
{
    if (clock) {
        clock_ = std::move(clock);
    }
}

// ============================================================================
// Metadata
// ============================================================================

bool DownloadOrchestrator::fetchVideoInfo(const QString &url)
{
    if (!backend_) {
        qWarning() << "DownloadOrchestrator: No backend set";
        return false;
    }
    if (!PartInputModel::isUrlValid(url)) {
        if (errorHandler_) {
            errorHandler_->handleValidationError(tr("Enter a valid video URL."));
        }
        return false;
    }
    if (isBusy() || queue_->hasActive()) {
        if (errorHandler_) {
            errorHandler_->handleValidationError(tr("Wait for the current downloads to finish."));
        }
        return false;
    }

    queue_->clearAll();
    progress_->clearAll();
    status_->clearError();
    clearWhenCancelled_.clear();
    attempts_.clear();

    inputs_->setUrl(url);
    pendingVideoId_ = VideoUtils::extractVideoId(url);

    qInfo() << "DownloadOrchestrator: Fetching video info for" << pendingVideoId_;
    backend_->fetchVideoInfo(pendingVideoId_);
    return true;
}

void DownloadOrchestrator::onVideoInfoReceived(const VideoInfo &info)
{
    if (pendingVideoId_.isEmpty()
        || (!info.videoId.isEmpty() && info.videoId != pendingVideoId_)) {
        LOG_VERBOSE() << "DownloadOrchestrator: Ignoring stale video info" << info.videoId;
        return;
    }
    pendingVideoId_.clear();

    int videoQuality = settings_ ? settings_->videoQuality() : VideoUtils::DefaultVideoQuality;
    int audioQuality = settings_ ? settings_->audioQuality() : VideoUtils::DefaultAudioQuality;
    inputs_->setVideo(info, videoQuality, audioQuality);

    qInfo() << "DownloadOrchestrator: Video" << info.videoId << "has" << info.parts.size() << "parts";
    emit videoInfoReady(info);
}

void DownloadOrchestrator::onVideoInfoFailed(const QString &videoId, const QString &error)
{
    if (pendingVideoId_.isEmpty() || videoId != pendingVideoId_) {
        LOG_VERBOSE() << "DownloadOrchestrator: Ignoring stale video info failure" << videoId;
        return;
    }
    pendingVideoId_.clear();

    ClassifiedError classified = ErrorClassifier::classify(error);
    if (errorHandler_) {
        errorHandler_->handleFetchFailed(classified.message);
    }
    emit videoInfoFailed(classified.message);
}

// ============================================================================
// Downloads
// ============================================================================

QString DownloadOrchestrator::validationError() const
{
    if (!inputs_ || !PartInputModel::isUrlValid(inputs_->url())) {
        return tr("Enter a valid video URL.");
    }

    const QList<int> selected = inputs_->selectedIndices();
    if (selected.isEmpty()) {
        return tr("Select at least one part.");
    }

    for (int index : selected) {
        if (!inputs_->isPartValid(index)) {
            return tr("Part %1 has an invalid title or quality.").arg(inputs_->part(index).ordinal);
        }
    }

    const QList<int> duplicates = inputs_->duplicateIndices();
    if (!duplicates.isEmpty()) {
        QStringList ordinals;
        for (int index : duplicates) {
            ordinals.append(QString::number(inputs_->part(index).ordinal));
        }
        return tr("Parts %1 would be saved under the same name.").arg(ordinals.join(QStringLiteral(", ")));
    }

    return QString();
}

QList<int> DownloadOrchestrator::duplicateIndices() const
{
    return inputs_ ? inputs_->duplicateIndices() : QList<int>();
}

bool DownloadOrchestrator::download()
{
    if (!backend_) {
        qWarning() << "DownloadOrchestrator: No backend set";
        return false;
    }

    QString reason = validationError();
    if (!reason.isEmpty()) {
        if (errorHandler_) {
            errorHandler_->handleValidationError(reason);
        }
        return false;
    }

    const QString videoId = VideoUtils::extractVideoId(inputs_->url());
    const QList<int> selected = inputs_->selectedIndices();

    // Finished parts are downloaded again, drop their old records
    for (int index : selected) {
        const int ordinal = inputs_->part(index).ordinal;
        while (auto done = queue_->findCompletedForPart(ordinal)) {
            clearRecord(done->downloadId, true);
        }
    }

    status_->clearError();

    const QString parentId = makeParentId(videoId);
    ensureParent(parentId);

    QList<PlannedPart> plan;
    for (int index : selected) {
        PartInput part = inputs_->part(index);
        plan.append(PlannedPart{part, QStringLiteral("%1-p%2").arg(parentId).arg(part.ordinal)});
    }

    qInfo() << "DownloadOrchestrator: Starting batch" << parentId << "with" << plan.size() << "parts";
    startRun(parentId, videoId, plan);
    return true;
}

bool DownloadOrchestrator::handleRedownload(int index)
{
    return redownload(index, false);
}

bool DownloadOrchestrator::retry(int index)
{
    return redownload(index, true);
}

bool DownloadOrchestrator::redownload(int index, bool onlyFailed)
{
    if (!backend_) {
        qWarning() << "DownloadOrchestrator: No backend set";
        return false;
    }
    if (!PartInputModel::isUrlValid(inputs_->url()) || !inputs_->isPartValid(index)) {
        if (errorHandler_) {
            errorHandler_->handleValidationError(tr("Part %1 has an invalid title or quality.")
                                                     .arg(index + 1));
        }
        return false;
    }

    const PartInput part = inputs_->part(index);
    const auto latest = queue_->findForPart(part.ordinal);

    if (onlyFailed && (!latest || latest->status != QueueItem::Status::Error)) {
        return false;
    }
    if (latest && latest->isActive()) {
        qInfo() << "DownloadOrchestrator: Part" << part.ordinal << "is still active";
        return false;
    }

    const QString videoId = VideoUtils::extractVideoId(inputs_->url());

    QString parentId = clearFinishedRecordsForPart(part.ordinal);
    if (parentId.isEmpty()) {
        parentId = makeParentId(videoId);
    }
    ensureParent(parentId);

    const QString attemptKey = QStringLiteral("%1-p%2").arg(parentId).arg(part.ordinal);
    QString downloadId;
    do {
        int attempt = ++attempts_[attemptKey];
        downloadId = QStringLiteral("%1-r%2-p%3").arg(parentId).arg(attempt).arg(part.ordinal);
    } while (queue_->contains(downloadId));

    status_->clearError();

    qInfo() << "DownloadOrchestrator: Redownloading part" << part.ordinal << "as" << downloadId;
    startRun(parentId, videoId, QList<PlannedPart>{PlannedPart{part, downloadId}});
    return true;
}

QString DownloadOrchestrator::makeParentId(const QString &videoId) const
{
    qint64 timestamp = clock_();
    QString parentId = QStringLiteral("%1-%2").arg(videoId).arg(timestamp);

    auto inUse = [this](const QString &id) {
        if (queue_->contains(id)) {
            return true;
        }
        for (const BatchRun &run : runs_) {
            if (run.parentId == id) {
                return true;
            }
        }
        return false;
    };

    while (inUse(parentId)) {
        parentId = QStringLiteral("%1-%2").arg(videoId).arg(++timestamp);
    }
    return parentId;
}

bool DownloadOrchestrator::ensureParent(const QString &parentId)
{
    if (queue_->contains(parentId)) {
        return false;
    }

    QueueItem parentItem;
    parentItem.downloadId = parentId;
    parentItem.title = inputs_->video().title;
    parentItem.filename = parentItem.title;
    return queue_->enqueue(parentItem);
}

int DownloadOrchestrator::startRun(const QString &parentId, const QString &sourceId,
                                   const QList<PlannedPart> &parts)
{
    BatchRun run;
    run.runId = nextRunId_++;
    run.parentId = parentId;
    run.sourceId = sourceId;
    for (const PlannedPart &planned : parts) {
        run.remaining.enqueue(planned);
    }

    const int runId = run.runId;
    runs_.insert(runId, run);

    emit batchStarted(parentId);
    dispatchNext(runId);
    return runId;
}

void DownloadOrchestrator::dispatchNext(int runId)
{
    auto it = runs_.find(runId);
    if (it == runs_.end()) {
        return;
    }

    if (!backend_) {
        qWarning() << "DownloadOrchestrator: Backend gone, stopping run for" << it->parentId;
        finishRun(runId);
        return;
    }

    while (!it->remaining.isEmpty()) {
        PlannedPart next = it->remaining.dequeue();

        QueueItem child;
        child.downloadId = next.downloadId;
        child.parentId = it->parentId;
        child.title = next.input.title.trimmed();
        child.filename = child.title;
        child.ordinal = next.input.ordinal;
        if (!queue_->enqueue(child)) {
            qWarning() << "DownloadOrchestrator: Skipping already queued part" << next.downloadId;
            continue;
        }

        DispatchOptions options;
        options.sourceId = it->sourceId;
        options.partId = next.input.cid;
        options.outputName = child.title;
        options.videoQuality = next.input.videoQuality;
        options.audioQuality = next.input.audioQuality;
        options.downloadId = next.downloadId;
        options.parentId = it->parentId;
        options.durationSeconds = next.input.duration;
        options.thumbnailUrl = next.input.thumbnailUrl;
        options.page = next.input.page;

        it->inFlight = next.downloadId;
        runByDownload_.insert(next.downloadId, runId);

        LOG_VERBOSE() << "DownloadOrchestrator: Dispatching" << next.downloadId
                      << "quality" << options.videoQuality << options.audioQuality;
        backend_->dispatch(options);
        emit partDispatched(next.downloadId);
        return;
    }

    finishRun(runId);
}

void DownloadOrchestrator::finishRun(int runId)
{
    auto it = runs_.find(runId);
    if (it == runs_.end()) {
        return;
    }

    const BatchRun run = it.value();
    runs_.erase(it);

    bool parentInUse = !queue_->childrenOf(run.parentId).isEmpty();
    for (const BatchRun &other : runs_) {
        if (other.parentId == run.parentId) {
            parentInUse = true;
        }
    }
    if (!parentInUse) {
        LOG_VERBOSE() << "DownloadOrchestrator: Removing empty batch" << run.parentId;
        queue_->clear(run.parentId);
    }

    qInfo() << "DownloadOrchestrator: Run for" << run.parentId
            << (run.failed ? "stopped on error" : "finished");
    emit batchFinished(run.parentId, run.failed);

    if (runs_.isEmpty()) {
        emit allRunsFinished();
    }
}

void DownloadOrchestrator::onDispatchSucceeded(const QString &downloadId, const QString &outputPath)
{
    scheduleEvent([this, downloadId, outputPath]() { settleSuccess(downloadId, outputPath); });
}

void DownloadOrchestrator::onDispatchFailed(const QString &downloadId, const QString &error)
{
    scheduleEvent([this, downloadId, error]() { settleFailure(downloadId, error); });
}

void DownloadOrchestrator::settleSuccess(const QString &downloadId, const QString &outputPath)
{
    clearWhenCancelled_.remove(downloadId);

    QString title;
    if (auto queued = queue_->item(downloadId)) {
        title = queued->title;
    }
    queue_->updateOnSuccess(downloadId, outputPath, title);
    qInfo() << "DownloadOrchestrator:" << downloadId << "saved to" << outputPath;

    int runId = runByDownload_.take(downloadId);
    auto it = runs_.find(runId);
    if (it != runs_.end() && it->inFlight == downloadId) {
        it->inFlight.clear();
        dispatchNext(runId);
    }
}

void DownloadOrchestrator::settleFailure(const QString &downloadId, const QString &error)
{
    ClassifiedError classified = ErrorClassifier::classify(error);
    int runId = runByDownload_.take(downloadId);
    auto it = runs_.find(runId);
    bool inFlight = it != runs_.end() && it->inFlight == downloadId;

    if (classified.isCancelled()) {
        qInfo() << "DownloadOrchestrator:" << downloadId << "was cancelled";
        queue_->confirmCancelled(downloadId);
        if (inFlight) {
            it->inFlight.clear();
            dispatchNext(runId);
        }
        return;
    }

    qWarning() << "DownloadOrchestrator:" << downloadId << "failed:" << error
               << "(" << ErrorClassifier::kindToString(classified.kind) << ")";

    clearWhenCancelled_.remove(downloadId);
    queue_->setError(downloadId, classified.message);
    status_->setError(classified.message);
    if (errorHandler_) {
        errorHandler_->handleDownloadFailed(classified.message);
    }

    if (inFlight) {
        // Fail fast: the rest of the batch is not dispatched
        it->failed = true;
        it->remaining.clear();
        it->inFlight.clear();
        finishRun(runId);
    }
}

// ============================================================================
// Cancellation
// ============================================================================

bool DownloadOrchestrator::cancelDownload(const QString &downloadId)
{
    const auto target = queue_->item(downloadId);
    if (!target) {
        return false;
    }

    auto cancelChild = [this](const QString &childId) {
        if (!queue_->requestCancel(childId)) {
            return false;
        }
        if (backend_) {
            backend_->cancel(childId);
        }
        return true;
    };

    if (!target->isParent()) {
        return cancelChild(downloadId);
    }

    for (BatchRun &run : runs_) {
        if (run.parentId == downloadId) {
            run.remaining.clear();
        }
    }

    bool cancelled = false;
    const QList<QueueItem> children = queue_->childrenOf(downloadId);
    for (const QueueItem &child : children) {
        if (cancelChild(child.downloadId)) {
            cancelled = true;
        }
    }
    return cancelled;
}

void DownloadOrchestrator::cancelAll()
{
    for (BatchRun &run : runs_) {
        run.remaining.clear();
    }

    const QList<QueueItem> items = queue_->items();
    for (const QueueItem &entry : items) {
        if (entry.isParent()) {
            continue;
        }
        if (queue_->requestCancel(entry.downloadId) && backend_) {
            backend_->cancel(entry.downloadId);
        }
    }
}

bool DownloadOrchestrator::setPartSelected(int index, bool selected)
{
    if (!inputs_->setSelected(index, selected)) {
        return false;
    }

    const auto latest = queue_->findForPart(inputs_->part(index).ordinal);
    if (!latest) {
        return true;
    }

    if (selected) {
        clearWhenCancelled_.remove(latest->downloadId);
    } else if (latest->status == QueueItem::Status::Cancelled) {
        clearRecord(latest->downloadId, true);
    } else if (latest->status == QueueItem::Status::Cancelling) {
        clearWhenCancelled_.insert(latest->downloadId);
    }
    return true;
}

void DownloadOrchestrator::onItemStatusChanged(const QString &downloadId)
{
    if (!clearWhenCancelled_.contains(downloadId)) {
        return;
    }

    scheduleEvent([this, downloadId]() {
        const auto entry = queue_->item(downloadId);
        if (entry && entry->status == QueueItem::Status::Cancelled
            && clearWhenCancelled_.remove(downloadId)) {
            clearRecord(downloadId, true);
        }
    });
}

// ============================================================================
// Records
// ============================================================================

void DownloadOrchestrator::clearRecord(const QString &downloadId, bool pruneParent)
{
    const auto entry = queue_->item(downloadId);
    if (!entry) {
        return;
    }

    queue_->clear(downloadId);
    progress_->clearFor(downloadId);
    clearWhenCancelled_.remove(downloadId);

    if (!pruneParent || entry->isParent()) {
        return;
    }

    if (!queue_->childrenOf(entry->parentId).isEmpty()) {
        return;
    }
    for (const BatchRun &run : runs_) {
        if (run.parentId == entry->parentId) {
            return;
        }
    }
    queue_->clear(entry->parentId);
}

QString DownloadOrchestrator::clearFinishedRecordsForPart(int ordinal)
{
    QString latestParentId;
    const QList<QueueItem> items = queue_->items();
    for (int i = items.size() - 1; i >= 0; --i) {
        const QueueItem &entry = items[i];
        if (entry.isParent() || entry.isActive()
            || VideoUtils::partOrdinalFromDownloadId(entry.downloadId) != ordinal) {
            continue;
        }
        if (latestParentId.isEmpty()) {
            latestParentId = entry.parentId;
        }
        // The latest batch is reused for the new attempt
        clearRecord(entry.downloadId, entry.parentId != latestParentId);
    }
    return latestParentId;
}

// ============================================================================
// Event queue
// ============================================================================

void DownloadOrchestrator::scheduleEvent(std::function<void()> event)
{
    eventQueue_.enqueue(std::move(event));

    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &DownloadOrchestrator::processEventQueue);
    }
}

void DownloadOrchestrator::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &DownloadOrchestrator::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void DownloadOrchestrator::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}
