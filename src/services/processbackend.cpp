#include "processbackend.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <optional>

#include "utils/logging.h"

namespace {

std::optional<double> optionalDouble(const QJsonValue &value)
{
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toDouble();
}

QList<int> parseQualities(const QJsonArray &array)
{
    QList<int> qualities;
    for (const QJsonValue &value : array) {
        // Either a bare id or a {"id": ..., "codecid": ...} object
        int id = value.isObject() ? value.toObject()["id"].toInt() : value.toInt();
        if (id > 0 && !qualities.contains(id)) {
            qualities.append(id);
        }
    }
    return qualities;
}

} // namespace

ProcessBackend::ProcessBackend(QObject *parent)
    : IDownloadBackend(parent)
    , process_(new QProcess(this))
{
    process_->setProcessChannelMode(QProcess::SeparateChannels);

    connect(process_, &QProcess::readyReadStandardOutput,
            this, &ProcessBackend::onReadyReadStandardOutput);
    connect(process_, &QProcess::readyReadStandardError,
            this, &ProcessBackend::onReadyReadStandardError);
    connect(process_, &QProcess::finished,
            this, &ProcessBackend::onProcessFinished);
    connect(process_, &QProcess::errorOccurred,
            this, &ProcessBackend::onProcessError);
}

ProcessBackend::~ProcessBackend()
{
    // No rejections from a backend that is going away
    disconnect(process_, nullptr, this, nullptr);
    stop();
}

void ProcessBackend::setProgram(const QString &program, const QStringList &arguments)
{
    program_ = program;
    arguments_ = arguments;
}

void ProcessBackend::stop()
{
    if (process_->state() == QProcess::NotRunning) {
        return;
    }

    process_->closeWriteChannel();
    if (!process_->waitForFinished(StopTimeoutMs)) {
        qWarning() << "ProcessBackend: Backend did not exit, killing it";
        process_->kill();
        process_->waitForFinished(StopTimeoutMs);
    }
}

// ============================================================================
// Commands
// ============================================================================

void ProcessBackend::fetchVideoInfo(const QString &videoId)
{
    QJsonObject args;
    args["videoId"] = videoId;
    sendRequest(Command::FetchVideoInfo, videoId, args);
}

void ProcessBackend::dispatch(const DispatchOptions &options)
{
    sendRequest(Command::Download, options.downloadId, dispatchArguments(options));
}

void ProcessBackend::cancel(const QString &downloadId)
{
    QJsonObject args;
    args["downloadId"] = downloadId;
    sendRequest(Command::Cancel, downloadId, args);
}

void ProcessBackend::cancelAll()
{
    sendRequest(Command::CancelAll, QString(), QJsonObject());
}

const char *ProcessBackend::commandName(Command command)
{
    switch (command) {
    case Command::FetchVideoInfo: return "fetch_video_info";
    case Command::Download: return "download_video";
    case Command::Cancel: return "cancel_download";
    case Command::CancelAll: return "cancel_all_downloads";
    }
    return "unknown";
}

bool ProcessBackend::ensureStarted()
{
    if (requestDevice_) {
        return true;
    }
    if (process_->state() != QProcess::NotRunning) {
        return true;
    }
    if (program_.isEmpty()) {
        return false;
    }

    outputBuffer_.clear();
    qInfo() << "ProcessBackend: Starting" << program_ << arguments_;
    // Writes issued while the process is starting are buffered by QProcess
    process_->start(program_, arguments_);
    return true;
}

void ProcessBackend::sendRequest(Command command, const QString &key, const QJsonObject &args)
{
    PendingRequest request{command, key};

    if (!ensureStarted()) {
        failRequest(request, QStringLiteral("ERR::NETWORK::backend program is not configured"));
        return;
    }

    int id = nextRequestId_++;
    pending_.insert(id, request);

    QByteArray line = encodeRequest(id, QString::fromLatin1(commandName(command)), args);
    LOG_VERBOSE() << "ProcessBackend: >>" << line.trimmed();

    QIODevice *out = requestDevice_ ? requestDevice_.data() : static_cast<QIODevice *>(process_);
    if (out->write(line) != line.size()) {
        pending_.remove(id);
        failRequest(request, QStringLiteral("ERR::NETWORK::%1").arg(out->errorString()));
    }
}

// ============================================================================
// Output handling
// ============================================================================

void ProcessBackend::onReadyReadStandardOutput()
{
    processOutput(process_->readAllStandardOutput());
}

void ProcessBackend::onReadyReadStandardError()
{
    const QList<QByteArray> lines = process_->readAllStandardError().split('\n');
    for (const QByteArray &line : lines) {
        if (!line.trimmed().isEmpty()) {
            LOG_VERBOSE() << "ProcessBackend: stderr:" << line.trimmed();
        }
    }
}

void ProcessBackend::processOutput(const QByteArray &data)
{
    outputBuffer_ += data;

    // One JSON document per line
    qsizetype idx;
    while ((idx = outputBuffer_.indexOf('\n')) >= 0) {
        QByteArray line = outputBuffer_.left(idx).trimmed();
        outputBuffer_ = outputBuffer_.mid(idx + 1);
        if (!line.isEmpty()) {
            handleLine(line);
        }
    }
}

void ProcessBackend::handleLine(const QByteArray &line)
{
    LOG_VERBOSE() << "ProcessBackend: <<" << line;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "ProcessBackend: Ignoring malformed line:" << parseError.errorString()
                   << line.left(200);
        return;
    }

    QJsonObject json = doc.object();
    if (json.contains("event")) {
        handleEvent(json);
    } else if (json.contains("id")) {
        handleReply(json);
    } else {
        qWarning() << "ProcessBackend: Ignoring line without id or event";
    }
}

void ProcessBackend::handleReply(const QJsonObject &json)
{
    int id = json["id"].toInt();
    if (!pending_.contains(id)) {
        LOG_VERBOSE() << "ProcessBackend: Reply for unknown request" << id;
        return;
    }
    PendingRequest request = pending_.take(id);

    if (!json["ok"].toBool()) {
        QString error = json["error"].toString();
        if (error.isEmpty()) {
            error = QStringLiteral("ERR::API_ERROR");
        }
        failRequest(request, error);
        return;
    }

    QJsonValue result = json["result"];
    switch (request.command) {
    case Command::FetchVideoInfo: {
        VideoInfo info = parseVideoInfo(result.toObject());
        if (info.videoId.isEmpty()) {
            info.videoId = request.key;
        }
        emit videoInfoReceived(info);
        break;
    }
    case Command::Download: {
        QString outputPath = result.isObject() ? result.toObject()["outputPath"].toString()
                                               : result.toString();
        emit dispatchSucceeded(request.key, outputPath);
        break;
    }
    case Command::Cancel:
    case Command::CancelAll:
        // Confirmation arrives as a download_cancelled event or a rejection
        break;
    }
}

void ProcessBackend::handleEvent(const QJsonObject &json)
{
    QString event = json["event"].toString();

    if (event == QLatin1String("progress")) {
        ProgressEntry entry = parseProgress(json["payload"].toObject());
        if (entry.downloadId.isEmpty()) {
            qWarning() << "ProcessBackend: Progress event without downloadId";
            return;
        }
        emit progressReceived(entry);
    } else if (event == QLatin1String("download_cancelled")) {
        QString downloadId = json["downloadId"].toString();
        if (downloadId.isEmpty()) {
            downloadId = json["payload"].toObject()["downloadId"].toString();
        }
        if (!downloadId.isEmpty()) {
            emit downloadCancelled(downloadId);
        }
    } else {
        LOG_VERBOSE() << "ProcessBackend: Ignoring event" << event;
    }
}

void ProcessBackend::failRequest(const PendingRequest &request, const QString &error)
{
    switch (request.command) {
    case Command::FetchVideoInfo:
        emit videoInfoFailed(request.key, error);
        break;
    case Command::Download:
        emit dispatchFailed(request.key, error);
        break;
    case Command::Cancel:
    case Command::CancelAll:
        qWarning() << "ProcessBackend:" << commandName(request.command)
                   << request.key << "failed:" << error;
        break;
    }
}

void ProcessBackend::rejectAll(const QString &reason)
{
    const QString error = QStringLiteral("ERR::NETWORK::%1").arg(reason);
    const QHash<int, PendingRequest> pending = pending_;
    pending_.clear();
    outputBuffer_.clear();

    for (auto it = pending.cbegin(); it != pending.cend(); ++it) {
        failRequest(it.value(), error);
    }
}

void ProcessBackend::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    QString reason = exitStatus == QProcess::CrashExit
        ? tr("backend crashed")
        : tr("backend exited with code %1").arg(exitCode);

    if (pending_.isEmpty()) {
        qInfo() << "ProcessBackend:" << reason;
    } else {
        qWarning() << "ProcessBackend:" << reason << "with" << pending_.size() << "requests outstanding";
    }

    rejectAll(reason);
    emit backendError(reason);
}

void ProcessBackend::onProcessError(QProcess::ProcessError error)
{
    // Crashes are reported through finished() as well
    if (error != QProcess::FailedToStart) {
        LOG_VERBOSE() << "ProcessBackend: Process error" << error << process_->errorString();
        return;
    }

    QString reason = tr("failed to start backend: %1").arg(process_->errorString());
    qWarning() << "ProcessBackend:" << reason;
    rejectAll(reason);
    emit backendError(reason);
}

// ============================================================================
// Wire format
// ============================================================================

QByteArray ProcessBackend::encodeRequest(int id, const QString &command, const QJsonObject &args)
{
    QJsonObject request;
    request["id"] = id;
    request["command"] = command;
    request["args"] = args;
    return QJsonDocument(request).toJson(QJsonDocument::Compact) + '\n';
}

QJsonObject ProcessBackend::dispatchArguments(const DispatchOptions &options)
{
    QJsonObject args;
    args["sourceId"] = options.sourceId;
    args["partId"] = options.partId;
    args["outputName"] = options.outputName;
    args["videoQuality"] = options.videoQuality;
    args["audioQuality"] = options.audioQuality;
    args["downloadId"] = options.downloadId;
    args["parentId"] = options.parentId;
    args["durationSeconds"] = options.durationSeconds;
    args["thumbnailUrl"] = options.thumbnailUrl;
    args["page"] = options.page;
    return args;
}

ProgressEntry ProcessBackend::parseProgress(const QJsonObject &payload)
{
    ProgressEntry entry;
    entry.downloadId = payload["downloadId"].toString();
    entry.parentId = payload["parentId"].toString();
    entry.stage = stageFromString(payload["stage"].toString());
    entry.filesize = optionalDouble(payload["filesize"]);
    entry.downloaded = optionalDouble(payload["downloaded"]);
    entry.transferRate = payload["transferRate"].toDouble();
    entry.percentage = payload["percentage"].toDouble();
    entry.deltaTime = payload["deltaTime"].toDouble();
    entry.elapsedTime = payload["elapsedTime"].toDouble();
    entry.isComplete = payload["isComplete"].toBool();
    return entry;
}

VideoInfo ProcessBackend::parseVideoInfo(const QJsonObject &result)
{
    VideoInfo info;
    info.title = result["title"].toString();
    info.videoId = result["bvid"].toString();
    if (info.videoId.isEmpty()) {
        info.videoId = result["videoId"].toString();
    }

    const QJsonArray parts = result["parts"].toArray();
    for (const QJsonValue &partVal : parts) {
        QJsonObject partObj = partVal.toObject();
        VideoPart part;
        part.part = partObj["part"].toString();
        part.page = partObj["page"].toInt();
        part.cid = partObj["cid"].toInteger();
        part.duration = partObj["duration"].toInt();
        part.videoQualities = parseQualities(partObj["videoQualities"].toArray());
        part.audioQualities = parseQualities(partObj["audioQualities"].toArray());

        QJsonValue thumbnail = partObj["thumbnail"];
        part.thumbnailUrl = thumbnail.isObject() ? thumbnail.toObject()["url"].toString()
                                                 : partObj["thumbnailUrl"].toString();
        info.parts.append(part);
    }

    return info;
}
