/**
 * @file processbackend.h
 * @brief Download backend running as a child process.
 */

#ifndef PROCESSBACKEND_H
#define PROCESSBACKEND_H

#include <QByteArray>
#include <QHash>
#include <QIODevice>
#include <QJsonObject>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QStringList>

#include "idownloadbackend.h"

/**
 * @brief IDownloadBackend implementation talking to a helper process.
 *
 * The helper speaks newline-delimited JSON on its standard streams.
 *
 * Requests (stdin):
 * @code
 * {"id": 7, "command": "download_video", "args": {...}}
 * @endcode
 *
 * Replies and events (stdout):
 * @code
 * {"id": 7, "ok": true, "result": "/videos/Intro.mp4"}
 * {"id": 8, "ok": false, "error": "ERR::DISK_FULL"}
 * {"event": "progress", "payload": {"downloadId": "...", "stage": "video", ...}}
 * {"event": "download_cancelled", "downloadId": "..."}
 * @endcode
 *
 * The process is started on the first request. If it exits or fails to
 * start, every outstanding request is rejected with
 * `ERR::NETWORK::<reason>`.
 */
class ProcessBackend : public IDownloadBackend
{
    Q_OBJECT

public:
    /// Time given to the helper to exit after its stdin was closed
    static constexpr int StopTimeoutMs = 2000;

    explicit ProcessBackend(QObject *parent = nullptr);
    ~ProcessBackend() override;

    /**
     * @brief Sets the helper program and its arguments.
     *
     * Takes effect the next time the process is started.
     */
    void setProgram(const QString &program, const QStringList &arguments = QStringList());

    [[nodiscard]] QString program() const { return program_; }
    [[nodiscard]] QStringList arguments() const { return arguments_; }
    [[nodiscard]] bool isRunning() const { return process_->state() != QProcess::NotRunning; }
    [[nodiscard]] int pendingRequestCount() const { return pending_.size(); }

    /**
     * @brief Closes the helper's stdin and waits for it to exit.
     */
    void stop();

    // IDownloadBackend interface
    void fetchVideoInfo(const QString &videoId) override;
    void dispatch(const DispatchOptions &options) override;
    void cancel(const QString &downloadId) override;
    void cancelAll() override;

    /// @name Wire Format
    /// @{
    [[nodiscard]] static QByteArray encodeRequest(int id, const QString &command,
                                                  const QJsonObject &args);
    [[nodiscard]] static QJsonObject dispatchArguments(const DispatchOptions &options);
    [[nodiscard]] static ProgressEntry parseProgress(const QJsonObject &payload);
    [[nodiscard]] static VideoInfo parseVideoInfo(const QJsonObject &result);
    /// @}

    // For testing: write requests here instead of the process (not owned)
    void setRequestDevice(QIODevice *device) { requestDevice_ = device; }

    // For testing: handle output as if the process had written it
    void processOutput(const QByteArray &data);

signals:
    /**
     * @brief Emitted when the helper process failed or exited.
     * @param message Description of the failure.
     */
    void backendError(const QString &message);

private slots:
    void onReadyReadStandardOutput();
    void onReadyReadStandardError();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessError(QProcess::ProcessError error);

private:
    enum class Command { FetchVideoInfo, Download, Cancel, CancelAll };

    struct PendingRequest {
        Command command = Command::Cancel;
        QString key;  ///< Video id or download id the reply belongs to
    };

    [[nodiscard]] static const char *commandName(Command command);

    bool ensureStarted();
    void sendRequest(Command command, const QString &key, const QJsonObject &args);
    void handleLine(const QByteArray &line);
    void handleReply(const QJsonObject &json);
    void handleEvent(const QJsonObject &json);
    void failRequest(const PendingRequest &request, const QString &error);
    void rejectAll(const QString &reason);

    QProcess *process_ = nullptr;
    QPointer<QIODevice> requestDevice_;
    QString program_;
    QStringList arguments_;
    QByteArray outputBuffer_;
    int nextRequestId_ = 1;
    QHash<int, PendingRequest> pending_;
};

#endif // PROCESSBACKEND_H
