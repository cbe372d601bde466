#ifndef DOWNLOADSTATUS_H
#define DOWNLOADSTATUS_H

#include <QObject>
#include <QString>

/**
 * @brief Last unrecovered error of the current batch.
 *
 * Presentation uses it to leave a blocking "still downloading" state as soon
 * as a batch fails. Cleared when a new batch starts.
 */
class DownloadStatus : public QObject
{
    Q_OBJECT

public:
    explicit DownloadStatus(QObject *parent = nullptr);
    ~DownloadStatus() override = default;

    [[nodiscard]] bool hasError() const { return hasError_; }
    [[nodiscard]] QString errorMessage() const { return errorMessage_; }

    void setError(const QString &message);
    void clearError();

signals:
    void errorChanged(bool hasError, const QString &message);

private:
    bool hasError_ = false;
    QString errorMessage_;
};

#endif // DOWNLOADSTATUS_H
