#include "downloadstatus.h"

DownloadStatus::DownloadStatus(QObject *parent)
    : QObject(parent)
{
}

void DownloadStatus::setError(const QString &message)
{
    if (hasError_ && errorMessage_ == message) {
        return;
    }
    hasError_ = true;
    errorMessage_ = message;
    emit errorChanged(hasError_, errorMessage_);
}

void DownloadStatus::clearError()
{
    if (!hasError_) {
        return;
    }
    hasError_ = false;
    errorMessage_.clear();
    emit errorChanged(hasError_, errorMessage_);
}
