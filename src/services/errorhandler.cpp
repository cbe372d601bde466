#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    present(category, severity, title, details, timeoutForSeverity(severity));
}

void ErrorHandler::handleDownloadFailed(const QString &message)
{
    handleError(ErrorCategory::Download,
                ErrorSeverity::Critical,
                tr("Download failed"),
                message);
}

void ErrorHandler::handleFetchFailed(const QString &message)
{
    handleError(ErrorCategory::Metadata,
                ErrorSeverity::Warning,
                tr("Could not fetch video information"),
                message);
}

void ErrorHandler::handleQualityFallback(const QString &message)
{
    present(ErrorCategory::Quality,
            ErrorSeverity::Warning,
            tr("Quality unavailable"),
            message,
            QualityFallbackTimeoutMs);
}

void ErrorHandler::handleValidationError(const QString &message)
{
    handleError(ErrorCategory::Validation,
                ErrorSeverity::Info,
                tr("Invalid input"),
                message);
}

void ErrorHandler::present(ErrorCategory category,
                           ErrorSeverity severity,
                           const QString &title,
                           const QString &details,
                           int timeout)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeout);
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // Sticky
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Download:
        return QStringLiteral("Download");
    case ErrorCategory::Metadata:
        return QStringLiteral("Metadata");
    case ErrorCategory::Quality:
        return QStringLiteral("Quality");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
