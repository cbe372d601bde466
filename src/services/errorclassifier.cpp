#include "errorclassifier.h"

#include <QCoreApplication>

namespace {

const QLatin1String ErrorPrefix("ERR::");
const QLatin1String NetworkPrefix("ERR::NETWORK::");

struct ErrorPattern {
    const char *code;
    ErrorKind kind;
};

// Order matters, the first matching code wins
constexpr ErrorPattern Patterns[] = {
    {"ERR::VIDEO_NOT_FOUND", ErrorKind::NotFound},
    {"ERR::COOKIE_MISSING", ErrorKind::AuthMissing},
    {"ERR::API_ERROR", ErrorKind::UpstreamApiError},
    {"ERR::FILE_EXISTS", ErrorKind::OutputConflict},
    {"ERR::DISK_FULL", ErrorKind::DiskFull},
    {"ERR::MERGE_FAILED", ErrorKind::MergeFailed},
    {"ERR::QUALITY_NOT_FOUND", ErrorKind::QualityUnavailable},
    {"ERR::RATE_LIMITED", ErrorKind::RateLimited},
    {"ERR::NETWORK", ErrorKind::NetworkError},
    {"ERR::CANCELLED", ErrorKind::Cancelled},
};

QString tr(const char *text)
{
    return QCoreApplication::translate("ErrorClassifier", text);
}

QString localizedMessage(ErrorKind kind, const QString &detail)
{
    switch (kind) {
    case ErrorKind::NotFound:
        return tr("The video could not be found.");
    case ErrorKind::AuthMissing:
        return tr("Login cookie is missing. Sign in and try again.");
    case ErrorKind::UpstreamApiError:
        return tr("The video service returned an error.");
    case ErrorKind::OutputConflict:
        return tr("A file with the same name already exists.");
    case ErrorKind::DiskFull:
        return tr("Not enough disk space.");
    case ErrorKind::MergeFailed:
        return tr("Merging audio and video failed.");
    case ErrorKind::QualityUnavailable:
        return tr("The selected quality is not available.");
    case ErrorKind::RateLimited:
        return tr("Too many requests. Wait a moment and try again.");
    case ErrorKind::NetworkError:
        if (detail.isEmpty()) {
            return tr("A network error occurred.");
        }
        return tr("A network error occurred: %1").arg(detail);
    case ErrorKind::Cancelled:
        return tr("The download was cancelled.");
    case ErrorKind::Unclassified:
        break;
    }
    return QString();
}

} // namespace

namespace ErrorClassifier {

ClassifiedError classify(const QString &raw)
{
    ClassifiedError result;
    result.raw = raw;
    result.message = raw;

    for (const ErrorPattern &pattern : Patterns) {
        if (!raw.contains(QLatin1String(pattern.code))) {
            continue;
        }

        result.kind = pattern.kind;
        if (pattern.kind == ErrorKind::NetworkError) {
            int pos = raw.indexOf(NetworkPrefix);
            if (pos >= 0) {
                result.detail = raw.mid(pos + NetworkPrefix.size()).trimmed();
            }
        }
        result.messageKey = messageKey(pattern.kind);
        result.message = localizedMessage(pattern.kind, result.detail);
        break;
    }

    return result;
}

QString errorCode(const QString &raw)
{
    int pos = raw.indexOf(ErrorPrefix);
    if (pos < 0) {
        return QString();
    }
    QString rest = raw.mid(pos + ErrorPrefix.size());
    int end = rest.indexOf(QLatin1String("::"));
    return (end < 0 ? rest : rest.left(end)).trimmed();
}

QString messageKey(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NotFound:
        return QStringLiteral("video.video_not_found");
    case ErrorKind::AuthMissing:
        return QStringLiteral("video.cookie_missing");
    case ErrorKind::UpstreamApiError:
        return QStringLiteral("video.api_error");
    case ErrorKind::OutputConflict:
        return QStringLiteral("video.file_exists");
    case ErrorKind::DiskFull:
        return QStringLiteral("video.disk_full");
    case ErrorKind::MergeFailed:
        return QStringLiteral("video.merge_failed");
    case ErrorKind::QualityUnavailable:
        return QStringLiteral("video.quality_not_found");
    case ErrorKind::RateLimited:
        return QStringLiteral("video.rate_limited");
    case ErrorKind::NetworkError:
        return QStringLiteral("video.network_error");
    case ErrorKind::Cancelled:
        return QStringLiteral("video.cancelled");
    case ErrorKind::Unclassified:
        break;
    }
    return QString();
}

const char *kindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NotFound: return "not-found";
    case ErrorKind::AuthMissing: return "auth-missing";
    case ErrorKind::UpstreamApiError: return "upstream-api-error";
    case ErrorKind::OutputConflict: return "output-conflict";
    case ErrorKind::DiskFull: return "disk-full";
    case ErrorKind::MergeFailed: return "merge-failed";
    case ErrorKind::QualityUnavailable: return "quality-unavailable";
    case ErrorKind::RateLimited: return "rate-limited";
    case ErrorKind::NetworkError: return "network-error";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::Unclassified: return "unclassified";
    }
    return "unknown";
}

} // namespace ErrorClassifier
