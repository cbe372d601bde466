/**
 * @file errorclassifier.h
 * @brief Classification of backend failure strings.
 *
 * The backend reports failures across the process boundary as strings of the
 * form `ERR::<CODE>` or `ERR::NETWORK::<detail>`. This is the only place that
 * parses them.
 */

#ifndef ERRORCLASSIFIER_H
#define ERRORCLASSIFIER_H

#include <QString>

/**
 * @brief Taxonomy of backend failures.
 */
enum class ErrorKind {
    NotFound,            ///< ERR::VIDEO_NOT_FOUND
    AuthMissing,         ///< ERR::COOKIE_MISSING
    UpstreamApiError,    ///< ERR::API_ERROR
    OutputConflict,      ///< ERR::FILE_EXISTS
    DiskFull,            ///< ERR::DISK_FULL
    MergeFailed,         ///< ERR::MERGE_FAILED
    QualityUnavailable,  ///< ERR::QUALITY_NOT_FOUND
    RateLimited,         ///< ERR::RATE_LIMITED
    NetworkError,        ///< ERR::NETWORK::<detail>
    Cancelled,           ///< ERR::CANCELLED, never shown to the user
    Unclassified         ///< Anything else, passed through unchanged
};

/**
 * @brief Result of classifying a raw failure string.
 */
struct ClassifiedError {
    ErrorKind kind = ErrorKind::Unclassified;
    QString raw;
    QString messageKey;  ///< Translation key, e.g. "video.disk_full"; empty when unclassified
    QString message;     ///< Localized message; the raw string when unclassified
    QString detail;      ///< Text after "ERR::NETWORK::" for network errors

    [[nodiscard]] bool isCancelled() const { return kind == ErrorKind::Cancelled; }
};

namespace ErrorClassifier {

/**
 * @brief Classifies a backend failure.
 *
 * Matches the taxonomy codes as substrings, in declaration order; the first
 * match wins.
 */
[[nodiscard]] ClassifiedError classify(const QString &raw);

/**
 * @brief Extracts the code component of a failure string.
 * @return "DISK_FULL" for "ERR::DISK_FULL", "NETWORK" for
 *         "ERR::NETWORK::timeout", or an empty string without an ERR:: prefix.
 */
[[nodiscard]] QString errorCode(const QString &raw);

/// Translation key for a kind, empty for Unclassified.
[[nodiscard]] QString messageKey(ErrorKind kind);

/// Lower-case kind name for logging.
[[nodiscard]] const char *kindToString(ErrorKind kind);

} // namespace ErrorClassifier

#endif // ERRORCLASSIFIER_H
