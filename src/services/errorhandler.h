/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error presentation.
 *
 * This service standardizes how errors are categorized, presented as toasts,
 * and logged across the application.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Download,    ///< A part download or merge failed
    Metadata,    ///< Fetching video information failed
    Quality,     ///< The backend fell back to a lower quality
    Validation,  ///< Input validation, configuration errors
    System       ///< General system/application errors
};

/**
 * @brief Severity levels determining how long a toast stays visible.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - short timeout
    Warning,   ///< Warning - longer timeout
    Critical   ///< Critical - stays until dismissed or replaced
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error presentation across the application:
 * - Categorizes errors for appropriate handling
 * - Emits a toast whose lifetime depends on severity
 * - Logs errors for debugging
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(handler, &ErrorHandler::statusMessage,
 *         this, &Console::showToast);
 *
 * handler->handleError(ErrorCategory::Download,
 *                      ErrorSeverity::Critical,
 *                      "Download failed",
 *                      "Not enough disk space");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /// Toast lifetime of quality fallback warnings
    static constexpr int QualityFallbackTimeoutMs = 6000;

    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a failed part download (critical severity).
     * @param message The classified, user-facing message.
     *
     * The toast stays until replaced.
     */
    void handleDownloadFailed(const QString &message);

    /**
     * @brief Handles a failed metadata fetch (warning severity).
     * @param message The classified, user-facing message.
     */
    void handleFetchFailed(const QString &message);

    /**
     * @brief Handles a quality fallback warning.
     * @param message Description of the substituted quality.
     *
     * Never a failure; shown for QualityFallbackTimeoutMs.
     */
    void handleQualityFallback(const QString &message);

    /**
     * @brief Handles rejected user input (info severity).
     * @param message The validation message.
     */
    void handleValidationError(const QString &message);
    /// @}

signals:
    /**
     * @brief Emitted to display a toast.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void present(ErrorCategory category,
                 ErrorSeverity severity,
                 const QString &title,
                 const QString &details,
                 int timeout);

    /**
     * @brief Logs an error for debugging.
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    /**
     * @brief Gets the toast timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);
};

#endif // ERRORHANDLER_H
