/**
 * @file errorhandler.h
 * @brief Centralized error categorisation and logging for remote operations.
 *
 * This service standardizes how errors are categorized, reported, and logged
 * across the application, so the command-line front end and any other
 * consumer present failures consistently.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "ftperror.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,     ///< Login, network or reconnect failures
    FileOperation,  ///< Transfer, listing, delete, rename errors
    LocalFile,      ///< Local folder creation, file read/write errors
    Validation,     ///< Input validation, configuration errors
    System          ///< General system/application errors
};

/**
 * @brief Severity levels determining how loudly errors are reported.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - short status message
    Warning,   ///< Warning - operation failed, the session is still usable
    Critical   ///< Critical - the session or run cannot continue
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the application:
 * - Categorizes errors for appropriate handling
 * - Maps FtpError kinds to a category and severity
 * - Logs errors through the Qt message handler
 * - Publishes a one-line status message for the user
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(connection, &ConnectionManager::connectionError,
 *         handler, &ErrorHandler::handleConnectionError);
 *
 * files->deleteFile(path, [handler](const FtpError &error) {
 *     if (error.isError()) {
 *         handler->handleFtpError(QObject::tr("Delete"), error);
 *     }
 * });
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

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

    /**
     * @brief Handles an FtpError returned by a remote operation.
     * @param operation The operation that failed (e.g., "Upload").
     * @param error The error; ignored if it is not an error.
     */
    void handleFtpError(const QString &operation, const FtpError &error);
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a connection error (critical severity).
     * @param message The error message.
     */
    void handleConnectionError(const QString &message);

    /**
     * @brief Handles a file operation error (warning severity).
     * @param operation The operation that failed (e.g., "upload", "download").
     * @param error The error message.
     */
    void handleOperationFailed(const QString &operation, const QString &error);

    /**
     * @brief Handles invalid user input or configuration (warning severity).
     */
    void handleValidationError(const QString &message);
    /// @}

    /// @brief Category used for errors of @p kind
    [[nodiscard]] static ErrorCategory categoryForKind(FtpErrorKind kind);

    /// @brief Severity used for errors of @p kind
    [[nodiscard]] static ErrorSeverity severityForKind(FtpErrorKind kind);

    /**
     * @brief Converts category to string for logging.
     */
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /**
     * @brief Converts severity to string for logging.
     */
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted with a one-line message for the user.
     * @param message The message text.
     * @param timeout Suggested display time in milliseconds (0 for no timeout).
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
    /**
     * @brief Logs an error for debugging.
     */
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    /**
     * @brief Gets the status message timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
};

#endif // ERRORHANDLER_H
