/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error presentation.
 *
 * This service standardizes how errors are categorized, displayed, and logged
 * across the application. Nothing it handles is fatal to the process.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

class QWidget;

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Listing,        ///< Local or remote directory listing errors
    Transfer,       ///< Download/upload failures, remote mkdir failures
    Configuration,  ///< Host store, settings and command line errors
    System          ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are displayed.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - footer only, short timeout
    Warning,   ///< Warning - footer, longer timeout
    Critical   ///< Critical - footer + dialog box
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error presentation across the application:
 * - Categorizes errors for appropriate handling
 * - Displays errors based on severity (footer vs dialog)
 * - Logs errors through Qt's message handlers
 *
 * Dialogs are only shown when a parent widget was given, so the handler can
 * be used headless.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(window, this);
 *
 * connect(aggregator, &ProgressAggregator::transferFailed,
 *         handler, &ErrorHandler::handleTransferFailed);
 *
 * handler->handleListingError("/root/secret", "Permission denied");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parentWidget Widget to use as parent for dialogs (not owned, may be null).
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QWidget *parentWidget, QObject *parent = nullptr);

    ~ErrorHandler() override = default;

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

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief A directory could not be listed (warning severity).
     * @param path The directory that failed.
     * @param error The error message.
     */
    void handleListingError(const QString &path, const QString &error);

    /**
     * @brief A transfer job completed with an error (warning severity).
     * @param fileName Display name of the job.
     * @param error The error message.
     */
    void handleTransferFailed(const QString &fileName, const QString &error);

    /**
     * @brief A configuration problem at startup or load time (warning severity).
     * @param message The error message.
     */
    void handleConfigurationError(const QString &message);
    /// @}

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

    /**
     * @brief Gets the footer timeout for a severity level.
     * @return Timeout in milliseconds (0 keeps the message until replaced).
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted to display a footer message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void showErrorDialog(const QString &title, const QString &message);
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    QWidget *parentWidget_ = nullptr;
};

#endif // ERRORHANDLER_H
