#include "errorhandler.h"

#include <QDebug>
#include <QMessageBox>

ErrorHandler::ErrorHandler(QWidget *parentWidget, QObject *parent)
    : QObject(parent)
    , parentWidget_(parentWidget)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));

    if (severity == ErrorSeverity::Critical && parentWidget_ != nullptr) {
        showErrorDialog(title, details.isEmpty() ? title : details);
    }
}

void ErrorHandler::handleListingError(const QString &path, const QString &error)
{
    handleError(ErrorCategory::Listing,
                ErrorSeverity::Warning,
                tr("Cannot list %1").arg(path),
                error);
}

void ErrorHandler::handleTransferFailed(const QString &fileName, const QString &error)
{
    // The aggregator's message already names the file
    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Warning,
                error.isEmpty() ? tr("Transfer of %1 failed").arg(fileName) : error);
}

void ErrorHandler::handleConfigurationError(const QString &message)
{
    handleError(ErrorCategory::Configuration,
                ErrorSeverity::Warning,
                tr("Configuration"),
                message);
}

void ErrorHandler::showErrorDialog(const QString &title, const QString &message)
{
    QMessageBox::warning(parentWidget_, title, message);
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
        return 0;     // Stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Listing:
        return QStringLiteral("Listing");
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Configuration:
        return QStringLiteral("Config");
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
