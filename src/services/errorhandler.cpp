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
    logError(category, severity, title, details);

    // Build the display message
    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleFtpError(const QString &operation, const FtpError &error)
{
    if (!error.isError()) {
        return;
    }
    handleError(categoryForKind(error.kind),
                severityForKind(error.kind),
                tr("%1 failed").arg(operation),
                error.message);
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Critical,
                tr("Connection Error"),
                message);
}

void ErrorHandler::handleOperationFailed(const QString &operation, const QString &error)
{
    handleError(ErrorCategory::FileOperation,
                ErrorSeverity::Warning,
                tr("%1 failed").arg(operation),
                error);
}

void ErrorHandler::handleValidationError(const QString &message)
{
    handleError(ErrorCategory::Validation,
                ErrorSeverity::Warning,
                tr("Invalid input"),
                message);
}

ErrorCategory ErrorHandler::categoryForKind(FtpErrorKind kind)
{
    switch (kind) {
    case FtpErrorKind::Connection:
        return ErrorCategory::Connection;
    case FtpErrorKind::Transfer:
    case FtpErrorKind::Listing:
    case FtpErrorKind::Command:
        return ErrorCategory::FileOperation;
    case FtpErrorKind::Filesystem:
        return ErrorCategory::LocalFile;
    case FtpErrorKind::None:
        break;
    }
    return ErrorCategory::System;
}

ErrorSeverity ErrorHandler::severityForKind(FtpErrorKind kind)
{
    switch (kind) {
    case FtpErrorKind::Connection:
    case FtpErrorKind::Filesystem:
        return ErrorSeverity::Critical;
    case FtpErrorKind::Transfer:
    case FtpErrorKind::Listing:
    case FtpErrorKind::Command:
        return ErrorSeverity::Warning;
    case FtpErrorKind::None:
        break;
    }
    return ErrorSeverity::Info;
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
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::FileOperation:
        return QStringLiteral("FileOp");
    case ErrorCategory::LocalFile:
        return QStringLiteral("Local");
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
