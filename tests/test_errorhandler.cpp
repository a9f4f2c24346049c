/**
 * @file test_errorhandler.cpp
 * @brief Unit tests for ErrorHandler.
 *
 * Tests verify:
 * - Error handling emits footer messages
 * - Severity levels determine timeout durations
 * - Listing and transfer failures are reported as warnings
 * - Signal forwarding works correctly
 *
 * The handler is built without a parent widget so Critical errors never
 * open a dialog.
 */

#include <QtTest/QtTest>
#include <QSignalSpy>

#include "services/errorhandler.h"

class TestErrorHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Status message tests
    void testHandleErrorEmitsStatusMessage();
    void testDetailsEqualToTitleNotRepeated();
    void testInfoSeverityTimeout();
    void testWarningSeverityTimeout();
    void testCriticalSeverityTimeout();

    // Convenience method tests
    void testHandleListingError();
    void testHandleTransferFailed();
    void testHandleTransferFailedWithoutMessage();
    void testHandleConfigurationError();

    // Signal forwarding tests
    void testErrorLoggedSignal();

    // Category and severity string conversion
    void testCategorySeverityStrings();

private:
    ErrorHandler *handler_ = nullptr;
};

void TestErrorHandler::init()
{
    handler_ = new ErrorHandler(nullptr, this);
}

void TestErrorHandler::cleanup()
{
    delete handler_;
    handler_ = nullptr;
}

void TestErrorHandler::testHandleErrorEmitsStatusMessage()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::System,
                          ErrorSeverity::Info,
                          "Test error",
                          "Details");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("Test error: Details"));
}

void TestErrorHandler::testDetailsEqualToTitleNotRepeated()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::System, ErrorSeverity::Info, "Same", "Same");

    QCOMPARE(spy.at(0).at(0).toString(), QString("Same"));
}

void TestErrorHandler::testInfoSeverityTimeout()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::System,
                          ErrorSeverity::Info,
                          "Info message");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 3000);
}

void TestErrorHandler::testWarningSeverityTimeout()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    QTest::ignoreMessage(QtWarningMsg, "[System/WARN] Warning message");
    handler_->handleError(ErrorCategory::System,
                          ErrorSeverity::Warning,
                          "Warning message");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 5000);
}

void TestErrorHandler::testCriticalSeverityTimeout()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    QTest::ignoreMessage(QtCriticalMsg, "[System/CRIT] Broken");
    handler_->handleError(ErrorCategory::System, ErrorSeverity::Critical, "Broken");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 0);
    QCOMPARE(ErrorHandler::timeoutForSeverity(ErrorSeverity::Critical), 0);
}

void TestErrorHandler::testHandleListingError()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("^\\[Listing/WARN\\] Cannot list /root"));
    handler_->handleListingError("/root", "remote directory unreachable");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("Cannot list /root: remote directory unreachable"));
    QCOMPARE(spy.at(0).at(1).toInt(), 5000);
}

void TestErrorHandler::testHandleTransferFailed()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("^\\[Transfer/WARN\\]"));
    handler_->handleTransferFailed("db.sql", "Download error for db.sql: scp exited with status 1");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(),
             QString("Download error for db.sql: scp exited with status 1"));
}

void TestErrorHandler::testHandleTransferFailedWithoutMessage()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("^\\[Transfer/WARN\\]"));
    handler_->handleTransferFailed("db.sql", QString());

    QCOMPARE(spy.at(0).at(0).toString(), QString("Transfer of db.sql failed"));
}

void TestErrorHandler::testHandleConfigurationError()
{
    QSignalSpy spy(handler_, &ErrorHandler::errorLogged);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("^\\[Config/WARN\\]"));
    handler_->handleConfigurationError("unknown host alias 'prod'");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<ErrorCategory>(), ErrorCategory::Configuration);
    QCOMPARE(spy.at(0).at(3).toString(), QString("unknown host alias 'prod'"));
}

void TestErrorHandler::testErrorLoggedSignal()
{
    QSignalSpy spy(handler_, &ErrorHandler::errorLogged);

    QTest::ignoreMessage(QtWarningMsg, "[Transfer/WARN] File error: Details here");
    handler_->handleError(ErrorCategory::Transfer,
                          ErrorSeverity::Warning,
                          "File error",
                          "Details here");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<ErrorCategory>(), ErrorCategory::Transfer);
    QCOMPARE(spy.at(0).at(1).value<ErrorSeverity>(), ErrorSeverity::Warning);
    QCOMPARE(spy.at(0).at(2).toString(), QString("File error"));
    QCOMPARE(spy.at(0).at(3).toString(), QString("Details here"));
}

void TestErrorHandler::testCategorySeverityStrings()
{
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::Listing), QString("Listing"));
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::Transfer), QString("Transfer"));
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::Configuration), QString("Config"));
    QCOMPARE(ErrorHandler::categoryToString(ErrorCategory::System), QString("System"));

    QCOMPARE(ErrorHandler::severityToString(ErrorSeverity::Info), QString("INFO"));
    QCOMPARE(ErrorHandler::severityToString(ErrorSeverity::Warning), QString("WARN"));
    QCOMPARE(ErrorHandler::severityToString(ErrorSeverity::Critical), QString("CRIT"));
}

QTEST_MAIN(TestErrorHandler)
#include "test_errorhandler.moc"
