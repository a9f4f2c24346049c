/**
 * @file mocktransport.h
 * @brief Mock transport for unit and threaded integration testing.
 *
 * This mock implements ITransport and can be shared with worker threads
 * exactly like SshTransport.
 */

#ifndef MOCKTRANSPORT_H
#define MOCKTRANSPORT_H

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QPair>
#include <QSet>
#include <QStringList>
#include <QWaitCondition>

#include "services/fileentry.h"
#include "services/itransport.h"

/**
 * @brief Scriptable, thread-safe ITransport for tests.
 *
 * @par Features:
 * - Configurable directory listings, file sizes and file contents
 * - Per-path failure simulation for list, get, put and mkdir
 * - Optional gate that holds get/put calls until the test releases them
 * - Request tracking and peak concurrency for test assertions
 *
 * @par Example usage:
 * @code
 * auto mock = std::make_shared<MockTransport>();
 * mock->mockSetDirectoryListing("/srv", {{"logs", true}, {"a.txt", false}});
 * mock->mockSetFileData("/srv/a.txt", "hello");
 *
 * RemoteDirectory remote(mock);
 * QCOMPARE(remote.listRemote("/srv").size(), 2);
 * QCOMPARE(mock->mockListRequests().first(), QString("/srv"));
 * @endcode
 */
class MockTransport : public ITransport
{
public:
    MockTransport() = default;
    ~MockTransport() override;

    /// @name ITransport Implementation
    /// @{
    CommandResult list(const QString &remotePath) override;
    CommandResult stat(const QString &remotePath) override;
    CommandResult home() override;
    CommandResult get(const QString &remotePath, const QString &localPath) override;
    CommandResult put(const QString &localPath, const QString &remotePath) override;
    CommandResult mkdirParents(const QString &remotePath) override;
    [[nodiscard]] QString describeTarget() const override { return QStringLiteral("mock@test:22"); }
    /// @}

    /// @name Mock Control
    /// @{

    /// @brief Sets what list() returns for @p path (order is kept as given).
    void mockSetDirectoryListing(const QString &path, const QList<FileEntry> &entries);

    /// @brief Makes list() of @p path exit with status 2.
    void mockSetListingFails(const QString &path);

    /// @brief Sets the size stat() reports; files with data get their data size.
    void mockSetFileSize(const QString &path, quint64 size);

    /// @brief Contents written by get() (also sets the reported size).
    void mockSetFileData(const QString &path, const QByteArray &data);

    /// @brief Login directory reported by home(); empty makes home() fail.
    void mockSetHome(const QString &path);

    void mockSetGetFails(const QString &remotePath, const QString &error);
    void mockSetPutFails(const QString &remotePath, const QString &error);
    void mockSetMkdirFails(const QString &remotePath, const QString &error);

    /**
     * @brief Holds every get()/put() until released.
     *
     * Each mockRelease() lets one waiting (or future) call through.
     */
    void mockSetGated(bool gated);
    void mockRelease(int count = 1);
    void mockReleaseAll();
    /// @}

    /// @name Inspection
    /// @{
    [[nodiscard]] QStringList mockListRequests() const;
    [[nodiscard]] QStringList mockStatRequests() const;
    [[nodiscard]] QStringList mockGetRequests() const;
    [[nodiscard]] QList<QPair<QString, QString>> mockPutRequests() const;
    [[nodiscard]] QStringList mockMkdirRequests() const;
    [[nodiscard]] QByteArray mockUploadedData(const QString &remotePath) const;
    [[nodiscard]] int mockActiveTransfers() const;
    [[nodiscard]] int mockPeakConcurrentTransfers() const;
    [[nodiscard]] int mockWaitingTransfers() const;
    /// @}

private:
    void enterTransfer();
    void leaveTransfer();

    static CommandResult success(const QByteArray &output = QByteArray());
    static CommandResult failure(int exitCode, const QString &error);

    mutable QMutex mutex_;
    QWaitCondition gateCondition_;

    QMap<QString, QList<FileEntry>> listings_;
    QSet<QString> failingListings_;
    QMap<QString, quint64> sizes_;
    QMap<QString, QByteArray> data_;
    QString home_;
    QMap<QString, QString> getFailures_;
    QMap<QString, QString> putFailures_;
    QMap<QString, QString> mkdirFailures_;
    QMap<QString, QByteArray> uploaded_;

    bool gated_ = false;
    int releases_ = 0;
    int waiting_ = 0;
    int active_ = 0;
    int peak_ = 0;

    QStringList listRequests_;
    QStringList statRequests_;
    QStringList getRequests_;
    QList<QPair<QString, QString>> putRequests_;
    QStringList mkdirRequests_;
};

#endif // MOCKTRANSPORT_H
