#include "mocktransport.h"

#include <QFile>
#include <QMutexLocker>

MockTransport::~MockTransport()
{
    // Never leave a worker blocked on the gate
    mockReleaseAll();
}

CommandResult MockTransport::list(const QString &remotePath)
{
    QMutexLocker locker(&mutex_);
    listRequests_.append(remotePath);

    if (failingListings_.contains(remotePath) || !listings_.contains(remotePath)) {
        return failure(2, QStringLiteral("ls: cannot access '%1': No such file or directory")
                              .arg(remotePath));
    }

    QByteArray output;
    for (const FileEntry &entry : listings_.value(remotePath)) {
        output += entry.name.toUtf8();
        if (entry.isDirectory) {
            output += '/';
        }
        output += '\n';
    }
    return success(output);
}

CommandResult MockTransport::stat(const QString &remotePath)
{
    QMutexLocker locker(&mutex_);
    statRequests_.append(remotePath);

    if (!sizes_.contains(remotePath)) {
        return failure(1, QString());
    }
    return success(QByteArray::number(sizes_.value(remotePath)) + '\n');
}

CommandResult MockTransport::home()
{
    QMutexLocker locker(&mutex_);
    if (home_.isEmpty()) {
        return failure(255, QStringLiteral("Connection refused"));
    }
    return success(home_.toUtf8() + '\n');
}

CommandResult MockTransport::get(const QString &remotePath, const QString &localPath)
{
    enterTransfer();

    QByteArray data;
    QString error;
    {
        QMutexLocker locker(&mutex_);
        getRequests_.append(remotePath);
        error = getFailures_.value(remotePath);
        if (data_.contains(remotePath)) {
            data = data_.value(remotePath);
        } else {
            data = QByteArray(static_cast<int>(sizes_.value(remotePath, 0)), 'x');
        }
    }

    CommandResult result;
    if (!error.isEmpty()) {
        result = failure(1, error);
    } else {
        QFile file(localPath);
        if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size()) {
            result = failure(1, QStringLiteral("%1: %2").arg(localPath, file.errorString()));
        } else {
            result = success();
        }
    }

    leaveTransfer();
    return result;
}

CommandResult MockTransport::put(const QString &localPath, const QString &remotePath)
{
    enterTransfer();

    QFile file(localPath);
    const bool readable = file.open(QIODevice::ReadOnly);
    const QByteArray data = readable ? file.readAll() : QByteArray();

    CommandResult result;
    {
        QMutexLocker locker(&mutex_);
        putRequests_.append(qMakePair(localPath, remotePath));
        const QString error = putFailures_.value(remotePath);
        if (!error.isEmpty()) {
            result = failure(1, error);
        } else if (!readable) {
            result = failure(1, QStringLiteral("%1: No such file or directory").arg(localPath));
        } else {
            uploaded_.insert(remotePath, data);
            result = success();
        }
    }

    leaveTransfer();
    return result;
}

CommandResult MockTransport::mkdirParents(const QString &remotePath)
{
    QMutexLocker locker(&mutex_);
    mkdirRequests_.append(remotePath);

    const QString error = mkdirFailures_.value(remotePath);
    if (!error.isEmpty()) {
        return failure(1, error);
    }
    return success();
}

void MockTransport::mockSetDirectoryListing(const QString &path, const QList<FileEntry> &entries)
{
    QMutexLocker locker(&mutex_);
    listings_.insert(path, entries);
    failingListings_.remove(path);
}

void MockTransport::mockSetListingFails(const QString &path)
{
    QMutexLocker locker(&mutex_);
    failingListings_.insert(path);
}

void MockTransport::mockSetFileSize(const QString &path, quint64 size)
{
    QMutexLocker locker(&mutex_);
    sizes_.insert(path, size);
}

void MockTransport::mockSetFileData(const QString &path, const QByteArray &data)
{
    QMutexLocker locker(&mutex_);
    data_.insert(path, data);
    sizes_.insert(path, static_cast<quint64>(data.size()));
}

void MockTransport::mockSetHome(const QString &path)
{
    QMutexLocker locker(&mutex_);
    home_ = path;
}

void MockTransport::mockSetGetFails(const QString &remotePath, const QString &error)
{
    QMutexLocker locker(&mutex_);
    getFailures_.insert(remotePath, error);
}

void MockTransport::mockSetPutFails(const QString &remotePath, const QString &error)
{
    QMutexLocker locker(&mutex_);
    putFailures_.insert(remotePath, error);
}

void MockTransport::mockSetMkdirFails(const QString &remotePath, const QString &error)
{
    QMutexLocker locker(&mutex_);
    mkdirFailures_.insert(remotePath, error);
}

void MockTransport::mockSetGated(bool gated)
{
    QMutexLocker locker(&mutex_);
    gated_ = gated;
    if (!gated_) {
        gateCondition_.wakeAll();
    }
}

void MockTransport::mockRelease(int count)
{
    QMutexLocker locker(&mutex_);
    releases_ += count;
    gateCondition_.wakeAll();
}

void MockTransport::mockReleaseAll()
{
    mockSetGated(false);
}

QStringList MockTransport::mockListRequests() const
{
    QMutexLocker locker(&mutex_);
    return listRequests_;
}

QStringList MockTransport::mockStatRequests() const
{
    QMutexLocker locker(&mutex_);
    return statRequests_;
}

QStringList MockTransport::mockGetRequests() const
{
    QMutexLocker locker(&mutex_);
    return getRequests_;
}

QList<QPair<QString, QString>> MockTransport::mockPutRequests() const
{
    QMutexLocker locker(&mutex_);
    return putRequests_;
}

QStringList MockTransport::mockMkdirRequests() const
{
    QMutexLocker locker(&mutex_);
    return mkdirRequests_;
}

QByteArray MockTransport::mockUploadedData(const QString &remotePath) const
{
    QMutexLocker locker(&mutex_);
    return uploaded_.value(remotePath);
}

int MockTransport::mockActiveTransfers() const
{
    QMutexLocker locker(&mutex_);
    return active_;
}

int MockTransport::mockPeakConcurrentTransfers() const
{
    QMutexLocker locker(&mutex_);
    return peak_;
}

int MockTransport::mockWaitingTransfers() const
{
    QMutexLocker locker(&mutex_);
    return waiting_;
}

void MockTransport::enterTransfer()
{
    QMutexLocker locker(&mutex_);
    ++active_;
    peak_ = qMax(peak_, active_);

    ++waiting_;
    while (gated_ && releases_ == 0) {
        gateCondition_.wait(&mutex_);
    }
    --waiting_;
    if (gated_) {
        --releases_;
    }
}

void MockTransport::leaveTransfer()
{
    QMutexLocker locker(&mutex_);
    --active_;
}

CommandResult MockTransport::success(const QByteArray &output)
{
    CommandResult result;
    result.exitCode = 0;
    result.standardOutput = output;
    return result;
}

CommandResult MockTransport::failure(int exitCode, const QString &error)
{
    CommandResult result;
    result.exitCode = exitCode;
    result.standardError = error;
    return result;
}
