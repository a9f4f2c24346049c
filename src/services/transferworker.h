/**
 * @file transferworker.h
 * @brief Bodies of the background transfer jobs.
 */

#ifndef TRANSFERWORKER_H
#define TRANSFERWORKER_H

#include <QList>
#include <QString>
#include <QStringList>

#include <memory>

#include "models/transferjob.h"

class ITransport;
class ProgressChannel;
class QThread;

/**
 * @brief Executes one transfer job with blocking transport calls.
 *
 * A worker owns nothing but copies of its job data plus shared handles to
 * the transport and the progress channel. It never touches UI state: every
 * outcome is reported as a ProgressEvent, and each job ends with exactly one
 * Completed event.
 *
 * run() executes on the calling thread, which is what the tests use;
 * start() runs a job on a new QThread that deletes itself when done.
 *
 * @par Example usage:
 * @code
 * TransferWorker worker(transport, channel);
 * worker.run(job);                       // synchronous
 * TransferWorker::start(transport, channel, job);  // background
 * @endcode
 */
class TransferWorker
{
public:
    TransferWorker(std::shared_ptr<ITransport> transport,
                   std::shared_ptr<ProgressChannel> channel);

    /// @brief Dispatches on the job's kind and isDirectory flag.
    void run(const TransferJob &job);

    /**
     * @brief Runs @p job on a dedicated thread.
     * @return The started thread; it is deleted after it finishes.
     */
    static QThread *start(std::shared_ptr<ITransport> transport,
                          std::shared_ptr<ProgressChannel> channel,
                          const TransferJob &job);

    /// @name Job bodies
    /// @{

    /// @brief One scp-equivalent get; progress is sampled on disk by the aggregator.
    void downloadFile(const TransferJob &job);

    /// @brief Enumerates the remote tree depth-first, then copies files one by one.
    void downloadFolder(const TransferJob &job);

    /// @brief Ensures the remote parent exists, then one put.
    void uploadFile(const TransferJob &job);

    /// @brief Creates every remote directory, then copies files one by one.
    void uploadFolder(const TransferJob &job);
    /// @}

    /**
     * @brief A file discovered while scanning a folder job.
     */
    struct PlannedFile {
        QString sourcePath;
        QString relativePath;
        quint64 size = 0;
    };

    /**
     * @brief Depth-first enumeration of a remote tree.
     * @param remoteRoot Folder to scan.
     * @param files Receives every file, in visit order.
     * @param directories Receives every subdirectory as a relative path.
     * @return False if the root itself could not be listed.
     */
    bool scanRemoteTree(const QString &remoteRoot, QList<PlannedFile> &files,
                        QStringList &directories) const;

    /**
     * @brief Enumerates a local tree; same ordering rules as scanRemoteTree().
     * @param unreadableDir Receives the first folder that could not be read.
     * @return False if the root or any subdirectory could not be read.
     */
    static bool scanLocalTree(const QString &localRoot, QList<PlannedFile> &files,
                              QStringList &directories, QString *unreadableDir = nullptr);

private:
    void scanRemoteDirectory(const QString &remoteDir, const QString &relativeDir,
                             QList<PlannedFile> &files, QStringList &directories,
                             bool *ok = nullptr) const;
    void finish(const TransferJob &job, const QString &errorMessage = QString());

    std::shared_ptr<ITransport> transport_;
    std::shared_ptr<ProgressChannel> channel_;
};

#endif // TRANSFERWORKER_H
