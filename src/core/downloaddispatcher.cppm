/*!
 * @file        downloaddispatcher.cppm
 * @brief       Bounded download queue with dedup, concurrency and retry policy.
 * @details     Turns media records into download jobs and drives them through
 *              a TransferBackend.
 *
 *              Policy enforced here:
 *              - a URL that already has a Queued, Running or Paused job is
 *                coalesced into that job;
 *              - at most capacity() non-terminal jobs exist at a time;
 *              - at most maxConcurrent() jobs are Running;
 *              - MP4 and Other go to a direct fetch, M3U8 and MPD to the
 *                transcode pipeline;
 *              - transient failures are retried with exponential backoff up
 *                to maxAttempts(), permanent ones fail the job at once;
 *              - a running job that reports nothing for the inactivity
 *                timeout is aborted and treated as a transient failure.
 *
 *              Progress is monotonically non-decreasing per job. Every failed
 *              job emits jobFailed() exactly once.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QTimer>

#ifndef Q_MOC_RUN
export module rawser.core.downloaddispatcher;
import rawser.core.types;
import rawser.core.transfer;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Queue of download jobs.
 *
 * enqueue() may be called from any thread; every other member runs on the
 * dispatcher's thread.
 */
RAWSER_MODULE_EXPORT class DownloadDispatcher : public QObject {

    Q_OBJECT

    //!< @brief Global maximum number of running jobs.
    Q_PROPERTY(int maxConcurrent READ maxConcurrent WRITE setMaxConcurrent NOTIFY maxConcurrentChanged)

    //!< @brief Number of running jobs.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief Number of jobs waiting for a slot.
    Q_PROPERTY(int queuedCount READ queuedCount NOTIFY countsChanged)

public:
    /**
     * @brief Construct a dispatcher.
     * @param backend Fetch/transcode collaborator.
     * @param parent Optional parent QObject.
     */
    explicit DownloadDispatcher(TransferBackend* backend, QObject* parent = nullptr);

    //!< @brief Maximum number of non-terminal jobs.
    void setCapacity(int capacity);
    int capacity() const;

    void setMaxConcurrent(int value);
    int maxConcurrent() const;

    //!< @brief Attempts allowed per job, the first one included.
    void setMaxAttempts(int value);
    int maxAttempts() const;

    //!< @brief Delay before the first retry; doubled for each further retry.
    void setRetryBaseDelay(int ms);

    /**
     * @brief Backoff before the retry that follows a failed attempt.
     * @param attempt 1-based number of the attempt that failed.
     * @return Base delay doubled per earlier attempt, capped at ten minutes.
     */
    int retryDelay(int attempt) const;

    /**
     * @brief Number of Completed, Failed and Cancelled jobs kept for listing.
     *
     * Beyond the limit the oldest finished jobs are forgotten.
     */
    void setHistoryLimit(int limit);
    int historyLimit() const;

    //!< @brief Silence allowed from a running transfer before it is aborted.
    void setInactivityTimeout(int ms);

    //!< @brief Directory for destinations chosen by the dispatcher.
    void setDownloadDir(const QString& dir);
    QString downloadDir() const;

    /**
     * @brief Queue a download of a media record.
     *
     * A record whose URL already has a Queued, Running or Paused job returns
     * that job's id and queues nothing.
     *
     * @param record Media to download.
     * @param error Receives ResourceExhausted when the queue is full.
     * @param destination Output path; inferred from the URL when empty.
     * @return Job id, empty on failure.
     */
    QString enqueue(const MediaRecord& record, Error* error = nullptr, const QString& destination = QString());

    //!< @brief Cancel a non-terminal job.
    Error cancelJob(const QString& id);

    /**
     * @brief Pause a Queued or Running job.
     *
     * The running attempt is aborted and not counted; resumeJob() starts the
     * transfer over.
     */
    Error pauseJob(const QString& id);

    //!< @brief Return a Paused job to the queue.
    Error resumeJob(const QString& id);

    //!< @brief Queue a Failed or Cancelled job again with a fresh attempt budget.
    Error retryJob(const QString& id);

    /**
     * @brief Cancel every non-terminal job of a task.
     * @return Number of jobs cancelled.
     */
    int cancelJobsForTask(const QString& taskId);

    //!< @brief Forget Completed, Failed and Cancelled jobs.
    void clearFinished();

    /**
     * @brief Snapshot of one job.
     * @return false for unknown ids.
     */
    bool job(const QString& id, DownloadJob* job) const;

    //!< @brief Snapshots of every job in submission order.
    QList<DownloadJob> jobs() const;

    int activeCount() const;
    int queuedCount() const;

signals:
    void statusChanged(const QString& jobId, JobStatus status);
    void progressChanged(const QString& jobId, double fraction);
    void jobCompleted(const QString& jobId, const QString& path);

    //!< @brief Emitted once per job that ends in Failed.
    void jobFailed(const QString& jobId, const QString& reason);

    //!< @brief A transient failure will be retried after delayMs.
    void retryScheduled(const QString& jobId, int attempt, int delayMs);

    //!< @brief The job started its first attempt.
    void jobActivated(const QString& jobId, const QString& taskId);

    //!< @brief An activated job reached a terminal status.
    void jobSettled(const QString& jobId, const QString& taskId, JobStatus status);

    void countsChanged();
    void maxConcurrentChanged();

private:
    struct Entry {
        DownloadJob job;
        QPointer<TransferReply> reply;      //!< Attempt in flight.
        QTimer* watchdog = nullptr;         //!< Inactivity timer of the attempt.
        quint64 attempt = 0;                //!< Token of the current attempt.
        bool retryPending = false;          //!< Waiting for the backoff delay.
        bool activated = false;             //!< jobActivated() was emitted.
        bool timedOut = false;              //!< Aborted by the watchdog.
    };
    using EntryPtr = QSharedPointer<Entry>;

    //!< @brief Start queued jobs while slots are free.
    void startQueued();

    void launch(const EntryPtr& entry);
    void onAttemptProgress(const QString& id, quint64 attempt, qint64 done, qint64 total);
    void onAttemptFinished(const QString& id, quint64 attempt);

    //!< @brief Abort the running attempt without reporting its outcome.
    void dropAttempt(const EntryPtr& entry);

    void fail(const EntryPtr& entry, const QString& reason);
    void cancelEntry(const EntryPtr& entry);

    //!< @brief Report a terminal status to the task bookkeeping.
    void settle(const EntryPtr& entry);

    //!< @brief Forget the oldest finished jobs beyond the history limit.
    void pruneHistory();

    void setStatus(const EntryPtr& entry, JobStatus status);
    int pendingCount() const;
    QString inferDestination(const MediaRecord& record) const;

    TransferBackend* m_backend = nullptr;
    int m_capacity = 64;
    int m_maxConcurrent = 3;
    int m_maxAttempts = 3;
    int m_retryBaseDelayMs = 1000;
    int m_inactivityTimeoutMs = 60000;
    int m_historyLimit = 200;
    QString m_downloadDir;
    quint64 m_nextId = 0;

    QHash<QString, EntryPtr> m_jobs;            //!< Job id -> entry.
    QStringList m_order;                        //!< Job ids in submission order.
    QHash<QString, QString> m_activeByUrl;      //!< URL key -> non-terminal job id.
};

#include "downloaddispatcher.moc"
