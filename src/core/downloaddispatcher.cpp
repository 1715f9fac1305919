module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMetaObject>
#include <QSet>
#include <QStandardPaths>
#include <QThread>
#include <QtGlobal>

module rawser.core.downloaddispatcher;

import rawser.core.types;
import rawser.core.transfer;
import rawser.utils.download_utils;
import rawser.utils.media_utils;

namespace utils = rawser::utils;

namespace {

constexpr qint64 kMaxRetryDelayMs = 10 * 60 * 1000;

QString urlKey(const QUrl& url)
{
    return url.adjusted(QUrl::RemoveFragment).toString(QUrl::FullyEncoded);
}

} // namespace

DownloadDispatcher::DownloadDispatcher(TransferBackend* backend, QObject* parent)
    : QObject(parent),
    m_backend(backend)
{
    m_downloadDir = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
}

void DownloadDispatcher::setCapacity(int capacity)
{
    m_capacity = qMax(1, capacity);
}

int DownloadDispatcher::capacity() const
{
    return m_capacity;
}

void DownloadDispatcher::setMaxConcurrent(int value)
{
    if (value < 1) value = 1;
    if (m_maxConcurrent == value) return;
    m_maxConcurrent = value;
    emit maxConcurrentChanged();
    startQueued();
}

int DownloadDispatcher::maxConcurrent() const
{
    return m_maxConcurrent;
}

void DownloadDispatcher::setMaxAttempts(int value)
{
    m_maxAttempts = qMax(1, value);
}

int DownloadDispatcher::maxAttempts() const
{
    return m_maxAttempts;
}

void DownloadDispatcher::setRetryBaseDelay(int ms)
{
    m_retryBaseDelayMs = int(qBound<qint64>(1, ms, kMaxRetryDelayMs));
}

int DownloadDispatcher::retryDelay(int attempt) const
{
    const int doublings = qBound(0, attempt - 1, 30);
    return int(qMin(qint64(m_retryBaseDelayMs) << doublings, kMaxRetryDelayMs));
}

void DownloadDispatcher::setHistoryLimit(int limit)
{
    m_historyLimit = qMax(0, limit);
    pruneHistory();
}

int DownloadDispatcher::historyLimit() const
{
    return m_historyLimit;
}

void DownloadDispatcher::setInactivityTimeout(int ms)
{
    m_inactivityTimeoutMs = qMax(1, ms);
}

void DownloadDispatcher::setDownloadDir(const QString& dir)
{
    m_downloadDir = utils::localFilePath(dir);
}

QString DownloadDispatcher::downloadDir() const
{
    return m_downloadDir;
}

QString DownloadDispatcher::inferDestination(const MediaRecord& record) const
{
    QSet<QString> reserved;
    for (const EntryPtr& entry : m_jobs) {
        if (!isTerminal(entry->job.status)) reserved.insert(entry->job.destination);
    }
    const QString name = utils::mediaFileName(record, QDateTime::currentSecsSinceEpoch());
    return utils::uniqueFilePath(QDir(m_downloadDir).filePath(name), reserved);
}

QString DownloadDispatcher::enqueue(const MediaRecord& record, Error* error, const QString& destination)
{
    if (QThread::currentThread() != thread()) {
        QString id;
        Error result;
        QMetaObject::invokeMethod(this, [this, &id, &result, &record, &destination] {
            id = enqueue(record, &result, destination);
        }, Qt::BlockingQueuedConnection);
        if (error) *error = result;
        return id;
    }

    if (!record.url.isValid() || record.url.scheme().isEmpty()) {
        if (error) *error = makeError(ErrorCode::InvalidArgument, QStringLiteral("invalid media URL: %1").arg(record.url.toString()));
        return QString();
    }

    const QString key = urlKey(record.url);
    if (const QString existing = m_activeByUrl.value(key); !existing.isEmpty()) {
        qDebug() << "[Download] Coalesced into job" << existing << record.url.toString();
        return existing;
    }

    if (pendingCount() >= m_capacity) {
        if (error) *error = makeError(ErrorCode::ResourceExhausted,
                                      QStringLiteral("download queue is full (%1 jobs)").arg(m_capacity));
        return QString();
    }

    auto entry = EntryPtr::create();
    entry->job.id = QString::number(++m_nextId);
    entry->job.record = record;
    entry->job.status = JobStatus::Queued;
    entry->job.destination = destination.isEmpty() ? inferDestination(record) : utils::localFilePath(destination);
    if (!QDir().mkpath(QFileInfo(entry->job.destination).absolutePath())) {
        qWarning() << "[Download] Cannot create directory for" << entry->job.destination;
    }

    m_jobs.insert(entry->job.id, entry);
    m_order.append(entry->job.id);
    m_activeByUrl.insert(key, entry->job.id);

    emit statusChanged(entry->job.id, JobStatus::Queued);
    startQueued();
    return entry->job.id;
}

int DownloadDispatcher::pendingCount() const
{
    int count = 0;
    for (const EntryPtr& entry : m_jobs) {
        if (!isTerminal(entry->job.status)) ++count;
    }
    return count;
}

int DownloadDispatcher::activeCount() const
{
    int count = 0;
    for (const EntryPtr& entry : m_jobs) {
        if (entry->job.status == JobStatus::Running) ++count;
    }
    return count;
}

int DownloadDispatcher::queuedCount() const
{
    int count = 0;
    for (const EntryPtr& entry : m_jobs) {
        if (entry->job.status == JobStatus::Queued) ++count;
    }
    return count;
}

void DownloadDispatcher::startQueued()
{
    pruneHistory();
    const QStringList order = m_order;
    for (const QString& id : order) {
        if (activeCount() >= m_maxConcurrent) break;
        const EntryPtr entry = m_jobs.value(id);
        if (!entry || entry->job.status != JobStatus::Queued || entry->retryPending) continue;
        launch(entry);
    }
    emit countsChanged();
}

void DownloadDispatcher::launch(const EntryPtr& entry)
{
    DownloadJob& job = entry->job;
    ++job.attempts;
    const quint64 attempt = ++entry->attempt;
    entry->timedOut = false;
    setStatus(entry, JobStatus::Running);

    if (!entry->activated) {
        entry->activated = true;
        emit jobActivated(job.id, job.record.taskId);
    }

    // A handler of the signals above may have cancelled or paused the job.
    if (job.status != JobStatus::Running || attempt != entry->attempt) return;

    TransferRequest request;
    request.url = job.record.url;
    request.headers = utils::replayHeaders(job.record);
    request.destination = job.destination;

    qDebug() << "[Download] Attempt" << job.attempts << "of job" << job.id << mediaTypeName(job.record.type)
             << job.record.url.toString();

    TransferReply* reply = utils::needsTranscode(job.record.type) ? m_backend->transcode(request)
                                                                   : m_backend->fetch(request);
    if (!reply) {
        fail(entry, QStringLiteral("transfer backend refused the job"));
        startQueued();
        return;
    }
    reply->setParent(this);
    entry->reply = reply;

    const QString id = job.id;
    connect(reply, &TransferReply::progress, this, [this, id, attempt](qint64 done, qint64 total) {
        onAttemptProgress(id, attempt, done, total);
    });
    connect(reply, &TransferReply::finished, this, [this, id, attempt] {
        onAttemptFinished(id, attempt);
    });

    entry->watchdog = new QTimer(this);
    entry->watchdog->setSingleShot(true);
    entry->watchdog->setInterval(m_inactivityTimeoutMs);
    connect(entry->watchdog, &QTimer::timeout, this, [this, id, attempt] {
        const EntryPtr timedOut = m_jobs.value(id);
        if (!timedOut || timedOut->attempt != attempt || !timedOut->reply) return;
        qWarning() << "[Download] No data for" << m_inactivityTimeoutMs << "ms, aborting job" << id;
        timedOut->timedOut = true;
        timedOut->reply->abort();
    });
    entry->watchdog->start();

    if (reply->isFinished()) {
        QMetaObject::invokeMethod(this, [this, id, attempt] { onAttemptFinished(id, attempt); }, Qt::QueuedConnection);
    }
}

void DownloadDispatcher::onAttemptProgress(const QString& id, quint64 attempt, qint64 done, qint64 total)
{
    const EntryPtr entry = m_jobs.value(id);
    if (!entry || entry->attempt != attempt || entry->job.status != JobStatus::Running) return;
    if (entry->watchdog) entry->watchdog->start();
    if (total <= 0) return;

    const double fraction = qBound(0.0, double(done) / double(total), 1.0);
    if (fraction <= entry->job.progress) return;
    entry->job.progress = fraction;
    emit progressChanged(id, fraction);
}

void DownloadDispatcher::onAttemptFinished(const QString& id, quint64 attempt)
{
    const EntryPtr entry = m_jobs.value(id);
    if (!entry || entry->attempt != attempt || entry->job.status != JobStatus::Running) return;

    TransferResult result;
    if (entry->reply) result = entry->reply->result();
    dropAttempt(entry);

    if (result.error == TransferError::Aborted && entry->timedOut) {
        result.error = TransferError::Transient;
        result.reason = QStringLiteral("no data received for %1 ms").arg(m_inactivityTimeoutMs);
    }
    entry->timedOut = false;

    DownloadJob& job = entry->job;
    switch (result.error) {
    case TransferError::None:
        m_activeByUrl.remove(urlKey(job.record.url));
        if (job.progress < 1.0) {
            job.progress = 1.0;
            emit progressChanged(id, 1.0);
        }
        job.lastError.clear();
        setStatus(entry, JobStatus::Completed);
        qDebug() << "[Download] Completed job" << id << job.destination << result.bytesWritten << "bytes";
        emit jobCompleted(id, job.destination);
        settle(entry);
        break;
    case TransferError::Transient:
        job.lastError = result.reason;
        if (job.attempts < m_maxAttempts) {
            const int delay = retryDelay(job.attempts);
            entry->retryPending = true;
            setStatus(entry, JobStatus::Queued);
            qWarning() << "[Download] Job" << id << "failed transiently, retry in" << delay << "ms:" << result.reason;
            emit retryScheduled(id, job.attempts, delay);
            QTimer::singleShot(delay, this, [this, id, attempt] {
                const EntryPtr waiting = m_jobs.value(id);
                if (!waiting || waiting->attempt != attempt || !waiting->retryPending) return;
                waiting->retryPending = false;
                startQueued();
            });
        } else {
            fail(entry, QStringLiteral("%1 (gave up after %2 attempts)").arg(result.reason).arg(job.attempts));
        }
        break;
    case TransferError::Permanent:
    case TransferError::Aborted:
        fail(entry, result.reason.isEmpty() ? QStringLiteral("transfer failed") : result.reason);
        break;
    }
    startQueued();
}

void DownloadDispatcher::dropAttempt(const EntryPtr& entry)
{
    if (entry->watchdog) {
        entry->watchdog->stop();
        entry->watchdog->deleteLater();
        entry->watchdog = nullptr;
    }
    if (TransferReply* reply = entry->reply) {
        entry->reply = nullptr;
        disconnect(reply, nullptr, this, nullptr);
        if (!reply->isFinished()) reply->abort();
        reply->deleteLater();
    }
}

void DownloadDispatcher::fail(const EntryPtr& entry, const QString& reason)
{
    DownloadJob& job = entry->job;
    m_activeByUrl.remove(urlKey(job.record.url));
    job.lastError = reason;
    setStatus(entry, JobStatus::Failed);
    qWarning() << "[Download] Failed job" << job.id << reason;
    emit jobFailed(job.id, reason);
    settle(entry);
}

void DownloadDispatcher::settle(const EntryPtr& entry)
{
    if (!entry->activated) return;
    emit jobSettled(entry->job.id, entry->job.record.taskId, entry->job.status);
}

void DownloadDispatcher::setStatus(const EntryPtr& entry, JobStatus status)
{
    entry->job.status = status;
    emit statusChanged(entry->job.id, status);
}

void DownloadDispatcher::cancelEntry(const EntryPtr& entry)
{
    ++entry->attempt;
    entry->retryPending = false;
    dropAttempt(entry);
    m_activeByUrl.remove(urlKey(entry->job.record.url));
    setStatus(entry, JobStatus::Cancelled);
    settle(entry);
}

Error DownloadDispatcher::cancelJob(const QString& id)
{
    const EntryPtr entry = m_jobs.value(id);
    if (!entry) return makeError(ErrorCode::NotFound, QStringLiteral("unknown job %1").arg(id));
    if (isTerminal(entry->job.status)) {
        return makeError(ErrorCode::StateViolation,
                         QStringLiteral("job %1 is already %2").arg(id, jobStatusName(entry->job.status)));
    }
    cancelEntry(entry);
    startQueued();
    return {};
}

Error DownloadDispatcher::pauseJob(const QString& id)
{
    const EntryPtr entry = m_jobs.value(id);
    if (!entry) return makeError(ErrorCode::NotFound, QStringLiteral("unknown job %1").arg(id));
    const JobStatus status = entry->job.status;
    if (status != JobStatus::Queued && status != JobStatus::Running) {
        return makeError(ErrorCode::StateViolation,
                         QStringLiteral("cannot pause job %1 in status %2").arg(id, jobStatusName(status)));
    }
    ++entry->attempt;
    entry->retryPending = false;
    if (status == JobStatus::Running) {
        dropAttempt(entry);
        --entry->job.attempts;
    }
    setStatus(entry, JobStatus::Paused);
    startQueued();
    return {};
}

Error DownloadDispatcher::resumeJob(const QString& id)
{
    const EntryPtr entry = m_jobs.value(id);
    if (!entry) return makeError(ErrorCode::NotFound, QStringLiteral("unknown job %1").arg(id));
    if (entry->job.status != JobStatus::Paused) {
        return makeError(ErrorCode::StateViolation,
                         QStringLiteral("cannot resume job %1 in status %2").arg(id, jobStatusName(entry->job.status)));
    }
    setStatus(entry, JobStatus::Queued);
    startQueued();
    return {};
}

Error DownloadDispatcher::retryJob(const QString& id)
{
    const EntryPtr entry = m_jobs.value(id);
    if (!entry) return makeError(ErrorCode::NotFound, QStringLiteral("unknown job %1").arg(id));
    const JobStatus status = entry->job.status;
    if (status != JobStatus::Failed && status != JobStatus::Cancelled) {
        return makeError(ErrorCode::StateViolation,
                         QStringLiteral("cannot retry job %1 in status %2").arg(id, jobStatusName(status)));
    }
    const QString key = urlKey(entry->job.record.url);
    if (const QString other = m_activeByUrl.value(key); !other.isEmpty()) {
        return makeError(ErrorCode::StateViolation, QStringLiteral("job %1 already downloads this URL").arg(other));
    }
    if (pendingCount() >= m_capacity) {
        return makeError(ErrorCode::ResourceExhausted,
                         QStringLiteral("download queue is full (%1 jobs)").arg(m_capacity));
    }

    entry->job.attempts = 0;
    entry->job.progress = 0.0;
    entry->job.lastError.clear();
    entry->activated = false;
    m_activeByUrl.insert(key, id);
    setStatus(entry, JobStatus::Queued);
    startQueued();
    return {};
}

int DownloadDispatcher::cancelJobsForTask(const QString& taskId)
{
    if (taskId.isEmpty()) return 0;
    int cancelled = 0;
    const QStringList order = m_order;
    for (const QString& id : order) {
        const EntryPtr entry = m_jobs.value(id);
        if (!entry || entry->job.record.taskId != taskId || isTerminal(entry->job.status)) continue;
        cancelEntry(entry);
        ++cancelled;
    }
    if (cancelled > 0) {
        qDebug() << "[Download] Cancelled" << cancelled << "job(s) of task" << taskId;
        startQueued();
    }
    return cancelled;
}

void DownloadDispatcher::clearFinished()
{
    for (auto it = m_jobs.begin(); it != m_jobs.end();) {
        if (isTerminal(it.value()->job.status)) {
            m_order.removeAll(it.key());
            it = m_jobs.erase(it);
        } else {
            ++it;
        }
    }
    emit countsChanged();
}

void DownloadDispatcher::pruneHistory()
{
    int finished = 0;
    for (const EntryPtr& entry : std::as_const(m_jobs)) {
        if (isTerminal(entry->job.status)) ++finished;
    }
    for (auto it = m_order.begin(); finished > m_historyLimit && it != m_order.end();) {
        const EntryPtr entry = m_jobs.value(*it);
        if (entry && !isTerminal(entry->job.status)) {
            ++it;
            continue;
        }
        if (entry) --finished;
        m_jobs.remove(*it);
        it = m_order.erase(it);
    }
}

bool DownloadDispatcher::job(const QString& id, DownloadJob* job) const
{
    const EntryPtr entry = m_jobs.value(id);
    if (!entry) return false;
    if (job) *job = entry->job;
    return true;
}

QList<DownloadJob> DownloadDispatcher::jobs() const
{
    QList<DownloadJob> list;
    list.reserve(m_order.size());
    for (const QString& id : m_order) {
        if (const EntryPtr entry = m_jobs.value(id)) list.append(entry->job);
    }
    return list;
}
