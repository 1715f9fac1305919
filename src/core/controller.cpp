module;
#include <QDateTime>
#include <QDebug>
#include <QUrl>

module rawser.core.controller;

import rawser.core.types;
import rawser.core.enginesingleton;
import rawser.core.resourcepool;
import rawser.core.interceptor;
import rawser.core.tabmanager;
import rawser.core.eventbus;
import rawser.core.transfer;
import rawser.core.downloaddispatcher;
import rawser.services.settings;
import rawser.utils.download_utils;
import rawser.utils.media_utils;

namespace utils = rawser::utils;

RawserController::RawserController(EngineSingleton* engine, TransferBackend* transfer, const CoreSettings& settings,
                                   QObject* parent)
    : QObject(parent)
{
    m_bus = new EventBus(this);
    m_pool = new ResourcePool(engine, this);
    m_interceptor = new MediaInterceptor(m_pool, this);
    m_tabs = new TabManager(m_pool, m_interceptor, m_bus, this);
    m_dispatcher = new DownloadDispatcher(transfer, this);

    m_pool->setLimits(settings.maxContexts, settings.maxPages);
    m_tabs->setPageTimeout(settings.pageTimeoutMs);
    m_tabs->setNavigationTimeout(settings.navigationTimeoutMs);
    m_dispatcher->setCapacity(settings.queueCapacity);
    m_dispatcher->setMaxConcurrent(settings.maxConcurrent);
    m_dispatcher->setMaxAttempts(settings.maxAttempts);
    m_dispatcher->setRetryBaseDelay(settings.retryBaseDelayMs);
    m_dispatcher->setInactivityTimeout(settings.transferTimeoutMs);
    m_dispatcher->setHistoryLimit(settings.historyLimit);
    m_dispatcher->setDownloadDir(settings.downloadDir);
    m_autoDownload = settings.autoStart;

    wire();
}

void RawserController::wire()
{
    connect(m_interceptor, &MediaInterceptor::mediaDetected, this, &RawserController::onMediaDetected);

    connect(m_dispatcher, &DownloadDispatcher::jobActivated, this, [this](const QString& jobId, const QString& taskId) {
        DownloadJob job;
        if (m_dispatcher->job(jobId, &job)) {
            m_bus->publishLog(QStringLiteral("[Download] Starting: %1 -> %2").arg(job.record.url.toString(), job.destination));
        }
        if (taskId.isEmpty()) return;
        const Error error = m_tabs->beginDownload(taskId);
        if (!error.ok()) qDebug() << "[Download] Job" << jobId << "has no open task:" << error.message;
    });

    connect(m_dispatcher, &DownloadDispatcher::jobSettled, this, [this](const QString& jobId, const QString& taskId, JobStatus) {
        if (taskId.isEmpty()) return;
        const Error error = m_tabs->endDownload(taskId);
        if (!error.ok()) qDebug() << "[Download] Job" << jobId << "settled after its task:" << error.message;
    });

    connect(m_dispatcher, &DownloadDispatcher::progressChanged, m_bus, &EventBus::publishDownloadProgress);

    connect(m_dispatcher, &DownloadDispatcher::jobCompleted, this, [this](const QString& jobId, const QString& path) {
        m_bus->publishLog(QStringLiteral("[Download] Completed: %1").arg(path));
        m_bus->publishDownloadComplete(jobId, path);
    });

    connect(m_dispatcher, &DownloadDispatcher::jobFailed, this, [this](const QString& jobId, const QString& reason) {
        m_bus->publishLog(QStringLiteral("[Download] Failed: %1: %2").arg(jobId, reason));
        m_bus->publishDownloadFailed(jobId, reason);
    });

    connect(m_dispatcher, &DownloadDispatcher::retryScheduled, this, [this](const QString& jobId, int attempt, int delayMs) {
        m_bus->publishLog(QStringLiteral("[Download] Retrying %1 (attempt %2) in %3 ms").arg(jobId).arg(attempt).arg(delayMs));
    });

    connect(m_tabs, &TabManager::taskClosed, this, [this](const QString& taskId) {
        const int cancelled = m_dispatcher->cancelJobsForTask(taskId);
        if (cancelled > 0) {
            m_bus->publishLog(QStringLiteral("[Download] Cancelled %1 job(s) of %2").arg(cancelled).arg(taskId));
        }
    });
}

void RawserController::onMediaDetected(const MediaRecord& record)
{
    m_bus->publishMediaDetected(record);
    m_bus->publishLog(QStringLiteral("[Media] %1: %2").arg(mediaTypeName(record.type), record.url.toString()));

    if (!m_autoDownload || !utils::isPrimaryMedia(record.type)) return;
    Error error;
    if (m_dispatcher->enqueue(record, &error).isEmpty()) {
        report(QStringLiteral("auto-download"), error);
    }
}

Error RawserController::report(const QString& operation, const Error& error)
{
    if (!error.ok()) {
        m_bus->publishLog(QStringLiteral("[Error] %1: %2").arg(operation, error.message));
    }
    return error;
}

QString RawserController::createTask(const QString& url, Error* error)
{
    Error failure;
    const QString id = m_tabs->createTask(url, &failure);
    if (id.isEmpty()) report(QStringLiteral("create"), failure);
    if (error) *error = failure;
    return id;
}

Error RawserController::closeTask(const QString& id)
{
    return report(QStringLiteral("close %1").arg(id), m_tabs->closeTask(id));
}

Error RawserController::toggleBrowse(const QString& id)
{
    return report(QStringLiteral("browse %1").arg(id), m_tabs->toggleBrowse(id));
}

Error RawserController::navigate(const QString& id, const QString& url, QString* createdId)
{
    if (!id.isEmpty()) {
        return report(QStringLiteral("navigate %1").arg(id), m_tabs->navigate(id, url));
    }

    Error error;
    const QString created = createTask(url, &error);
    if (created.isEmpty()) return error;
    if (createdId) *createdId = created;
    return report(QStringLiteral("navigate %1").arg(created), m_tabs->navigate(created, url));
}

QString RawserController::startDownload(const QString& mediaUrl, Error* error)
{
    const QUrl url = utils::normalizeUrl(mediaUrl);
    if (!url.isValid() || url.host().isEmpty()) {
        const Error invalid = report(QStringLiteral("download"),
                                     makeError(ErrorCode::InvalidArgument, QStringLiteral("invalid URL: %1").arg(mediaUrl)));
        if (error) *error = invalid;
        return QString();
    }

    MediaRecord record;
    if (!m_interceptor->findByUrl(url, &record)) {
        record.url = url;
        record.discoveredAt = QDateTime::currentDateTime();
        MediaType type = MediaType::Other;
        bool ambiguous = false;
        if (utils::classifyMedia(url, QString(), &type, &ambiguous)) {
            record.type = type;
            record.ambiguous = ambiguous;
        }
    }

    Error failure;
    const QString jobId = m_dispatcher->enqueue(record, &failure);
    if (jobId.isEmpty()) {
        report(QStringLiteral("download"), failure);
    } else {
        m_bus->publishLog(QStringLiteral("[Download] Queued %1: %2").arg(jobId, url.toString()));
    }
    if (error) *error = failure;
    return jobId;
}

Error RawserController::cancelDownload(const QString& jobId)
{
    return report(QStringLiteral("cancel %1").arg(jobId), m_dispatcher->cancelJob(jobId));
}

Error RawserController::pauseDownload(const QString& jobId)
{
    return report(QStringLiteral("pause %1").arg(jobId), m_dispatcher->pauseJob(jobId));
}

Error RawserController::resumeDownload(const QString& jobId)
{
    return report(QStringLiteral("resume %1").arg(jobId), m_dispatcher->resumeJob(jobId));
}

Error RawserController::restartEngine()
{
    // TabManager logs the outcome itself.
    return m_tabs->restartEngine();
}

void RawserController::shutdown()
{
    if (m_shutDown) return;
    m_shutDown = true;

    for (const DownloadJob& job : m_dispatcher->jobs()) {
        if (isTerminal(job.status)) continue;
        const Error error = m_dispatcher->cancelJob(job.id);
        if (!error.ok()) qDebug() << "[Download] Shutdown cancel of" << job.id << error.message;
    }
    m_tabs->shutdown();
    m_bus->publishLog(QStringLiteral("[Engine] Shut down"));
}

bool RawserController::autoDownload() const
{
    return m_autoDownload;
}

void RawserController::setAutoDownload(bool enabled)
{
    if (m_autoDownload == enabled) return;
    m_autoDownload = enabled;
    emit autoDownloadChanged();
}

EventBus* RawserController::bus() const
{
    return m_bus;
}

ResourcePool* RawserController::pool() const
{
    return m_pool;
}

MediaInterceptor* RawserController::interceptor() const
{
    return m_interceptor;
}

TabManager* RawserController::tabs() const
{
    return m_tabs;
}

DownloadDispatcher* RawserController::dispatcher() const
{
    return m_dispatcher;
}
