module;
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>

module rawser.core.eventbus;

import rawser.core.types;

EventBus::EventBus(QObject* parent)
    : QObject(parent)
{
}

void EventBus::post(std::function<void()> event)
{
    bool drainNow = false;
    bool schedule = false;
    {
        QMutexLocker lock(&m_mutex);
        m_queue.enqueue(std::move(event));
        if (m_draining || m_drainScheduled) return;
        if (QThread::currentThread() == thread()) {
            drainNow = true;
        } else {
            m_drainScheduled = true;
            schedule = true;
        }
    }
    if (drainNow) {
        drain();
    } else if (schedule) {
        QMetaObject::invokeMethod(this, [this] { drain(); }, Qt::QueuedConnection);
    }
}

void EventBus::drain()
{
    {
        QMutexLocker lock(&m_mutex);
        m_drainScheduled = false;
        if (m_draining) return;
        m_draining = true;
    }
    for (;;) {
        std::function<void()> event;
        {
            QMutexLocker lock(&m_mutex);
            if (m_queue.isEmpty()) {
                m_draining = false;
                return;
            }
            event = m_queue.dequeue();
            ++m_delivered;
        }
        event();
    }
}

quint64 EventBus::delivered() const
{
    QMutexLocker lock(&m_mutex);
    return m_delivered;
}

void EventBus::publishTaskCreated(const QString& taskId, const QUrl& url)
{
    post([this, taskId, url] { emit taskCreated(taskId, url); });
}

void EventBus::publishTaskUpdated(const QString& taskId, TaskState state)
{
    post([this, taskId, state] { emit taskUpdated(taskId, state); });
}

void EventBus::publishLog(const QString& message)
{
    qDebug().noquote() << message;
    post([this, message] { emit log(message); });
}

void EventBus::publishMediaDetected(const MediaRecord& record)
{
    post([this, record] { emit mediaDetected(record); });
}

void EventBus::publishDownloadProgress(const QString& jobId, double fraction)
{
    post([this, jobId, fraction] { emit downloadProgress(jobId, fraction); });
}

void EventBus::publishDownloadComplete(const QString& jobId, const QString& path)
{
    post([this, jobId, path] { emit downloadComplete(jobId, path); });
}

void EventBus::publishDownloadFailed(const QString& jobId, const QString& reason)
{
    post([this, jobId, reason] { emit downloadFailed(jobId, reason); });
}
