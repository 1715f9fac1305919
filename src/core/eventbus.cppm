/*!
 * @file        eventbus.cppm
 * @brief       Ordered notification channel to the GUI collaborator.
 * @details     Every core component publishes task, media, download and
 *              log notifications through one EventBus. Publishing is safe
 *              from any thread; events are delivered as Qt signals on the
 *              bus's thread in exactly the order they were published.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QMutex>
#include <QObject>
#include <QQueue>
#include <QString>
#include <QUrl>
#include <functional>

#ifndef Q_MOC_RUN
export module rawser.core.eventbus;
import rawser.core.types;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief FIFO pub/sub channel of core events.
 *
 * Publications are queued and drained on the bus thread; a handler that
 * publishes while being notified appends to the same queue, so nesting
 * never reorders events.
 */
RAWSER_MODULE_EXPORT class EventBus : public QObject {

    Q_OBJECT

public:
    explicit EventBus(QObject* parent = nullptr);

    void publishTaskCreated(const QString& taskId, const QUrl& url);
    void publishTaskUpdated(const QString& taskId, TaskState state);

    /**
     * @brief Publish a user-facing log line.
     *
     * The line is also written to the debug log.
     */
    void publishLog(const QString& message);

    void publishMediaDetected(const MediaRecord& record);
    void publishDownloadProgress(const QString& jobId, double fraction);
    void publishDownloadComplete(const QString& jobId, const QString& path);
    void publishDownloadFailed(const QString& jobId, const QString& reason);

    //!< @brief Number of events delivered so far.
    quint64 delivered() const;

signals:
    void taskCreated(const QString& taskId, const QUrl& url);
    void taskUpdated(const QString& taskId, TaskState state);
    void log(const QString& message);
    void mediaDetected(const MediaRecord& record);
    void downloadProgress(const QString& jobId, double fraction);
    void downloadComplete(const QString& jobId, const QString& path);
    void downloadFailed(const QString& jobId, const QString& reason);

private:
    //!< @brief Queue an event and make sure a drain is scheduled.
    void post(std::function<void()> event);

    //!< @brief Deliver queued events in order.
    void drain();

    mutable QMutex m_mutex;                     //!< Guards the queue and flags.
    QQueue<std::function<void()>> m_queue;      //!< Events not yet delivered.
    bool m_draining = false;                    //!< drain() is on the stack.
    bool m_drainScheduled = false;              //!< A queued drain is pending.
    quint64 m_delivered = 0;                    //!< Delivered event counter.
};

#include "eventbus.moc"
