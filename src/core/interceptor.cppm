/*!
 * @file        interceptor.cppm
 * @brief       Media discovery on live task pages.
 * @details     Observes the request stream of every page attached to a task
 *              and turns media requests into MediaRecord values.
 *
 *              The engine delivers requests synchronously, so the inline path
 *              does constant-time work only: a hash lookup of the page, a
 *              suffix/content-type classification and a reservation of the
 *              (task, URL) pair. Header and cookie capture, record storage and
 *              the mediaDetected notification are deferred to the next turn of
 *              the event loop.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module rawser.core.interceptor;
import rawser.core.types;
import rawser.core.resourcepool;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Classifies page traffic into deduplicated media records.
 *
 * Exactly one mediaDetected() is emitted per new (task, URL) pair; repeated
 * sightings are suppressed. Detaching a page stops observation but keeps the
 * records already emitted for its task.
 */
RAWSER_MODULE_EXPORT class MediaInterceptor : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct an interceptor fed by the pool's response stream.
     * @param pool Resource pool relaying engine traffic and cookies.
     * @param parent Optional parent QObject.
     */
    explicit MediaInterceptor(ResourcePool* pool, QObject* parent = nullptr);

    /**
     * @brief Start observing a page on behalf of a task.
     * @param taskId Owning task.
     * @param page Live page handle.
     */
    void attach(const QString& taskId, const PageHandle& page);

    //!< @brief Stop observing a page. Records already emitted are kept.
    void detach(quint64 pageId);

    //!< @brief Drop every page, reservation and record of a closed task.
    void forgetTask(const QString& taskId);

    //!< @brief Whether a page is being observed.
    bool isAttached(quint64 pageId) const;

    /**
     * @brief Records discovered for a task.
     *
     * MP4, M3U8 and MPD records come first, Other records last; discovery
     * order is kept within each group.
     */
    QList<MediaRecord> records(const QString& taskId) const;

    /**
     * @brief Look up a record by URL across all tasks.
     * @param url Media URL.
     * @param record Receives the most recently discovered match.
     * @return true if a record was found.
     */
    bool findByUrl(const QUrl& url, MediaRecord* record) const;

signals:
    //!< @brief Emitted once per new (task, URL) pair.
    void mediaDetected(const MediaRecord& record);

private slots:
    //!< @brief Inline classification of one observed request.
    void onResponseObserved(quint64 pageId, const ResponseInfo& info);

private:
    struct Attachment {
        QString taskId;
        quint64 contextId = 0;
    };

    //!< @brief Deferred header capture and emission.
    void publish(const QString& taskId, quint64 contextId, const QString& key,
                 const ResponseInfo& info, MediaType type, bool ambiguous);

    ResourcePool* m_pool = nullptr;                     //!< Cookie source.
    mutable QMutex m_mutex;                             //!< Guards the tables below.
    QHash<quint64, Attachment> m_pages;                 //!< Page id -> attachment.
    QHash<QString, QSet<QString>> m_seen;               //!< Task id -> reserved URL keys.
    QHash<QString, QList<MediaRecord>> m_records;       //!< Task id -> emitted records.
};

#include "interceptor.moc"
