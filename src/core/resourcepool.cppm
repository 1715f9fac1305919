/*!
 * @file        resourcepool.cppm
 * @brief       Leasing and accounting of engine contexts and pages.
 * @details     Wraps the EngineSingleton and hands out isolated contexts and
 *              ephemeral pages, keeping live counts against configured caps.
 *
 *              Context bookkeeping is synchronous and thread-safe: a cap slot
 *              is reserved under the pool mutex before the engine is asked
 *              for a context, so concurrent callers can never observe a count
 *              above the cap. Page acquisition and navigation are the only
 *              suspending operations; both carry a timeout and complete
 *              through callbacks on the pool's thread.
 *
 *              An engine crash invalidates every handle at once. Releasing a
 *              handle from an older engine generation is a NotFound no-op.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <functional>

#ifndef Q_MOC_RUN
export module rawser.core.resourcepool;
import rawser.core.types;
import rawser.core.enginesingleton;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Pool of engine contexts and pages.
 *
 * Invariants held at every instant:
 * - liveContexts() + reserved context slots <= maxContexts()
 * - livePages() + pendingPages() <= maxPages()
 * - every live page belongs to a live context
 */
RAWSER_MODULE_EXPORT class ResourcePool : public QObject {

    Q_OBJECT

    //!< @brief Number of live contexts.
    Q_PROPERTY(int liveContexts READ liveContexts NOTIFY countsChanged)

    //!< @brief Number of live pages.
    Q_PROPERTY(int livePages READ livePages NOTIFY countsChanged)

public:
    //!< @brief Completion of acquirePage(); exactly one of page/error is set.
    using PageCallback = std::function<void(const PageHandle& page, const Error& error)>;

    //!< @brief Completion of navigatePage().
    using NavigateCallback = std::function<void(const Error& error)>;

    /**
     * @brief Construct a pool over the engine singleton.
     * @param engine Engine lifecycle owner.
     * @param parent Optional parent QObject.
     */
    explicit ResourcePool(EngineSingleton* engine, QObject* parent = nullptr);

    /**
     * @brief Configure the caps.
     * @param maxContexts Maximum live contexts (at least 1).
     * @param maxPages Maximum live plus pending pages (at least 1).
     */
    void setLimits(int maxContexts, int maxPages);

    int maxContexts() const;
    int maxPages() const;

    /**
     * @brief Lease an isolated context. Starts the engine on first use.
     * @param error Receives ResourceExhausted or EngineUnavailable.
     * @return Context handle, invalid on failure.
     */
    ContextHandle acquireContext(Error* error = nullptr);

    /**
     * @brief Release a context, closing its pages first.
     * @param context Handle to release.
     * @return NotFound for unknown or stale handles.
     */
    Error releaseContext(const ContextHandle& context);

    /**
     * @brief Lease a page from a context.
     *
     * Immediate failures are returned and @p done is not called. Otherwise
     * @p done runs later on the pool's thread with the page or with Timeout,
     * EngineUnavailable or NotFound. A page that arrives after its request
     * was abandoned is closed at once.
     *
     * @param context Owning context.
     * @param timeoutMs Time allowed for the engine to deliver the page.
     * @param done Completion callback.
     * @return Error for immediate failures.
     */
    Error acquirePage(const ContextHandle& context, int timeoutMs, PageCallback done);

    /**
     * @brief Release a page.
     * @param page Handle to release.
     * @return NotFound for unknown or stale handles.
     */
    Error releasePage(const PageHandle& page);

    /**
     * @brief Load a URL in a live page with a timeout.
     *
     * @p done runs later on the pool's thread with NavigationTimeout,
     * NavigationFailed, NotFound (page released meanwhile) or
     * EngineUnavailable. Immediate failures are returned instead.
     *
     * @param page Target page.
     * @param url URL to load.
     * @param timeoutMs Time allowed for the load.
     * @param done Completion callback.
     * @return Error for immediate failures.
     */
    Error navigatePage(const PageHandle& page, const QUrl& url, int timeoutMs, NavigateCallback done);

    /**
     * @brief Switch a live page between background and interactive use.
     * @return NotFound for unknown or stale handles.
     */
    Error setPageInteractive(const PageHandle& page, bool interactive);

    /**
     * @brief Cookie header a context would send to a URL.
     * @param contextId Context id.
     * @param url Target URL.
     * @return Header value, empty when unknown.
     */
    QString cookieHeader(quint64 contextId, const QUrl& url) const;

    //!< @brief Whether a page handle is currently live.
    bool isPageLive(const PageHandle& page) const;

    int liveContexts() const;
    int livePages() const;
    int pendingPages() const;

    /**
     * @brief Restart a crashed or stopped engine.
     * @param error Receives the failure.
     * @return true when the engine is running on return.
     */
    bool restartEngine(Error* error = nullptr);

    /**
     * @brief Drain the pool and stop the engine.
     *
     * Pending page and navigation requests fail with EngineUnavailable,
     * then pages are closed, contexts destroyed and the engine stopped.
     */
    void shutdown();

signals:
    //!< @brief Emitted whenever a live or pending count changes.
    void countsChanged();

    //!< @brief Emitted after an engine crash invalidated every handle.
    void invalidated(const QString& reason);

    //!< @brief Network exchange observed on one of the engine's pages.
    void responseObserved(quint64 pageId, const ResponseInfo& info);

    /**
     * @brief Emitted after a live page died and was dropped from the pool.
     *
     * Loads in flight on the page have already failed with NavigationFailed.
     */
    void pageLost(const PageHandle& page, const QString& reason);

private slots:
    //!< @brief Drop every handle after an engine crash.
    void onEngineCrashed(const QString& reason);

    //!< @brief Drop one page the engine lost.
    void onEnginePageLost(quint64 pageId, const QString& reason);

private:
    struct PendingPage {
        quint64 contextId = 0;
        quint64 generation = 0;
        int timeoutMs = 0;
        PageCallback done;
        QTimer* timer = nullptr;
    };

    struct PendingNavigation {
        quint64 pageId = 0;
        NavigateCallback done;
        QTimer* timer = nullptr;
    };

    //!< @brief Ask the engine for a page; runs on the pool's thread.
    void startPageRequest(quint64 requestId);

    //!< @brief Handle a page delivered by the engine.
    void onPageCreated(quint64 requestId, quint64 pageId, const QString& error);

    //!< @brief Fail a pending page request.
    void failPendingPage(quint64 requestId, const Error& error);

    //!< @brief Handle a finished load.
    void finishNavigation(quint64 requestId, const Error& error);

    //!< @brief Take every pending request for failure outside the lock.
    void takeAllPending(QList<PendingPage>* pages, QList<PendingNavigation>* navigations);

    //!< @brief Complete taken requests with one error.
    void failTaken(const QList<PendingPage>& pages, const QList<PendingNavigation>& navigations, const Error& error);

    EngineSingleton* m_engine = nullptr;            //!< Engine owner.
    mutable QMutex m_mutex;                         //!< Guards the tables below.
    int m_maxContexts = 10;                         //!< Context cap.
    int m_maxPages = 10;                            //!< Page cap.
    int m_reservedContexts = 0;                     //!< Slots held by in-flight acquireContext().
    quint64 m_generation = 0;                       //!< Engine generation of live handles.
    quint64 m_nextRequestId = 0;                    //!< Request id counter.
    QHash<quint64, QSet<quint64>> m_contexts;       //!< Context id -> live page ids.
    QHash<quint64, quint64> m_pages;                //!< Page id -> context id.
    QHash<quint64, PendingPage> m_pendingPages;     //!< Request id -> page request.
    QHash<quint64, PendingNavigation> m_navigations; //!< Request id -> load in flight.
};

#include "resourcepool.moc"
