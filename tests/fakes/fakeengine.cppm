/*!
 * @file        fakeengine.cppm
 * @brief       In-process BrowserEngine for tests.
 * @details     Contexts and pages are plain ids. Page delivery and page loads
 *              complete on timers with configurable delays, so tests can
 *              drive timeouts, late deliveries and crashes deterministically.
 *              Every member is safe to call from any thread; callbacks run on
 *              the engine's thread.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QAtomicInt>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>
#include <QThread>
#include <QUrl>

#ifndef Q_MOC_RUN
export module rawser.testing.fakeengine;
import rawser.core.types;
import rawser.core.engine;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

RAWSER_MODULE_EXPORT class FakeEngine : public BrowserEngine {

    Q_OBJECT

public:
    explicit FakeEngine(QObject* parent = nullptr);

    bool start(QString* error) override;
    void stop() override;
    bool isRunning() const override;

    quint64 createContext(QString* error) override;
    void destroyContext(quint64 contextId) override;

    void createPage(quint64 contextId, PageCallback done) override;
    void closePage(quint64 pageId) override;
    void navigate(quint64 pageId, const QUrl& url, LoadCallback done) override;
    void setPageInteractive(quint64 pageId, bool interactive) override;

    QString cookieHeader(quint64 contextId, const QUrl& url) const override;

    //!< @brief Delay before a page is delivered; -1 never delivers.
    void setPageDelay(int ms);

    //!< @brief Delay before a load finishes; -1 never finishes.
    void setNavigationDelay(int ms);

    void setNavigationSucceeds(bool succeeds);
    void setStartFails(bool fails);

    //!< @brief Cookie header returned for every URL of a context.
    void setCookie(quint64 contextId, const QString& header);

    /**
     * @brief Report a request seen on a page.
     * @param pageId Page the request belongs to.
     * @param url Request URL.
     * @param contentType Content type, may be empty.
     * @param firstParty Document URL.
     * @param headers Request headers.
     */
    void emitResponse(quint64 pageId, const QUrl& url, const QString& contentType = QString(),
                      const QUrl& firstParty = QUrl(), const HeaderMap& headers = HeaderMap());

    //!< @brief Drop every context and page and report a crash.
    void simulateCrash(const QString& reason);

    //!< @brief Drop one page as a dead renderer would.
    void simulatePageLoss(quint64 pageId, const QString& reason);

    int startCalls() const;
    //!< @brief Thread the last start ran on.
    QThread* startThread() const;
    int contextCount() const;
    int pageCount() const;
    int closedPages() const;
    bool isInteractive(quint64 pageId) const;
    QList<QUrl> loads() const;

signals:
    //!< @brief Emitted after a live page is shown or hidden.
    void interactiveChanged(quint64 pageId, bool interactive);

private:
    mutable QMutex m_mutex;
    QAtomicInt m_startCalls;
    QThread* m_startThread = nullptr;
    bool m_running = false;
    bool m_startFails = false;
    int m_pageDelayMs = 0;
    int m_navigationDelayMs = 0;
    bool m_navigationSucceeds = true;
    quint64 m_epoch = 0;                    //!< Bumped by stop and crash.
    quint64 m_nextContextId = 0;
    quint64 m_nextPageId = 0;
    QSet<quint64> m_contexts;
    QHash<quint64, quint64> m_pages;        //!< Page id -> context id.
    QSet<quint64> m_interactive;
    QHash<quint64, QString> m_cookies;
    QList<QUrl> m_loads;
    int m_closedPages = 0;
};

#include "fakeengine.moc"
