/*!
 * @file        webengine_backend.cppm
 * @brief       BrowserEngine implementation over Qt WebEngine.
 * @details     Each context is an off-the-record QWebEngineProfile, so
 *              cookies and storage never leak between tasks. Each page is a
 *              QWebEnginePage of its context's profile with a page-level
 *              request interceptor that reports every request it sees.
 *
 *              Cookies are mirrored from the profile's cookie store so the
 *              Cookie header for a media URL can be answered from any thread.
 *
 *              Qt WebEngine objects live on the GUI thread; calls from other
 *              threads are marshalled onto it.
 *
 *              A renderer that dies takes only its page down; three deaths
 *              within ten seconds are treated as an engine crash.
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
#include <QNetworkCookie>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>
#include <QWebEnginePage>
#include <QWebEngineLoadingInfo>
#include <QWebEngineProfile>
#include <QWebEngineUrlRequestInterceptor>

#ifndef Q_MOC_RUN
export module rawser.services.webengine_backend;
import rawser.core.types;
import rawser.core.engine;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Follows the loading events of one requested load on a page.
 *
 * Events of a load that was already running when the request was made are
 * skipped until the requested URL has started.
 */
RAWSER_MODULE_EXPORT class LoadWatch {
public:
    enum class Outcome { Pending, Succeeded, Failed };

    explicit LoadWatch(const QUrl& target);

    Outcome onLoadingChanged(QWebEngineLoadingInfo::LoadStatus status, const QUrl& url);

private:
    QUrl m_target;
    bool m_started = false;
};

/**
 * @brief Qt WebEngine driven engine backend.
 *
 * Requires a QGuiApplication created with Qt::AA_ShareOpenGLContexts.
 */
RAWSER_MODULE_EXPORT class WebEngineBackend : public BrowserEngine {

    Q_OBJECT

public:
    explicit WebEngineBackend(QObject* parent = nullptr);
    ~WebEngineBackend() override;

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

private:
    struct Context {
        QPointer<QWebEngineProfile> profile;
    };

    struct Page {
        QPointer<QWebEnginePage> page;
        QWebEngineUrlRequestInterceptor* observer = nullptr;
        quint64 contextId = 0;
        quint64 loadToken = 0;              //!< Bumped by every navigate.
    };

    //!< @brief Whether the caller is on the backend's thread.
    bool onOwnerThread() const;

    void trackCookies(quint64 contextId, QWebEngineProfile* profile);
    void dropPage(quint64 pageId);

    /**
     * @brief Handle an abnormal renderer exit of one page.
     *
     * The page is dropped and reported through pageLost. Repeated exits
     * inside a short window mean the renderer cannot stay up; every page and
     * context is then dropped and the whole engine reports crashed.
     */
    void onRendererTerminated(quint64 pageId, const QString& reason);

    bool m_running = false;
    quint64 m_nextContextId = 0;
    quint64 m_nextPageId = 0;
    QHash<quint64, Context> m_contexts;
    QHash<quint64, Page> m_pages;
    QList<qint64> m_rendererExits;                          //!< Recent abnormal exits, ms since epoch.

    mutable QMutex m_cookieMutex;                           //!< Guards m_cookies.
    QHash<quint64, QList<QNetworkCookie>> m_cookies;        //!< Context id -> cookie jar mirror.
};

#include "webengine_backend.moc"
