/*!
 * @file        engine.cppm
 * @brief       Browser engine collaborator interface.
 * @details     Declares the black-box surface the core drives: engine
 *              lifecycle, isolated contexts, pages leased from a context,
 *              navigation, and a per-page stream of observed requests.
 *
 *              Implementations own every engine object; the core only holds
 *              numeric ids. Asynchronous calls report through callbacks that
 *              must be invoked on the engine object's thread and never from
 *              inside the call that scheduled them.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QObject>
#include <QString>
#include <QUrl>
#include <functional>

#ifndef Q_MOC_RUN
export module rawser.core.engine;
import rawser.core.types;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Abstract browser engine.
 *
 * One instance is installed into EngineSingleton per process. Context and
 * page ids are never reused within one engine object.
 */
RAWSER_MODULE_EXPORT class BrowserEngine : public QObject {

    Q_OBJECT

public:
    //!< @brief Page creation result: page id (0 on failure) and error text.
    using PageCallback = std::function<void(quint64 pageId, const QString& error)>;

    //!< @brief Navigation result.
    using LoadCallback = std::function<void(bool ok, const QString& error)>;

    explicit BrowserEngine(QObject* parent = nullptr) : QObject(parent) {}
    ~BrowserEngine() override = default;

    /**
     * @brief Start the engine.
     * @param error Receives the failure reason.
     * @return true on success.
     */
    virtual bool start(QString* error) = 0;

    //!< @brief Stop the engine and drop every context and page.
    virtual void stop() = 0;

    //!< @brief Whether the engine is running.
    virtual bool isRunning() const = 0;

    /**
     * @brief Create an isolated cookie/storage scope.
     * @param error Receives the failure reason.
     * @return Context id, 0 on failure.
     */
    virtual quint64 createContext(QString* error) = 0;

    //!< @brief Destroy a context and every page still open in it.
    virtual void destroyContext(quint64 contextId) = 0;

    /**
     * @brief Create a page inside a context.
     * @param contextId Owning context.
     * @param done Completion callback.
     */
    virtual void createPage(quint64 contextId, PageCallback done) = 0;

    //!< @brief Close a page.
    virtual void closePage(quint64 pageId) = 0;

    /**
     * @brief Load a URL in a page.
     * @param pageId Target page.
     * @param url URL to load.
     * @param done Completion callback.
     */
    virtual void navigate(quint64 pageId, const QUrl& url, LoadCallback done) = 0;

    /**
     * @brief Switch a page between background and interactive use.
     * @param pageId Target page.
     * @param interactive true when a user may interact with the page.
     */
    virtual void setPageInteractive(quint64 pageId, bool interactive) = 0;

    /**
     * @brief Cookie header value the context would send to a URL.
     * @param contextId Context to read.
     * @param url Target URL.
     * @return "name=value; ..." or an empty string.
     */
    virtual QString cookieHeader(quint64 contextId, const QUrl& url) const = 0;

signals:
    //!< @brief Emitted for every network exchange observed on a page.
    void responseObserved(quint64 pageId, const ResponseInfo& info);

    /**
     * @brief Emitted when one page died, typically its renderer process.
     *
     * The engine has already dropped the page; its context and every other
     * page stay usable.
     */
    void pageLost(quint64 pageId, const QString& reason);

    //!< @brief Emitted when the engine died; every context and page is gone.
    void crashed(const QString& reason);
};

#include "engine.moc"
