module;
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPointer>
#include <QTimer>
#include <QtGlobal>

module rawser.core.resourcepool;

import rawser.core.types;
import rawser.core.engine;
import rawser.core.enginesingleton;

ResourcePool::ResourcePool(EngineSingleton* engine, QObject* parent)
    : QObject(parent),
    m_engine(engine)
{
    connect(m_engine, &EngineSingleton::crashed, this, &ResourcePool::onEngineCrashed);
    connect(m_engine, &EngineSingleton::responseObserved, this, &ResourcePool::responseObserved);
    connect(m_engine, &EngineSingleton::pageLost, this, &ResourcePool::onEnginePageLost);
}

void ResourcePool::setLimits(int maxContexts, int maxPages)
{
    QMutexLocker lock(&m_mutex);
    m_maxContexts = qMax(1, maxContexts);
    m_maxPages = qMax(1, maxPages);
}

int ResourcePool::maxContexts() const
{
    QMutexLocker lock(&m_mutex);
    return m_maxContexts;
}

int ResourcePool::maxPages() const
{
    QMutexLocker lock(&m_mutex);
    return m_maxPages;
}

ContextHandle ResourcePool::acquireContext(Error* error)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_contexts.size() + m_reservedContexts >= m_maxContexts) {
            if (error) *error = makeError(ErrorCode::ResourceExhausted,
                                          QStringLiteral("context limit of %1 reached").arg(m_maxContexts));
            return {};
        }
        ++m_reservedContexts;
    }

    const auto unreserve = [this] {
        QMutexLocker lock(&m_mutex);
        --m_reservedContexts;
    };

    if (!m_engine->ensureStarted(error)) {
        unreserve();
        return {};
    }

    const quint64 generation = m_engine->generation();
    BrowserEngine* backend = m_engine->backend();
    QString reason;
    const quint64 id = backend ? backend->createContext(&reason) : 0;

    ContextHandle handle;
    {
        QMutexLocker lock(&m_mutex);
        --m_reservedContexts;
        if (id != 0 && m_engine->isRunning() && m_engine->generation() == generation) {
            if (m_generation != generation) {
                m_generation = generation;
                m_contexts.clear();
                m_pages.clear();
            }
            m_contexts.insert(id, {});
            handle = ContextHandle{ id, generation };
        }
    }

    if (!handle.isValid()) {
        if (error) *error = makeError(ErrorCode::EngineUnavailable,
                                      reason.isEmpty() ? QStringLiteral("engine lost while creating context") : reason);
        return {};
    }
    emit countsChanged();
    return handle;
}

Error ResourcePool::releaseContext(const ContextHandle& context)
{
    QSet<quint64> pages;
    QList<PendingPage> pendingPages;
    QList<PendingNavigation> navigations;
    {
        QMutexLocker lock(&m_mutex);
        if (!context.isValid() || context.generation != m_generation || !m_contexts.contains(context.id)) {
            return makeError(ErrorCode::NotFound, QStringLiteral("unknown context %1").arg(context.id));
        }
        pages = m_contexts.take(context.id);
        for (quint64 pageId : pages) m_pages.remove(pageId);

        for (auto it = m_pendingPages.begin(); it != m_pendingPages.end();) {
            if (it->contextId == context.id) {
                pendingPages.append(it.value());
                it = m_pendingPages.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = m_navigations.begin(); it != m_navigations.end();) {
            if (pages.contains(it->pageId)) {
                navigations.append(it.value());
                it = m_navigations.erase(it);
            } else {
                ++it;
            }
        }
    }

    failTaken(pendingPages, navigations, makeError(ErrorCode::NotFound, QStringLiteral("context released")));

    if (BrowserEngine* backend = m_engine->backend(); backend && m_engine->isRunning()) {
        for (quint64 pageId : pages) backend->closePage(pageId);
        backend->destroyContext(context.id);
    }
    emit countsChanged();
    return {};
}

Error ResourcePool::acquirePage(const ContextHandle& context, int timeoutMs, PageCallback done)
{
    quint64 requestId = 0;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_engine->isRunning()) {
            return makeError(ErrorCode::EngineUnavailable, QStringLiteral("engine is not running"));
        }
        if (!context.isValid() || context.generation != m_generation || !m_contexts.contains(context.id)) {
            return makeError(ErrorCode::NotFound, QStringLiteral("unknown context %1").arg(context.id));
        }
        if (m_pages.size() + m_pendingPages.size() >= m_maxPages) {
            return makeError(ErrorCode::ResourceExhausted, QStringLiteral("page limit of %1 reached").arg(m_maxPages));
        }
        requestId = ++m_nextRequestId;
        PendingPage request;
        request.contextId = context.id;
        request.generation = m_generation;
        request.timeoutMs = timeoutMs;
        request.done = std::move(done);
        m_pendingPages.insert(requestId, request);
    }
    emit countsChanged();
    QMetaObject::invokeMethod(this, [this, requestId] { startPageRequest(requestId); }, Qt::QueuedConnection);
    return {};
}

void ResourcePool::startPageRequest(quint64 requestId)
{
    quint64 contextId = 0;
    QTimer* timer = nullptr;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_pendingPages.find(requestId);
        if (it == m_pendingPages.end()) return;
        contextId = it->contextId;
        timer = new QTimer(this);
        timer->setSingleShot(true);
        timer->setInterval(qMax(1, it->timeoutMs));
        it->timer = timer;
    }
    connect(timer, &QTimer::timeout, this, [this, requestId] {
        failPendingPage(requestId, makeError(ErrorCode::Timeout, QStringLiteral("page acquisition timed out")));
    });
    timer->start();

    BrowserEngine* backend = m_engine->backend();
    if (!backend) {
        failPendingPage(requestId, makeError(ErrorCode::EngineUnavailable, QStringLiteral("no engine backend installed")));
        return;
    }
    QPointer<ResourcePool> self(this);
    backend->createPage(contextId, [self, requestId](quint64 pageId, const QString& error) {
        if (!self) return;
        self->onPageCreated(requestId, pageId, error);
    });
}

void ResourcePool::onPageCreated(quint64 requestId, quint64 pageId, const QString& error)
{
    PendingPage request;
    PageHandle page;
    bool found = false;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_pendingPages.find(requestId);
        if (it != m_pendingPages.end()) {
            request = it.value();
            m_pendingPages.erase(it);
            found = true;
            if (pageId != 0 && error.isEmpty() && request.generation == m_generation
                && m_contexts.contains(request.contextId)) {
                m_pages.insert(pageId, request.contextId);
                m_contexts[request.contextId].insert(pageId);
                page = PageHandle{ pageId, request.contextId, m_generation };
            }
        }
    }

    BrowserEngine* backend = m_engine->backend();
    if (!found) {
        // The request timed out or was cancelled; the page has no owner.
        if (pageId != 0 && backend && m_engine->isRunning()) {
            qDebug() << "[Pool] Closing late page" << pageId;
            backend->closePage(pageId);
        }
        return;
    }

    if (request.timer) {
        request.timer->stop();
        request.timer->deleteLater();
    }
    emit countsChanged();

    if (!page.isValid()) {
        if (pageId != 0 && backend && m_engine->isRunning()) backend->closePage(pageId);
        request.done(PageHandle{}, makeError(ErrorCode::EngineUnavailable,
                                             error.isEmpty() ? QStringLiteral("engine returned no page") : error));
        return;
    }
    request.done(page, Error{});
}

void ResourcePool::failPendingPage(quint64 requestId, const Error& error)
{
    PendingPage request;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_pendingPages.find(requestId);
        if (it == m_pendingPages.end()) return;
        request = it.value();
        m_pendingPages.erase(it);
    }
    if (request.timer) {
        request.timer->stop();
        request.timer->deleteLater();
    }
    emit countsChanged();
    if (request.done) request.done(PageHandle{}, error);
}

Error ResourcePool::releasePage(const PageHandle& page)
{
    QList<PendingNavigation> navigations;
    {
        QMutexLocker lock(&m_mutex);
        if (!page.isValid() || page.generation != m_generation || !m_pages.contains(page.id)) {
            return makeError(ErrorCode::NotFound, QStringLiteral("unknown page %1").arg(page.id));
        }
        const quint64 contextId = m_pages.take(page.id);
        m_contexts[contextId].remove(page.id);
        for (auto it = m_navigations.begin(); it != m_navigations.end();) {
            if (it->pageId == page.id) {
                navigations.append(it.value());
                it = m_navigations.erase(it);
            } else {
                ++it;
            }
        }
    }

    failTaken({}, navigations, makeError(ErrorCode::NotFound, QStringLiteral("page released")));

    if (BrowserEngine* backend = m_engine->backend(); backend && m_engine->isRunning()) {
        backend->closePage(page.id);
    }
    emit countsChanged();
    return {};
}

Error ResourcePool::navigatePage(const PageHandle& page, const QUrl& url, int timeoutMs, NavigateCallback done)
{
    quint64 requestId = 0;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_engine->isRunning()) {
            return makeError(ErrorCode::EngineUnavailable, QStringLiteral("engine is not running"));
        }
        if (!page.isValid() || page.generation != m_generation || !m_pages.contains(page.id)) {
            return makeError(ErrorCode::NotFound, QStringLiteral("unknown page %1").arg(page.id));
        }
        requestId = ++m_nextRequestId;
        PendingNavigation navigation;
        navigation.pageId = page.id;
        navigation.done = std::move(done);
        m_navigations.insert(requestId, navigation);
    }

    QMetaObject::invokeMethod(this, [this, requestId, url, timeoutMs] {
        quint64 pageId = 0;
        QTimer* timer = nullptr;
        {
            QMutexLocker lock(&m_mutex);
            auto it = m_navigations.find(requestId);
            if (it == m_navigations.end()) return;
            pageId = it->pageId;
            timer = new QTimer(this);
            timer->setSingleShot(true);
            it->timer = timer;
        }
        connect(timer, &QTimer::timeout, this, [this, requestId, timeoutMs] {
            finishNavigation(requestId, makeError(ErrorCode::NavigationTimeout,
                                                  QStringLiteral("navigation timed out after %1 ms").arg(timeoutMs)));
        });
        timer->start(qMax(1, timeoutMs));

        BrowserEngine* backend = m_engine->backend();
        if (!backend) {
            finishNavigation(requestId, makeError(ErrorCode::EngineUnavailable, QStringLiteral("no engine backend installed")));
            return;
        }
        QPointer<ResourcePool> self(this);
        backend->navigate(pageId, url, [self, requestId](bool ok, const QString& error) {
            if (!self) return;
            self->finishNavigation(requestId, ok ? Error{}
                                                 : makeError(ErrorCode::NavigationFailed,
                                                             error.isEmpty() ? QStringLiteral("load failed") : error));
        });
    }, Qt::QueuedConnection);
    return {};
}

void ResourcePool::finishNavigation(quint64 requestId, const Error& error)
{
    PendingNavigation navigation;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_navigations.find(requestId);
        if (it == m_navigations.end()) return;
        navigation = it.value();
        m_navigations.erase(it);
    }
    if (navigation.timer) {
        navigation.timer->stop();
        navigation.timer->deleteLater();
    }
    if (navigation.done) navigation.done(error);
}

Error ResourcePool::setPageInteractive(const PageHandle& page, bool interactive)
{
    {
        QMutexLocker lock(&m_mutex);
        if (!page.isValid() || page.generation != m_generation || !m_pages.contains(page.id)) {
            return makeError(ErrorCode::NotFound, QStringLiteral("unknown page %1").arg(page.id));
        }
    }
    if (BrowserEngine* backend = m_engine->backend()) backend->setPageInteractive(page.id, interactive);
    return {};
}

QString ResourcePool::cookieHeader(quint64 contextId, const QUrl& url) const
{
    {
        QMutexLocker lock(&m_mutex);
        if (!m_contexts.contains(contextId)) return QString();
    }
    BrowserEngine* backend = m_engine->backend();
    return backend ? backend->cookieHeader(contextId, url) : QString();
}

bool ResourcePool::isPageLive(const PageHandle& page) const
{
    QMutexLocker lock(&m_mutex);
    return page.isValid() && page.generation == m_generation && m_pages.contains(page.id);
}

int ResourcePool::liveContexts() const
{
    QMutexLocker lock(&m_mutex);
    return m_contexts.size();
}

int ResourcePool::livePages() const
{
    QMutexLocker lock(&m_mutex);
    return m_pages.size();
}

int ResourcePool::pendingPages() const
{
    QMutexLocker lock(&m_mutex);
    return m_pendingPages.size();
}

bool ResourcePool::restartEngine(Error* error)
{
    return m_engine->restart(error);
}

void ResourcePool::takeAllPending(QList<PendingPage>* pages, QList<PendingNavigation>* navigations)
{
    *pages = m_pendingPages.values();
    *navigations = m_navigations.values();
    m_pendingPages.clear();
    m_navigations.clear();
}

void ResourcePool::failTaken(const QList<PendingPage>& pages,
                             const QList<PendingNavigation>& navigations,
                             const Error& error)
{
    for (const PendingPage& request : pages) {
        if (request.timer) {
            request.timer->stop();
            request.timer->deleteLater();
        }
        if (request.done) request.done(PageHandle{}, error);
    }
    for (const PendingNavigation& navigation : navigations) {
        if (navigation.timer) {
            navigation.timer->stop();
            navigation.timer->deleteLater();
        }
        if (navigation.done) navigation.done(error);
    }
}

void ResourcePool::shutdown()
{
    QList<PendingPage> pendingPages;
    QList<PendingNavigation> navigations;
    QList<quint64> pages;
    QList<quint64> contexts;
    {
        QMutexLocker lock(&m_mutex);
        takeAllPending(&pendingPages, &navigations);
        pages = m_pages.keys();
        contexts = m_contexts.keys();
        m_pages.clear();
        m_contexts.clear();
    }

    failTaken(pendingPages, navigations, makeError(ErrorCode::EngineUnavailable, QStringLiteral("pool shut down")));

    if (BrowserEngine* backend = m_engine->backend(); backend && m_engine->isRunning()) {
        for (quint64 pageId : pages) backend->closePage(pageId);
        for (quint64 contextId : contexts) backend->destroyContext(contextId);
    }
    m_engine->stop();
    emit countsChanged();
}

void ResourcePool::onEngineCrashed(const QString& reason)
{
    QList<PendingPage> pendingPages;
    QList<PendingNavigation> navigations;
    {
        QMutexLocker lock(&m_mutex);
        takeAllPending(&pendingPages, &navigations);
        m_pages.clear();
        m_contexts.clear();
    }
    qWarning() << "[Pool] Engine crashed, all contexts and pages invalidated:" << reason;
    failTaken(pendingPages, navigations, makeError(ErrorCode::EngineUnavailable, QStringLiteral("engine crashed: %1").arg(reason)));
    emit countsChanged();
    emit invalidated(reason);
}

void ResourcePool::onEnginePageLost(quint64 pageId, const QString& reason)
{
    PageHandle page;
    QList<PendingNavigation> navigations;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_pages.find(pageId);
        if (it == m_pages.end()) return;
        page = PageHandle{ pageId, it.value(), m_generation };
        m_pages.erase(it);
        m_contexts[page.contextId].remove(pageId);
        for (auto nav = m_navigations.begin(); nav != m_navigations.end();) {
            if (nav->pageId == pageId) {
                navigations.append(nav.value());
                nav = m_navigations.erase(nav);
            } else {
                ++nav;
            }
        }
    }
    qWarning() << "[Pool] Page" << pageId << "lost:" << reason;

    // Loads fail first so their commands revert before the owner drops the page.
    failTaken({}, navigations, makeError(ErrorCode::NavigationFailed, QStringLiteral("page lost: %1").arg(reason)));
    if (BrowserEngine* backend = m_engine->backend(); backend && m_engine->isRunning()) {
        backend->closePage(pageId);
    }
    emit countsChanged();
    emit pageLost(page, reason);
}
