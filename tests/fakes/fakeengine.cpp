module;
#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>
#include <QTimer>

module rawser.testing.fakeengine;

import rawser.core.types;
import rawser.core.engine;

FakeEngine::FakeEngine(QObject* parent)
    : BrowserEngine(parent)
{
}

bool FakeEngine::start(QString* error)
{
    if (QThread::currentThread() != thread()) {
        bool ok = false;
        QMetaObject::invokeMethod(this, [this, &ok, error] { ok = start(error); },
                                  Qt::BlockingQueuedConnection);
        return ok;
    }
    m_startCalls.ref();
    // Slow start so concurrent first callers overlap.
    QThread::msleep(20);
    QMutexLocker lock(&m_mutex);
    m_startThread = QThread::currentThread();
    if (m_startFails) {
        if (error) *error = QStringLiteral("start refused");
        return false;
    }
    m_running = true;
    return true;
}

void FakeEngine::stop()
{
    QMutexLocker lock(&m_mutex);
    m_running = false;
    ++m_epoch;
    m_contexts.clear();
    m_pages.clear();
    m_interactive.clear();
}

bool FakeEngine::isRunning() const
{
    QMutexLocker lock(&m_mutex);
    return m_running;
}

quint64 FakeEngine::createContext(QString* error)
{
    QMutexLocker lock(&m_mutex);
    if (!m_running) {
        if (error) *error = QStringLiteral("not running");
        return 0;
    }
    const quint64 id = ++m_nextContextId;
    m_contexts.insert(id);
    return id;
}

void FakeEngine::destroyContext(quint64 contextId)
{
    QMutexLocker lock(&m_mutex);
    m_contexts.remove(contextId);
    m_cookies.remove(contextId);
    for (auto it = m_pages.begin(); it != m_pages.end();) {
        if (it.value() == contextId) {
            m_interactive.remove(it.key());
            it = m_pages.erase(it);
        } else {
            ++it;
        }
    }
}

void FakeEngine::createPage(quint64 contextId, PageCallback done)
{
    int delay = 0;
    quint64 epoch = 0;
    {
        QMutexLocker lock(&m_mutex);
        delay = m_pageDelayMs;
        epoch = m_epoch;
    }
    if (delay < 0) return;

    const auto deliver = [this, contextId, done, epoch] {
        quint64 pageId = 0;
        {
            QMutexLocker lock(&m_mutex);
            if (epoch != m_epoch) return;
            if (m_running && m_contexts.contains(contextId)) {
                pageId = ++m_nextPageId;
                m_pages.insert(pageId, contextId);
            }
        }
        done(pageId, pageId == 0 ? QStringLiteral("context is gone") : QString());
    };
    QMetaObject::invokeMethod(this, [this, delay, deliver] {
        QTimer::singleShot(delay, this, deliver);
    }, Qt::QueuedConnection);
}

void FakeEngine::closePage(quint64 pageId)
{
    QMutexLocker lock(&m_mutex);
    if (m_pages.remove(pageId) > 0) ++m_closedPages;
    m_interactive.remove(pageId);
}

void FakeEngine::navigate(quint64 pageId, const QUrl& url, LoadCallback done)
{
    int delay = 0;
    quint64 epoch = 0;
    {
        QMutexLocker lock(&m_mutex);
        m_loads.append(url);
        delay = m_navigationDelayMs;
        epoch = m_epoch;
    }
    if (delay < 0) return;

    const auto finish = [this, pageId, done, epoch] {
        bool ok = false;
        {
            QMutexLocker lock(&m_mutex);
            if (epoch != m_epoch) return;
            ok = m_navigationSucceeds && m_pages.contains(pageId);
        }
        done(ok, ok ? QString() : QStringLiteral("load failed"));
    };
    QMetaObject::invokeMethod(this, [this, delay, finish] {
        QTimer::singleShot(delay, this, finish);
    }, Qt::QueuedConnection);
}

void FakeEngine::setPageInteractive(quint64 pageId, bool interactive)
{
    {
        QMutexLocker lock(&m_mutex);
        if (!m_pages.contains(pageId)) return;
        if (interactive) {
            m_interactive.insert(pageId);
        } else {
            m_interactive.remove(pageId);
        }
    }
    emit interactiveChanged(pageId, interactive);
}

QString FakeEngine::cookieHeader(quint64 contextId, const QUrl&) const
{
    QMutexLocker lock(&m_mutex);
    return m_cookies.value(contextId);
}

void FakeEngine::setPageDelay(int ms)
{
    QMutexLocker lock(&m_mutex);
    m_pageDelayMs = ms;
}

void FakeEngine::setNavigationDelay(int ms)
{
    QMutexLocker lock(&m_mutex);
    m_navigationDelayMs = ms;
}

void FakeEngine::setNavigationSucceeds(bool succeeds)
{
    QMutexLocker lock(&m_mutex);
    m_navigationSucceeds = succeeds;
}

void FakeEngine::setStartFails(bool fails)
{
    QMutexLocker lock(&m_mutex);
    m_startFails = fails;
}

void FakeEngine::setCookie(quint64 contextId, const QString& header)
{
    QMutexLocker lock(&m_mutex);
    m_cookies.insert(contextId, header);
}

void FakeEngine::emitResponse(quint64 pageId, const QUrl& url, const QString& contentType,
                              const QUrl& firstParty, const HeaderMap& headers)
{
    ResponseInfo info;
    info.url = url;
    info.method = QStringLiteral("GET");
    info.contentType = contentType;
    info.firstPartyUrl = firstParty;
    info.resourceType = QStringLiteral("media");
    info.headers = headers;
    emit responseObserved(pageId, info);
}

void FakeEngine::simulateCrash(const QString& reason)
{
    {
        QMutexLocker lock(&m_mutex);
        m_running = false;
        ++m_epoch;
        m_contexts.clear();
        m_pages.clear();
        m_interactive.clear();
    }
    emit crashed(reason);
}

void FakeEngine::simulatePageLoss(quint64 pageId, const QString& reason)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_pages.remove(pageId) == 0) return;
        m_interactive.remove(pageId);
    }
    emit pageLost(pageId, reason);
}

int FakeEngine::startCalls() const
{
    return m_startCalls.loadRelaxed();
}

QThread* FakeEngine::startThread() const
{
    QMutexLocker lock(&m_mutex);
    return m_startThread;
}

int FakeEngine::contextCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_contexts.size();
}

int FakeEngine::pageCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_pages.size();
}

int FakeEngine::closedPages() const
{
    QMutexLocker lock(&m_mutex);
    return m_closedPages;
}

bool FakeEngine::isInteractive(quint64 pageId) const
{
    QMutexLocker lock(&m_mutex);
    return m_interactive.contains(pageId);
}

QList<QUrl> FakeEngine::loads() const
{
    QMutexLocker lock(&m_mutex);
    return m_loads;
}
