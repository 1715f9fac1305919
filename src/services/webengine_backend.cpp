module;
#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QGuiApplication>
#include <QMetaObject>
#include <QMutexLocker>
#include <QSharedPointer>
#include <QStringList>
#include <QThread>
#include <QWebEngineLoadingInfo>
#include <QWebEngineCookieStore>
#include <QWebEngineUrlRequestInfo>
#include <functional>

module rawser.services.webengine_backend;

import rawser.core.types;
import rawser.core.engine;

namespace {

constexpr int kRendererExitLimit = 3;
constexpr qint64 kRendererExitWindowMs = 10000;

QString resourceTypeName(QWebEngineUrlRequestInfo::ResourceType type)
{
    switch (type) {
    case QWebEngineUrlRequestInfo::ResourceTypeMainFrame: return QStringLiteral("document");
    case QWebEngineUrlRequestInfo::ResourceTypeSubFrame: return QStringLiteral("subframe");
    case QWebEngineUrlRequestInfo::ResourceTypeMedia: return QStringLiteral("media");
    case QWebEngineUrlRequestInfo::ResourceTypeXhr: return QStringLiteral("xhr");
    case QWebEngineUrlRequestInfo::ResourceTypeScript: return QStringLiteral("script");
    case QWebEngineUrlRequestInfo::ResourceTypeStylesheet: return QStringLiteral("stylesheet");
    case QWebEngineUrlRequestInfo::ResourceTypeImage: return QStringLiteral("image");
    case QWebEngineUrlRequestInfo::ResourceTypeFontResource: return QStringLiteral("font");
    default: return QStringLiteral("other");
    }
}

/**
 * @brief Page-level interceptor that only observes.
 */
class RequestObserver : public QWebEngineUrlRequestInterceptor {
public:
    using Sink = std::function<void(const ResponseInfo&)>;

    RequestObserver(Sink sink, QObject* parent)
        : QWebEngineUrlRequestInterceptor(parent),
        m_sink(std::move(sink))
    {
    }

    void interceptRequest(QWebEngineUrlRequestInfo& info) override
    {
        ResponseInfo observed;
        observed.url = info.requestUrl();
        observed.method = QString::fromLatin1(info.requestMethod());
        observed.firstPartyUrl = info.firstPartyUrl();
        observed.resourceType = resourceTypeName(info.resourceType());
        const auto headers = info.httpHeaders();
        for (auto it = headers.cbegin(); it != headers.cend(); ++it) {
            observed.headers.insert(QString::fromLatin1(it.key()), QString::fromUtf8(it.value()));
        }
        m_sink(observed);
    }

private:
    Sink m_sink;
};

bool domainMatches(const QString& host, const QString& cookieDomain)
{
    QString domain = cookieDomain.toLower();
    if (domain.startsWith(QLatin1Char('.'))) domain.remove(0, 1);
    if (domain.isEmpty()) return false;
    return host == domain || host.endsWith(QLatin1Char('.') + domain);
}

} // namespace

LoadWatch::LoadWatch(const QUrl& target)
    : m_target(target.adjusted(QUrl::StripTrailingSlash | QUrl::NormalizePathSegments))
{
}

LoadWatch::Outcome LoadWatch::onLoadingChanged(QWebEngineLoadingInfo::LoadStatus status, const QUrl& url)
{
    if (status == QWebEngineLoadingInfo::LoadStartedStatus) {
        if (url.adjusted(QUrl::StripTrailingSlash | QUrl::NormalizePathSegments) == m_target) m_started = true;
        return Outcome::Pending;
    }
    if (!m_started) return Outcome::Pending;
    return status == QWebEngineLoadingInfo::LoadSucceededStatus ? Outcome::Succeeded : Outcome::Failed;
}

WebEngineBackend::WebEngineBackend(QObject* parent)
    : BrowserEngine(parent)
{
}

WebEngineBackend::~WebEngineBackend()
{
    if (m_running) stop();
}

bool WebEngineBackend::onOwnerThread() const
{
    return QThread::currentThread() == thread();
}

bool WebEngineBackend::start(QString* error)
{
    if (!onOwnerThread()) {
        bool ok = false;
        QMetaObject::invokeMethod(this, [this, &ok, error] { ok = start(error); }, Qt::BlockingQueuedConnection);
        return ok;
    }
    if (m_running) return true;
    if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        if (error) *error = QStringLiteral("Qt WebEngine requires a QGuiApplication");
        return false;
    }
    m_running = true;
    qDebug() << "[WebEngine] Started";
    return true;
}

void WebEngineBackend::stop()
{
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this] { stop(); }, Qt::BlockingQueuedConnection);
        return;
    }
    const QList<quint64> pages = m_pages.keys();
    for (quint64 pageId : pages) dropPage(pageId);
    const QList<quint64> contexts = m_contexts.keys();
    for (quint64 contextId : contexts) destroyContext(contextId);
    m_running = false;
    qDebug() << "[WebEngine] Stopped";
}

bool WebEngineBackend::isRunning() const
{
    return m_running;
}

quint64 WebEngineBackend::createContext(QString* error)
{
    if (!onOwnerThread()) {
        quint64 id = 0;
        QMetaObject::invokeMethod(this, [this, &id, error] { id = createContext(error); }, Qt::BlockingQueuedConnection);
        return id;
    }
    if (!m_running) {
        if (error) *error = QStringLiteral("engine is not running");
        return 0;
    }

    // A profile without a storage name is off the record.
    auto* profile = new QWebEngineProfile(this);
    profile->setHttpCacheType(QWebEngineProfile::MemoryHttpCache);
    profile->setPersistentCookiesPolicy(QWebEngineProfile::NoPersistentCookies);

    const quint64 id = ++m_nextContextId;
    m_contexts.insert(id, Context{ profile });
    trackCookies(id, profile);
    return id;
}

void WebEngineBackend::trackCookies(quint64 contextId, QWebEngineProfile* profile)
{
    {
        QMutexLocker lock(&m_cookieMutex);
        m_cookies.insert(contextId, {});
    }
    QWebEngineCookieStore* store = profile->cookieStore();
    connect(store, &QWebEngineCookieStore::cookieAdded, this, [this, contextId](const QNetworkCookie& cookie) {
        QMutexLocker lock(&m_cookieMutex);
        auto it = m_cookies.find(contextId);
        if (it == m_cookies.end()) return;
        it->removeIf([&cookie](const QNetworkCookie& known) { return known.hasSameIdentifier(cookie); });
        it->append(cookie);
    });
    connect(store, &QWebEngineCookieStore::cookieRemoved, this, [this, contextId](const QNetworkCookie& cookie) {
        QMutexLocker lock(&m_cookieMutex);
        auto it = m_cookies.find(contextId);
        if (it == m_cookies.end()) return;
        it->removeIf([&cookie](const QNetworkCookie& known) { return known.hasSameIdentifier(cookie); });
    });
    store->loadAllCookies();
}

void WebEngineBackend::destroyContext(quint64 contextId)
{
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, contextId] { destroyContext(contextId); }, Qt::BlockingQueuedConnection);
        return;
    }
    QList<quint64> pages;
    for (auto it = m_pages.cbegin(); it != m_pages.cend(); ++it) {
        if (it->contextId == contextId) pages.append(it.key());
    }
    for (quint64 pageId : pages) dropPage(pageId);

    const Context context = m_contexts.take(contextId);
    {
        QMutexLocker lock(&m_cookieMutex);
        m_cookies.remove(contextId);
    }
    if (context.profile) {
        disconnect(context.profile->cookieStore(), nullptr, this, nullptr);
        context.profile->deleteLater();
    }
}

void WebEngineBackend::createPage(quint64 contextId, PageCallback done)
{
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, contextId, done] { createPage(contextId, done); }, Qt::QueuedConnection);
        return;
    }

    const Context context = m_contexts.value(contextId);
    if (!m_running || !context.profile) {
        QMetaObject::invokeMethod(this, [done] { done(0, QStringLiteral("unknown context")); }, Qt::QueuedConnection);
        return;
    }

    const quint64 id = ++m_nextPageId;
    auto* page = new QWebEnginePage(context.profile, context.profile);
    page->setVisible(false);

    QPointer<WebEngineBackend> self(this);
    auto* observer = new RequestObserver([self, id](const ResponseInfo& info) {
        if (self) emit self->responseObserved(id, info);
    }, page);
    page->setUrlRequestInterceptor(observer);

    connect(page, &QWebEnginePage::renderProcessTerminated, this,
            [this, id](QWebEnginePage::RenderProcessTerminationStatus status, int exitCode) {
        if (status == QWebEnginePage::NormalTerminationStatus) return;
        qWarning() << "[WebEngine] Renderer of page" << id << "terminated, status" << status << "exit code" << exitCode;
        onRendererTerminated(id, QStringLiteral("renderer terminated (status %1, exit code %2)")
                                     .arg(int(status)).arg(exitCode));
    });

    m_pages.insert(id, Page{ page, observer, contextId });
    QMetaObject::invokeMethod(this, [done, id] { done(id, QString()); }, Qt::QueuedConnection);
}

void WebEngineBackend::dropPage(quint64 pageId)
{
    const Page entry = m_pages.take(pageId);
    if (!entry.page) return;
    entry.page->setUrlRequestInterceptor(nullptr);
    disconnect(entry.page, nullptr, this, nullptr);
    entry.page->deleteLater();
}

void WebEngineBackend::onRendererTerminated(quint64 pageId, const QString& reason)
{
    dropPage(pageId);

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    m_rendererExits.removeIf([now](qint64 at) { return now - at > kRendererExitWindowMs; });
    m_rendererExits.append(now);
    if (m_rendererExits.size() < kRendererExitLimit) {
        emit pageLost(pageId, reason);
        return;
    }

    m_rendererExits.clear();
    const QList<quint64> pages = m_pages.keys();
    for (quint64 id : pages) dropPage(id);
    const QList<quint64> contexts = m_contexts.keys();
    for (quint64 contextId : contexts) destroyContext(contextId);
    m_running = false;
    emit crashed(QStringLiteral("renderer crash loop: %1").arg(reason));
}

void WebEngineBackend::closePage(quint64 pageId)
{
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, pageId] { closePage(pageId); }, Qt::BlockingQueuedConnection);
        return;
    }
    dropPage(pageId);
}

void WebEngineBackend::navigate(quint64 pageId, const QUrl& url, LoadCallback done)
{
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, pageId, url, done] { navigate(pageId, url, done); }, Qt::QueuedConnection);
        return;
    }

    const Page entry = m_pages.value(pageId);
    if (!entry.page) {
        QMetaObject::invokeMethod(this, [done] { done(false, QStringLiteral("unknown page")); }, Qt::QueuedConnection);
        return;
    }

    const quint64 token = ++m_pages[pageId].loadToken;
    auto connection = QSharedPointer<QMetaObject::Connection>::create();
    auto watch = QSharedPointer<LoadWatch>::create(url);
    *connection = connect(entry.page, &QWebEnginePage::loadingChanged, this,
                          [this, pageId, token, connection, watch, done](const QWebEngineLoadingInfo& info) {
        if (m_pages.value(pageId).loadToken != token) {
            QObject::disconnect(*connection);
            done(false, QStringLiteral("superseded by a newer load"));
            return;
        }
        const LoadWatch::Outcome outcome = watch->onLoadingChanged(info.status(), info.url());
        if (outcome == LoadWatch::Outcome::Pending) return;
        QObject::disconnect(*connection);
        if (outcome == LoadWatch::Outcome::Succeeded) {
            done(true, QString());
            return;
        }
        done(false, info.errorString().isEmpty() ? QStringLiteral("page failed to load") : info.errorString());
    });
    entry.page->load(url);
}

void WebEngineBackend::setPageInteractive(quint64 pageId, bool interactive)
{
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, pageId, interactive] { setPageInteractive(pageId, interactive); },
                                  Qt::BlockingQueuedConnection);
        return;
    }
    const Page entry = m_pages.value(pageId);
    if (!entry.page) return;
    entry.page->setVisible(interactive);
    entry.page->setLifecycleState(QWebEnginePage::LifecycleState::Active);
}

QString WebEngineBackend::cookieHeader(quint64 contextId, const QUrl& url) const
{
    const QString host = url.host().toLower();
    const QString path = url.path().isEmpty() ? QStringLiteral("/") : url.path();
    const bool secure = url.scheme() == QLatin1String("https");
    const QDateTime now = QDateTime::currentDateTimeUtc();

    QStringList pairs;
    QMutexLocker lock(&m_cookieMutex);
    for (const QNetworkCookie& cookie : m_cookies.value(contextId)) {
        if (!domainMatches(host, cookie.domain())) continue;
        if (!cookie.path().isEmpty() && !path.startsWith(cookie.path())) continue;
        if (cookie.isSecure() && !secure) continue;
        if (!cookie.isSessionCookie() && cookie.expirationDate().toUTC() < now) continue;
        pairs.append(QString::fromUtf8(cookie.name()) + QLatin1Char('=') + QString::fromUtf8(cookie.value()));
    }
    return pairs.join(QStringLiteral("; "));
}

