module;
#include <QDateTime>
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <algorithm>

module rawser.core.interceptor;

import rawser.core.types;
import rawser.core.resourcepool;
import rawser.utils.media_utils;

namespace utils = rawser::utils;

namespace {

QString urlKey(const QUrl& url)
{
    return url.adjusted(QUrl::RemoveFragment).toString(QUrl::FullyEncoded);
}

// "user-agent" -> "User-Agent"
QString canonicalHeaderName(const QString& name)
{
    QString out = name.trimmed().toLower();
    bool upper = true;
    for (QChar& c : out) {
        if (upper) c = c.toUpper();
        upper = (c == '-');
    }
    return out;
}

} // namespace

MediaInterceptor::MediaInterceptor(ResourcePool* pool, QObject* parent)
    : QObject(parent),
    m_pool(pool)
{
    connect(m_pool, &ResourcePool::responseObserved, this, &MediaInterceptor::onResponseObserved);
}

void MediaInterceptor::attach(const QString& taskId, const PageHandle& page)
{
    if (taskId.isEmpty() || !page.isValid()) return;
    QMutexLocker lock(&m_mutex);
    m_pages.insert(page.id, Attachment{ taskId, page.contextId });
}

void MediaInterceptor::detach(quint64 pageId)
{
    QMutexLocker lock(&m_mutex);
    m_pages.remove(pageId);
}

void MediaInterceptor::forgetTask(const QString& taskId)
{
    QMutexLocker lock(&m_mutex);
    for (auto it = m_pages.begin(); it != m_pages.end();) {
        if (it->taskId == taskId) {
            it = m_pages.erase(it);
        } else {
            ++it;
        }
    }
    m_seen.remove(taskId);
    m_records.remove(taskId);
}

bool MediaInterceptor::isAttached(quint64 pageId) const
{
    QMutexLocker lock(&m_mutex);
    return m_pages.contains(pageId);
}

QList<MediaRecord> MediaInterceptor::records(const QString& taskId) const
{
    QList<MediaRecord> list;
    {
        QMutexLocker lock(&m_mutex);
        list = m_records.value(taskId);
    }
    std::stable_sort(list.begin(), list.end(), [](const MediaRecord& a, const MediaRecord& b) {
        return utils::isPrimaryMedia(a.type) && !utils::isPrimaryMedia(b.type);
    });
    return list;
}

bool MediaInterceptor::findByUrl(const QUrl& url, MediaRecord* record) const
{
    const QString key = urlKey(url);
    QMutexLocker lock(&m_mutex);
    const MediaRecord* best = nullptr;
    for (auto it = m_records.cbegin(); it != m_records.cend(); ++it) {
        for (const MediaRecord& candidate : it.value()) {
            if (urlKey(candidate.url) != key) continue;
            if (!best || candidate.discoveredAt > best->discoveredAt) best = &candidate;
        }
    }
    if (!best) return false;
    if (record) *record = *best;
    return true;
}

void MediaInterceptor::onResponseObserved(quint64 pageId, const ResponseInfo& info)
{
    Attachment attachment;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_pages.constFind(pageId);
        if (it == m_pages.cend()) return;
        attachment = it.value();
    }

    if (utils::isSkippedRequest(info.url)) return;
    MediaType type = MediaType::Other;
    bool ambiguous = false;
    if (!utils::classifyMedia(info.url, info.contentType, &type, &ambiguous)) return;

    const QString key = urlKey(info.url);
    {
        QMutexLocker lock(&m_mutex);
        QSet<QString>& seen = m_seen[attachment.taskId];
        if (seen.contains(key)) return;
        seen.insert(key);
    }

    QMetaObject::invokeMethod(this, [this, attachment, key, info, type, ambiguous] {
        publish(attachment.taskId, attachment.contextId, key, info, type, ambiguous);
    }, Qt::QueuedConnection);
}

void MediaInterceptor::publish(const QString& taskId, quint64 contextId, const QString& key,
                               const ResponseInfo& info, MediaType type, bool ambiguous)
{
    MediaRecord record;
    record.url = info.url;
    record.type = type;
    record.referrer = info.firstPartyUrl;
    record.contentType = info.contentType;
    record.taskId = taskId;
    record.discoveredAt = QDateTime::currentDateTime();
    record.ambiguous = ambiguous;

    for (auto it = info.headers.cbegin(); it != info.headers.cend(); ++it) {
        record.headers.insert(canonicalHeaderName(it.key()), it.value());
    }
    if (!record.headers.contains("Referer") && info.firstPartyUrl.isValid() && !info.firstPartyUrl.isEmpty()) {
        record.headers.insert("Referer", info.firstPartyUrl.toString());
    }
    const QString cookies = m_pool->cookieHeader(contextId, info.url);
    if (!cookies.isEmpty()) record.headers.insert("Cookie", cookies);

    {
        QMutexLocker lock(&m_mutex);
        // The task was closed between reservation and publication.
        if (!m_seen.value(taskId).contains(key)) return;
        m_records[taskId].append(record);
    }

    if (ambiguous) {
        qDebug() << "[Media] Ambiguous classification, treated as OTHER:" << info.url.toString();
    }
    emit mediaDetected(record);
}
