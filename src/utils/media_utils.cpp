module;
#include <QFileInfo>
#include <QString>
#include <QStringList>
#include <QUrl>

module rawser.utils.media_utils;

import rawser.core.types;
import rawser.utils.download_utils;

namespace rawser::utils {

namespace {

bool containsAny(const QString& haystack, const QStringList& needles)
{
    for (const QString& needle : needles) {
        if (haystack.contains(needle)) return true;
    }
    return false;
}

QString pathSuffix(const QUrl& url)
{
    return QFileInfo(url.path().toLower()).suffix();
}

// Returns false when the URL says nothing about media.
bool typeFromUrl(const QUrl& url, MediaType* type, bool* segment)
{
    const QString full = url.toString().toLower();
    const QString ext = pathSuffix(url);

    if (ext == "ts" || ext == "m4s") {
        *segment = true;
        return false;
    }
    if (ext == "m3u8") { *type = MediaType::M3U8; return true; }
    if (ext == "mpd") { *type = MediaType::MPD; return true; }
    if (ext == "mp4" || ext == "mov" || ext == "m4v") {
        if (containsAny(full, { "googleads", "doubleclick" })) return false;
        *type = MediaType::MP4;
        return true;
    }

    const QStringList other = { "webm", "mkv", "flv", "mp3", "m4a", "aac", "ogg", "oga", "opus", "wav", "flac" };
    if (other.contains(ext)) { *type = MediaType::Other; return true; }

    if (full.contains("manifest") && (full.contains("m3u8") || full.contains("hls"))) {
        *type = MediaType::M3U8;
        return true;
    }
    if (full.contains("manifest") && full.contains("dash")) {
        *type = MediaType::MPD;
        return true;
    }
    if (full.contains("video/mp4") || full.contains("video/quicktime")) {
        *type = MediaType::MP4;
        return true;
    }
    return false;
}

bool typeFromContentType(const QString& contentType, MediaType* type, bool* segment)
{
    const QString ct = contentType.section(';', 0, 0).trimmed().toLower();
    if (ct.isEmpty()) return false;
    if (ct == "video/mp4" || ct == "video/quicktime" || ct == "video/x-m4v") {
        *type = MediaType::MP4;
        return true;
    }
    if (ct == "application/vnd.apple.mpegurl" || ct == "application/x-mpegurl"
        || ct == "audio/mpegurl" || ct == "audio/x-mpegurl") {
        *type = MediaType::M3U8;
        return true;
    }
    if (ct == "application/dash+xml") {
        *type = MediaType::MPD;
        return true;
    }
    if (ct == "video/mp2t" || ct == "video/iso.segment") {
        *segment = true;
        return false;
    }
    if (ct.startsWith("video/") || ct.startsWith("audio/")) {
        *type = MediaType::Other;
        return true;
    }
    return false;
}

} // namespace

bool isSkippedRequest(const QUrl& url)
{
    const QString full = url.toString().toLower();
    static const QStringList trackers = {
        "google-analytics", "googletagmanager", "facebook.com/tr",
        "doubleclick", "googlesyndication", "analytics",
        "tracking", "beacon", "pixel", "telemetry",
        "favicon", "fonts.googleapis", "fonts.gstatic"
    };
    if (containsAny(full, trackers)) return true;

    static const QStringList assets = {
        "js", "css", "woff", "woff2", "ttf", "eot",
        "png", "jpg", "jpeg", "gif", "svg", "ico", "webp"
    };
    return assets.contains(pathSuffix(url));
}

bool classifyMedia(const QUrl& url, const QString& contentType, MediaType* type, bool* ambiguous)
{
    if (ambiguous) *ambiguous = false;
    if (!url.isValid() || !type) return false;

    MediaType byUrl = MediaType::Other;
    MediaType byContent = MediaType::Other;
    bool urlSegment = false;
    bool contentSegment = false;
    const bool hasUrl = typeFromUrl(url, &byUrl, &urlSegment);
    const bool hasContent = typeFromContentType(contentType, &byContent, &contentSegment);

    if (!hasUrl && !hasContent) return false;
    if (urlSegment || (contentSegment && !hasUrl)) return false;

    if (hasUrl && !hasContent) {
        *type = byUrl;
    } else if (!hasUrl && hasContent) {
        *type = byContent;
    } else if (byUrl == byContent) {
        *type = byUrl;
    } else if (byUrl == MediaType::Other) {
        *type = byContent;
    } else if (byContent == MediaType::Other) {
        *type = byUrl;
    } else {
        *type = MediaType::Other;
        if (ambiguous) *ambiguous = true;
    }
    return true;
}

bool isPrimaryMedia(MediaType type)
{
    return type != MediaType::Other;
}

bool needsTranscode(MediaType type)
{
    return type == MediaType::M3U8 || type == MediaType::MPD;
}

QString mediaExtension(MediaType type, const QUrl& url)
{
    switch (type) {
    case MediaType::MP4:
    case MediaType::M3U8:
    case MediaType::MPD:
        return QStringLiteral(".mp4");
    case MediaType::Other:
        break;
    }
    const QString ext = pathSuffix(url);
    const QStringList audio = { "mp3", "m4a", "aac", "ogg", "oga", "opus", "wav", "flac" };
    if (ext == "webm" || ext == "mkv" || ext == "flv" || audio.contains(ext)) return "." + ext;
    return QStringLiteral(".mp4");
}

QString mediaFileName(const MediaRecord& record, qint64 timestampSecs)
{
    QString name = sanitizeFileName(fileNameFromUrl(record.url));
    if (!name.isEmpty() && name.contains('.') && !name.startsWith('.')) {
        if (needsTranscode(record.type)) {
            name = QFileInfo(name).completeBaseName() + mediaExtension(record.type, record.url);
        }
        return name;
    }
    return QStringLiteral("video_%1%2").arg(timestampSecs).arg(mediaExtension(record.type, record.url));
}

HeaderMap defaultReplayHeaders()
{
    return {
        { "User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                        "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36" },
        { "Accept", "*/*" },
        { "Accept-Language", "en-US,en;q=0.9" },
        { "Accept-Encoding", "identity" },
        { "Connection", "keep-alive" },
        { "Sec-Fetch-Dest", "video" },
        { "Sec-Fetch-Mode", "no-cors" },
        { "Sec-Fetch-Site", "cross-site" }
    };
}

HeaderMap replayHeaders(const MediaRecord& record)
{
    HeaderMap headers = defaultReplayHeaders();
    for (auto it = record.headers.cbegin(); it != record.headers.cend(); ++it) {
        if (it.value().isEmpty()) continue;
        headers.insert(it.key(), it.value());
    }

    const QString mediaOrigin = urlOrigin(record.url);
    if (!headers.contains("Referer")) {
        if (record.referrer.isValid() && !record.referrer.isEmpty()) {
            headers.insert("Referer", record.referrer.toString());
        } else if (!mediaOrigin.isEmpty()) {
            headers.insert("Referer", mediaOrigin + "/");
        }
    }
    if (!headers.contains("Origin")) {
        const QString pageOrigin = urlOrigin(record.referrer);
        const QString origin = pageOrigin.isEmpty() ? mediaOrigin : pageOrigin;
        if (!origin.isEmpty()) headers.insert("Origin", origin);
    }
    return headers;
}

QString ffmpegHeaderBlock(const HeaderMap& headers)
{
    QString block;
    for (auto it = headers.cbegin(); it != headers.cend(); ++it) {
        block += it.key() + ": " + it.value() + "\r\n";
    }
    return block;
}

} // namespace rawser::utils
