module;
#include <algorithm>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>
#include <QUrlQuery>

module rawser.utils.download_utils;

namespace rawser::utils {

namespace {

constexpr int kMaxFileNameLength = 200;

// Query keys CDNs use to forward a Content-Disposition value.
const QStringList& dispositionKeys()
{
    static const QStringList keys = {
        QStringLiteral("response-content-disposition"),
        QStringLiteral("content-disposition"),
        QStringLiteral("rscd")
    };
    return keys;
}

QString nameFromDisposition(const QString& disposition)
{
    static const QRegularExpression pattern(
        QStringLiteral("filename\\*?\\s*=\\s*(?:UTF-8'')?\"?([^\";]+)\"?"),
        QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = pattern.match(disposition);
    if (!match.hasMatch()) return QString();
    return QUrl::fromPercentEncoding(match.captured(1).trimmed().toUtf8());
}

bool isReservedChar(QChar c)
{
    switch (c.unicode()) {
    case '<': case '>': case ':': case '"':
    case '/': case '\\': case '|': case '?': case '*':
        return true;
    default:
        return false;
    }
}

} // namespace

QString localFilePath(const QString& path)
{
    QString result = path.trimmed();
    if (result.isEmpty()) return result;
    if (result.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive)) {
        const QUrl url(result);
        if (url.isLocalFile()) result = url.toLocalFile();
    } else if (result == QLatin1String("~") || result.startsWith(QStringLiteral("~/"))) {
        result = QDir::homePath() + result.mid(1);
    }
    return QDir::cleanPath(result);
}

QUrl normalizeUrl(const QString& input)
{
    QString text = input.trimmed();
    if (text.isEmpty()) return QUrl();

    static const QStringList schemes = {
        QStringLiteral("http://"), QStringLiteral("https://"),
        QStringLiteral("file://"), QStringLiteral("about:")
    };
    const bool hasScheme = std::any_of(schemes.cbegin(), schemes.cend(), [&text](const QString& scheme) {
        return text.startsWith(scheme, Qt::CaseInsensitive);
    });
    if (!hasScheme) text.prepend(QStringLiteral("https://"));

    const QUrl url(text, QUrl::TolerantMode);
    if (!url.isValid()) return QUrl();
    if (url.scheme().startsWith(QStringLiteral("http")) && url.host().isEmpty()) return QUrl();
    return url;
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();

    const QUrlQuery query(url);
    for (const QString& key : dispositionKeys()) {
        const QString value = query.queryItemValue(key, QUrl::FullyDecoded);
        if (value.isEmpty()) continue;
        const QString name = nameFromDisposition(value);
        if (!name.isEmpty()) return name;
    }
    const QString explicitName = query.queryItemValue(QStringLiteral("filename"), QUrl::FullyDecoded);
    if (!explicitName.isEmpty()) return explicitName;

    return url.fileName();
}

QString sanitizeFileName(const QString& name)
{
    QString out;
    out.reserve(name.size());
    for (const QChar c : name) {
        if (c.unicode() < 0x20 || c.unicode() == 0x7f) continue;
        out.append(isReservedChar(c) ? QChar(u'_') : c);
    }

    if (out.size() > kMaxFileNameLength) {
        const int dot = out.lastIndexOf(u'.');
        const QString extension = dot > 0 ? out.mid(dot) : QString();
        out = extension.size() < kMaxFileNameLength
            ? out.left(kMaxFileNameLength - extension.size()) + extension
            : out.left(kMaxFileNameLength);
    }
    return out.trimmed();
}

QString urlOrigin(const QUrl& url)
{
    if (!url.isValid() || url.host().isEmpty()) return QString();
    return url.adjusted(QUrl::RemovePath | QUrl::RemoveQuery | QUrl::RemoveFragment
                        | QUrl::RemoveUserInfo).toString(QUrl::StripTrailingSlash);
}

QString uniqueFilePath(const QString& path, const QSet<QString>& reserved)
{
    const QString wanted = localFilePath(path);
    if (wanted.isEmpty()) return wanted;

    const auto isTaken = [&reserved](const QString& candidate) {
        return reserved.contains(candidate)
            || QFile::exists(candidate)
            || QFile::exists(candidate + QStringLiteral(".part"));
    };
    if (!isTaken(wanted)) return wanted;

    const QFileInfo info(wanted);
    const QDir dir = info.absoluteDir();
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix().isEmpty() ? QString() : QStringLiteral(".") + info.suffix();
    for (int n = 1; n < 10000; ++n) {
        const QString candidate = dir.filePath(QStringLiteral("%1 (%2)%3").arg(base).arg(n).arg(suffix));
        if (!isTaken(candidate)) return candidate;
    }
    return wanted;
}

} // namespace rawser::utils
