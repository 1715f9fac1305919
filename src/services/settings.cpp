module;
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

module rawser.services.settings;

import rawser.utils.download_utils;

namespace utils = rawser::utils;

namespace {

int readInt(const QSettings& settings, const QString& key, int fallback, int min, int max)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) return fallback;
    return qBound(min, value, max);
}

} // namespace

QString defaultDownloadDir()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (base.isEmpty()) base = QDir::homePath();
    return QDir(base).filePath(QStringLiteral("Rawser"));
}

CoreSettings CoreSettings::defaults()
{
    CoreSettings s;
    s.downloadDir = defaultDownloadDir();
    return s;
}

CoreSettings CoreSettings::load(QSettings& settings)
{
    const CoreSettings d = defaults();
    CoreSettings s = d;

    settings.beginGroup(QStringLiteral("engine"));
    s.pageTimeoutMs = readInt(settings, QStringLiteral("pageTimeoutMs"), d.pageTimeoutMs, 100, 600000);
    s.navigationTimeoutMs = readInt(settings, QStringLiteral("navigationTimeoutMs"), d.navigationTimeoutMs, 100, 600000);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("pool"));
    s.maxContexts = readInt(settings, QStringLiteral("maxContexts"), d.maxContexts, 1, 256);
    s.maxPages = readInt(settings, QStringLiteral("maxPages"), d.maxPages, 1, 256);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("downloads"));
    const QString dir = settings.value(QStringLiteral("directory"), d.downloadDir).toString().trimmed();
    s.downloadDir = dir.isEmpty() ? d.downloadDir : utils::localFilePath(dir);
    s.queueCapacity = readInt(settings, QStringLiteral("queueCapacity"), d.queueCapacity, 1, 10000);
    s.maxConcurrent = readInt(settings, QStringLiteral("maxConcurrent"), d.maxConcurrent, 1, 32);
    s.maxAttempts = readInt(settings, QStringLiteral("maxAttempts"), d.maxAttempts, 1, 20);
    s.retryBaseDelayMs = readInt(settings, QStringLiteral("retryBaseDelayMs"), d.retryBaseDelayMs, 1, 600000);
    s.transferTimeoutMs = readInt(settings, QStringLiteral("transferTimeoutMs"), d.transferTimeoutMs, 1000, 3600000);
    s.historyLimit = readInt(settings, QStringLiteral("historyLimit"), d.historyLimit, 0, 10000);
    const QString ffmpeg = settings.value(QStringLiteral("ffmpegPath"), d.ffmpegPath).toString().trimmed();
    s.ffmpegPath = ffmpeg.isEmpty() ? d.ffmpegPath : ffmpeg;
    s.autoStart = settings.value(QStringLiteral("autoStart"), d.autoStart).toBool();
    settings.endGroup();

    return s;
}

void CoreSettings::save(QSettings& settings) const
{
    settings.beginGroup(QStringLiteral("engine"));
    settings.setValue(QStringLiteral("pageTimeoutMs"), pageTimeoutMs);
    settings.setValue(QStringLiteral("navigationTimeoutMs"), navigationTimeoutMs);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("pool"));
    settings.setValue(QStringLiteral("maxContexts"), maxContexts);
    settings.setValue(QStringLiteral("maxPages"), maxPages);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("downloads"));
    settings.setValue(QStringLiteral("directory"), downloadDir);
    settings.setValue(QStringLiteral("queueCapacity"), queueCapacity);
    settings.setValue(QStringLiteral("maxConcurrent"), maxConcurrent);
    settings.setValue(QStringLiteral("maxAttempts"), maxAttempts);
    settings.setValue(QStringLiteral("retryBaseDelayMs"), retryBaseDelayMs);
    settings.setValue(QStringLiteral("transferTimeoutMs"), transferTimeoutMs);
    settings.setValue(QStringLiteral("historyLimit"), historyLimit);
    settings.setValue(QStringLiteral("ffmpegPath"), ffmpegPath);
    settings.setValue(QStringLiteral("autoStart"), autoStart);
    settings.endGroup();
}
