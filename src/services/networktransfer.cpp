module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QProcess>
#include <QRegularExpression>
#include <QStringList>

module rawser.services.networktransfer;

import rawser.core.types;
import rawser.core.transfer;
import rawser.utils.media_utils;

namespace utils = rawser::utils;

namespace {

constexpr int kOutputTailLines = 10;

// Move a finished ".part" file over the destination.
bool promotePartFile(const QString& partPath, const QString& destination, QString* reason)
{
    if (QFile::exists(destination) && !QFile::remove(destination)) {
        *reason = QStringLiteral("cannot replace %1").arg(destination);
        return false;
    }
    if (!QFile::rename(partPath, destination)) {
        *reason = QStringLiteral("cannot move %1 into place").arg(partPath);
        return false;
    }
    return true;
}

/**
 * @brief Streams one GET into a ".part" file.
 */
class FetchReply : public TransferReply {
public:
    FetchReply(QNetworkAccessManager* manager, const TransferRequest& request, QObject* parent)
        : TransferReply(parent),
        m_destination(request.destination),
        m_partPath(request.destination + QStringLiteral(".part"))
    {
        m_file.setFileName(m_partPath);
        if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            finish({ 0, TransferError::Permanent,
                     QStringLiteral("cannot open output file %1: %2").arg(m_partPath, m_file.errorString()) });
            return;
        }

        QNetworkRequest req(request.url);
        req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
        for (auto it = request.headers.cbegin(); it != request.headers.cend(); ++it) {
            req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());
        }

        m_reply = manager->get(req);
        QPointer<QNetworkReply> replyPtr(m_reply);

        connect(m_reply, &QNetworkReply::metaDataChanged, this, [this, replyPtr]() {
            if (!replyPtr || replyPtr != m_reply) return;
            const int status = replyPtr->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            if (status >= 400) {
                m_httpStatus = status;
                replyPtr->abort();
                return;
            }
            m_total = replyPtr->header(QNetworkRequest::ContentLengthHeader).toLongLong();
        });

        connect(m_reply, &QNetworkReply::readyRead, this, [this, replyPtr]() {
            if (!replyPtr || replyPtr != m_reply) return;
            const QByteArray data = replyPtr->readAll();
            if (data.isEmpty()) return;
            const qint64 written = m_file.write(data);
            if (written != data.size()) {
                m_diskError = m_file.errorString();
                replyPtr->abort();
                return;
            }
            m_written += written;
            setProgress(m_written, m_total > 0 ? m_total : -1);
        });

        connect(m_reply, &QNetworkReply::finished, this, [this, replyPtr]() {
            if (!replyPtr) return;
            onFinished(replyPtr);
        });
    }

    void abort() override
    {
        m_aborted = true;
        if (m_reply) {
            m_reply->abort();
        } else if (!isFinished()) {
            finish({ m_written, TransferError::Aborted, QStringLiteral("aborted") });
        }
    }

private:
    void onFinished(QNetworkReply* reply)
    {
        if (reply != m_reply) {
            reply->deleteLater();
            return;
        }
        if (reply->bytesAvailable() > 0 && m_diskError.isEmpty() && m_httpStatus == 0 && !m_aborted) {
            const QByteArray rest = reply->readAll();
            if (m_file.write(rest) != rest.size()) {
                m_diskError = m_file.errorString();
            } else {
                m_written += rest.size();
            }
        }
        m_file.close();

        TransferResult result;
        result.bytesWritten = m_written;
        if (m_aborted) {
            result.error = TransferError::Aborted;
            result.reason = QStringLiteral("aborted");
        } else if (!m_diskError.isEmpty()) {
            result.error = TransferError::Permanent;
            result.reason = QStringLiteral("disk write failed: %1").arg(m_diskError);
        } else if (m_httpStatus >= 400) {
            result.error = classifyNetworkError(reply->error(), m_httpStatus);
            result.reason = QStringLiteral("HTTP %1").arg(m_httpStatus);
        } else if (reply->error() != QNetworkReply::NoError) {
            const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            result.error = classifyNetworkError(reply->error(), status);
            result.reason = reply->errorString();
        } else {
            QString reason;
            if (!promotePartFile(m_partPath, m_destination, &reason)) {
                result.error = TransferError::Permanent;
                result.reason = reason;
            }
        }

        if (!result.ok()) QFile::remove(m_partPath);
        reply->deleteLater();
        m_reply = nullptr;
        finish(result);
    }

    QString m_destination;
    QString m_partPath;
    QFile m_file;
    QNetworkReply* m_reply = nullptr;
    qint64 m_written = 0;
    qint64 m_total = -1;
    int m_httpStatus = 0;
    QString m_diskError;
    bool m_aborted = false;
};

/**
 * @brief Runs ffmpeg to fetch and remux a manifest into MP4.
 */
class TranscodeReply : public TransferReply {
public:
    TranscodeReply(const QString& program, const TransferRequest& request, QObject* parent)
        : TransferReply(parent),
        m_destination(request.destination),
        m_partPath(request.destination + QStringLiteral(".part"))
    {
        m_process = new QProcess(this);
        m_process->setProcessChannelMode(QProcess::MergedChannels);

        const QStringList args {
            QStringLiteral("-y"),
            QStringLiteral("-hide_banner"),
            QStringLiteral("-nostdin"),
            QStringLiteral("-headers"), utils::ffmpegHeaderBlock(request.headers),
            QStringLiteral("-i"), request.url.toString(QUrl::FullyEncoded),
            QStringLiteral("-c"), QStringLiteral("copy"),
            QStringLiteral("-bsf:a"), QStringLiteral("aac_adtstoasc"),
            QStringLiteral("-f"), QStringLiteral("mp4"),
            m_partPath
        };

        connect(m_process, &QProcess::readyReadStandardOutput, this, [this]() {
            m_pending += QString::fromUtf8(m_process->readAllStandardOutput());
            consumeOutput();
        });

        connect(m_process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
            if (error != QProcess::FailedToStart || isFinished()) return;
            finish({ 0, TransferError::Permanent,
                     QStringLiteral("ffmpeg could not be started: %1").arg(m_process->errorString()) });
        });

        connect(m_process, &QProcess::finished, this, [this](int exitCode, QProcess::ExitStatus status) {
            onFinished(exitCode, status);
        });

        qDebug() << "[Transcode] Starting" << program << request.url.toString();
        m_process->start(program, args);
    }

    void abort() override
    {
        m_aborted = true;
        if (m_process->state() != QProcess::NotRunning) m_process->kill();
        QFile::remove(m_partPath);
        finish({ 0, TransferError::Aborted, QStringLiteral("aborted") });
    }

private:
    void consumeOutput()
    {
        // ffmpeg rewrites its status line with carriage returns.
        m_pending.replace(QLatin1Char('\r'), QLatin1Char('\n'));
        const int cut = m_pending.lastIndexOf(QLatin1Char('\n'));
        if (cut < 0) return;
        const QStringList lines = m_pending.left(cut).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
        m_pending = m_pending.mid(cut + 1);

        for (const QString& line : lines) {
            m_tail.append(line.trimmed());
            while (m_tail.size() > kOutputTailLines) m_tail.removeFirst();

            if (m_durationMs <= 0) {
                const qint64 duration = parseFfmpegTimestamp(line, QStringLiteral("Duration:"));
                if (duration > 0) m_durationMs = duration;
            }
            const qint64 time = parseFfmpegTimestamp(line, QStringLiteral("time="));
            if (time >= 0) setProgress(time, m_durationMs > 0 ? m_durationMs : -1);
        }
    }

    void onFinished(int exitCode, QProcess::ExitStatus status)
    {
        if (isFinished()) {
            if (m_aborted) QFile::remove(m_partPath);
            return;
        }
        if (!m_pending.isEmpty()) {
            m_pending += QLatin1Char('\n');
            consumeOutput();
        }

        TransferResult result;
        if (status == QProcess::NormalExit && exitCode == 0) {
            QString reason;
            if (promotePartFile(m_partPath, m_destination, &reason)) {
                result.bytesWritten = QFileInfo(m_destination).size();
            } else {
                result.error = TransferError::Permanent;
                result.reason = reason;
            }
        } else {
            const QString output = m_tail.join(QLatin1Char('\n'));
            result.error = status == QProcess::CrashExit ? TransferError::Transient : classifyFfmpegFailure(output);
            result.reason = QStringLiteral("ffmpeg exited with code %1: %2").arg(exitCode).arg(output);
        }
        if (!result.ok()) QFile::remove(m_partPath);
        finish(result);
    }

    QString m_destination;
    QString m_partPath;
    QProcess* m_process = nullptr;
    QString m_pending;
    QStringList m_tail;
    qint64 m_durationMs = -1;
    bool m_aborted = false;
};

} // namespace

TransferError classifyNetworkError(QNetworkReply::NetworkError error, int httpStatus)
{
    if (httpStatus >= 500 || httpStatus == 408 || httpStatus == 429) return TransferError::Transient;
    if (httpStatus >= 400) return TransferError::Permanent;

    switch (error) {
    case QNetworkReply::NoError:
        return TransferError::None;
    case QNetworkReply::OperationCanceledError:
        return TransferError::Aborted;
    case QNetworkReply::TimeoutError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::InternalServerError:
    case QNetworkReply::ServiceUnavailableError:
    case QNetworkReply::UnknownServerError:
        return TransferError::Transient;
    default:
        return TransferError::Permanent;
    }
}

TransferError classifyFfmpegFailure(const QString& output)
{
    static const QStringList transientMarkers {
        QStringLiteral("timed out"),
        QStringLiteral("connection reset"),
        QStringLiteral("connection refused"),
        QStringLiteral("server returned 5"),
        QStringLiteral("too many requests"),
        QStringLiteral("temporary failure in name resolution"),
        QStringLiteral("network is unreachable"),
        QStringLiteral("broken pipe")
    };
    const QString text = output.toLower();
    for (const QString& marker : transientMarkers) {
        if (text.contains(marker)) return TransferError::Transient;
    }
    return TransferError::Permanent;
}

qint64 parseFfmpegTimestamp(const QString& line, const QString& key)
{
    const QRegularExpression re(QRegularExpression::escape(key)
                                + QStringLiteral(R"(\s*(\d+):(\d{2}):(\d{2})(?:\.(\d+))?)"));
    const QRegularExpressionMatch match = re.match(line);
    if (!match.hasMatch()) return -1;

    const qint64 hours = match.captured(1).toLongLong();
    const qint64 minutes = match.captured(2).toLongLong();
    const qint64 seconds = match.captured(3).toLongLong();
    qint64 millis = 0;
    const QString fraction = match.captured(4);
    if (!fraction.isEmpty()) millis = fraction.left(3).leftJustified(3, QLatin1Char('0')).toLongLong();
    return ((hours * 60 + minutes) * 60 + seconds) * 1000 + millis;
}

NetworkTransferBackend::NetworkTransferBackend(QObject* parent)
    : TransferBackend(parent),
    m_manager(new QNetworkAccessManager(this))
{
}

void NetworkTransferBackend::setFfmpegPath(const QString& path)
{
    m_ffmpegPath = path.trimmed().isEmpty() ? QStringLiteral("ffmpeg") : path.trimmed();
}

QString NetworkTransferBackend::ffmpegPath() const
{
    return m_ffmpegPath;
}

TransferReply* NetworkTransferBackend::fetch(const TransferRequest& request)
{
    return new FetchReply(m_manager, request, this);
}

TransferReply* NetworkTransferBackend::transcode(const TransferRequest& request)
{
    return new TranscodeReply(m_ffmpegPath, request, this);
}
