/*!
 * @file        networktransfer.cppm
 * @brief       Default fetch and transcode collaborator.
 * @details     Direct downloads stream a QNetworkReply into a ".part" file
 *              that is renamed over the destination on success. Manifests
 *              (HLS, DASH) are handed to an ffmpeg process that fetches the
 *              segments and remuxes them into MP4 without re-encoding;
 *              progress is parsed from its "Duration:" and "time=" output.
 *
 *              Failures are classified for the dispatcher's retry policy:
 *              timeouts, 5xx, 408, 429, connection and DNS failures are
 *              transient; other HTTP errors, malformed input and disk
 *              failures are permanent.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rawser.services.networktransfer;
import rawser.core.types;
import rawser.core.transfer;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Classify a finished network request.
 * @param error Qt network error of the reply.
 * @param httpStatus HTTP status code, 0 when none was received.
 * @return Transient, Permanent or Aborted; None for success.
 */
RAWSER_MODULE_EXPORT TransferError classifyNetworkError(QNetworkReply::NetworkError error, int httpStatus);

//!< @brief Classify a failed ffmpeg run from the tail of its output.
RAWSER_MODULE_EXPORT TransferError classifyFfmpegFailure(const QString& output);

/**
 * @brief Parse an ffmpeg timestamp following a key.
 *
 * "Duration: 00:01:02.50," with key "Duration:" gives 62500.
 *
 * @param line One line of ffmpeg output.
 * @param key Text preceding the timestamp, e.g. "Duration:" or "time=".
 * @return Milliseconds, or -1 when the key or a timestamp is missing.
 */
RAWSER_MODULE_EXPORT qint64 parseFfmpegTimestamp(const QString& line, const QString& key);

/**
 * @brief TransferBackend over Qt Network and ffmpeg.
 */
RAWSER_MODULE_EXPORT class NetworkTransferBackend : public TransferBackend {

    Q_OBJECT

public:
    explicit NetworkTransferBackend(QObject* parent = nullptr);

    //!< @brief ffmpeg executable name or path.
    void setFfmpegPath(const QString& path);
    QString ffmpegPath() const;

    TransferReply* fetch(const TransferRequest& request) override;
    TransferReply* transcode(const TransferRequest& request) override;

private:
    QNetworkAccessManager* m_manager = nullptr;
    QString m_ffmpegPath = QStringLiteral("ffmpeg");
};

#include "networktransfer.moc"
