/*!
 * @file        transfer.cppm
 * @brief       Fetch and transcode collaborator interface.
 * @details     The dispatcher owns queueing, retry and backoff policy. The
 *              byte transfer itself is delegated to a TransferBackend, which
 *              starts one TransferReply per attempt. A reply reports progress
 *              and finishes exactly once with a TransferResult.
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
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rawser.core.transfer;
import rawser.core.types;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Outcome class of one transfer attempt.
 */
RAWSER_MODULE_EXPORT enum class TransferError {
    None,       //!< Bytes written and moved into place.
    Transient,  //!< Timeout, 5xx, connection or DNS failure; retryable.
    Permanent,  //!< 4xx, malformed manifest, disk failure; not retryable.
    Aborted     //!< Stopped by abort().
};

/**
 * @brief Parameters of a fetch or transcode.
 */
RAWSER_MODULE_EXPORT struct TransferRequest {
    QUrl url;               //!< Source URL or manifest.
    HeaderMap headers;      //!< Headers to replay.
    QString destination;    //!< Final output path.
};

/**
 * @brief Result reported by a finished reply.
 */
RAWSER_MODULE_EXPORT struct TransferResult {
    qint64 bytesWritten = 0;
    TransferError error = TransferError::None;
    QString reason;

    bool ok() const { return error == TransferError::None; }
};

/**
 * @brief One running transfer attempt.
 */
RAWSER_MODULE_EXPORT class TransferReply : public QObject {

    Q_OBJECT

public:
    explicit TransferReply(QObject* parent = nullptr);

    //!< @brief Stop the attempt; finishes with TransferError::Aborted.
    virtual void abort() = 0;

    bool isFinished() const;
    TransferResult result() const;

signals:
    /**
     * @brief Bytes (or media time) done against the expected total.
     * @param done Units completed.
     * @param total Expected units, or -1 when unknown.
     */
    void progress(qint64 done, qint64 total);

    //!< @brief Emitted once when the attempt ends.
    void finished();

protected:
    void setProgress(qint64 done, qint64 total);

    //!< @brief Store the result and emit finished(); later calls are ignored.
    void finish(const TransferResult& result);

private:
    bool m_finished = false;
    TransferResult m_result;
};

/**
 * @brief Factory of transfer attempts.
 */
RAWSER_MODULE_EXPORT class TransferBackend : public QObject {

    Q_OBJECT

public:
    explicit TransferBackend(QObject* parent = nullptr) : QObject(parent) {}

    /**
     * @brief Start a direct streamed fetch to request.destination.
     * @return Reply owned by the caller; may already be finished.
     */
    virtual TransferReply* fetch(const TransferRequest& request) = 0;

    /**
     * @brief Start a segmented fetch and remux of a manifest.
     * @return Reply owned by the caller; may already be finished.
     */
    virtual TransferReply* transcode(const TransferRequest& request) = 0;
};

#include "transfer.moc"
