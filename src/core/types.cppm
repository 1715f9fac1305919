/*!
 * @file        types.cppm
 * @brief       Shared value types of the Rawser core.
 * @details     Declares the handles, records, states and error values passed
 *              between the engine layer, the task registry, the media
 *              interceptor and the download dispatcher.
 *
 *              Everything here is a plain copyable value. Ownership of the
 *              underlying engine objects stays with ResourcePool; a handle
 *              only names a resource and the engine generation it belongs to.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QDateTime>
#include <QMap>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rawser.core.types;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Error taxonomy shared by every core component.
 *
 * Commands return an Error synchronously; asynchronous outcomes carry the
 * same codes through signals.
 */
RAWSER_MODULE_EXPORT enum class ErrorCode {
    None,                           //!< Success.
    NotFound,                       //!< Unknown or already released id/handle.
    InvalidArgument,                //!< Malformed URL or parameter.
    ResourceExhausted,              //!< Context, page or queue cap reached.
    StateViolation,                 //!< Illegal state transition attempted.
    EngineUnavailable,              //!< Engine not started or crashed.
    NavigationTimeout,              //!< Page load did not finish in time.
    NavigationFailed,               //!< Page load finished with an error.
    Timeout,                        //!< Engine-facing call other than navigation timed out.
    MediaClassificationAmbiguous,   //!< Non-fatal, classification resolved to Other.
    DownloadTransientError,         //!< Retryable transfer failure.
    DownloadPermanentError          //!< Terminal transfer failure for one job.
};

/**
 * @brief Result value of a core command.
 */
RAWSER_MODULE_EXPORT struct Error {
    ErrorCode code = ErrorCode::None;   //!< Error code, None on success.
    QString message;                    //!< Human readable detail.

    //!< @brief Whether the command succeeded.
    bool ok() const { return code == ErrorCode::None; }
};

/**
 * @brief Dominant displayed state of a task.
 */
RAWSER_MODULE_EXPORT enum class TaskState {
    Idle,           //!< Context held, no page, no active work.
    Active,         //!< Background navigation or work without a visible page.
    Browsing,       //!< Interactive page attached.
    Downloading,    //!< One or more jobs in flight.
    Closed          //!< Terminal.
};

/**
 * @brief Closed set of media kinds recognised by the interceptor.
 */
RAWSER_MODULE_EXPORT enum class MediaType {
    MP4,    //!< Progressive MP4/MOV file.
    M3U8,   //!< HLS playlist.
    MPD,    //!< DASH manifest.
    Other   //!< Any other audio/video resource.
};

/**
 * @brief Lifecycle of a download job.
 */
RAWSER_MODULE_EXPORT enum class JobStatus {
    Queued,
    Running,
    Paused,
    Completed,
    Failed,
    Cancelled
};

//!< @brief Header name to value map used for request replay.
RAWSER_MODULE_EXPORT using HeaderMap = QMap<QString, QString>;

/**
 * @brief Isolated cookie/storage scope leased from the engine.
 */
RAWSER_MODULE_EXPORT struct ContextHandle {
    quint64 id = 0;             //!< Engine context id, 0 when empty.
    quint64 generation = 0;     //!< Engine generation the context belongs to.

    bool isValid() const { return id != 0; }
};

/**
 * @brief Renderable page leased from a context.
 */
RAWSER_MODULE_EXPORT struct PageHandle {
    quint64 id = 0;             //!< Engine page id, 0 when empty.
    quint64 contextId = 0;      //!< Owning context id.
    quint64 generation = 0;     //!< Engine generation the page belongs to.

    bool isValid() const { return id != 0; }
};

/**
 * @brief One network exchange observed on a page.
 *
 * Filled by the engine backend; contentType may be empty when the engine
 * only reports the request side.
 */
RAWSER_MODULE_EXPORT struct ResponseInfo {
    QUrl url;               //!< Requested URL.
    QString method;         //!< HTTP method.
    QString contentType;    //!< Response content type, if known.
    QUrl firstPartyUrl;     //!< Document that issued the request.
    QString resourceType;   //!< Engine resource type name.
    HeaderMap headers;      //!< Request headers the engine exposed.
};

/**
 * @brief Classified, deduplicated media resource discovered for a task.
 */
RAWSER_MODULE_EXPORT struct MediaRecord {
    QUrl url;                           //!< Media URL.
    MediaType type = MediaType::Other;  //!< Classified media kind.
    HeaderMap headers;                  //!< Captured headers for authenticated replay.
    QUrl referrer;                      //!< Page the request came from.
    QString contentType;                //!< Content type seen at detection.
    QString taskId;                     //!< Owning task, empty for ad-hoc downloads.
    QDateTime discoveredAt;             //!< Detection timestamp.
    bool ambiguous = false;             //!< Classification fell back to Other.
};

/**
 * @brief Snapshot of a download job.
 */
RAWSER_MODULE_EXPORT struct DownloadJob {
    QString id;                             //!< Job id.
    MediaRecord record;                     //!< Source media record.
    JobStatus status = JobStatus::Queued;   //!< Current status.
    double progress = 0.0;                  //!< Fraction in [0, 1].
    QString destination;                    //!< Output file path.
    int attempts = 0;                       //!< Started attempts.
    QString lastError;                      //!< Reason of the last failure.
};

/**
 * @brief Read-only copy of a task's public fields.
 */
RAWSER_MODULE_EXPORT struct TaskSnapshot {
    QString id;
    QUrl url;
    TaskState state = TaskState::Idle;
    ContextHandle context;
    PageHandle page;
    bool interactive = false;   //!< Page is attached in browsing mode.
    int activeJobs = 0;
    bool engineLost = false;    //!< Resources were invalidated by an engine crash.
    QDateTime createdAt;
    QDateTime lastActiveAt;
};

//!< @brief Shorthand for building a failed Error value.
RAWSER_MODULE_EXPORT Error makeError(ErrorCode code, const QString& message);

//!< @brief Stable name of an error code.
RAWSER_MODULE_EXPORT QString errorCodeName(ErrorCode code);

//!< @brief Stable name of a task state.
RAWSER_MODULE_EXPORT QString taskStateName(TaskState state);

//!< @brief Stable name of a media type.
RAWSER_MODULE_EXPORT QString mediaTypeName(MediaType type);

//!< @brief Stable name of a job status.
RAWSER_MODULE_EXPORT QString jobStatusName(JobStatus status);

//!< @brief Whether the status is Completed, Failed or Cancelled.
RAWSER_MODULE_EXPORT bool isTerminal(JobStatus status);
