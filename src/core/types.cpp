module;
#include <QString>

module rawser.core.types;

Error makeError(ErrorCode code, const QString& message)
{
    return Error{ code, message };
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return QStringLiteral("None");
    case ErrorCode::NotFound: return QStringLiteral("NotFound");
    case ErrorCode::InvalidArgument: return QStringLiteral("InvalidArgument");
    case ErrorCode::ResourceExhausted: return QStringLiteral("ResourceExhausted");
    case ErrorCode::StateViolation: return QStringLiteral("StateViolation");
    case ErrorCode::EngineUnavailable: return QStringLiteral("EngineUnavailable");
    case ErrorCode::NavigationTimeout: return QStringLiteral("NavigationTimeout");
    case ErrorCode::NavigationFailed: return QStringLiteral("NavigationFailed");
    case ErrorCode::Timeout: return QStringLiteral("Timeout");
    case ErrorCode::MediaClassificationAmbiguous: return QStringLiteral("MediaClassificationAmbiguous");
    case ErrorCode::DownloadTransientError: return QStringLiteral("DownloadTransientError");
    case ErrorCode::DownloadPermanentError: return QStringLiteral("DownloadPermanentError");
    }
    return QStringLiteral("Unknown");
}

QString taskStateName(TaskState state)
{
    switch (state) {
    case TaskState::Idle: return QStringLiteral("Idle");
    case TaskState::Active: return QStringLiteral("Active");
    case TaskState::Browsing: return QStringLiteral("Browsing");
    case TaskState::Downloading: return QStringLiteral("Downloading");
    case TaskState::Closed: return QStringLiteral("Closed");
    }
    return QStringLiteral("Unknown");
}

QString mediaTypeName(MediaType type)
{
    switch (type) {
    case MediaType::MP4: return QStringLiteral("MP4");
    case MediaType::M3U8: return QStringLiteral("M3U8");
    case MediaType::MPD: return QStringLiteral("MPD");
    case MediaType::Other: return QStringLiteral("OTHER");
    }
    return QStringLiteral("OTHER");
}

QString jobStatusName(JobStatus status)
{
    switch (status) {
    case JobStatus::Queued: return QStringLiteral("Queued");
    case JobStatus::Running: return QStringLiteral("Running");
    case JobStatus::Paused: return QStringLiteral("Paused");
    case JobStatus::Completed: return QStringLiteral("Completed");
    case JobStatus::Failed: return QStringLiteral("Failed");
    case JobStatus::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

bool isTerminal(JobStatus status)
{
    return status == JobStatus::Completed
        || status == JobStatus::Failed
        || status == JobStatus::Cancelled;
}
