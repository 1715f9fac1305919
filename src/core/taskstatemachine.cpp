module;
#include <QString>

module rawser.core.taskstatemachine;

import rawser.core.types;

namespace {

Error violation(TaskState from, const char* transition)
{
    return makeError(ErrorCode::StateViolation,
                     QStringLiteral("%1 is not allowed in state %2")
                         .arg(QString::fromLatin1(transition), taskStateName(from)));
}

} // namespace

TaskState TaskStateMachine::state() const
{
    if (m_closed) return TaskState::Closed;
    if (m_hasPage) return TaskState::Browsing;
    if (m_activeJobs > 0) return TaskState::Downloading;
    if (m_active) return TaskState::Active;
    return TaskState::Idle;
}

Error TaskStateMachine::attachPage()
{
    if (m_closed || m_hasPage) return violation(state(), "attach_page");
    m_hasPage = true;
    return {};
}

Error TaskStateMachine::detachPage()
{
    if (m_closed || !m_hasPage) return violation(state(), "detach_page");
    m_hasPage = false;
    return {};
}

Error TaskStateMachine::navigate()
{
    if (m_closed) return violation(state(), "navigate");
    m_active = true;
    return {};
}

Error TaskStateMachine::jobStarted()
{
    if (m_closed) return violation(state(), "job start");
    ++m_activeJobs;
    return {};
}

Error TaskStateMachine::jobFinished()
{
    if (m_closed || m_activeJobs == 0) return violation(state(), "job finish");
    --m_activeJobs;
    return {};
}

Error TaskStateMachine::close()
{
    if (m_closed) return violation(state(), "close");
    m_closed = true;
    m_hasPage = false;
    return {};
}

void TaskStateMachine::invalidate()
{
    if (m_closed) return;
    m_hasPage = false;
    m_active = false;
}

TaskStateMachine::Snapshot TaskStateMachine::snapshot() const
{
    return Snapshot{ m_closed, m_active, m_hasPage, m_activeJobs };
}

void TaskStateMachine::restore(const Snapshot& snapshot)
{
    if (m_closed) return;
    m_active = snapshot.active;
    m_hasPage = snapshot.hasPage;
}
