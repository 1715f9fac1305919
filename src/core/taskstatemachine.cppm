/*!
 * @file        taskstatemachine.cppm
 * @brief       Per-task state flags and legal transitions.
 * @details     A task is described by independent flags rather than one
 *              exclusive enum: whether it is closed, whether background work
 *              was started (Active), whether an interactive page is attached,
 *              and how many download jobs are in flight. The displayed
 *              TaskState is the dominant flag:
 *
 *              Closed > Browsing > Downloading > Active > Idle
 *
 *              Every transition validates first and mutates only on success,
 *              so an illegal call never changes the observable state.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module rawser.core.taskstatemachine;
import rawser.core.types;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief State machine of a single task.
 *
 * Not thread-safe; the owning TabManager serializes access per task.
 */
RAWSER_MODULE_EXPORT class TaskStateMachine {
public:
    //!< @brief Copy of the flags, used to revert a failed asynchronous command.
    struct Snapshot {
        bool closed = false;
        bool active = false;
        bool hasPage = false;
        int activeJobs = 0;
    };

    //!< @brief Dominant displayed state.
    TaskState state() const;

    bool isClosed() const { return m_closed; }
    bool isActive() const { return m_active; }
    bool hasPage() const { return m_hasPage; }
    int activeJobs() const { return m_activeJobs; }

    //!< @brief Idle, Active or Downloading -> Browsing.
    Error attachPage();

    //!< @brief Browsing -> the state the flags give without the page.
    Error detachPage();

    //!< @brief Any non-Closed state; marks the task Active.
    Error navigate();

    //!< @brief A download job for this task started.
    Error jobStarted();

    //!< @brief A download job for this task settled.
    Error jobFinished();

    //!< @brief Any non-Closed state -> Closed.
    Error close();

    //!< @brief Drop engine-bound flags after an engine crash; jobs are kept.
    void invalidate();

    Snapshot snapshot() const;

    /**
     * @brief Restore flags captured by snapshot().
     *
     * The job count is not restored because jobs move independently of
     * the command being reverted; a closed machine is never reopened.
     */
    void restore(const Snapshot& snapshot);

private:
    bool m_closed = false;      //!< Terminal flag.
    bool m_active = false;      //!< Background work was started.
    bool m_hasPage = false;     //!< Interactive page attached.
    int m_activeJobs = 0;       //!< Jobs in flight.
};
