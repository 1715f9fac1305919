/*!
 * @file        tabmanager.cppm
 * @brief       Registry of tasks and their command surface.
 * @details     A task owns one engine context for its whole life and at most
 *              one page. TabManager composes ResourcePool and TaskStateMachine
 *              into the public commands and keeps per-task ordering:
 *
 *              - createTask/closeTask/beginDownload/endDownload are synchronous
 *                and safe to call from any thread;
 *              - navigate/attachPage/detachPage/toggleBrowse are asynchronous,
 *                run one at a time per task in submission order and report
 *                through operationFinished().
 *
 *              Closing a task preempts its backlog. Any page that arrives for
 *              a closed task is released at once.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QQueue>
#include <QSet>
#include <QSharedPointer>
#include <QString>
#include <QUrl>
#include <functional>

#ifndef Q_MOC_RUN
export module rawser.core.tabmanager;
import rawser.core.types;
import rawser.core.taskstatemachine;
import rawser.core.resourcepool;
import rawser.core.interceptor;
import rawser.core.eventbus;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Task registry and per-task command serializer.
 */
RAWSER_MODULE_EXPORT class TabManager : public QObject {

    Q_OBJECT

    //!< @brief Number of open tasks.
    Q_PROPERTY(int count READ count NOTIFY countChanged)

public:
    /**
     * @brief Construct the manager.
     * @param pool Context and page leases.
     * @param interceptor Media observer attached to task pages.
     * @param bus Event channel to the GUI collaborator.
     * @param parent Optional parent QObject.
     */
    TabManager(ResourcePool* pool, MediaInterceptor* interceptor, EventBus* bus, QObject* parent = nullptr);

    //!< @brief Time allowed for a page load.
    void setNavigationTimeout(int ms);

    //!< @brief Time allowed for the engine to deliver a page.
    void setPageTimeout(int ms);

    /**
     * @brief Create a task in Idle with a fresh context.
     * @param url Target URL; https:// is assumed when no scheme is given.
     * @param error Receives InvalidArgument, ResourceExhausted or EngineUnavailable.
     * @return Task id, empty on failure.
     */
    QString createTask(const QString& url, Error* error = nullptr);

    /**
     * @brief Close a task, releasing its page and then its context.
     * @return NotFound for unknown or already closed ids.
     */
    Error closeTask(const QString& id);

    /**
     * @brief Load a URL in the task, leasing a background page if needed.
     * @return Immediate failure; the outcome arrives via operationFinished().
     */
    Error navigate(const QString& id, const QString& url);

    //!< @brief Attach an interactive page (Browsing).
    Error attachPage(const QString& id);

    //!< @brief Destroy the task's page; the context is kept.
    Error detachPage(const QString& id);

    //!< @brief attachPage() when not Browsing, detachPage() when Browsing.
    Error toggleBrowse(const QString& id);

    /**
     * @brief Record that a download job for the task started.
     * @return StateViolation for closed tasks, NotFound for unknown ids.
     */
    Error beginDownload(const QString& id);

    //!< @brief Record that a download job for the task settled.
    Error endDownload(const QString& id);

    /**
     * @brief Snapshot of one task.
     * @param id Task id.
     * @param snapshot Receives the copy.
     * @return NotFound for unknown or closed ids.
     */
    Error task(const QString& id, TaskSnapshot* snapshot) const;

    //!< @brief Snapshots of every open task, oldest first.
    QList<TaskSnapshot> tasks() const;

    int count() const;

    /**
     * @brief Restart the engine after a crash.
     *
     * Tasks that lost their resources get a fresh context and return to Idle.
     */
    Error restartEngine();

    //!< @brief Close every task, then drain the pool and stop the engine.
    void shutdown();

signals:
    //!< @brief Outcome of an asynchronous command.
    void operationFinished(const QString& taskId, const QString& operation, const Error& error);

    //!< @brief A task was closed; its jobs should be cancelled.
    void taskClosed(const QString& taskId);

    void countChanged();

private slots:
    //!< @brief Invalidate every task after an engine crash.
    void onPoolInvalidated(const QString& reason);
    void onPageLost(const PageHandle& page, const QString& reason);

private:
    struct Task;
    using TaskPtr = QSharedPointer<Task>;
    using CommandBody = std::function<void(const TaskPtr& task, quint64 generation)>;

    struct Command {
        QString operation;
        CommandBody run;
    };

    struct Task {
        QString id;
        QUrl url;
        TaskStateMachine state;
        ContextHandle context;
        PageHandle page;
        bool interactive = false;
        bool engineLost = false;
        QDateTime createdAt;
        QDateTime lastActiveAt;
        quint64 generation = 0;         //!< Bumped to cancel in-flight commands.
        bool busy = false;              //!< A command is running.
        QString currentOperation;
        QQueue<Command> backlog;
        mutable QMutex mutex;
    };

    //!< @brief Resolve an id; closed ids give StateViolation, unknown ones NotFound.
    TaskPtr lookup(const QString& id, Error* error) const;

    //!< @brief Run a command now or append it to the task's backlog.
    Error submit(const QString& id, const QString& operation, CommandBody body);

    //!< @brief Invoke a command on the manager's thread.
    void dispatch(const TaskPtr& task, const Command& command, quint64 generation);

    //!< @brief Report a command and start the next one.
    void finishCommand(const TaskPtr& task, quint64 generation, const Error& error);

    void runNavigate(const TaskPtr& task, quint64 generation, const QUrl& url);
    void runAttach(const TaskPtr& task, quint64 generation);
    void runDetach(const TaskPtr& task, quint64 generation);

    //!< @brief Load a URL in a page owned by the running command.
    void loadInPage(const TaskPtr& task, quint64 generation, const PageHandle& page, const QUrl& url,
                    const TaskStateMachine::Snapshot& before, bool leased);

    //!< @brief Undo a failed command and release the page it leased.
    void revert(const TaskPtr& task, quint64 generation, const TaskStateMachine::Snapshot& before,
                const PageHandle& leased);

    void publishState(const TaskPtr& task);
    static TaskSnapshot snapshotOf(const Task& task);

    ResourcePool* m_pool = nullptr;
    MediaInterceptor* m_interceptor = nullptr;
    EventBus* m_bus = nullptr;
    int m_navigationTimeoutMs = 30000;
    int m_pageTimeoutMs = 15000;

    mutable QMutex m_registryMutex;         //!< Guards the registry below.
    QHash<QString, TaskPtr> m_tasks;        //!< Open tasks by id.
    QSet<QString> m_closedIds;              //!< Recently closed ids.
    QQueue<QString> m_closedOrder;          //!< m_closedIds, oldest first.
};

#include "tabmanager.moc"
