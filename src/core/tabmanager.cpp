module;
#include <QDateTime>
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPointer>
#include <QStringList>
#include <QUuid>
#include <algorithm>

module rawser.core.tabmanager;

import rawser.core.types;
import rawser.core.taskstatemachine;
import rawser.core.resourcepool;
import rawser.core.interceptor;
import rawser.core.eventbus;
import rawser.utils.download_utils;

namespace utils = rawser::utils;

namespace {

//!< Closed ids still answered with StateViolation instead of NotFound.
constexpr qsizetype kClosedIdMemory = 1024;

} // namespace

TabManager::TabManager(ResourcePool* pool, MediaInterceptor* interceptor, EventBus* bus, QObject* parent)
    : QObject(parent),
    m_pool(pool),
    m_interceptor(interceptor),
    m_bus(bus)
{
    connect(m_pool, &ResourcePool::invalidated, this, &TabManager::onPoolInvalidated);
    connect(m_pool, &ResourcePool::pageLost, this, &TabManager::onPageLost);
}

void TabManager::setNavigationTimeout(int ms)
{
    m_navigationTimeoutMs = qMax(1, ms);
}

void TabManager::setPageTimeout(int ms)
{
    m_pageTimeoutMs = qMax(1, ms);
}

QString TabManager::createTask(const QString& url, Error* error)
{
    const QUrl target = utils::normalizeUrl(url);
    if (!target.isValid() || target.host().isEmpty()) {
        if (error) *error = makeError(ErrorCode::InvalidArgument, QStringLiteral("invalid URL: %1").arg(url));
        return QString();
    }

    Error failure;
    const ContextHandle context = m_pool->acquireContext(&failure);
    if (!context.isValid()) {
        if (error) *error = failure;
        return QString();
    }

    auto task = TaskPtr::create();
    task->url = target;
    task->context = context;
    task->createdAt = QDateTime::currentDateTime();
    task->lastActiveAt = task->createdAt;
    {
        QMutexLocker lock(&m_registryMutex);
        QString id;
        do {
            id = QUuid::createUuid().toString(QUuid::WithoutBraces).left(8);
        } while (m_tasks.contains(id) || m_closedIds.contains(id));
        task->id = id;
        m_tasks.insert(id, task);
    }

    m_bus->publishLog(QStringLiteral("[Tab] Creating: %1 -> %2").arg(task->id, target.toString()));
    m_bus->publishTaskCreated(task->id, target);
    m_bus->publishTaskUpdated(task->id, TaskState::Idle);
    emit countChanged();
    return task->id;
}

Error TabManager::closeTask(const QString& id)
{
    TaskPtr task;
    {
        QMutexLocker lock(&m_registryMutex);
        task = m_tasks.take(id);
        if (!task) return makeError(ErrorCode::NotFound, QStringLiteral("unknown task %1").arg(id));
        m_closedIds.insert(id);
        m_closedOrder.enqueue(id);
        while (m_closedOrder.size() > kClosedIdMemory) m_closedIds.remove(m_closedOrder.dequeue());
    }

    PageHandle page;
    ContextHandle context;
    QStringList preempted;
    {
        QMutexLocker lock(&task->mutex);
        const Error closed = task->state.close();
        if (!closed.ok()) qWarning() << "[Tab] Close of" << id << closed.message;
        ++task->generation;
        page = task->page;
        context = task->context;
        task->page = {};
        task->context = {};
        task->interactive = false;
        if (task->busy) preempted.append(task->currentOperation);
        for (const Command& command : std::as_const(task->backlog)) preempted.append(command.operation);
        task->backlog.clear();
        task->busy = false;
        task->currentOperation.clear();
    }

    const Error cancelled = makeError(ErrorCode::StateViolation, QStringLiteral("task %1 was closed").arg(id));
    for (const QString& operation : std::as_const(preempted)) emit operationFinished(id, operation, cancelled);

    if (page.isValid()) {
        m_interceptor->detach(page.id);
        const Error released = m_pool->releasePage(page);
        if (!released.ok()) qDebug() << "[Tab] Page of" << id << "already gone:" << released.message;
    }
    if (context.isValid()) {
        const Error released = m_pool->releaseContext(context);
        if (!released.ok()) qDebug() << "[Tab] Context of" << id << "already gone:" << released.message;
    }
    m_interceptor->forgetTask(id);

    m_bus->publishTaskUpdated(id, TaskState::Closed);
    m_bus->publishLog(QStringLiteral("[Tab] Closed: %1").arg(id));
    emit taskClosed(id);
    emit countChanged();
    return {};
}

TabManager::TaskPtr TabManager::lookup(const QString& id, Error* error) const
{
    QMutexLocker lock(&m_registryMutex);
    if (TaskPtr task = m_tasks.value(id)) return task;
    if (error) {
        *error = m_closedIds.contains(id)
                     ? makeError(ErrorCode::StateViolation, QStringLiteral("task %1 is closed").arg(id))
                     : makeError(ErrorCode::NotFound, QStringLiteral("unknown task %1").arg(id));
    }
    return {};
}

Error TabManager::submit(const QString& id, const QString& operation, CommandBody body)
{
    Error error;
    const TaskPtr task = lookup(id, &error);
    if (!task) return error;

    Command command{ operation, std::move(body) };
    quint64 generation = 0;
    {
        QMutexLocker lock(&task->mutex);
        if (task->state.isClosed()) {
            return makeError(ErrorCode::StateViolation, QStringLiteral("task %1 is closed").arg(id));
        }
        if (task->busy) {
            task->backlog.enqueue(command);
            return {};
        }
        task->busy = true;
        task->currentOperation = operation;
        generation = task->generation;
    }
    dispatch(task, command, generation);
    return {};
}

void TabManager::dispatch(const TaskPtr& task, const Command& command, quint64 generation)
{
    QMetaObject::invokeMethod(this, [task, command, generation] {
        command.run(task, generation);
    }, Qt::QueuedConnection);
}

void TabManager::finishCommand(const TaskPtr& task, quint64 generation, const Error& error)
{
    QString operation;
    Command next;
    bool hasNext = false;
    {
        QMutexLocker lock(&task->mutex);
        if (generation != task->generation) return;
        operation = task->currentOperation;
        task->lastActiveAt = QDateTime::currentDateTime();
        if (task->backlog.isEmpty()) {
            task->busy = false;
            task->currentOperation.clear();
        } else {
            next = task->backlog.dequeue();
            task->currentOperation = next.operation;
            hasNext = true;
        }
    }

    if (!error.ok()) {
        m_bus->publishLog(QStringLiteral("[Error] %1 %2: %3").arg(operation, task->id, error.message));
    }
    emit operationFinished(task->id, operation, error);
    if (hasNext) dispatch(task, next, generation);
}

Error TabManager::navigate(const QString& id, const QString& url)
{
    QUrl target;
    if (!url.trimmed().isEmpty()) {
        target = utils::normalizeUrl(url);
        if (!target.isValid() || target.host().isEmpty()) {
            return makeError(ErrorCode::InvalidArgument, QStringLiteral("invalid URL: %1").arg(url));
        }
    }
    return submit(id, QStringLiteral("navigate"), [this, target](const TaskPtr& task, quint64 generation) {
        runNavigate(task, generation, target);
    });
}

Error TabManager::attachPage(const QString& id)
{
    return submit(id, QStringLiteral("attachPage"), [this](const TaskPtr& task, quint64 generation) {
        runAttach(task, generation);
    });
}

Error TabManager::detachPage(const QString& id)
{
    return submit(id, QStringLiteral("detachPage"), [this](const TaskPtr& task, quint64 generation) {
        runDetach(task, generation);
    });
}

Error TabManager::toggleBrowse(const QString& id)
{
    return submit(id, QStringLiteral("toggleBrowse"), [this](const TaskPtr& task, quint64 generation) {
        bool browsing = false;
        {
            QMutexLocker lock(&task->mutex);
            browsing = task->state.hasPage();
        }
        if (browsing) {
            runDetach(task, generation);
        } else {
            runAttach(task, generation);
        }
    });
}

void TabManager::runNavigate(const TaskPtr& task, quint64 generation, const QUrl& url)
{
    TaskStateMachine::Snapshot before;
    PageHandle page;
    ContextHandle context;
    QUrl target;
    {
        QMutexLocker lock(&task->mutex);
        if (generation != task->generation) return;
        if (!task->context.isValid()) {
            lock.unlock();
            finishCommand(task, generation, makeError(ErrorCode::EngineUnavailable,
                                                      QStringLiteral("task lost its engine resources, restart required")));
            return;
        }
        before = task->state.snapshot();
        const Error moved = task->state.navigate();
        if (!moved.ok()) {
            lock.unlock();
            finishCommand(task, generation, moved);
            return;
        }
        if (url.isValid()) task->url = url;
        target = task->url;
        page = task->page;
        context = task->context;
        task->lastActiveAt = QDateTime::currentDateTime();
    }
    publishState(task);
    m_bus->publishLog(QStringLiteral("[Tab] Navigating: %1 -> %2").arg(task->id, target.toString()));

    if (page.isValid()) {
        loadInPage(task, generation, page, target, before, false);
        return;
    }

    QPointer<TabManager> self(this);
    const Error immediate = m_pool->acquirePage(context, m_pageTimeoutMs,
                                                [self, task, generation, target, before](const PageHandle& leased, const Error& error) {
        if (!self) return;
        bool current = false;
        if (error.ok()) {
            // Attached under the task lock so a concurrent close either sees the page or wins first.
            QMutexLocker lock(&task->mutex);
            current = generation == task->generation;
            if (current) {
                task->page = leased;
                task->interactive = false;
                self->m_interceptor->attach(task->id, leased);
            }
        }
        if (error.ok() && !current) {
            // Closed or invalidated while the page was on its way.
            const Error released = self->m_pool->releasePage(leased);
            if (!released.ok()) qDebug() << "[Tab] Late page already gone:" << released.message;
            return;
        }
        if (!error.ok()) {
            self->revert(task, generation, before, PageHandle{});
            self->finishCommand(task, generation, error);
            return;
        }
        self->loadInPage(task, generation, leased, target, before, true);
    });
    if (!immediate.ok()) {
        revert(task, generation, before, PageHandle{});
        finishCommand(task, generation, immediate);
    }
}

void TabManager::loadInPage(const TaskPtr& task, quint64 generation, const PageHandle& page, const QUrl& url,
                            const TaskStateMachine::Snapshot& before, bool leased)
{
    QPointer<TabManager> self(this);
    const PageHandle owned = leased ? page : PageHandle{};
    const Error immediate = m_pool->navigatePage(page, url, m_navigationTimeoutMs,
                                                 [self, task, generation, owned, before](const Error& error) {
        if (!self) return;
        if (!error.ok()) self->revert(task, generation, before, owned);
        self->finishCommand(task, generation, error);
    });
    if (!immediate.ok()) {
        revert(task, generation, before, owned);
        finishCommand(task, generation, immediate);
    }
}

void TabManager::runAttach(const TaskPtr& task, quint64 generation)
{
    TaskStateMachine::Snapshot before;
    PageHandle existing;
    ContextHandle context;
    QUrl target;
    {
        QMutexLocker lock(&task->mutex);
        if (generation != task->generation) return;
        if (!task->context.isValid()) {
            lock.unlock();
            finishCommand(task, generation, makeError(ErrorCode::EngineUnavailable,
                                                      QStringLiteral("task lost its engine resources, restart required")));
            return;
        }
        before = task->state.snapshot();
        const Error moved = task->state.attachPage();
        if (!moved.ok()) {
            lock.unlock();
            finishCommand(task, generation, moved);
            return;
        }
        existing = task->page;
        context = task->context;
        target = task->url;
        if (existing.isValid()) task->interactive = true;
    }

    if (existing.isValid()) {
        // Promote the background page; the loaded document is kept.
        const Error promoted = m_pool->setPageInteractive(existing, true);
        if (!promoted.ok()) {
            revert(task, generation, before, PageHandle{});
            finishCommand(task, generation, promoted);
            return;
        }
        publishState(task);
        m_bus->publishLog(QStringLiteral("[Tab] Browsing: %1").arg(task->id));
        finishCommand(task, generation, {});
        return;
    }
    publishState(task);

    QPointer<TabManager> self(this);
    const Error immediate = m_pool->acquirePage(context, m_pageTimeoutMs,
                                                [self, task, generation, target, before](const PageHandle& leased, const Error& error) {
        if (!self) return;
        bool current = false;
        if (error.ok()) {
            QMutexLocker lock(&task->mutex);
            current = generation == task->generation;
            if (current) {
                task->page = leased;
                task->interactive = true;
            }
        }
        if (error.ok() && !current) {
            const Error released = self->m_pool->releasePage(leased);
            if (!released.ok()) qDebug() << "[Tab] Late page already gone:" << released.message;
            return;
        }
        if (!error.ok()) {
            self->revert(task, generation, before, PageHandle{});
            self->finishCommand(task, generation, error);
            return;
        }
        const Error shown = self->m_pool->setPageInteractive(leased, true);
        if (!shown.ok()) {
            self->revert(task, generation, before, leased);
            self->finishCommand(task, generation, shown);
            return;
        }
        {
            QMutexLocker lock(&task->mutex);
            // A close that ran meanwhile already released the page and reported the command.
            if (generation != task->generation) return;
            self->m_interceptor->attach(task->id, leased);
        }
        self->m_bus->publishLog(QStringLiteral("[Tab] Browsing: %1").arg(task->id));
        self->loadInPage(task, generation, leased, target, before, true);
    });
    if (!immediate.ok()) {
        revert(task, generation, before, PageHandle{});
        finishCommand(task, generation, immediate);
    }
}

void TabManager::runDetach(const TaskPtr& task, quint64 generation)
{
    PageHandle page;
    {
        QMutexLocker lock(&task->mutex);
        if (generation != task->generation) return;
        const Error moved = task->state.detachPage();
        if (!moved.ok()) {
            lock.unlock();
            finishCommand(task, generation, moved);
            return;
        }
        page = task->page;
        task->page = {};
        task->interactive = false;
    }

    if (page.isValid()) {
        m_interceptor->detach(page.id);
        const Error released = m_pool->releasePage(page);
        if (!released.ok()) qDebug() << "[Tab] Page of" << task->id << "already gone:" << released.message;
    }
    publishState(task);
    m_bus->publishLog(QStringLiteral("[Tab] Browsing ended: %1").arg(task->id));
    finishCommand(task, generation, {});
}

void TabManager::revert(const TaskPtr& task, quint64 generation, const TaskStateMachine::Snapshot& before,
                        const PageHandle& leased)
{
    bool current = false;
    {
        QMutexLocker lock(&task->mutex);
        current = generation == task->generation;
        if (current) {
            task->state.restore(before);
            if (leased.isValid() && task->page.id == leased.id) task->page = {};
            if (task->state.hasPage() && !task->page.isValid()) {
                const Error detached = task->state.detachPage();
                if (!detached.ok()) qWarning() << "[Tab] Restored state has no page:" << detached.message;
            }
            task->interactive = task->page.isValid() && task->state.hasPage();
        }
    }
    if (leased.isValid()) {
        m_interceptor->detach(leased.id);
        const Error released = m_pool->releasePage(leased);
        if (!released.ok()) qDebug() << "[Tab] Leased page already gone:" << released.message;
    }
    if (current) publishState(task);
}

Error TabManager::beginDownload(const QString& id)
{
    Error error;
    const TaskPtr task = lookup(id, &error);
    if (!task) return error;
    {
        QMutexLocker lock(&task->mutex);
        error = task->state.jobStarted();
        if (error.ok()) task->lastActiveAt = QDateTime::currentDateTime();
    }
    if (error.ok()) publishState(task);
    return error;
}

Error TabManager::endDownload(const QString& id)
{
    Error error;
    const TaskPtr task = lookup(id, &error);
    if (!task) return error;
    {
        QMutexLocker lock(&task->mutex);
        error = task->state.jobFinished();
    }
    if (error.ok()) publishState(task);
    return error;
}

void TabManager::publishState(const TaskPtr& task)
{
    TaskState state;
    {
        QMutexLocker lock(&task->mutex);
        state = task->state.state();
    }
    m_bus->publishTaskUpdated(task->id, state);
}

TaskSnapshot TabManager::snapshotOf(const Task& task)
{
    QMutexLocker lock(&task.mutex);
    TaskSnapshot snapshot;
    snapshot.id = task.id;
    snapshot.url = task.url;
    snapshot.state = task.state.state();
    snapshot.context = task.context;
    snapshot.page = task.page;
    snapshot.interactive = task.interactive;
    snapshot.activeJobs = task.state.activeJobs();
    snapshot.engineLost = task.engineLost;
    snapshot.createdAt = task.createdAt;
    snapshot.lastActiveAt = task.lastActiveAt;
    return snapshot;
}

Error TabManager::task(const QString& id, TaskSnapshot* snapshot) const
{
    TaskPtr found;
    {
        QMutexLocker lock(&m_registryMutex);
        found = m_tasks.value(id);
    }
    if (!found) return makeError(ErrorCode::NotFound, QStringLiteral("unknown task %1").arg(id));
    if (snapshot) *snapshot = snapshotOf(*found);
    return {};
}

QList<TaskSnapshot> TabManager::tasks() const
{
    QList<TaskPtr> open;
    {
        QMutexLocker lock(&m_registryMutex);
        open = m_tasks.values();
    }
    QList<TaskSnapshot> list;
    list.reserve(open.size());
    for (const TaskPtr& task : std::as_const(open)) list.append(snapshotOf(*task));
    std::sort(list.begin(), list.end(), [](const TaskSnapshot& a, const TaskSnapshot& b) {
        return a.createdAt < b.createdAt;
    });
    return list;
}

int TabManager::count() const
{
    QMutexLocker lock(&m_registryMutex);
    return m_tasks.size();
}

void TabManager::onPageLost(const PageHandle& page, const QString& reason)
{
    QList<TaskPtr> open;
    {
        QMutexLocker lock(&m_registryMutex);
        open = m_tasks.values();
    }
    for (const TaskPtr& task : std::as_const(open)) {
        {
            QMutexLocker lock(&task->mutex);
            if (task->page.id != page.id || task->state.isClosed()) continue;
            task->page = {};
            task->interactive = false;
            if (task->state.hasPage()) {
                const Error detached = task->state.detachPage();
                if (!detached.ok()) qWarning() << "[Tab] Detach of lost page for" << task->id << detached.message;
            }
        }
        m_interceptor->detach(page.id);
        m_bus->publishLog(QStringLiteral("[Error] Page of task %1 lost: %2").arg(task->id, reason));
        publishState(task);
        return;
    }
}

void TabManager::onPoolInvalidated(const QString& reason)
{
    QList<TaskPtr> open;
    {
        QMutexLocker lock(&m_registryMutex);
        open = m_tasks.values();
    }

    const Error lost = makeError(ErrorCode::EngineUnavailable, QStringLiteral("engine crashed: %1").arg(reason));
    m_bus->publishLog(QStringLiteral("[Error] Engine crashed: %1").arg(reason));
    for (const TaskPtr& task : std::as_const(open)) {
        PageHandle page;
        QStringList preempted;
        {
            QMutexLocker lock(&task->mutex);
            if (task->state.isClosed()) continue;
            ++task->generation;
            page = task->page;
            task->page = {};
            task->context = {};
            task->interactive = false;
            task->engineLost = true;
            task->state.invalidate();
            if (task->busy) preempted.append(task->currentOperation);
            for (const Command& command : std::as_const(task->backlog)) preempted.append(command.operation);
            task->backlog.clear();
            task->busy = false;
            task->currentOperation.clear();
        }
        if (page.isValid()) m_interceptor->detach(page.id);
        for (const QString& operation : std::as_const(preempted)) emit operationFinished(task->id, operation, lost);
        publishState(task);
    }
}

Error TabManager::restartEngine()
{
    Error error;
    if (!m_pool->restartEngine(&error)) {
        m_bus->publishLog(QStringLiteral("[Error] Engine restart failed: %1").arg(error.message));
        return error;
    }
    m_bus->publishLog(QStringLiteral("[Engine] Restarted"));

    QList<TaskPtr> open;
    {
        QMutexLocker lock(&m_registryMutex);
        open = m_tasks.values();
    }
    for (const TaskPtr& task : std::as_const(open)) {
        {
            QMutexLocker lock(&task->mutex);
            if (!task->engineLost) continue;
        }
        Error failure;
        const ContextHandle context = m_pool->acquireContext(&failure);
        if (!context.isValid()) {
            m_bus->publishLog(QStringLiteral("[Error] Task %1 could not recover: %2").arg(task->id, failure.message));
            continue;
        }
        bool adopted = false;
        {
            QMutexLocker lock(&task->mutex);
            if (!task->state.isClosed()) {
                task->context = context;
                task->engineLost = false;
                task->lastActiveAt = QDateTime::currentDateTime();
                adopted = true;
            }
        }
        if (!adopted) {
            const Error released = m_pool->releaseContext(context);
            if (!released.ok()) qDebug() << "[Tab] Recovered context already gone:" << released.message;
            continue;
        }
        publishState(task);
    }
    return {};
}

void TabManager::shutdown()
{
    QStringList ids;
    {
        QMutexLocker lock(&m_registryMutex);
        ids = m_tasks.keys();
    }
    for (const QString& id : std::as_const(ids)) {
        const Error closed = closeTask(id);
        if (!closed.ok()) qDebug() << "[Tab] Shutdown close of" << id << closed.message;
    }
    m_pool->shutdown();
}
