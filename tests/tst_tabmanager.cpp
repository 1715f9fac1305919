#include <QtTest>
#include <algorithm>

import rawser.core.types;
import rawser.core.enginesingleton;
import rawser.core.resourcepool;
import rawser.core.interceptor;
import rawser.core.eventbus;
import rawser.core.tabmanager;
import rawser.testing.fakeengine;

class TestTabManager : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void createTaskStartsIdle();
    void invalidUrlIsRejected();
    void contextCapIsEnforced();
    void closeReleasesResources();
    void closedTaskRejectsCommands();
    void navigateLeasesBackgroundPage();
    void navigateWithoutUrlReloadsTaskUrl();
    void navigationFailureReverts();
    void navigationTimeoutReverts();
    void pageTimeoutReverts();
    void toggleBrowsePromotesBackgroundPage();
    void attachLeasesInteractivePage();
    void detachWithoutPageIsRejected();
    void commandsRunInSubmissionOrder();
    void closePreemptsPendingCommands();
    void downloadsDriveState();
    void engineCrashInvalidatesTasks();
    void crashPreemptsRunningCommand();
    void tasksAreListedOldestFirst();
    void shutdownClosesEveryTask();
    void lostPageReturnsTaskToIdle();
    void lostPageFailsPendingNavigation();
    void closeDuringAttachLeavesPageUnobserved();
    void closedIdsAreForgottenEventually();

private:
    TaskSnapshot snapshot(const QString& id) const;
    Error outcome(const QSignalSpy& spy, int index) const;
    static bool logged(const QSignalSpy& spy, const QString& prefix);

    FakeEngine* m_engine = nullptr;
    ResourcePool* m_pool = nullptr;
    MediaInterceptor* m_interceptor = nullptr;
    EventBus* m_bus = nullptr;
    TabManager* m_tabs = nullptr;
};

void TestTabManager::initTestCase()
{
    qRegisterMetaType<Error>();
    qRegisterMetaType<TaskState>();
    qRegisterMetaType<ResponseInfo>();
}

void TestTabManager::init()
{
    m_engine = new FakeEngine;
    QVERIFY(EngineSingleton::instance().init(m_engine));
    m_pool = new ResourcePool(&EngineSingleton::instance());
    m_interceptor = new MediaInterceptor(m_pool);
    m_bus = new EventBus;
    m_tabs = new TabManager(m_pool, m_interceptor, m_bus);
}

void TestTabManager::cleanup()
{
    m_tabs->shutdown();
    delete m_tabs;
    delete m_bus;
    delete m_interceptor;
    delete m_pool;
    EngineSingleton::instance().shutdown();
    delete m_engine;
}

TaskSnapshot TestTabManager::snapshot(const QString& id) const
{
    TaskSnapshot result;
    const Error error = m_tabs->task(id, &result);
    if (!error.ok()) qWarning() << "snapshot failed:" << error.message;
    return result;
}

Error TestTabManager::outcome(const QSignalSpy& spy, int index) const
{
    return spy.at(index).at(2).value<Error>();
}

bool TestTabManager::logged(const QSignalSpy& spy, const QString& prefix)
{
    return std::any_of(spy.cbegin(), spy.cend(), [&prefix](const QList<QVariant>& args) {
        return args.at(0).toString().startsWith(prefix);
    });
}

void TestTabManager::createTaskStartsIdle()
{
    QSignalSpy created(m_bus, &EventBus::taskCreated);
    QSignalSpy updated(m_bus, &EventBus::taskUpdated);

    Error error;
    const QString id = m_tabs->createTask(QStringLiteral("example.com/video"), &error);
    QVERIFY2(error.ok(), qPrintable(error.message));
    QCOMPARE(id.size(), 8);

    const TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Idle);
    QCOMPARE(task.url, QUrl("https://example.com/video"));
    QVERIFY(task.context.isValid());
    QVERIFY(!task.page.isValid());
    QVERIFY(!task.engineLost);
    QCOMPARE(m_tabs->count(), 1);
    QCOMPARE(m_pool->liveContexts(), 1);

    QCOMPARE(created.count(), 1);
    QCOMPARE(created.at(0).at(0).toString(), id);
    QCOMPARE(updated.count(), 1);
    QCOMPARE(updated.at(0).at(1).value<TaskState>(), TaskState::Idle);
}

void TestTabManager::invalidUrlIsRejected()
{
    Error error;
    QVERIFY(m_tabs->createTask(QString(), &error).isEmpty());
    QCOMPARE(error.code, ErrorCode::InvalidArgument);
    QVERIFY(m_tabs->createTask(QStringLiteral("http://"), &error).isEmpty());
    QCOMPARE(error.code, ErrorCode::InvalidArgument);
    QCOMPARE(m_tabs->count(), 0);
    QCOMPARE(m_pool->liveContexts(), 0);
}

void TestTabManager::contextCapIsEnforced()
{
    m_pool->setLimits(2, 10);
    QVERIFY(!m_tabs->createTask(QStringLiteral("https://a.test/")).isEmpty());
    QVERIFY(!m_tabs->createTask(QStringLiteral("https://b.test/")).isEmpty());

    Error error;
    QVERIFY(m_tabs->createTask(QStringLiteral("https://c.test/"), &error).isEmpty());
    QCOMPARE(error.code, ErrorCode::ResourceExhausted);
    QCOMPARE(m_tabs->count(), 2);
}

void TestTabManager::closeReleasesResources()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    QSignalSpy closed(m_tabs, &TabManager::taskClosed);
    QSignalSpy updated(m_bus, &EventBus::taskUpdated);

    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 1);
    QVERIFY(outcome(finished, 0).ok());
    QCOMPARE(m_pool->livePages(), 1);

    QVERIFY(m_tabs->closeTask(id).ok());
    QCOMPARE(closed.count(), 1);
    QCOMPARE(updated.last().at(1).value<TaskState>(), TaskState::Closed);
    QCOMPARE(m_pool->liveContexts(), 0);
    QCOMPARE(m_pool->livePages(), 0);
    QCOMPARE(m_engine->contextCount(), 0);
    QCOMPARE(m_engine->pageCount(), 0);

    TaskSnapshot gone;
    QCOMPARE(m_tabs->task(id, &gone).code, ErrorCode::NotFound);
    QCOMPARE(m_tabs->closeTask(id).code, ErrorCode::NotFound);
    QCOMPARE(m_tabs->closeTask(QStringLiteral("nope1234")).code, ErrorCode::NotFound);
    QCOMPARE(m_pool->liveContexts(), 0);
    QCOMPARE(m_tabs->count(), 0);
}

void TestTabManager::closedTaskRejectsCommands()
{
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->closeTask(id).ok());

    QCOMPARE(m_tabs->navigate(id, QString()).code, ErrorCode::StateViolation);
    QCOMPARE(m_tabs->toggleBrowse(id).code, ErrorCode::StateViolation);
    QCOMPARE(m_tabs->beginDownload(id).code, ErrorCode::StateViolation);
    QCOMPARE(m_tabs->beginDownload(QStringLiteral("unknown1")).code, ErrorCode::NotFound);
}

void TestTabManager::navigateLeasesBackgroundPage()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));

    QVERIFY(m_tabs->navigate(id, QStringLiteral("https://example.com/watch")).ok());
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(finished.at(0).at(1).toString(), QStringLiteral("navigate"));
    QVERIFY(outcome(finished, 0).ok());

    const TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Active);
    QVERIFY(task.page.isValid());
    QVERIFY(!task.interactive);
    QVERIFY(!m_engine->isInteractive(task.page.id));
    QVERIFY(m_interceptor->isAttached(task.page.id));
    QCOMPARE(task.url, QUrl("https://example.com/watch"));
    QCOMPARE(m_engine->loads(), QList<QUrl>{ QUrl("https://example.com/watch") });
}

void TestTabManager::navigateWithoutUrlReloadsTaskUrl()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/start"));
    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(m_engine->loads(), QList<QUrl>{ QUrl("https://example.com/start") });
    QCOMPARE(m_tabs->navigate(id, QStringLiteral("http://")).code, ErrorCode::InvalidArgument);
}

void TestTabManager::navigationFailureReverts()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    m_engine->setNavigationSucceeds(false);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));

    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::NavigationFailed);

    const TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Idle);
    QVERIFY(!task.page.isValid());
    QCOMPARE(m_pool->livePages(), 0);
    QCOMPARE(m_engine->pageCount(), 0);
    QVERIFY(task.context.isValid());
}

void TestTabManager::navigationTimeoutReverts()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    m_tabs->setNavigationTimeout(50);
    m_engine->setNavigationDelay(-1);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));

    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::NavigationTimeout);
    QCOMPARE(snapshot(id).state, TaskState::Idle);
    QCOMPARE(m_pool->livePages(), 0);
}

void TestTabManager::pageTimeoutReverts()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    m_tabs->setPageTimeout(50);
    m_engine->setPageDelay(-1);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));

    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::Timeout);
    QCOMPARE(snapshot(id).state, TaskState::Idle);
    QCOMPARE(m_pool->pendingPages(), 0);
}

void TestTabManager::toggleBrowsePromotesBackgroundPage()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 1);
    const TaskSnapshot background = snapshot(id);

    QVERIFY(m_tabs->toggleBrowse(id).ok());
    QTRY_COMPARE(finished.count(), 2);
    QVERIFY(outcome(finished, 1).ok());
    TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Browsing);
    QCOMPARE(task.page.id, background.page.id);
    QVERIFY(task.interactive);
    QVERIFY(m_engine->isInteractive(task.page.id));
    QCOMPARE(m_engine->loads().size(), 1);

    QVERIFY(m_tabs->toggleBrowse(id).ok());
    QTRY_COMPARE(finished.count(), 3);
    QVERIFY(outcome(finished, 2).ok());
    task = snapshot(id);
    QCOMPARE(task.state, TaskState::Active);
    QVERIFY(!task.page.isValid());
    QCOMPARE(task.context.id, background.context.id);
    QCOMPARE(m_engine->pageCount(), 0);
    QCOMPARE(m_engine->contextCount(), 1);
}

void TestTabManager::attachLeasesInteractivePage()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/home"));

    QVERIFY(m_tabs->attachPage(id).ok());
    QTRY_COMPARE(finished.count(), 1);
    QVERIFY(outcome(finished, 0).ok());
    const TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Browsing);
    QVERIFY(task.page.isValid());
    QVERIFY(m_engine->isInteractive(task.page.id));
    QVERIFY(m_interceptor->isAttached(task.page.id));
    QCOMPARE(m_engine->loads(), QList<QUrl>{ QUrl("https://example.com/home") });

    QVERIFY(m_tabs->detachPage(id).ok());
    QTRY_COMPARE(finished.count(), 2);
    QCOMPARE(snapshot(id).state, TaskState::Idle);
    QVERIFY(!m_interceptor->isAttached(task.page.id));
}

void TestTabManager::detachWithoutPageIsRejected()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->detachPage(id).ok());
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::StateViolation);
    QCOMPARE(snapshot(id).state, TaskState::Idle);
}

void TestTabManager::commandsRunInSubmissionOrder()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    m_engine->setNavigationDelay(30);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));

    QVERIFY(m_tabs->navigate(id, QStringLiteral("https://example.com/a")).ok());
    QVERIFY(m_tabs->navigate(id, QStringLiteral("https://example.com/b")).ok());
    QVERIFY(m_tabs->toggleBrowse(id).ok());
    QTRY_COMPARE(finished.count(), 3);

    QStringList operations;
    for (int i = 0; i < finished.count(); ++i) {
        operations << finished.at(i).at(1).toString();
        QVERIFY(outcome(finished, i).ok());
    }
    QCOMPARE(operations, (QStringList{ "navigate", "navigate", "toggleBrowse" }));
    QCOMPARE(m_engine->loads(), (QList<QUrl>{ QUrl("https://example.com/a"), QUrl("https://example.com/b") }));

    const TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Browsing);
    QCOMPARE(task.url, QUrl("https://example.com/b"));
    QCOMPARE(m_pool->livePages(), 1);
}

void TestTabManager::closePreemptsPendingCommands()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    m_engine->setPageDelay(200);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));

    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QVERIFY(m_tabs->toggleBrowse(id).ok());
    QTRY_COMPARE(m_pool->pendingPages(), 1);

    QVERIFY(m_tabs->closeTask(id).ok());
    QCOMPARE(finished.count(), 2);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::StateViolation);
    QCOMPARE(outcome(finished, 1).code, ErrorCode::StateViolation);

    QTest::qWait(300);
    QCOMPARE(finished.count(), 2);
    QCOMPARE(m_pool->livePages(), 0);
    QCOMPARE(m_pool->pendingPages(), 0);
    QCOMPARE(m_engine->pageCount(), 0);
    QCOMPARE(m_engine->contextCount(), 0);
}

void TestTabManager::downloadsDriveState()
{
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->beginDownload(id).ok());
    QCOMPARE(snapshot(id).state, TaskState::Downloading);
    QCOMPARE(snapshot(id).activeJobs, 1);

    QVERIFY(m_tabs->endDownload(id).ok());
    QCOMPARE(snapshot(id).state, TaskState::Idle);
    QCOMPARE(m_tabs->endDownload(id).code, ErrorCode::StateViolation);
}

void TestTabManager::engineCrashInvalidatesTasks()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 1);

    m_engine->simulateCrash(QStringLiteral("gpu process died"));
    TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Idle);
    QVERIFY(task.engineLost);
    QVERIFY(!task.context.isValid());
    QVERIFY(!task.page.isValid());

    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 2);
    QCOMPARE(outcome(finished, 1).code, ErrorCode::EngineUnavailable);

    Error error;
    QVERIFY(m_tabs->createTask(QStringLiteral("https://other.test/"), &error).isEmpty());
    QCOMPARE(error.code, ErrorCode::EngineUnavailable);

    QVERIFY(m_tabs->restartEngine().ok());
    task = snapshot(id);
    QVERIFY(!task.engineLost);
    QVERIFY(task.context.isValid());
    QCOMPARE(task.state, TaskState::Idle);

    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(finished.count(), 3);
    QVERIFY(outcome(finished, 2).ok());
    QCOMPARE(snapshot(id).state, TaskState::Active);
}

void TestTabManager::crashPreemptsRunningCommand()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    m_engine->setNavigationDelay(-1);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(m_engine->loads().size(), 1);

    m_engine->simulateCrash(QStringLiteral("killed"));
    QTRY_VERIFY(finished.count() >= 1);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::EngineUnavailable);
    QTest::qWait(50);
    QCOMPARE(finished.count(), 1);
}

void TestTabManager::tasksAreListedOldestFirst()
{
    QStringList ids;
    for (const char* url : { "https://a.test/", "https://b.test/", "https://c.test/" }) {
        ids << m_tabs->createTask(QString::fromLatin1(url));
        QTest::qWait(5);
    }
    const QList<TaskSnapshot> list = m_tabs->tasks();
    QCOMPARE(list.size(), 3);
    for (int i = 0; i < 3; ++i) QCOMPARE(list.at(i).id, ids.at(i));
}

void TestTabManager::shutdownClosesEveryTask()
{
    QSignalSpy closed(m_tabs, &TabManager::taskClosed);
    m_tabs->createTask(QStringLiteral("https://a.test/"));
    m_tabs->createTask(QStringLiteral("https://b.test/"));

    m_tabs->shutdown();
    QCOMPARE(closed.count(), 2);
    QCOMPARE(m_tabs->count(), 0);
    QCOMPARE(m_pool->liveContexts(), 0);
    QVERIFY(!m_engine->isRunning());
}

void TestTabManager::lostPageReturnsTaskToIdle()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    QSignalSpy updated(m_bus, &EventBus::taskUpdated);
    QSignalSpy logs(m_bus, &EventBus::log);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->attachPage(id).ok());
    QTRY_COMPARE(finished.count(), 1);
    const TaskSnapshot browsing = snapshot(id);
    QCOMPARE(browsing.state, TaskState::Browsing);

    const int updates = updated.count();
    m_engine->simulatePageLoss(browsing.page.id, QStringLiteral("renderer terminated"));

    const TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Idle);
    QVERIFY(!task.page.isValid());
    QVERIFY(!task.interactive);
    QVERIFY(!task.engineLost);
    QVERIFY(task.context.isValid());
    QCOMPARE(m_pool->livePages(), 0);
    QVERIFY(!m_interceptor->isAttached(browsing.page.id));
    QTRY_VERIFY(updated.count() > updates);
    QCOMPARE(updated.last().at(1).value<TaskState>(), TaskState::Idle);
    QTRY_VERIFY(logged(logs, QStringLiteral("[Error] Page of task %1 lost").arg(id)));

    // The task is still usable.
    QVERIFY(m_tabs->attachPage(id).ok());
    QTRY_COMPARE(finished.count(), 2);
    QVERIFY(outcome(finished, 1).ok());
    QCOMPARE(snapshot(id).state, TaskState::Browsing);
}

void TestTabManager::lostPageFailsPendingNavigation()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    m_engine->setNavigationDelay(-1);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->navigate(id, QString()).ok());
    QTRY_COMPARE(m_engine->loads().size(), 1);
    const TaskSnapshot loading = snapshot(id);
    QVERIFY(loading.page.isValid());

    m_engine->simulatePageLoss(loading.page.id, QStringLiteral("renderer terminated"));
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::NavigationFailed);

    const TaskSnapshot task = snapshot(id);
    QCOMPARE(task.state, TaskState::Idle);
    QVERIFY(!task.page.isValid());
    QCOMPARE(m_pool->livePages(), 0);
    QCOMPARE(m_engine->pageCount(), 0);
    QVERIFY(!m_interceptor->isAttached(loading.page.id));
}

void TestTabManager::closeDuringAttachLeavesPageUnobserved()
{
    QSignalSpy finished(m_tabs, &TabManager::operationFinished);
    const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));

    quint64 shownPage = 0;
    TabManager* tabs = m_tabs;
    // Close the task the moment its new page is made interactive.
    connect(m_engine, &FakeEngine::interactiveChanged, this, [&shownPage, tabs, id](quint64 pageId, bool interactive) {
        if (!interactive || shownPage != 0) return;
        shownPage = pageId;
        QVERIFY(tabs->closeTask(id).ok());
    });

    QVERIFY(m_tabs->attachPage(id).ok());
    QTRY_VERIFY(shownPage != 0);
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(outcome(finished, 0).code, ErrorCode::StateViolation);

    QTest::qWait(50);
    QCOMPARE(finished.count(), 1);
    QVERIFY(!m_interceptor->isAttached(shownPage));
    QVERIFY(m_engine->loads().isEmpty());
    QCOMPARE(m_pool->livePages(), 0);
    QCOMPARE(m_engine->pageCount(), 0);
}

void TestTabManager::closedIdsAreForgottenEventually()
{
    const QString first = m_tabs->createTask(QStringLiteral("https://example.com/"));
    QVERIFY(m_tabs->closeTask(first).ok());
    QCOMPARE(m_tabs->beginDownload(first).code, ErrorCode::StateViolation);

    for (int i = 0; i < 1024; ++i) {
        const QString id = m_tabs->createTask(QStringLiteral("https://example.com/"));
        QVERIFY(!id.isEmpty());
        QVERIFY(m_tabs->closeTask(id).ok());
    }
    QCOMPARE(m_tabs->beginDownload(first).code, ErrorCode::NotFound);
    QCOMPARE(m_tabs->count(), 0);
    QCOMPARE(m_pool->liveContexts(), 0);
}

QTEST_GUILESS_MAIN(TestTabManager)
#include "tst_tabmanager.moc"
