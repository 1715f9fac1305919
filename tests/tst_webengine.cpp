#include <QtTest>
#include <QUrl>
#include <QWebEngineLoadingInfo>

import rawser.services.webengine_backend;

class TestWebEngine : public QObject {
    Q_OBJECT

private slots:
    void loadCompletesAfterItsOwnStart();
    void earlierLoadIsIgnored();
    void failedLoadIsReported();
    void stoppedLoadIsReported();
};

void TestWebEngine::loadCompletesAfterItsOwnStart()
{
    LoadWatch watch(QUrl("https://example.com"));
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadStartedStatus, QUrl("https://example.com/")),
             LoadWatch::Outcome::Pending);
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadSucceededStatus, QUrl("https://example.com/")),
             LoadWatch::Outcome::Succeeded);
}

void TestWebEngine::earlierLoadIsIgnored()
{
    LoadWatch watch(QUrl("https://example.com/b"));

    // The previous document stops or fails after the new load was requested.
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadStoppedStatus, QUrl("https://example.com/a")),
             LoadWatch::Outcome::Pending);
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadFailedStatus, QUrl("https://example.com/a")),
             LoadWatch::Outcome::Pending);
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadStartedStatus, QUrl("https://example.com/a")),
             LoadWatch::Outcome::Pending);
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadSucceededStatus, QUrl("https://example.com/a")),
             LoadWatch::Outcome::Pending);

    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadStartedStatus, QUrl("https://example.com/b")),
             LoadWatch::Outcome::Pending);
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadSucceededStatus, QUrl("https://example.com/b")),
             LoadWatch::Outcome::Succeeded);
}

void TestWebEngine::failedLoadIsReported()
{
    LoadWatch watch(QUrl("https://example.com/missing"));
    watch.onLoadingChanged(QWebEngineLoadingInfo::LoadStartedStatus, QUrl("https://example.com/missing"));
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadFailedStatus, QUrl("https://example.com/missing")),
             LoadWatch::Outcome::Failed);
}

void TestWebEngine::stoppedLoadIsReported()
{
    LoadWatch watch(QUrl("https://example.com/slow"));
    watch.onLoadingChanged(QWebEngineLoadingInfo::LoadStartedStatus, QUrl("https://example.com/slow"));
    QCOMPARE(watch.onLoadingChanged(QWebEngineLoadingInfo::LoadStoppedStatus, QUrl("https://example.com/slow")),
             LoadWatch::Outcome::Failed);
}

QTEST_GUILESS_MAIN(TestWebEngine)
#include "tst_webengine.moc"
