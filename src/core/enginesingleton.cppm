/*!
 * @file        enginesingleton.cppm
 * @brief       Process-wide owner of the single browser engine.
 * @details     Holds the one BrowserEngine backend the process drives and
 *              guards its lifecycle. The engine starts lazily on first use
 *              behind a mutex-protected one-time barrier, so any number of
 *              concurrent first callers start it exactly once.
 *
 *              A crash leaves the engine stopped and marked crashed. Only an
 *              explicit restart() brings it back; ensureStarted() refuses to
 *              start a crashed engine so no second instance can appear behind
 *              the caller's back.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QString>
#include <functional>

#ifndef Q_MOC_RUN
export module rawser.core.enginesingleton;
import rawser.core.types;
import rawser.core.engine;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Singleton wrapper around the installed BrowserEngine.
 *
 * The backend is injected with init() and removed with shutdown(); the
 * singleton never owns it. Every successful start increments generation(),
 * which stamps handles so stale ones can be told apart after a restart.
 */
RAWSER_MODULE_EXPORT class EngineSingleton : public QObject {

    Q_OBJECT

    //!< @brief Whether the engine is running.
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)

public:
    //!< @brief Return the process-wide instance.
    static EngineSingleton& instance();

    /**
     * @brief Install the engine backend.
     * @param backend Backend to drive; must outlive the installation.
     * @param error Receives StateViolation when a backend is already installed.
     * @return true on success.
     */
    bool init(BrowserEngine* backend, Error* error = nullptr);

    //!< @brief Stop the engine if running and uninstall the backend.
    void shutdown();

    /**
     * @brief Start the engine if it is not running yet.
     *
     * Safe to call from any thread. The backend is started on its own thread
     * without holding the singleton lock, so a caller on another thread
     * blocks until that thread's event loop has run the start. Fails with
     * EngineUnavailable when no backend is installed, the backend fails to
     * start, or the engine crashed.
     *
     * @param error Receives the failure.
     * @return true when the engine is running on return.
     */
    bool ensureStarted(Error* error = nullptr);

    /**
     * @brief Restart after a crash or stop.
     * @param error Receives StateViolation if the engine is healthy and running.
     * @return true when the engine is running on return.
     */
    bool restart(Error* error = nullptr);

    //!< @brief Stop the engine; the next ensureStarted() starts it again.
    void stop();

    //!< @brief Whether the engine is running.
    bool isRunning() const;

    //!< @brief Whether the engine crashed and awaits restart().
    bool hasCrashed() const;

    //!< @brief Start counter; 0 before the first start.
    quint64 generation() const;

    //!< @brief Installed backend, or nullptr.
    BrowserEngine* backend() const;

signals:
    //!< @brief Emitted after every successful start.
    void started(quint64 generation);

    //!< @brief Emitted after an orderly stop.
    void stopped();

    //!< @brief Emitted when the backend reports a crash.
    void crashed(const QString& reason);

    //!< @brief Relay of BrowserEngine::responseObserved for the installed backend.
    void responseObserved(quint64 pageId, const ResponseInfo& info);

    //!< @brief Relay of BrowserEngine::pageLost for the installed backend.
    void pageLost(quint64 pageId, const QString& reason);

    //!< @brief Emitted when running state changes.
    void runningChanged();

private slots:
    //!< @brief Handle a crash reported by the backend.
    void onBackendCrashed(const QString& reason);

private:
    explicit EngineSingleton(QObject* parent = nullptr);

    /**
     * @brief Run a call on the backend's thread and wait for it.
     * @return false when the caller already is on that thread; nothing ran.
     */
    static bool runOnBackendThread(BrowserEngine* backend, const std::function<void()>& call);

    //!< @brief Start (or stop then start) the backend; m_starting must be set and m_mutex not held.
    bool startBackend(BrowserEngine* backend, bool restarting, Error* error);

    mutable QMutex m_mutex;                 //!< Guards every member below.
    QPointer<BrowserEngine> m_backend;      //!< Installed backend.
    bool m_running = false;                 //!< Engine running flag.
    bool m_starting = false;                //!< A start is in progress on the backend thread.
    bool m_crashed = false;                 //!< Crash awaiting restart.
    quint64 m_generation = 0;               //!< Successful start counter.
};

#include "enginesingleton.moc"
