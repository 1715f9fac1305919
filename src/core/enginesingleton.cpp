module;
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <QObject>
#include <QThread>

module rawser.core.enginesingleton;

import rawser.core.types;
import rawser.core.engine;

EngineSingleton& EngineSingleton::instance()
{
    static EngineSingleton engine;
    return engine;
}

EngineSingleton::EngineSingleton(QObject* parent)
    : QObject(parent)
{
}

bool EngineSingleton::init(BrowserEngine* backend, Error* error)
{
    if (!backend) {
        if (error) *error = makeError(ErrorCode::InvalidArgument, QStringLiteral("no engine backend given"));
        return false;
    }
    {
        QMutexLocker lock(&m_mutex);
        if (m_backend) {
            if (error) *error = makeError(ErrorCode::StateViolation, QStringLiteral("engine already initialized"));
            return false;
        }
        m_backend = backend;
        m_running = false;
        m_starting = false;
        m_crashed = false;
    }
    connect(backend, &BrowserEngine::crashed, this, &EngineSingleton::onBackendCrashed);
    connect(backend, &BrowserEngine::responseObserved, this, &EngineSingleton::responseObserved);
    connect(backend, &BrowserEngine::pageLost, this, &EngineSingleton::pageLost);
    return true;
}

void EngineSingleton::shutdown()
{
    stop();
    QMutexLocker lock(&m_mutex);
    if (m_backend) {
        disconnect(m_backend, nullptr, this, nullptr);
    }
    m_backend = nullptr;
    m_crashed = false;
}

bool EngineSingleton::runOnBackendThread(BrowserEngine* backend, const std::function<void()>& call)
{
    if (QThread::currentThread() == backend->thread()) return false;
    QMetaObject::invokeMethod(backend, call, Qt::BlockingQueuedConnection);
    return true;
}

bool EngineSingleton::startBackend(BrowserEngine* backend, bool restarting, Error* error)
{
    QString reason;
    if (restarting) backend->stop();
    const bool ok = backend->start(&reason);

    quint64 generation = 0;
    {
        QMutexLocker lock(&m_mutex);
        m_starting = false;
        if (ok) {
            m_running = true;
            m_crashed = false;
            generation = ++m_generation;
        }
    }
    if (!ok) {
        qWarning() << "[Engine] Failed to start:" << reason;
        if (error) *error = makeError(ErrorCode::EngineUnavailable, QStringLiteral("engine failed to start: %1").arg(reason));
        return false;
    }
    qDebug() << (restarting ? "[Engine] Restarted, generation" : "[Engine] Started, generation") << generation;
    emit runningChanged();
    emit started(generation);
    return true;
}

bool EngineSingleton::ensureStarted(Error* error)
{
    BrowserEngine* backend = nullptr;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_backend) {
            if (error) *error = makeError(ErrorCode::EngineUnavailable, QStringLiteral("no engine backend installed"));
            return false;
        }
        if (m_running) return true;
        if (m_crashed) {
            if (error) *error = makeError(ErrorCode::EngineUnavailable, QStringLiteral("engine crashed, restart required"));
            return false;
        }
        backend = m_backend.data();
    }

    // Starts happen one at a time on the backend's thread; callers elsewhere wait for it.
    bool ok = false;
    Error failure;
    if (runOnBackendThread(backend, [this, &ok, &failure] { ok = ensureStarted(&failure); })) {
        if (!ok && error) *error = failure;
        return ok;
    }

    {
        QMutexLocker lock(&m_mutex);
        if (m_running) return true;
        if (m_starting || m_backend.data() != backend) {
            if (error) *error = makeError(ErrorCode::EngineUnavailable, QStringLiteral("engine is starting"));
            return false;
        }
        m_starting = true;
    }
    return startBackend(backend, false, error);
}

bool EngineSingleton::restart(Error* error)
{
    BrowserEngine* backend = nullptr;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_backend) {
            if (error) *error = makeError(ErrorCode::EngineUnavailable, QStringLiteral("no engine backend installed"));
            return false;
        }
        backend = m_backend.data();
    }

    bool ok = false;
    Error failure;
    if (runOnBackendThread(backend, [this, &ok, &failure] { ok = restart(&failure); })) {
        if (!ok && error) *error = failure;
        return ok;
    }

    {
        QMutexLocker lock(&m_mutex);
        if (m_starting) {
            if (error) *error = makeError(ErrorCode::StateViolation, QStringLiteral("engine is starting"));
            return false;
        }
        if (m_running && !m_crashed) {
            if (error) *error = makeError(ErrorCode::StateViolation, QStringLiteral("engine is running"));
            return false;
        }
        m_running = false;
        m_starting = true;
    }
    return startBackend(backend, true, error);
}

void EngineSingleton::stop()
{
    BrowserEngine* backend = nullptr;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_running) {
            m_crashed = false;
            return;
        }
        m_running = false;
        m_crashed = false;
        backend = m_backend.data();
    }
    if (backend && !runOnBackendThread(backend, [backend] { backend->stop(); })) backend->stop();
    emit runningChanged();
    emit stopped();
}

bool EngineSingleton::isRunning() const
{
    QMutexLocker lock(&m_mutex);
    return m_running;
}

bool EngineSingleton::hasCrashed() const
{
    QMutexLocker lock(&m_mutex);
    return m_crashed;
}

quint64 EngineSingleton::generation() const
{
    QMutexLocker lock(&m_mutex);
    return m_generation;
}

BrowserEngine* EngineSingleton::backend() const
{
    QMutexLocker lock(&m_mutex);
    return m_backend.data();
}

void EngineSingleton::onBackendCrashed(const QString& reason)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_crashed) return;
        m_running = false;
        m_crashed = true;
    }
    qWarning() << "[Engine] Crashed:" << reason;
    emit runningChanged();
    emit crashed(reason);
}
