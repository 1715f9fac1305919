/*!
 * @file        controller.cppm
 * @brief       Command surface of the orchestrator for the GUI collaborator.
 * @details     RawserController owns one instance of every core component,
 *              applies CoreSettings to them and wires them together:
 *
 *              - media detected by the interceptor is published on the bus
 *                and, with auto start enabled, queued for download;
 *              - download progress and outcomes are published on the bus;
 *              - a job's first start and its settlement drive the owning
 *                task's Downloading flag;
 *              - closing a task cancels its jobs.
 *
 *              Every command returns an Error value and logs failures on the
 *              bus. Nothing throws.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module rawser.core.controller;
import rawser.core.types;
import rawser.core.enginesingleton;
import rawser.core.resourcepool;
import rawser.core.interceptor;
import rawser.core.tabmanager;
import rawser.core.eventbus;
import rawser.core.transfer;
import rawser.core.downloaddispatcher;
import rawser.services.settings;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Facade between the GUI collaborator and the core.
 */
RAWSER_MODULE_EXPORT class RawserController : public QObject {

    Q_OBJECT

    //!< @brief Queue detected primary media automatically.
    Q_PROPERTY(bool autoDownload READ autoDownload WRITE setAutoDownload NOTIFY autoDownloadChanged)

public:
    /**
     * @brief Build and wire the core.
     * @param engine Engine owner with a backend installed.
     * @param transfer Fetch/transcode collaborator.
     * @param settings Limits, timeouts and download policy.
     * @param parent Optional parent QObject.
     */
    RawserController(EngineSingleton* engine, TransferBackend* transfer, const CoreSettings& settings,
                     QObject* parent = nullptr);

    /**
     * @brief Open a task for a URL.
     * @param url Target URL.
     * @param error Receives the failure.
     * @return Task id, empty on failure.
     */
    QString createTask(const QString& url, Error* error = nullptr);

    Q_INVOKABLE Error closeTask(const QString& id);
    Q_INVOKABLE Error toggleBrowse(const QString& id);

    /**
     * @brief Load a URL in a task.
     * @param id Task id; empty creates a task for the URL first.
     * @param url URL to load.
     * @param createdId Receives the id of a task created for the call.
     */
    Error navigate(const QString& id, const QString& url, QString* createdId = nullptr);

    /**
     * @brief Download a media URL.
     *
     * A URL seen by the interceptor is downloaded with its captured headers;
     * any other URL gets a record classified from the URL alone.
     *
     * @param mediaUrl Media URL.
     * @param error Receives the failure.
     * @return Job id, empty on failure.
     */
    QString startDownload(const QString& mediaUrl, Error* error = nullptr);

    Q_INVOKABLE Error cancelDownload(const QString& jobId);
    Q_INVOKABLE Error pauseDownload(const QString& jobId);
    Q_INVOKABLE Error resumeDownload(const QString& jobId);

    //!< @brief Restart the engine after a crash.
    Q_INVOKABLE Error restartEngine();

    //!< @brief Cancel every download, close every task and stop the engine.
    Q_INVOKABLE void shutdown();

    bool autoDownload() const;
    void setAutoDownload(bool enabled);

    EventBus* bus() const;
    ResourcePool* pool() const;
    MediaInterceptor* interceptor() const;
    TabManager* tabs() const;
    DownloadDispatcher* dispatcher() const;

signals:
    void autoDownloadChanged();

private:
    void wire();
    void onMediaDetected(const MediaRecord& record);

    //!< @brief Log a failed command on the bus and hand the error back.
    Error report(const QString& operation, const Error& error);

    EventBus* m_bus = nullptr;
    ResourcePool* m_pool = nullptr;
    MediaInterceptor* m_interceptor = nullptr;
    TabManager* m_tabs = nullptr;
    DownloadDispatcher* m_dispatcher = nullptr;
    bool m_autoDownload = false;
    bool m_shutDown = false;
};

#include "controller.moc"
