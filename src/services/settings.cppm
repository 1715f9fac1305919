/*!
 * @file        settings.cppm
 * @brief       Persistent configuration of the Rawser core.
 * @details     Loads and stores the caps, timeouts and download policy from
 *              QSettings. Values are grouped as:
 *
 *              - engine: pageTimeoutMs, navigationTimeoutMs
 *              - pool: maxContexts, maxPages
 *              - downloads: directory, queueCapacity, maxConcurrent,
 *                maxAttempts, retryBaseDelayMs, transferTimeoutMs,
 *                historyLimit, ffmpegPath, autoStart
 *
 *              Out-of-range values are clamped on load.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QSettings>
#include <QString>

#ifndef Q_MOC_RUN
export module rawser.services.settings;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

/**
 * @brief Tunables shared by the core components.
 */
RAWSER_MODULE_EXPORT struct CoreSettings {
    int maxContexts = 10;               //!< Live context cap.
    int maxPages = 10;                  //!< Live plus pending page cap.
    int pageTimeoutMs = 15000;          //!< Page acquisition timeout.
    int navigationTimeoutMs = 30000;    //!< Page load timeout.
    int queueCapacity = 64;             //!< Non-terminal download jobs.
    int maxConcurrent = 3;              //!< Running download jobs.
    int maxAttempts = 3;                //!< Attempts per job, first included.
    int retryBaseDelayMs = 1000;        //!< First retry delay.
    int transferTimeoutMs = 60000;      //!< Inactivity allowed per transfer.
    int historyLimit = 200;             //!< Finished download jobs kept for listing.
    QString downloadDir;                //!< Output directory.
    QString ffmpegPath = QStringLiteral("ffmpeg");
    bool autoStart = false;             //!< Download primary media on detection.

    //!< @brief Defaults with the platform download directory filled in.
    static CoreSettings defaults();

    //!< @brief Read every group, falling back to defaults() per key.
    static CoreSettings load(QSettings& settings);

    void save(QSettings& settings) const;
};

//!< @brief <Downloads>/Rawser for the current user.
RAWSER_MODULE_EXPORT QString defaultDownloadDir();
