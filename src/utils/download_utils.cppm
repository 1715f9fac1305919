/*!
 * @file        download_utils.cppm
 * @brief       Path, URL and file name helpers for download destinations.
 * @details     Side-effect free helpers shared by the task registry, the
 *              download dispatcher and the settings layer: user URL input,
 *              request origins, and destination names that are safe and do
 *              not collide with files already on disk or promised to
 *              another job.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QSet>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module rawser.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

RAWSER_MODULE_EXPORT namespace rawser::utils {

/**
 * @brief Resolves a user supplied directory or file location.
 *
 * Accepts plain paths, "~/" paths and file:// URLs.
 *
 * @param path Raw location.
 * @return Cleaned local path, empty when the input is empty.
 */
QString localFilePath(const QString& path);

/**
 * @brief Turns user input into a navigable URL.
 *
 * Input without a scheme is treated as an https address, so "example.com/v"
 * becomes "https://example.com/v".
 *
 * @param input Raw URL text.
 * @return Parsed URL, invalid when the input cannot be used.
 */
QUrl normalizeUrl(const QString& input);

/**
 * @brief Infers a file name from a URL.
 *
 * Signed CDN URLs often carry the real name in a content-disposition query
 * parameter; that wins over the last path segment.
 *
 * @param url Source URL.
 * @return File name, possibly empty.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Makes a file name safe for every supported filesystem.
 *
 * Replaces reserved characters with '_', drops control characters and
 * limits the result to 200 characters, keeping the extension.
 */
QString sanitizeFileName(const QString& name);

//!< @brief "scheme://host[:port]" of a URL, empty for URLs without a host.
QString urlOrigin(const QUrl& url);

/**
 * @brief Picks a free destination path.
 *
 * A path is taken when it exists on disk, has a ".part" sibling, or is in
 * the reserved set. " (N)" is appended to the base name until a free path
 * is found.
 *
 * @param path Desired file path.
 * @param reserved Paths already promised to other transfers.
 * @return A free file path.
 */
QString uniqueFilePath(const QString& path, const QSet<QString>& reserved = {});

} // namespace rawser::utils
