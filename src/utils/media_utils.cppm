/*!
 * @file        media_utils.cppm
 * @brief       Media classification and replay helpers.
 * @details     Maps observed requests to MediaType from URL suffixes and
 *              content types, filters out trackers and static assets, and
 *              builds the browser-like headers and file names used when a
 *              discovered resource is fetched outside the engine.
 *
 *              Every helper is a pure function over its inputs so the
 *              interceptor can call the classification path inline without
 *              blocking the engine's own request delivery.
 *
 * @author      Rawser contributors
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Rawser contributors. All rights reserved.
 * @license     MIT
 */

module;
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rawser.utils.media_utils;
import rawser.core.types;
#endif

#ifdef Q_MOC_RUN
#define RAWSER_MODULE_EXPORT
#else
#define RAWSER_MODULE_EXPORT export
#endif

RAWSER_MODULE_EXPORT namespace rawser::utils {

/**
 * @brief Whether a request is noise for media discovery.
 *
 * Analytics, ad and tracking beacons, scripts, styles, fonts and images
 * are skipped before any classification happens.
 *
 * @param url Request URL.
 * @return true if the request must not produce a media record.
 */
bool isSkippedRequest(const QUrl& url);

/**
 * @brief Classifies a request into a MediaType.
 *
 * The URL suffix and the content type are evaluated independently. When
 * both name a primary type and they disagree, the result is Other and
 * @p ambiguous is set. HLS transport segments (.ts) are not media records.
 *
 * @param url Request URL.
 * @param contentType Response content type, may be empty.
 * @param type Receives the media type.
 * @param ambiguous Receives whether classification fell back to Other.
 * @return true if the request is a media resource.
 */
bool classifyMedia(const QUrl& url, const QString& contentType, MediaType* type, bool* ambiguous = nullptr);

//!< @brief MP4, M3U8 and MPD are primary; Other is lower priority.
bool isPrimaryMedia(MediaType type);

//!< @brief Whether a media type goes through the transcode pipeline.
bool needsTranscode(MediaType type);

/**
 * @brief File extension used for the downloaded output of a media type.
 *
 * Manifests are muxed into MP4; Other keeps the URL's own extension when it
 * has one.
 *
 * @param type Media type.
 * @param url Media URL.
 * @return Extension including the leading dot.
 */
QString mediaExtension(MediaType type, const QUrl& url);

/**
 * @brief Infers the output file name for a media record.
 *
 * Uses the URL's file name when it has an extension, otherwise
 * "video_<timestamp><ext>".
 *
 * @param record Media record.
 * @param timestampSecs Seconds since epoch used for generated names.
 * @return Sanitized file name.
 */
QString mediaFileName(const MediaRecord& record, qint64 timestampSecs);

//!< @brief Browser-like request headers used when replaying media requests.
HeaderMap defaultReplayHeaders();

/**
 * @brief Builds the headers sent when fetching a media record.
 *
 * Defaults are overlaid with the captured headers. Referer falls back to
 * the record's referrer, then to the media origin; Origin is derived the
 * same way when it was not captured.
 *
 * @param record Media record.
 * @return Header map ready for the transfer backend.
 */
HeaderMap replayHeaders(const MediaRecord& record);

/**
 * @brief Serialises headers in the "Name: value\r\n" block ffmpeg expects.
 *
 * @param headers Header map.
 * @return Header block.
 */
QString ffmpegHeaderBlock(const HeaderMap& headers);

} // namespace rawser::utils
