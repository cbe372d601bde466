/**
 * @file videoutils.h
 * @brief Pure helpers for video identifiers, output names and quality ids.
 */

#ifndef VIDEOUTILS_H
#define VIDEOUTILS_H

#include <QList>
#include <QString>
#include <QStringList>

namespace VideoUtils {

/// Video quality id used when a part reports no video qualities (1080p).
constexpr int DefaultVideoQuality = 80;

/// Audio quality id used when a part reports no audio qualities (64K).
constexpr int DefaultAudioQuality = 30216;

/// Characters stripped from titles before duplicate comparison.
inline constexpr char ForbiddenFilenameChars[] = "\\/:*?\"<>|";

/**
 * @brief Extracts the video identifier from a watch URL.
 * @param url A URL of the form https://www.bilibili.com/video/BV1xx411c7XD.
 * @return The identifier (e.g. "BV1xx411c7XD"), or an empty string.
 */
[[nodiscard]] QString extractVideoId(const QString &url);

/**
 * @brief Normalizes an output name for duplicate detection.
 *
 * Trims surrounding whitespace, case-folds and removes every forbidden
 * path character, so "My Video: Part 1" and "my video part 1" compare equal.
 */
[[nodiscard]] QString normalizeFilename(const QString &name);

/**
 * @brief Returns true if @p name contains a forbidden path character or NUL.
 */
[[nodiscard]] bool containsForbiddenChars(const QString &name);

/**
 * @brief Finds the positions of every title that collides with another.
 *
 * Titles are normalized first. The returned indices are grouped by collision
 * (in order of first occurrence) and refer to positions in @p titles.
 * Entries whose index is not in @p considered are ignored; an empty
 * @p considered list means every title takes part.
 */
[[nodiscard]] QList<int> duplicateIndices(const QStringList &titles,
                                          const QList<int> &considered = {});

/**
 * @brief Extracts the part ordinal encoded at the end of a download id.
 * @return The ordinal from a trailing "-p<N>", or -1 when absent.
 */
[[nodiscard]] int partOrdinalFromDownloadId(const QString &downloadId);

/// Human-readable label for a video quality id ("1080p60"), or the id itself.
[[nodiscard]] QString videoQualityLabel(int qualityId);

/// Human-readable label for an audio quality id ("192K"), or the id itself.
[[nodiscard]] QString audioQualityLabel(int qualityId);

/// Audio quality ids in descending quality order.
[[nodiscard]] const QList<int> &audioQualityOrder();

} // namespace VideoUtils

#endif // VIDEOUTILS_H
