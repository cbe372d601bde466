/**
 * @file downloadtypes.h
 * @brief Value types exchanged with the download backend.
 */

#ifndef DOWNLOADTYPES_H
#define DOWNLOADTYPES_H

#include <QList>
#include <QMetaType>
#include <QString>

#include <optional>

/**
 * @brief Named phase of a child download.
 *
 * Quality fallback stages are non-fatal warnings: the backend substituted a
 * lower quality than requested and carries on.
 */
enum class DownloadStage {
    None,                     ///< Event carried no stage
    Video,                    ///< Fetching the video stream
    Audio,                    ///< Fetching the audio stream
    Merge,                    ///< Muxing audio and video (not interruptible)
    Complete,                 ///< Output written
    WarnVideoQualityFallback, ///< Requested video quality unavailable
    WarnAudioQualityFallback  ///< Requested audio quality unavailable
};

/// @brief Convert a wire stage name ("video", "warn-audio-quality-fallback") to DownloadStage.
[[nodiscard]] inline DownloadStage stageFromString(const QString &stage)
{
    if (stage == QLatin1String("video")) return DownloadStage::Video;
    if (stage == QLatin1String("audio")) return DownloadStage::Audio;
    if (stage == QLatin1String("merge")) return DownloadStage::Merge;
    if (stage == QLatin1String("complete")) return DownloadStage::Complete;
    if (stage == QLatin1String("warn-video-quality-fallback")) return DownloadStage::WarnVideoQualityFallback;
    if (stage == QLatin1String("warn-audio-quality-fallback")) return DownloadStage::WarnAudioQualityFallback;
    return DownloadStage::None;
}

/// @brief Convert DownloadStage to its wire name (empty for None).
[[nodiscard]] inline QString stageToString(DownloadStage stage)
{
    switch (stage) {
        case DownloadStage::None: return QString();
        case DownloadStage::Video: return QStringLiteral("video");
        case DownloadStage::Audio: return QStringLiteral("audio");
        case DownloadStage::Merge: return QStringLiteral("merge");
        case DownloadStage::Complete: return QStringLiteral("complete");
        case DownloadStage::WarnVideoQualityFallback: return QStringLiteral("warn-video-quality-fallback");
        case DownloadStage::WarnAudioQualityFallback: return QStringLiteral("warn-audio-quality-fallback");
    }
    return QString();
}

/// @brief True for the quality fallback warning stages.
[[nodiscard]] inline bool isWarningStage(DownloadStage stage)
{
    return stage == DownloadStage::WarnVideoQualityFallback
        || stage == DownloadStage::WarnAudioQualityFallback;
}

/**
 * @brief One progress observation for a (download, stage) pair.
 *
 * Sizes are in megabytes and the transfer rate in KB/s, as reported by the
 * backend. Sizes are optional because the merge stage rarely knows them.
 */
struct ProgressEntry {
    QString downloadId;
    QString parentId;                ///< Batch id, filled in by the bridge when absent
    QString internalId;              ///< Stable key: "<downloadId>:<stage>" or "<downloadId>"
    DownloadStage stage = DownloadStage::None;
    std::optional<double> filesize;
    std::optional<double> downloaded;
    double transferRate = 0.0;
    double percentage = 0.0;         ///< 0-100
    double deltaTime = 0.0;          ///< Seconds since the previous event
    double elapsedTime = 0.0;        ///< Seconds since the stage started
    bool isComplete = false;

    [[nodiscard]] bool hasByteTotals() const
    {
        return filesize.has_value() && downloaded.has_value() && *filesize > 0.0;
    }

    bool operator==(const ProgressEntry &other) const
    {
        return downloadId == other.downloadId
            && parentId == other.parentId
            && stage == other.stage
            && filesize == other.filesize
            && downloaded == other.downloaded
            && transferRate == other.transferRate
            && percentage == other.percentage
            && deltaTime == other.deltaTime
            && elapsedTime == other.elapsedTime
            && isComplete == other.isComplete;
    }
    bool operator!=(const ProgressEntry &other) const { return !(*this == other); }
};

/**
 * @brief Metadata of one part of a remote video.
 */
struct VideoPart {
    QString part;                ///< Part name as published
    int page = 0;                ///< 1-indexed page number
    qint64 cid = 0;              ///< Content id of the part
    int duration = 0;            ///< Seconds
    QList<int> videoQualities;   ///< Available video quality ids, best first
    QList<int> audioQualities;   ///< Available audio quality ids, best first
    QString thumbnailUrl;
};

/**
 * @brief Metadata of a remote video returned by the backend.
 */
struct VideoInfo {
    QString title;
    QString videoId;             ///< Stable identifier, e.g. "BV1xx411c7XD"
    QList<VideoPart> parts;
};

/**
 * @brief Arguments of a single per-part backend dispatch.
 */
struct DispatchOptions {
    QString sourceId;            ///< Video identifier
    qint64 partId = 0;           ///< Content id of the part (cid)
    QString outputName;          ///< Trimmed output file name
    int videoQuality = 0;
    int audioQuality = 0;
    QString downloadId;
    QString parentId;
    int durationSeconds = 0;
    QString thumbnailUrl;
    int page = 0;
};

Q_DECLARE_METATYPE(ProgressEntry)
Q_DECLARE_METATYPE(VideoInfo)
Q_DECLARE_METATYPE(DispatchOptions)

#endif // DOWNLOADTYPES_H
