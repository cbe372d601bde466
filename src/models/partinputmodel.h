/**
 * @file partinputmodel.h
 * @brief Source URL and per-part user configuration of the current video.
 *
 * Seeded from fetched video metadata, then edited by the user before a
 * download is started.
 */

#ifndef PARTINPUTMODEL_H
#define PARTINPUTMODEL_H

#include <QList>
#include <QObject>
#include <QString>

#include "services/downloadtypes.h"

/**
 * @brief User configuration of one video part.
 */
struct PartInput {
    qint64 cid = 0;          ///< Content id of the part
    int page = 0;            ///< 1-indexed page number
    int ordinal = 0;         ///< 1-based position, used to derive child download ids
    QString title;           ///< Editable output name
    int videoQuality = 0;
    int audioQuality = 0;
    bool selected = true;
    int duration = 0;        ///< Seconds
    QString thumbnailUrl;
};

/**
 * @brief Model for the URL and the part inputs of the current video.
 *
 * Holds the VideoInfo the inputs were seeded from so that selected qualities
 * can be validated against what each part actually offers.
 *
 * @par Example usage:
 * @code
 * PartInputModel *inputs = new PartInputModel(this);
 * inputs->setUrl("https://www.bilibili.com/video/BV1xx411c7XD");
 * inputs->setVideo(info, 80, 30280);
 *
 * inputs->setTitle(0, "Intro");
 * inputs->setSelected(2, false);
 *
 * if (inputs->isValid()) {
 *     // Start the download...
 * }
 * @endcode
 */
class PartInputModel : public QObject
{
    Q_OBJECT

public:
    /// URL length bounds accepted by isUrlValid()
    static constexpr int MinUrlLength = 2;
    static constexpr int MaxUrlLength = 1000;

    /// Trimmed title length bounds accepted by isPartValid()
    static constexpr int MinTitleLength = 2;
    static constexpr int MaxTitleLength = 100;

    explicit PartInputModel(QObject *parent = nullptr);
    ~PartInputModel() override = default;

    /// @name URL
    /// @{
    void setUrl(const QString &url);
    [[nodiscard]] QString url() const { return url_; }

    /**
     * @brief Checks a watch URL.
     *
     * Accepts 2 to 1000 characters forming an absolute URL on
     * www.bilibili.com from which a video id can be extracted.
     */
    [[nodiscard]] static bool isUrlValid(const QString &url);
    /// @}

    /// @name Video and Parts
    /// @{

    /**
     * @brief Replaces the inputs with one entry per part of @p info.
     * @param info Fetched video metadata.
     * @param preferredVideoQuality Used when the part offers it.
     * @param preferredAudioQuality Used when the part offers it.
     *
     * Titles are seeded as "<video title> <part name>". A quality the part
     * does not offer falls back to the part's best, or to the defaults when
     * the part reports none. Every part starts selected.
     * Emits partsChanged().
     */
    void setVideo(const VideoInfo &info, int preferredVideoQuality, int preferredAudioQuality);

    [[nodiscard]] VideoInfo video() const { return video_; }
    [[nodiscard]] QList<PartInput> parts() const { return parts_; }
    [[nodiscard]] PartInput part(int index) const { return parts_.value(index); }
    [[nodiscard]] int count() const { return parts_.size(); }

    /// Drops the video, its inputs and the URL. Emits partsChanged().
    void clear();
    /// @}

    /// @name Editing
    /// @{
    bool setTitle(int index, const QString &title);
    bool setVideoQuality(int index, int quality);
    bool setAudioQuality(int index, int quality);
    bool setSelected(int index, bool selected);
    void selectAll();
    void deselectAll();
    /// @}

    /// @name Validation
    /// @{
    [[nodiscard]] QList<int> selectedIndices() const;

    /// Indices of selected parts whose normalized titles collide.
    [[nodiscard]] QList<int> duplicateIndices() const;

    /**
     * @brief Validates one part on its own.
     *
     * The trimmed title must be 2 to 100 characters without forbidden path
     * characters and must not normalize to an empty string. Both qualities
     * must be offered by the part.
     */
    [[nodiscard]] bool isPartValid(int index) const;

    /**
     * @brief True when a download may start: valid URL, at least one selected
     * part, every selected part valid and no duplicate titles among them.
     */
    [[nodiscard]] bool isValid() const;
    /// @}

signals:
    void urlChanged(const QString &url);
    void partsChanged();
    void partChanged(int index);
    void selectionChanged();

private:
    [[nodiscard]] bool isIndexValid(int index) const { return index >= 0 && index < parts_.size(); }

    QString url_;
    VideoInfo video_;
    QList<PartInput> parts_;
};

#endif // PARTINPUTMODEL_H
