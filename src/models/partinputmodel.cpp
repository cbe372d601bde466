/**
 * @file partinputmodel.cpp
 * @brief Implementation of the PartInputModel class.
 */

#include "partinputmodel.h"

#include <QUrl>

#include "utils/videoutils.h"

namespace {

int pickQuality(const QList<int> &available, int preferred, int fallback)
{
    if (available.contains(preferred)) {
        return preferred;
    }
    if (!available.isEmpty()) {
        return available.first();
    }
    return fallback;
}

// Audio ids do not sort by fidelity, so an unavailable preference falls back
// along the known ranking instead of the order the part lists them in.
int pickAudioQuality(const QList<int> &available, int preferred)
{
    if (available.contains(preferred)) {
        return preferred;
    }
    for (int quality : VideoUtils::audioQualityOrder()) {
        if (available.contains(quality)) {
            return quality;
        }
    }
    return pickQuality(available, preferred, VideoUtils::DefaultAudioQuality);
}

bool isQualityOffered(const QList<int> &available, int quality, int fallback)
{
    // Parts that report nothing are downloaded at the default quality
    if (available.isEmpty()) {
        return quality == fallback;
    }
    return available.contains(quality);
}

} // namespace

PartInputModel::PartInputModel(QObject *parent)
    : QObject(parent)
{
}

void PartInputModel::setUrl(const QString &url)
{
    if (url_ == url) {
        return;
    }
    url_ = url;
    emit urlChanged(url_);
}

bool PartInputModel::isUrlValid(const QString &url)
{
    if (url.size() < MinUrlLength || url.size() > MaxUrlLength) {
        return false;
    }

    QUrl parsed(url, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.scheme().isEmpty() || parsed.host().isEmpty()) {
        return false;
    }
    if (parsed.host().compare(QLatin1String("www.bilibili.com"), Qt::CaseInsensitive) != 0) {
        return false;
    }
    return !VideoUtils::extractVideoId(url).isEmpty();
}

void PartInputModel::setVideo(const VideoInfo &info, int preferredVideoQuality,
                              int preferredAudioQuality)
{
    video_ = info;
    parts_.clear();

    int ordinal = 1;
    for (const VideoPart &videoPart : info.parts) {
        PartInput input;
        input.cid = videoPart.cid;
        input.page = videoPart.page;
        input.ordinal = ordinal++;
        input.title = QStringLiteral("%1 %2").arg(info.title, videoPart.part).trimmed();
        input.videoQuality = pickQuality(videoPart.videoQualities, preferredVideoQuality,
                                         VideoUtils::DefaultVideoQuality);
        input.audioQuality = pickAudioQuality(videoPart.audioQualities, preferredAudioQuality);
        input.selected = true;
        input.duration = videoPart.duration;
        input.thumbnailUrl = videoPart.thumbnailUrl;
        parts_.append(input);
    }

    emit partsChanged();
}

void PartInputModel::clear()
{
    url_.clear();
    video_ = VideoInfo();
    parts_.clear();
    emit partsChanged();
}

bool PartInputModel::setTitle(int index, const QString &title)
{
    if (!isIndexValid(index) || parts_[index].title == title) {
        return false;
    }
    parts_[index].title = title;
    emit partChanged(index);
    return true;
}

bool PartInputModel::setVideoQuality(int index, int quality)
{
    if (!isIndexValid(index) || parts_[index].videoQuality == quality) {
        return false;
    }
    parts_[index].videoQuality = quality;
    emit partChanged(index);
    return true;
}

bool PartInputModel::setAudioQuality(int index, int quality)
{
    if (!isIndexValid(index) || parts_[index].audioQuality == quality) {
        return false;
    }
    parts_[index].audioQuality = quality;
    emit partChanged(index);
    return true;
}

bool PartInputModel::setSelected(int index, bool selected)
{
    if (!isIndexValid(index) || parts_[index].selected == selected) {
        return false;
    }
    parts_[index].selected = selected;
    emit partChanged(index);
    emit selectionChanged();
    return true;
}

void PartInputModel::selectAll()
{
    for (PartInput &input : parts_) {
        input.selected = true;
    }
    emit selectionChanged();
}

void PartInputModel::deselectAll()
{
    for (PartInput &input : parts_) {
        input.selected = false;
    }
    emit selectionChanged();
}

QList<int> PartInputModel::selectedIndices() const
{
    QList<int> indices;
    for (int i = 0; i < parts_.size(); ++i) {
        if (parts_[i].selected) {
            indices.append(i);
        }
    }
    return indices;
}

QList<int> PartInputModel::duplicateIndices() const
{
    const QList<int> selected = selectedIndices();
    if (selected.isEmpty()) {
        return {};
    }

    QStringList titles;
    titles.reserve(parts_.size());
    for (const PartInput &input : parts_) {
        titles.append(input.title);
    }
    return VideoUtils::duplicateIndices(titles, selected);
}

bool PartInputModel::isPartValid(int index) const
{
    if (!isIndexValid(index)) {
        return false;
    }

    const PartInput &input = parts_[index];
    const QString trimmed = input.title.trimmed();
    if (trimmed.size() < MinTitleLength || trimmed.size() > MaxTitleLength) {
        return false;
    }
    if (VideoUtils::containsForbiddenChars(input.title)) {
        return false;
    }
    if (VideoUtils::normalizeFilename(input.title).isEmpty()) {
        return false;
    }

    const VideoPart videoPart = video_.parts.value(index);
    return isQualityOffered(videoPart.videoQualities, input.videoQuality,
                            VideoUtils::DefaultVideoQuality)
        && isQualityOffered(videoPart.audioQualities, input.audioQuality,
                            VideoUtils::DefaultAudioQuality);
}

bool PartInputModel::isValid() const
{
    if (!isUrlValid(url_)) {
        return false;
    }

    const QList<int> selected = selectedIndices();
    if (selected.isEmpty()) {
        return false;
    }
    for (int index : selected) {
        if (!isPartValid(index)) {
            return false;
        }
    }
    return duplicateIndices().isEmpty();
}
