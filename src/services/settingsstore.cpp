/**
 * @file settingsstore.cpp
 * @brief Implementation of the SettingsStore service.
 */

#include "settingsstore.h"

#include <QDebug>
#include <QSettings>

#include <memory>

#include "utils/videoutils.h"

namespace {

const QString DefaultLanguage = QStringLiteral("en");
const QString DefaultBackendProgram = QStringLiteral("partdl-backend");

std::unique_ptr<QSettings> openSettings(const QString &filePath)
{
    if (filePath.isEmpty()) {
        return std::make_unique<QSettings>();
    }
    return std::make_unique<QSettings>(filePath, QSettings::IniFormat);
}

} // namespace

SettingsStore::SettingsStore(const QString &filePath, QObject *parent)
    : QObject(parent)
    , filePath_(filePath)
{
    loadSettings();
}

QStringList SettingsStore::supportedLanguages()
{
    return {QStringLiteral("en"), QStringLiteral("ja"), QStringLiteral("fr"),
            QStringLiteral("es"), QStringLiteral("zh"), QStringLiteral("ko")};
}

QString SettingsStore::translationFileName() const
{
    return QStringLiteral("partdl_%1").arg(language_);
}

bool SettingsStore::setLanguage(const QString &language)
{
    if (!supportedLanguages().contains(language)) {
        qWarning() << "SettingsStore: Unsupported language" << language;
        return false;
    }
    if (language_ == language) {
        return true;
    }

    language_ = language;
    saveSettings();
    emit settingsChanged();
    return true;
}

bool SettingsStore::setVideoQuality(int quality)
{
    if (quality <= 0) {
        return false;
    }
    if (videoQuality_ != quality) {
        videoQuality_ = quality;
        saveSettings();
        emit settingsChanged();
    }
    return true;
}

bool SettingsStore::setAudioQuality(int quality)
{
    if (quality <= 0) {
        return false;
    }
    if (audioQuality_ != quality) {
        audioQuality_ = quality;
        saveSettings();
        emit settingsChanged();
    }
    return true;
}

void SettingsStore::setBackendProgram(const QString &program)
{
    if (backendProgram_ == program) {
        return;
    }
    backendProgram_ = program;
    saveSettings();
    emit settingsChanged();
}

void SettingsStore::setBackendArguments(const QStringList &arguments)
{
    if (backendArguments_ == arguments) {
        return;
    }
    backendArguments_ = arguments;
    saveSettings();
    emit settingsChanged();
}

void SettingsStore::resetToDefaults()
{
    language_ = DefaultLanguage;
    videoQuality_ = VideoUtils::DefaultVideoQuality;
    audioQuality_ = VideoUtils::DefaultAudioQuality;
    backendProgram_ = DefaultBackendProgram;
    backendArguments_.clear();
    saveSettings();
    emit settingsChanged();
}

void SettingsStore::loadSettings()
{
    auto settings = openSettings(filePath_);

    language_ = settings->value("general/language", DefaultLanguage).toString();
    if (!supportedLanguages().contains(language_)) {
        qWarning() << "SettingsStore: Ignoring unsupported language" << language_;
        language_ = DefaultLanguage;
    }

    videoQuality_ = settings->value("download/videoQuality",
                                    VideoUtils::DefaultVideoQuality).toInt();
    if (videoQuality_ <= 0) {
        videoQuality_ = VideoUtils::DefaultVideoQuality;
    }
    audioQuality_ = settings->value("download/audioQuality",
                                    VideoUtils::DefaultAudioQuality).toInt();
    if (audioQuality_ <= 0) {
        audioQuality_ = VideoUtils::DefaultAudioQuality;
    }

    backendProgram_ = settings->value("backend/program", DefaultBackendProgram).toString();
    backendArguments_ = settings->value("backend/arguments").toStringList();
}

void SettingsStore::saveSettings()
{
    auto settings = openSettings(filePath_);
    settings->setValue("general/language", language_);
    settings->setValue("download/videoQuality", videoQuality_);
    settings->setValue("download/audioQuality", audioQuality_);
    settings->setValue("backend/program", backendProgram_);
    settings->setValue("backend/arguments", backendArguments_);
}
