/**
 * @file settingsstore.h
 * @brief Persistent user settings.
 */

#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>

/**
 * @brief User settings persisted with QSettings.
 *
 * Settings are loaded on construction and written back on every change.
 * By default the platform location of the application's QSettings is used;
 * passing a file path stores them in that INI file instead.
 */
class SettingsStore : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs the store and loads the saved settings.
     * @param filePath INI file to use, or empty for the platform default.
     * @param parent Optional parent QObject.
     */
    explicit SettingsStore(const QString &filePath = QString(), QObject *parent = nullptr);
    ~SettingsStore() override = default;

    /// Languages the interface is translated into.
    [[nodiscard]] static QStringList supportedLanguages();

    [[nodiscard]] QString language() const { return language_; }

    /// Base name of the translation catalog for the current language.
    [[nodiscard]] QString translationFileName() const;
    [[nodiscard]] int videoQuality() const { return videoQuality_; }
    [[nodiscard]] int audioQuality() const { return audioQuality_; }

    /// Program started by the process backend.
    [[nodiscard]] QString backendProgram() const { return backendProgram_; }
    [[nodiscard]] QStringList backendArguments() const { return backendArguments_; }

    /**
     * @brief Changes the interface language.
     * @return False if @p language is not one of supportedLanguages().
     */
    bool setLanguage(const QString &language);

    /**
     * @brief Changes the preferred video quality id.
     * @return False for a non-positive id.
     */
    bool setVideoQuality(int quality);

    /**
     * @brief Changes the preferred audio quality id.
     * @return False for a non-positive id.
     */
    bool setAudioQuality(int quality);

    void setBackendProgram(const QString &program);
    void setBackendArguments(const QStringList &arguments);

    /// Restores every setting to its default and saves.
    void resetToDefaults();

signals:
    void settingsChanged();

private:
    void loadSettings();
    void saveSettings();

    QString filePath_;
    QString language_;
    int videoQuality_ = 0;
    int audioQuality_ = 0;
    QString backendProgram_;
    QStringList backendArguments_;
};

#endif // SETTINGSSTORE_H
