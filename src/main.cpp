#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSet>
#include <QTextStream>
#include <QTimer>
#include <QTranslator>

#include "models/downloadstatus.h"
#include "models/partinputmodel.h"
#include "models/progressstore.h"
#include "models/queuestore.h"
#include "services/downloadorchestrator.h"
#include "services/errorhandler.h"
#include "services/processbackend.h"
#include "services/progressbridge.h"
#include "services/settingsstore.h"
#include "utils/logging.h"
#include "utils/videoutils.h"
#include "version.h"

namespace {

// Parses "1,3-5" into part ordinals. Returns an empty set on malformed input.
QSet<int> parseOrdinals(const QString &text)
{
    QSet<int> ordinals;
    const QStringList ranges = text.split(',', Qt::SkipEmptyParts);
    for (const QString &range : ranges) {
        const QStringList bounds = range.trimmed().split('-');
        bool okFirst = false;
        bool okLast = false;
        int first = bounds.value(0).toInt(&okFirst);
        int last = bounds.size() == 2 ? bounds.value(1).toInt(&okLast) : first;
        if (bounds.size() == 1) {
            okLast = okFirst;
        }
        if (!okFirst || !okLast || bounds.size() > 2 || first < 1 || last < first) {
            return {};
        }
        for (int i = first; i <= last; ++i) {
            ordinals.insert(i);
        }
    }
    return ordinals;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("partdl");
    app.setApplicationVersion(PARTDL_VERSION);
    app.setOrganizationName("partdl");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Downloads the parts of a multi-part video one after the other");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("url", "Watch URL of the video");

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption backendOption(
        "backend", "Backend program that fetches and merges parts", "program");
    QCommandLineOption backendArgOption(
        "backend-arg", "Argument passed to the backend program (repeatable)", "arg");
    QCommandLineOption partsOption(
        "parts", "Part ordinals to download, e.g. 1,3-5 (default: all)", "list");
    QCommandLineOption videoQualityOption(
        "video-quality", "Preferred video quality id", "id");
    QCommandLineOption audioQualityOption(
        "audio-quality", "Preferred audio quality id", "id");
    QCommandLineOption configOption(
        "config", "Settings file (INI) instead of the default location", "file");
    QCommandLineOption listOption(
        "list", "Only list the parts of the video");

    parser.addOptions({verboseOption, backendOption, backendArgOption, partsOption,
                       videoQualityOption, audioQualityOption, configOption, listOption});

    parser.process(app);

    // Set verbose logging flag
    partdl::verboseLogging = parser.isSet(verboseOption);

    if (partdl::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    if (parser.positionalArguments().size() != 1) {
        parser.showHelp(2);
    }
    const QString url = parser.positionalArguments().first();

    QSet<int> wantedOrdinals;
    if (parser.isSet(partsOption)) {
        wantedOrdinals = parseOrdinals(parser.value(partsOption));
        if (wantedOrdinals.isEmpty()) {
            qCritical() << "Invalid --parts value:" << parser.value(partsOption);
            return 2;
        }
    }

    int videoQualityOverride = 0;
    int audioQualityOverride = 0;
    if (parser.isSet(videoQualityOption)) {
        videoQualityOverride = parser.value(videoQualityOption).toInt();
        if (videoQualityOverride <= 0) {
            qCritical() << "Invalid --video-quality value:" << parser.value(videoQualityOption);
            return 2;
        }
    }
    if (parser.isSet(audioQualityOption)) {
        audioQualityOverride = parser.value(audioQualityOption).toInt();
        if (audioQualityOverride <= 0) {
            qCritical() << "Invalid --audio-quality value:" << parser.value(audioQualityOption);
            return 2;
        }
    }

    QTextStream out(stdout);
    QTextStream err(stderr);

    SettingsStore settings(parser.value(configOption));

    QTranslator translator;
    if (settings.language() != QLatin1String("en")) {
        const QString translationsDir = QCoreApplication::applicationDirPath()
                                        + QStringLiteral("/translations");
        if (translator.load(settings.translationFileName(), translationsDir)) {
            app.installTranslator(&translator);
        } else {
            qWarning() << "No translation for" << settings.language() << "in" << translationsDir;
        }
    }

    // Command line options override the settings for this run only
    ProcessBackend backend;
    backend.setProgram(parser.isSet(backendOption) ? parser.value(backendOption)
                                                   : settings.backendProgram(),
                       parser.isSet(backendArgOption) ? parser.values(backendArgOption)
                                                      : settings.backendArguments());

    PartInputModel inputs;
    ProgressStore progress;
    QueueStore queue(&progress);
    DownloadStatus status;
    ErrorHandler errorHandler;

    ProgressBridge bridge(&queue, &progress, &errorHandler);
    bridge.setBackend(&backend);

    DownloadOrchestrator orchestrator(&inputs, &queue, &progress, &status,
                                      &errorHandler, &settings);
    orchestrator.setBackend(&backend);

    QObject::connect(&errorHandler, &ErrorHandler::statusMessage,
                     [&err](const QString &message, int) {
        err << message << Qt::endl;
    });

    QObject::connect(&queue, &QueueStore::itemStatusChanged,
                     [&queue, &out](const QString &downloadId) {
        auto entry = queue.item(downloadId);
        if (!entry || entry->isParent()) {
            return;
        }
        out << "[" << queueStatusToString(entry->status) << "] " << entry->title;
        if (entry->status == QueueItem::Status::Done && !entry->outputPath.isEmpty()) {
            out << " -> " << entry->outputPath;
        }
        out << Qt::endl;
    });

    QObject::connect(&backend, &ProcessBackend::backendError,
                     [&err](const QString &message) {
        err << "Backend: " << message << Qt::endl;
    });

    QObject::connect(&orchestrator, &DownloadOrchestrator::videoInfoFailed,
                     &app, [&app](const QString &) { app.exit(1); });

    QObject::connect(&orchestrator, &DownloadOrchestrator::videoInfoReady, &app,
                     [&](const VideoInfo &info) {
        out << info.title << " (" << info.videoId << ")" << Qt::endl;
        for (int i = 0; i < inputs.count(); ++i) {
            const PartInput part = inputs.part(i);
            out << QString("  %1. %2 [%3 / %4]")
                       .arg(part.ordinal)
                       .arg(part.title,
                            VideoUtils::videoQualityLabel(part.videoQuality),
                            VideoUtils::audioQualityLabel(part.audioQuality))
                << Qt::endl;
        }

        if (parser.isSet(listOption)) {
            app.exit(0);
            return;
        }

        const VideoInfo video = inputs.video();
        for (int i = 0; i < inputs.count(); ++i) {
            const PartInput part = inputs.part(i);
            if (!wantedOrdinals.isEmpty()) {
                orchestrator.setPartSelected(i, wantedOrdinals.contains(part.ordinal));
            }
            const VideoPart offered = video.parts.value(i);
            if (videoQualityOverride > 0 && offered.videoQualities.contains(videoQualityOverride)) {
                inputs.setVideoQuality(i, videoQualityOverride);
            }
            if (audioQualityOverride > 0 && offered.audioQualities.contains(audioQualityOverride)) {
                inputs.setAudioQuality(i, audioQualityOverride);
            }
        }

        if (!orchestrator.download()) {
            app.exit(2);
        }
    });

    QObject::connect(&orchestrator, &DownloadOrchestrator::allRunsFinished, &app,
                     [&app, &status]() { app.exit(status.hasError() ? 1 : 0); });

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        if (orchestrator.isBusy()) {
            backend.cancelAll();
        }
        backend.stop();
    });

    QTimer::singleShot(0, &app, [&]() {
        if (!orchestrator.fetchVideoInfo(url)) {
            app.exit(2);
        }
    });

    return app.exec();
}
