#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QGuiApplication>
#include <QSettings>
#include <QStringList>

import rawser.core.types;
import rawser.core.enginesingleton;
import rawser.core.controller;
import rawser.services.settings;
import rawser.services.networktransfer;
import rawser.services.webengine_backend;
import rawser.utils.download_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace utils = rawser::utils;

int main(int argc, char *argv[])
{
    // Qt WebEngine needs shared contexts before the application object exists.
    QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);
    QGuiApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Rawser"));
    QCoreApplication::setApplicationName(QStringLiteral("Rawser"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Browser task orchestrator with media capture"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption browseOption(QStringLiteral("browse"),
                                          QStringLiteral("Attach an interactive page to every task."));
    const QCommandLineOption autoOption(QStringLiteral("auto-download"),
                                        QStringLiteral("Download detected MP4, HLS and DASH media automatically."));
    const QCommandLineOption dirOption(QStringLiteral("dir"),
                                       QStringLiteral("Download directory."), QStringLiteral("path"));
    const QCommandLineOption concurrentOption(QStringLiteral("max-concurrent"),
                                              QStringLiteral("Maximum number of running downloads."), QStringLiteral("n"));
    parser.addOption(browseOption);
    parser.addOption(autoOption);
    parser.addOption(dirOption);
    parser.addOption(concurrentOption);
    parser.addPositionalArgument(QStringLiteral("urls"), QStringLiteral("Pages to open, one task each."), QStringLiteral("[url...]"));
    parser.process(app);

    QSettings store;
    CoreSettings settings = CoreSettings::load(store);
    if (parser.isSet(autoOption)) settings.autoStart = true;
    if (parser.isSet(dirOption)) settings.downloadDir = utils::localFilePath(parser.value(dirOption));
    if (parser.isSet(concurrentOption)) {
        bool ok = false;
        const int value = parser.value(concurrentOption).toInt(&ok);
        if (!ok || value < 1) {
            qWarning() << "[Rawser] --max-concurrent expects a positive number";
            return 2;
        }
        settings.maxConcurrent = value;
    }

    WebEngineBackend backend;
    EngineSingleton& engine = EngineSingleton::instance();
    Error error;
    if (!engine.init(&backend, &error)) {
        qWarning() << "[Rawser] Engine setup failed:" << error.message;
        return 1;
    }

    NetworkTransferBackend transfer;
    transfer.setFfmpegPath(settings.ffmpegPath);

    RawserController controller(&engine, &transfer, settings);
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&controller, &engine] {
        controller.shutdown();
        engine.shutdown();
    });

    const QStringList urls = parser.positionalArguments();
    for (const QString& url : urls) {
        QString id;
        const Error failure = controller.navigate(QString(), url, &id);
        if (!failure.ok() || id.isEmpty()) continue;
        if (parser.isSet(browseOption)) {
            const Error browse = controller.toggleBrowse(id);
            if (!browse.ok()) qWarning() << "[Rawser] Browsing" << id << "failed:" << browse.message;
        }
    }

    return app.exec();
}
