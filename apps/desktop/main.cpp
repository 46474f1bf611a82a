#include <QApplication>
#include "CanvasWindow.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include "core/config/ConfigLoader.hpp"
#include "utils/Logger.hpp"

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("StrokeMatch"));
    QCommandLineParser parser;
    parser.setApplicationDescription("StrokeMatch drawing recognizer");
    parser.addHelpOption();

    QCommandLineOption configOpt({"C", "config"},
        "Recognition config file", "path", "config/recognition.json");
    QCommandLineOption precisionOpt({"p", "precision"},
        "Map precision (overrides config)", "n");
    QCommandLineOption libraryFileOpt({"l", "library-file"},
        "Library storage file (overrides config)", "path");
    QCommandLineOption strokeWidthOpt({"w", "stroke-width"},
        "Stroke width", "width", "3");
    QCommandLineOption strokeColorOpt({"s", "stroke-color"},
        "Stroke color (hex)", "color", "#141414");
    QCommandLineOption fullscreenOpt({"F", "fullscreen"},
        "Launch the canvas fullscreen");

    parser.addOption(configOpt);
    parser.addOption(precisionOpt);
    parser.addOption(libraryFileOpt);
    parser.addOption(strokeWidthOpt);
    parser.addOption(strokeColorOpt);
    parser.addOption(fullscreenOpt);

    parser.process(app);

    sm::RecognitionConfig config =
        sm::loadRecognitionConfig(parser.value(configOpt).toStdString());
    if (parser.isSet(precisionOpt)) {
        bool ok = false;
        int precision = parser.value(precisionOpt).toInt(&ok);
        if (ok && precision >= 1)
            config.precision = precision;
        else
            SM_LOG(sm::LogLevel::Warn, "Ignoring invalid --precision");
    }
    if (parser.isSet(libraryFileOpt))
        config.libraryFile = parser.value(libraryFileOpt).toStdString();
    sm::setLogLevel(config.logLevel);

    CanvasWindowOptions opts;
    opts.strokeWidth = parser.value(strokeWidthOpt).toInt();
    if (opts.strokeWidth <= 0) opts.strokeWidth = 3;
    opts.strokeColor = QColor(parser.value(strokeColorOpt));
    if (!opts.strokeColor.isValid()) opts.strokeColor = QColor("#141414");
    opts.fullscreen = parser.isSet(fullscreenOpt);

    SM_LOG(sm::LogLevel::Info, "StrokeMatch Desktop starting (precision " +
                                   std::to_string(config.precision) + ")");
    CanvasWindow win(config, opts);
    if (opts.fullscreen)
        win.showFullScreen();
    else
        win.show();
    return app.exec();
}
