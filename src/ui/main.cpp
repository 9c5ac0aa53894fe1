// Copyright (c) 2025 Transcriber
// Main entry point for Qt GUI application

#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQuickStyle>

#include "transcription_bridge.hpp"

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);
    QGuiApplication::setOrganizationName("Sisyphus");
    QGuiApplication::setApplicationName("Transcriber");

    // Fusion follows the window palette, which the theme setting drives
    QQuickStyle::setStyle("Fusion");

    // Register TranscriptionBridge type for QML
    qmlRegisterType<TranscriptionBridge>("App", 1, 0, "TranscriptionBridge");

    // Create QML engine
    QQmlApplicationEngine engine;
    QObject::connect(&engine, &QQmlApplicationEngine::objectCreationFailed,
                     &app, []() { QCoreApplication::exit(-1); },
                     Qt::QueuedConnection);

    // Load main QML file
    engine.loadFromModule("App", "Main");

    if (engine.rootObjects().isEmpty()) {
        return -1;
    }

    return app.exec();
}
