// Copyright (c) 2025 Transcriber
// TranscriptionBridge - Implementation

#include "ui/transcription_bridge.hpp"
#include "app/transcription_controller.hpp"
#include "core/config.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QMetaObject>
#include <QSettings>

#include <filesystem>
#include <vector>

using namespace app;

namespace {
QString trimmed(const QString& s) { return s.trimmed(); }
}

TranscriptionBridge::TranscriptionBridge(QObject* parent)
    : QObject(parent)
    , owned_settings_(std::make_unique<QSettings>(QStringLiteral("Sisyphus"), QStringLiteral("Transcriber")))
    , settings_(owned_settings_.get())
{
    std::vector<std::filesystem::path> model_dirs;
    if (QCoreApplication::instance()) {
        const QString app_models = QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("models"));
        model_dirs.push_back(std::filesystem::u8path(app_models.toStdString()));
    }
    controller_ = std::make_unique<TranscriptionController>(default_pipeline_services(std::move(model_dirs)));
    connectController();
    loadSettings();
}

TranscriptionBridge::TranscriptionBridge(PipelineServices services, QSettings* settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , controller_(std::make_unique<TranscriptionController>(std::move(services)))
{
    connectController();
    loadSettings();
}

TranscriptionBridge::~TranscriptionBridge() {
    // Callbacks capture `this`; drop them before the worker is joined
    controller_->clear_subscriptions();
    controller_->cancel();
    controller_->wait();
}

void TranscriptionBridge::connectController() {
    // Marshal to Qt main thread
    controller_->subscribe_to_log([this](const std::string& line) {
        const QString text = QString::fromStdString(line);
        QMetaObject::invokeMethod(this, [this, text]() {
            onLog(text);
        }, Qt::QueuedConnection);
    });

    controller_->subscribe_to_progress([this](const JobProgress& progress) {
        QMetaObject::invokeMethod(this, [this, progress]() {
            onProgress(progress);
        }, Qt::QueuedConnection);
    });

    controller_->subscribe_to_backend([this](const std::string& name) {
        const QString text = QString::fromStdString(name);
        QMetaObject::invokeMethod(this, [this, text]() {
            onBackend(text);
        }, Qt::QueuedConnection);
    });

    controller_->subscribe_to_finished([this](const JobResult& result) {
        QMetaObject::invokeMethod(this, [this, result]() {
            onFinished(result);
        }, Qt::QueuedConnection);
    });
}

//==============================================================================
// Settings
//==============================================================================

void TranscriptionBridge::loadSettings() {
    if (!settings_) return;
    const core::AppSettings s = core::load_settings(*settings_);
    ffmpeg_path_ = QString::fromStdString(s.ffmpeg_path);
    ytdlp_path_ = QString::fromStdString(s.ytdlp_path);
    output_dir_ = QString::fromStdString(s.output_dir);
    models_dir_ = QString::fromStdString(s.models_dir);
    theme_ = QString::fromStdString(s.theme);
    if (whisperModels().contains(QString::fromStdString(s.model))) whisper_model_ = QString::fromStdString(s.model);
    if (languages().contains(QString::fromStdString(s.language))) language_ = QString::fromStdString(s.language);
    if (backends().contains(QString::fromStdString(s.backend))) backend_ = QString::fromStdString(s.backend);
}

void TranscriptionBridge::saveSettings() {
    if (!settings_) return;
    core::AppSettings s;
    s.ffmpeg_path = trimmed(ffmpeg_path_).toStdString();
    s.ytdlp_path = trimmed(ytdlp_path_).toStdString();
    s.output_dir = trimmed(output_dir_).toStdString();
    s.models_dir = trimmed(models_dir_).toStdString();
    s.theme = theme_.toStdString();
    s.model = whisper_model_.toStdString();
    s.language = language_.toStdString();
    s.backend = backend_.toStdString();
    core::save_settings(*settings_, s);
}

QString TranscriptionBridge::toLocalPath(const QUrl& url) const {
    if (url.isLocalFile()) return QDir::toNativeSeparators(url.toLocalFile());
    return url.toString();
}

//==============================================================================
// Choices
//==============================================================================

QStringList TranscriptionBridge::languages() const {
    return {"auto", "en", "es", "fr", "de", "it", "pt", "ja", "zh"};
}

QStringList TranscriptionBridge::whisperModels() const {
    return {"tiny", "base", "small", "medium", "large-v3"};
}

QStringList TranscriptionBridge::backends() const {
    return {"auto", "cuda", "gpu", "cpu"};
}

QStringList TranscriptionBridge::themes() const {
    return {"system", "light", "dark"};
}

//==============================================================================
// Property Setters
//==============================================================================

void TranscriptionBridge::setUrl(const QString& value) {
    if (url_ != value) {
        url_ = value;
        emit urlChanged();
    }
}

void TranscriptionBridge::setLanguage(const QString& value) {
    if (language_ != value) {
        language_ = value;
        emit languageChanged();
    }
}

void TranscriptionBridge::setWhisperModel(const QString& value) {
    if (whisper_model_ != value) {
        whisper_model_ = value;
        emit whisperModelChanged();
    }
}

void TranscriptionBridge::setBackend(const QString& value) {
    if (backend_ != value) {
        backend_ = value;
        emit backendChanged();
    }
}

void TranscriptionBridge::setPlaylist(bool value) {
    if (playlist_ != value) {
        playlist_ = value;
        emit playlistChanged();
    }
}

void TranscriptionBridge::setFfmpegPath(const QString& value) {
    if (ffmpeg_path_ != value) {
        ffmpeg_path_ = value;
        emit ffmpegPathChanged();
        saveSettings();
    }
}

void TranscriptionBridge::setYtdlpPath(const QString& value) {
    if (ytdlp_path_ != value) {
        ytdlp_path_ = value;
        emit ytdlpPathChanged();
        saveSettings();
    }
}

void TranscriptionBridge::setOutputDir(const QString& value) {
    if (output_dir_ != value) {
        output_dir_ = value;
        emit outputDirChanged();
        saveSettings();
    }
}

void TranscriptionBridge::setModelsDir(const QString& value) {
    if (models_dir_ != value) {
        models_dir_ = value;
        emit modelsDirChanged();
        saveSettings();
    }
}

void TranscriptionBridge::setTheme(const QString& value) {
    if (theme_ != value && themes().contains(value)) {
        theme_ = value;
        emit themeChanged();
        saveSettings();
    }
}

void TranscriptionBridge::setRunning(bool running) {
    if (is_running_ != running) {
        is_running_ = running;
        emit isRunningChanged();
    }
}

void TranscriptionBridge::setCancelEnabled(bool enabled) {
    if (cancel_enabled_ != enabled) {
        cancel_enabled_ = enabled;
        emit cancelEnabledChanged();
    }
}

void TranscriptionBridge::setProgress(int percent) {
    if (progress_ != percent) {
        progress_ = percent;
        emit progressChanged();
    }
}

void TranscriptionBridge::setBackendName(const QString& name) {
    if (backend_name_ != name) {
        backend_name_ = name;
        emit backendNameChanged();
    }
}

//==============================================================================
// Job Control
//==============================================================================

void TranscriptionBridge::startTranscription() {
    if (is_running_) {
        qWarning() << "Transcription already running!";
        return;
    }

    const QString url = url_.trimmed();
    if (url.isEmpty()) {
        emit warningRequested(QStringLiteral("Missing URL"),
                              QStringLiteral("Please provide a video or playlist URL."));
        return;
    }

    saveSettings();

    JobRequest request;
    request.url = url.toStdString();
    request.language = language_.toStdString();
    request.model_name = whisper_model_.toStdString();
    request.backend = backend_.toStdString();
    request.playlist = playlist_;
    request.ffmpeg_path = trimmed(ffmpeg_path_).toStdString();
    request.ytdlp_path = trimmed(ytdlp_path_).toStdString();
    request.output_dir = trimmed(output_dir_).toStdString();
    request.models_dir = trimmed(models_dir_).toStdString();

    if (!controller_->start(request)) {
        qWarning() << "Failed to start transcription!";
        return;
    }

    setRunning(true);
    setCancelEnabled(true);
    setProgress(0);
    setBackendName(QStringLiteral("detecting..."));
    emit logMessage(QStringLiteral("Starting transcription..."));
    qDebug() << "Transcription started for" << url;
}

void TranscriptionBridge::cancelTranscription() {
    if (!is_running_) {
        return;
    }
    // "Cancellation requested..." arrives through the log callback
    controller_->cancel();
    setCancelEnabled(false);
}

//==============================================================================
// Event Handlers (Convert C++ -> Qt Signals)
//==============================================================================

void TranscriptionBridge::onLog(const QString& line) {
    emit logMessage(line);
}

void TranscriptionBridge::onProgress(const JobProgress& progress) {
    setProgress(progress.percent());
}

void TranscriptionBridge::onBackend(const QString& name) {
    setBackendName(name);
}

void TranscriptionBridge::onFinished(const JobResult& result) {
    const bool success = result.state == JobResult::State::COMPLETED;
    const QString message = QString::fromStdString(result.message);

    setRunning(false);
    setCancelEnabled(false);
    setUrl(QString());
    emit logMessage(QStringLiteral("Transcription %1: %2")
                        .arg(success ? QStringLiteral("completed") : QStringLiteral("stopped"), message));
    emit finished(success, message);
    qDebug() << "Transcription finished:" << message;
}
