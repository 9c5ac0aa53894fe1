// Copyright (c) 2025 Transcriber
// TranscriptionBridge - Qt/QML bridge to TranscriptionController

#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <memory>

class QSettings;

// Forward declarations
namespace app {
    class TranscriptionController;
    struct JobProgress;
    struct JobResult;
    struct PipelineServices;
}

class TranscriptionBridge : public QObject {
    Q_OBJECT

    // Job inputs
    Q_PROPERTY(QString url READ url WRITE setUrl NOTIFY urlChanged)
    Q_PROPERTY(QString language READ language WRITE setLanguage NOTIFY languageChanged)
    Q_PROPERTY(QString whisperModel READ whisperModel WRITE setWhisperModel NOTIFY whisperModelChanged)
    Q_PROPERTY(QString backend READ backend WRITE setBackend NOTIFY backendChanged)
    Q_PROPERTY(bool playlist READ playlist WRITE setPlaylist NOTIFY playlistChanged)

    // Settings tab
    Q_PROPERTY(QString ffmpegPath READ ffmpegPath WRITE setFfmpegPath NOTIFY ffmpegPathChanged)
    Q_PROPERTY(QString ytdlpPath READ ytdlpPath WRITE setYtdlpPath NOTIFY ytdlpPathChanged)
    Q_PROPERTY(QString outputDir READ outputDir WRITE setOutputDir NOTIFY outputDirChanged)
    Q_PROPERTY(QString modelsDir READ modelsDir WRITE setModelsDir NOTIFY modelsDirChanged)
    Q_PROPERTY(QString theme READ theme WRITE setTheme NOTIFY themeChanged)

    // Job state
    Q_PROPERTY(bool isRunning READ isRunning NOTIFY isRunningChanged)
    Q_PROPERTY(bool cancelEnabled READ cancelEnabled NOTIFY cancelEnabledChanged)
    Q_PROPERTY(int progress READ progress NOTIFY progressChanged)
    Q_PROPERTY(QString backendName READ backendName NOTIFY backendNameChanged)

    // Choices
    Q_PROPERTY(QStringList languages READ languages CONSTANT)
    Q_PROPERTY(QStringList whisperModels READ whisperModels CONSTANT)
    Q_PROPERTY(QStringList backends READ backends CONSTANT)
    Q_PROPERTY(QStringList themes READ themes CONSTANT)

public:
    /// Production controller; settings in the platform store
    explicit TranscriptionBridge(QObject* parent = nullptr);

    /// Custom pipeline services and settings store (not owned)
    TranscriptionBridge(app::PipelineServices services, QSettings* settings, QObject* parent = nullptr);

    ~TranscriptionBridge();

    // Property getters
    QString url() const { return url_; }
    QString language() const { return language_; }
    QString whisperModel() const { return whisper_model_; }
    QString backend() const { return backend_; }
    bool playlist() const { return playlist_; }
    QString ffmpegPath() const { return ffmpeg_path_; }
    QString ytdlpPath() const { return ytdlp_path_; }
    QString outputDir() const { return output_dir_; }
    QString modelsDir() const { return models_dir_; }
    QString theme() const { return theme_; }
    bool isRunning() const { return is_running_; }
    bool cancelEnabled() const { return cancel_enabled_; }
    int progress() const { return progress_; }
    QString backendName() const { return backend_name_; }

    QStringList languages() const;
    QStringList whisperModels() const;
    QStringList backends() const;
    QStringList themes() const;

    // Property setters
    void setUrl(const QString& value);
    void setLanguage(const QString& value);
    void setWhisperModel(const QString& value);
    void setBackend(const QString& value);
    void setPlaylist(bool value);
    void setFfmpegPath(const QString& value);
    void setYtdlpPath(const QString& value);
    void setOutputDir(const QString& value);
    void setModelsDir(const QString& value);
    void setTheme(const QString& value);

public slots:
    // Job control
    void startTranscription();
    void cancelTranscription();

    // Persist the current settings
    void saveSettings();

    // File dialogs hand back file:// URLs
    QString toLocalPath(const QUrl& url) const;

signals:
    // Property change notifications
    void urlChanged();
    void languageChanged();
    void whisperModelChanged();
    void backendChanged();
    void playlistChanged();
    void ffmpegPathChanged();
    void ytdlpPathChanged();
    void outputDirChanged();
    void modelsDirChanged();
    void themeChanged();
    void isRunningChanged();
    void cancelEnabledChanged();
    void progressChanged();
    void backendNameChanged();

    // Job events (forwarded from controller)
    void logMessage(QString message);
    void finished(bool success, QString message);

    // Input problem the user must fix
    void warningRequested(QString title, QString message);

private:
    void connectController();
    void loadSettings();

    // Callback handlers (run on the Qt main thread)
    void onLog(const QString& line);
    void onProgress(const app::JobProgress& progress);
    void onBackend(const QString& name);
    void onFinished(const app::JobResult& result);

    void setRunning(bool running);
    void setCancelEnabled(bool enabled);
    void setProgress(int percent);
    void setBackendName(const QString& name);

    // State
    std::unique_ptr<QSettings> owned_settings_;
    QSettings* settings_ = nullptr;
    std::unique_ptr<app::TranscriptionController> controller_;
    bool is_running_ = false;
    bool cancel_enabled_ = false;
    int progress_ = 0;
    QString backend_name_ = "-";

    // Configuration
    QString url_;
    QString language_ = "auto";
    QString whisper_model_ = "base";
    QString backend_ = "auto";
    bool playlist_ = false;
    QString ffmpeg_path_;
    QString ytdlp_path_;
    QString output_dir_;
    QString models_dir_;
    QString theme_ = "system";
};
