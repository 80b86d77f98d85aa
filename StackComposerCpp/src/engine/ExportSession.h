#ifndef EXPORT_SESSION_H
#define EXPORT_SESSION_H

#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QThread>
#include <QTimer>
#include <atomic>
#include <climits>
#include <functional>
#include <memory>
#include <string>

#include "../model/Composition.h"
#include "../model/ExportSettings.h"
#include "CancellationToken.h"
#include "ExportError.h"
#include "ExportInterfaces.h"

namespace StackComposer
{

    // Idle -> Building -> Rendering -> {Completed | Failed | Cancelled}
    enum class ExportState
    {
        IDLE,
        BUILDING,
        RENDERING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    std::string toString(ExportState state);

    // 导出所需的外部协作者
    struct ExportDependencies
    {
        std::shared_ptr<IMediaProbe> probe;
        std::shared_ptr<IFrameSourceFactory> sources;
        std::function<std::unique_ptr<IFrameEncoder>()> encoderFactory;
        std::shared_ptr<IExportSink> sink;  // 可为空

        // FFmpeg 实现
        static ExportDependencies ffmpeg(std::shared_ptr<IExportSink> sink = nullptr);
    };

    // 一次导出任务，在独立线程上构建时间线并渲染
    class ExportSession : public QObject
    {
        Q_OBJECT

    public:
        explicit ExportSession(ExportDependencies dependencies, QObject *parent = nullptr);
        ~ExportSession() override;

        // 仅在 IDLE 状态下可调用；outputPath 为空时写到临时目录
        bool start(CompositionSnapshot composition, const MediaLibrary &library,
                   const ExportSettings &settings, const std::string &outputPath = std::string());

        // BUILDING / RENDERING 时有效
        void cancel();

        // 终止状态回到 IDLE
        bool reset();

        bool waitForFinished(unsigned long msecs = ULONG_MAX);

        ExportState state() const { return m_state.load(); }
        bool isTerminal() const;
        bool isActive() const;

        // 可在任意线程读取
        double progress() const { return m_progress.value(); }

        ExportError error() const;
        std::string errorString() const { return error().reason; }
        std::string outputPath() const;

        // <临时目录>/Stack_<时间戳>.mov
        static std::string defaultOutputPath(const ExportSettings &settings);

    signals:
        void stateChanged(StackComposer::ExportState state);
        void progressChanged(double progress);
        void completed(const QString &outputPath);
        void failed(const QString &reason);
        void cancelled();

    private slots:
        void onProgressTimer();

    private:
        friend class ExportWorker;

        void runExport();
        void setState(ExportState state);
        void finish(ExportState state, const ExportError &error);

        ExportDependencies m_dependencies;
        std::unique_ptr<QThread> m_worker;
        QTimer m_progressTimer;
        double m_lastReportedProgress = -1.0;

        std::atomic<ExportState> m_state{ExportState::IDLE};
        ExportProgress m_progress;
        CancellationToken m_token;

        mutable QMutex m_mutex;
        ExportError m_error;
        std::string m_outputPath;

        CompositionSnapshot m_composition;
        MediaLibrary m_library;
        ExportSettings m_settings;
    };

} // namespace StackComposer

Q_DECLARE_METATYPE(StackComposer::ExportState)

#endif // EXPORT_SESSION_H
