#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTimer>
#include <string>
#include "model/ConfigLoader.h"
#include "model/ProjectConfig.h"
#include "decoder/MediaProbe.h"
#include "engine/ExportService.h"

// 使用命名空间
using namespace StackComposer;

// 命令行导出工具：读取工程文件，导出为视频
class StackExportTool
{
public:
    bool prepare(const QString &projectPath, const QString &settingsPath, const QString &outputPath,
                 const QString &copyPath, const QString &resolution)
    {
        ConfigLoader loader;

        if (!settingsPath.isEmpty() && !loader.loadEngineConfigFromFile(settingsPath, m_config))
        {
            qWarning() << "配置文件加载失败:" << loader.errorString();
            return false;
        }

        if (!resolution.isEmpty() && !exportResolutionFromString(resolution.toStdString(), m_config.export_settings.resolution))
        {
            qWarning() << "未知的导出分辨率:" << resolution;
            return false;
        }

        ProjectDocument project;
        if (!loader.loadProjectFromFile(projectPath, project))
        {
            qWarning() << "工程文件加载失败:" << loader.errorString();
            return false;
        }

        probeMedia(project);

        if (!loader.buildComposition(project, m_config, m_library, m_composition))
        {
            qWarning() << "工程文件无效:" << loader.errorString();
            return false;
        }

        m_destination = outputPath.isEmpty() ? project.output_path : outputPath.toStdString();
        m_copyDestination = copyPath.toStdString();
        printProjectInfo();
        return true;
    }

    void start(QCoreApplication &app)
    {
        // 直接渲染到目标路径，未指定时写入临时目录
        std::shared_ptr<IExportSink> sink;
        if (!m_copyDestination.empty())
        {
            sink = std::make_shared<FileExportSink>(m_copyDestination);
        }

        m_service = std::make_unique<ExportService>(ExportDependencies::ffmpeg(sink));

        std::string error;
        m_session = m_service->beginExport(m_composition, m_library, m_config.export_settings, m_destination, error);
        if (!m_session)
        {
            qWarning() << "无法开始导出:" << QString::fromStdString(error);
            app.exit(1);
            return;
        }

        QObject::connect(m_session.get(), &ExportSession::progressChanged, [](double progress) {
            qDebug() << "合成进度: " << static_cast<int>(progress * 100) << "%";
        });
        QObject::connect(m_session.get(), &ExportSession::completed, &app, [&app](const QString &path) {
            qDebug() << "导出成功! 输出文件:" << path;
            app.exit(0);
        });
        QObject::connect(m_session.get(), &ExportSession::failed, &app, [&app](const QString &reason) {
            qWarning() << "导出失败:" << reason;
            app.exit(1);
        });
        QObject::connect(m_session.get(), &ExportSession::cancelled, &app, [&app]() {
            qWarning() << "导出已取消";
            app.exit(2);
        });

        // 连接信号之前就已结束的情况
        if (m_session->isTerminal())
        {
            app.exit(m_session->state() == ExportState::COMPLETED ? 0 : 1);
        }
    }

private:
    // 补齐工程文件中缺省的尺寸与时长
    void probeMedia(ProjectDocument &project)
    {
        MediaProbe probe;
        for (MediaConfig &media : project.media)
        {
            if (media.width > 0 && media.height > 0 && (media.type != "video" || media.duration > 0.0))
            {
                continue;
            }

            MediaProbeInfo info;
            std::string error;
            if (!probe.probe(media.path, info, error))
            {
                qWarning() << "无法探测素材" << QString::fromStdString(media.id) << ":" << QString::fromStdString(error);
                continue;
            }
            if (media.width <= 0 || media.height <= 0)
            {
                media.width = info.size.width();
                media.height = info.size.height();
            }
            if (media.type == "video" && media.duration <= 0.0)
            {
                media.duration = info.duration;
            }
        }
    }

    void printProjectInfo()
    {
        const ExportSettings &settings = m_config.export_settings;
        const QSize size = settings.renderSize(m_composition.canvasSize());
        const double duration = m_composition.effectiveDuration(m_library);

        qDebug() << "项目信息:";
        qDebug() << "  名称:" << QString::fromStdString(m_composition.name());
        qDebug() << "  画布:" << QString::fromStdString(displayName(m_composition.canvasSize()))
                 << "(" << QString::fromStdString(subtitle(m_composition.canvasSize())) << ")";
        qDebug() << "  分辨率:" << size.width() << "x" << size.height();
        qDebug() << "  帧率:" << settings.frameRate;
        qDebug() << "  时长:" << QString::fromStdString(formatDisplayDuration(duration));
        qDebug() << "  图层数量:" << m_composition.layerCount();
        qDebug() << "  预计大小:" << settings.estimatedFileSize(duration) / (1024 * 1024) << "MB";
    }

    EngineConfig m_config;
    MediaLibrary m_library;
    Composition m_composition;
    std::string m_destination;
    std::string m_copyDestination;
    std::unique_ptr<ExportService> m_service;
    std::unique_ptr<ExportSession> m_session;
};

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("stack_export");
    app.setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("把 Stack 工程导出为视频文件");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("project", "工程文件 (project.json)");
    QCommandLineOption settingsOption("settings", "引擎配置文件", "settings.json");
    QCommandLineOption outputOption("output", "输出文件路径", "file");
    QCommandLineOption copyOption("copy-to", "导出完成后另存一份到该路径", "file");
    QCommandLineOption resolutionOption("resolution", "导出分辨率 (1080p / 4k)", "resolution");
    parser.addOption(settingsOption);
    parser.addOption(outputOption);
    parser.addOption(copyOption);
    parser.addOption(resolutionOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1)
    {
        parser.showHelp(1);
    }

    StackExportTool tool;
    if (!tool.prepare(positional.first(), parser.value(settingsOption), parser.value(outputOption),
                      parser.value(copyOption), parser.value(resolutionOption)))
    {
        return 1;
    }

    QTimer::singleShot(0, &app, [&tool, &app]() { tool.start(app); });
    return app.exec();
}
