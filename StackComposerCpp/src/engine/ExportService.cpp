#include "ExportService.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

#include "../decoder/FrameSources.h"
#include "../decoder/MediaProbe.h"
#include "RenderEngine.h"

namespace StackComposer
{

    ExportDependencies ExportDependencies::ffmpeg(std::shared_ptr<IExportSink> sink)
    {
        ExportDependencies dependencies;
        dependencies.probe = std::make_shared<MediaProbe>();
        dependencies.sources = std::make_shared<FFmpegFrameSourceFactory>();
        dependencies.encoderFactory = []() -> std::unique_ptr<IFrameEncoder> {
            return std::make_unique<RenderEngine>();
        };
        dependencies.sink = std::move(sink);
        return dependencies;
    }

    ExportService::ExportService(ExportDependencies dependencies)
        : m_dependencies(std::move(dependencies))
    {
    }

    std::unique_ptr<ExportSession> ExportService::beginExport(const Composition &composition, const MediaLibrary &library,
                                                              const ExportSettings &settings, const std::string &outputPath,
                                                              std::string &error)
    {
        if (hasActiveExport())
        {
            error = "已有导出任务正在进行";
            qWarning() << QString::fromStdString(error);
            return nullptr;
        }

        auto session = std::make_unique<ExportSession>(m_dependencies);
        if (!session->start(composition.snapshot(), library, settings, outputPath))
        {
            error = session->errorString();
            return nullptr;
        }

        m_active = session.get();
        return session;
    }

    bool ExportService::hasActiveExport() const
    {
        return !m_active.isNull() && m_active->isActive();
    }

    void ExportService::cancelActiveExport()
    {
        if (!m_active.isNull())
        {
            m_active->cancel();
        }
    }

    FileExportSink::FileExportSink(const std::string &destination)
        : m_destination(destination)
    {
    }

    bool FileExportSink::save(const std::string &filePath, std::string &error)
    {
        const QString source = QString::fromStdString(filePath);
        const QString destination = QString::fromStdString(m_destination);
        if (QFileInfo(source).absoluteFilePath() == QFileInfo(destination).absoluteFilePath())
        {
            return true;
        }

        if (QFile::exists(destination) && !QFile::remove(destination))
        {
            error = "无法覆盖已存在的文件: " + m_destination;
            return false;
        }

        if (!QFile::copy(source, destination))
        {
            error = "无法复制到 " + m_destination;
            return false;
        }

        qDebug() << "已保存导出文件到:" << destination;
        return true;
    }

} // namespace StackComposer
