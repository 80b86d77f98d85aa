#ifndef EXPORT_SERVICE_H
#define EXPORT_SERVICE_H

#include <QPointer>
#include <memory>
#include <string>

#include "ExportSession.h"

namespace StackComposer
{

    // 创建导出会话，同一时间只允许一个会话处于进行中
    class ExportService
    {
    public:
        explicit ExportService(ExportDependencies dependencies);

        // 失败时返回空指针并写入 error
        std::unique_ptr<ExportSession> beginExport(const Composition &composition, const MediaLibrary &library,
                                                   const ExportSettings &settings, const std::string &outputPath,
                                                   std::string &error);

        bool hasActiveExport() const;
        void cancelActiveExport();

    private:
        ExportDependencies m_dependencies;
        QPointer<ExportSession> m_active;
    };

    // 把导出结果复制到指定位置
    class FileExportSink : public IExportSink
    {
    public:
        explicit FileExportSink(const std::string &destination);
        bool save(const std::string &filePath, std::string &error) override;

    private:
        std::string m_destination;
    };

} // namespace StackComposer

#endif // EXPORT_SERVICE_H
