#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include <QString>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QFile>
#include "Composition.h"
#include "ProjectConfig.h"

namespace StackComposer
{

    class ConfigLoader
    {
    public:
        ConfigLoader() = default;

        // 引擎配置（settings.json），缺省字段保持默认值
        bool loadEngineConfigFromFile(const QString &filePath, EngineConfig &config);
        bool loadEngineConfigFromString(const QString &jsonString, EngineConfig &config);

        // 工程文件（project.json）
        bool loadProjectFromFile(const QString &filePath, ProjectDocument &project);
        bool loadProjectFromString(const QString &jsonString, ProjectDocument &project);

        // 把工程文件转换为素材库和合成
        bool buildComposition(const ProjectDocument &project, const EngineConfig &config,
                              MediaLibrary &library, Composition &composition);

        // 获取错误信息
        QString errorString() const { return m_errorString; }

    private:
        QString m_errorString;

        bool readRootObject(const QString &jsonString, QJsonObject &root);

        bool parseAppConfig(const QJsonObject &json, AppSettings &app);
        bool parseExportConfig(const QJsonObject &json, ExportSettings &settings);
        bool parsePreviewConfig(const QJsonObject &json, PreviewConfig &preview);
        bool parseCanvasConfig(const QJsonObject &json, CanvasConfig &canvas);

        bool parseMediaConfig(const QJsonObject &json, MediaConfig &media);
        bool parseCompositionConfig(const QJsonObject &json, CompositionConfig &composition);
        bool parseLayerConfig(const QJsonObject &json, LayerConfig &layer);
    };

} // namespace StackComposer

#endif // CONFIG_LOADER_H
