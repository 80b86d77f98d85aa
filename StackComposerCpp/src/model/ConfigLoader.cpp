#include "ConfigLoader.h"
#include <algorithm>
#include <QDebug>

namespace StackComposer
{

    namespace
    {
        std::string toStdString(const QJsonValue &value)
        {
            return value.toString().toUtf8().toStdString();
        }

        bool readFile(const QString &filePath, QString &content, QString &error)
        {
            QFile file(filePath);
            if (!file.open(QIODevice::ReadOnly))
            {
                error = QString("无法打开配置文件: %1").arg(filePath);
                return false;
            }

            QByteArray jsonData = file.readAll();
            file.close();
            content = QString::fromUtf8(jsonData);
            return true;
        }
    }

    bool ConfigLoader::loadEngineConfigFromFile(const QString &filePath, EngineConfig &config)
    {
        QString content;
        if (!readFile(filePath, content, m_errorString))
        {
            return false;
        }
        return loadEngineConfigFromString(content, config);
    }

    bool ConfigLoader::loadEngineConfigFromString(const QString &jsonString, EngineConfig &config)
    {
        QJsonObject root;
        if (!readRootObject(jsonString, root))
        {
            return false;
        }

        if (root.contains("app") && root["app"].isObject())
        {
            if (!parseAppConfig(root["app"].toObject(), config.app))
            {
                return false;
            }
        }

        if (root.contains("export") && root["export"].isObject())
        {
            if (!parseExportConfig(root["export"].toObject(), config.export_settings))
            {
                return false;
            }
        }

        if (root.contains("preview") && root["preview"].isObject())
        {
            if (!parsePreviewConfig(root["preview"].toObject(), config.preview))
            {
                return false;
            }
        }

        if (root.contains("canvas") && root["canvas"].isObject())
        {
            if (!parseCanvasConfig(root["canvas"].toObject(), config.canvas))
            {
                return false;
            }
        }

        return true;
    }

    bool ConfigLoader::loadProjectFromFile(const QString &filePath, ProjectDocument &project)
    {
        QString content;
        if (!readFile(filePath, content, m_errorString))
        {
            return false;
        }
        return loadProjectFromString(content, project);
    }

    bool ConfigLoader::loadProjectFromString(const QString &jsonString, ProjectDocument &project)
    {
        QJsonObject root;
        if (!readRootObject(jsonString, root))
        {
            return false;
        }

        if (root.contains("media") && root["media"].isArray())
        {
            project.media.clear();
            for (const QJsonValue &mediaValue : root["media"].toArray())
            {
                if (!mediaValue.isObject())
                {
                    continue;
                }
                MediaConfig media;
                if (!parseMediaConfig(mediaValue.toObject(), media))
                {
                    return false;
                }
                project.media.push_back(media);
            }
        }

        if (root.contains("composition") && root["composition"].isObject())
        {
            if (!parseCompositionConfig(root["composition"].toObject(), project.composition))
            {
                return false;
            }
        }

        if (root.contains("output_path") && root["output_path"].isString())
        {
            project.output_path = toStdString(root["output_path"]);
        }

        return true;
    }

    bool ConfigLoader::buildComposition(const ProjectDocument &project, const EngineConfig &config,
                                        MediaLibrary &library, Composition &composition)
    {
        for (const MediaConfig &media : project.media)
        {
            const QSize size(media.width, media.height);
            if (media.type == "video")
            {
                library.add(MediaItem::video(media.id, media.path, size, media.duration));
            }
            else
            {
                const double duration = media.image_duration > 0.0 ? media.image_duration : config.app.defaultImageDuration;
                library.add(MediaItem::image(media.id, media.path, size, duration));
            }
        }

        composition = Composition(config.app, project.composition.name);
        CanvasSize canvas = config.app.defaultCanvas;
        if (!canvasSizeFromString(project.composition.canvas, canvas))
        {
            m_errorString = QString("未知的画布比例: %1").arg(QString::fromStdString(project.composition.canvas));
            return false;
        }
        composition.setCanvasSize(canvas);
        composition.setLoopMedia(project.composition.loop);
        composition.setGridDivisions(config.canvas.grid_divisions);

        for (const LayerConfig &layerConfig : project.composition.layers)
        {
            const MediaItem *item = library.find(layerConfig.media_id);
            if (!item)
            {
                m_errorString = QString("图层 %1 引用了不存在的素材: %2")
                                    .arg(QString::fromStdString(layerConfig.id))
                                    .arg(QString::fromStdString(layerConfig.media_id));
                return false;
            }

            MediaLayer layer;
            layer.id = layerConfig.id;
            layer.mediaId = layerConfig.media_id;
            layer.position = QPointF(layerConfig.x, layerConfig.y);
            layer.size = QSizeF(layerConfig.width, layerConfig.height);
            layer.zIndex = layerConfig.z;
            layer.visible = layerConfig.visible;
            layer.opacity = static_cast<float>(std::min(std::max(layerConfig.opacity, 0.0), 1.0));
            if (item->isVideo())
            {
                VideoTiming timing;
                timing.startOffset = std::max(0.0, layerConfig.start_offset);
                timing.playbackRate = layerConfig.rate > 0.0 ? layerConfig.rate : 1.0;
                timing.volume = static_cast<float>(std::min(std::max(layerConfig.volume, 0.0), 1.0));
                layer.timing = timing;
            }
            else
            {
                const double duration = layerConfig.image_duration > 0.0 ? layerConfig.image_duration : item->imageDuration;
                layer.timing = ImageTiming{clampImageDuration(duration)};
            }

            if (!composition.addLayer(layer, library))
            {
                m_errorString = QString::fromStdString(composition.errorString());
                return false;
            }
        }

        // 先加图层再打开吸附，避免改写文件中的位置
        composition.setSnapToGrid(project.composition.snap_to_grid);
        return true;
    }

    bool ConfigLoader::readRootObject(const QString &jsonString, QJsonObject &root)
    {
        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(jsonString.toUtf8(), &parseError);

        if (parseError.error != QJsonParseError::NoError)
        {
            m_errorString = QString("JSON解析错误: %1").arg(parseError.errorString());
            return false;
        }

        if (!doc.isObject())
        {
            m_errorString = "JSON根元素不是对象";
            return false;
        }

        root = doc.object();
        return true;
    }

    bool ConfigLoader::parseAppConfig(const QJsonObject &json, AppSettings &app)
    {
        if (json.contains("default_image_duration") && json["default_image_duration"].isDouble())
        {
            app.defaultImageDuration = clampImageDuration(json["default_image_duration"].toDouble());
        }

        if (json.contains("default_canvas") && json["default_canvas"].isString())
        {
            if (!canvasSizeFromString(toStdString(json["default_canvas"]), app.defaultCanvas))
            {
                m_errorString = QString("未知的画布比例: %1").arg(json["default_canvas"].toString());
                return false;
            }
        }

        if (json.contains("loop_media") && json["loop_media"].isBool())
        {
            app.loopMediaByDefault = json["loop_media"].toBool();
        }

        return true;
    }

    bool ConfigLoader::parseExportConfig(const QJsonObject &json, ExportSettings &settings)
    {
        if (json.contains("resolution") && json["resolution"].isString())
        {
            if (!exportResolutionFromString(toStdString(json["resolution"]), settings.resolution))
            {
                m_errorString = QString("未知的导出分辨率: %1").arg(json["resolution"].toString());
                return false;
            }
        }

        if (json.contains("fps") && json["fps"].isDouble())
        {
            settings.frameRate = json["fps"].toInt();
        }

        if (json.contains("video_codec") && json["video_codec"].isString())
        {
            settings.videoCodec = toStdString(json["video_codec"]);
        }

        if (json.contains("audio_codec") && json["audio_codec"].isString())
        {
            settings.audioCodec = toStdString(json["audio_codec"]);
        }

        if (json.contains("audio_bitrate") && json["audio_bitrate"].isString())
        {
            settings.audioBitrate = toStdString(json["audio_bitrate"]);
        }

        if (json.contains("preset") && json["preset"].isString())
        {
            settings.preset = toStdString(json["preset"]);
        }

        if (json.contains("crf") && json["crf"].isDouble())
        {
            settings.crf = json["crf"].toInt();
        }

        if (json.contains("container") && json["container"].isString())
        {
            settings.container = toStdString(json["container"]);
        }

        if (json.contains("background_color") && json["background_color"].isString())
        {
            settings.backgroundColor = toStdString(json["background_color"]);
        }

        if (json.contains("empty_duration") && json["empty_duration"].isDouble())
        {
            settings.emptyCompositionDuration = json["empty_duration"].toDouble();
        }

        if (json.contains("progress_interval_ms") && json["progress_interval_ms"].isDouble())
        {
            settings.progressIntervalMs = json["progress_interval_ms"].toInt();
        }

        std::string error;
        if (!settings.validate(error))
        {
            m_errorString = QString("导出配置无效: %1").arg(QString::fromStdString(error));
            return false;
        }

        return true;
    }

    bool ConfigLoader::parsePreviewConfig(const QJsonObject &json, PreviewConfig &preview)
    {
        if (json.contains("tick_interval_ms") && json["tick_interval_ms"].isDouble())
        {
            preview.tick_interval_ms = std::max(1, json["tick_interval_ms"].toInt());
        }

        if (json.contains("fit_mode") && json["fit_mode"].isString())
        {
            const QString mode = json["fit_mode"].toString();
            if (mode != "fill" && mode != "fit")
            {
                m_errorString = QString("未知的适配模式: %1").arg(mode);
                return false;
            }
            preview.fit_mode = mode.toStdString();
        }

        if (json.contains("seek_tolerance_ms") && json["seek_tolerance_ms"].isDouble())
        {
            preview.seek_tolerance_ms = std::max(0, json["seek_tolerance_ms"].toInt());
        }

        return true;
    }

    bool ConfigLoader::parseCanvasConfig(const QJsonObject &json, CanvasConfig &canvas)
    {
        if (json.contains("grid_divisions") && json["grid_divisions"].isDouble())
        {
            canvas.grid_divisions = std::max(1, json["grid_divisions"].toInt());
        }
        return true;
    }

    bool ConfigLoader::parseMediaConfig(const QJsonObject &json, MediaConfig &media)
    {
        if (!json.contains("id") || !json["id"].isString())
        {
            m_errorString = "素材缺少 id";
            return false;
        }
        media.id = toStdString(json["id"]);

        if (json.contains("type") && json["type"].isString())
        {
            media.type = toStdString(json["type"]);
        }
        if (media.type != "video" && media.type != "image")
        {
            m_errorString = QString("素材 %1 的类型无效: %2")
                                .arg(QString::fromStdString(media.id))
                                .arg(QString::fromStdString(media.type));
            return false;
        }

        if (json.contains("path") && json["path"].isString())
        {
            media.path = toStdString(json["path"]);
        }

        if (json.contains("width") && json["width"].isDouble())
        {
            media.width = json["width"].toInt();
        }

        if (json.contains("height") && json["height"].isDouble())
        {
            media.height = json["height"].toInt();
        }

        if (json.contains("duration") && json["duration"].isDouble())
        {
            media.duration = json["duration"].toDouble();
        }

        if (json.contains("image_duration") && json["image_duration"].isDouble())
        {
            media.image_duration = json["image_duration"].toDouble();
        }

        return true;
    }

    bool ConfigLoader::parseCompositionConfig(const QJsonObject &json, CompositionConfig &composition)
    {
        if (json.contains("name") && json["name"].isString())
        {
            composition.name = toStdString(json["name"]);
        }

        if (json.contains("canvas") && json["canvas"].isString())
        {
            composition.canvas = toStdString(json["canvas"]);
        }

        if (json.contains("loop") && json["loop"].isBool())
        {
            composition.loop = json["loop"].toBool();
        }

        if (json.contains("snap_to_grid") && json["snap_to_grid"].isBool())
        {
            composition.snap_to_grid = json["snap_to_grid"].toBool();
        }

        if (json.contains("layers") && json["layers"].isArray())
        {
            composition.layers.clear();
            int index = 0;
            for (const QJsonValue &layerValue : json["layers"].toArray())
            {
                if (!layerValue.isObject())
                {
                    continue;
                }
                LayerConfig layer;
                layer.z = index; // 未指定 z 时按数组顺序
                if (!parseLayerConfig(layerValue.toObject(), layer))
                {
                    return false;
                }
                if (layer.id.empty())
                {
                    layer.id = "layer-" + std::to_string(index + 1);
                }
                composition.layers.push_back(layer);
                index++;
            }
        }

        return true;
    }

    bool ConfigLoader::parseLayerConfig(const QJsonObject &json, LayerConfig &layer)
    {
        if (json.contains("id") && json["id"].isString())
        {
            layer.id = toStdString(json["id"]);
        }

        if (!json.contains("media_id") || !json["media_id"].isString())
        {
            m_errorString = "图层缺少 media_id";
            return false;
        }
        layer.media_id = toStdString(json["media_id"]);

        if (json.contains("x") && json["x"].isDouble())
        {
            layer.x = json["x"].toDouble();
        }

        if (json.contains("y") && json["y"].isDouble())
        {
            layer.y = json["y"].toDouble();
        }

        if (json.contains("width") && json["width"].isDouble())
        {
            layer.width = json["width"].toDouble();
        }

        if (json.contains("height") && json["height"].isDouble())
        {
            layer.height = json["height"].toDouble();
        }

        if (layer.width <= 0.0 || layer.height <= 0.0)
        {
            m_errorString = QString("图层 %1 的尺寸必须大于 0").arg(QString::fromStdString(layer.id));
            return false;
        }

        if (json.contains("z") && json["z"].isDouble())
        {
            layer.z = json["z"].toInt();
        }

        if (json.contains("visible") && json["visible"].isBool())
        {
            layer.visible = json["visible"].toBool();
        }

        if (json.contains("opacity") && json["opacity"].isDouble())
        {
            layer.opacity = json["opacity"].toDouble();
        }

        if (json.contains("volume") && json["volume"].isDouble())
        {
            layer.volume = json["volume"].toDouble();
        }

        if (json.contains("image_duration") && json["image_duration"].isDouble())
        {
            layer.image_duration = json["image_duration"].toDouble();
        }

        if (json.contains("start_offset") && json["start_offset"].isDouble())
        {
            layer.start_offset = json["start_offset"].toDouble();
        }

        if (json.contains("rate") && json["rate"].isDouble())
        {
            layer.rate = json["rate"].toDouble();
        }

        return true;
    }

} // namespace StackComposer
