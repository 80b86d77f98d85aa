#ifndef PROJECT_CONFIG_H
#define PROJECT_CONFIG_H

#include <string>
#include <vector>

#include "AppSettings.h"
#include "ExportSettings.h"

namespace StackComposer {

// 预览配置
struct PreviewConfig {
    int tick_interval_ms = 16;       // 预览刷新间隔
    std::string fit_mode = "fill";   // "fill" 或 "fit"
    int seek_tolerance_ms = 50;      // 各图层跳转允许的偏差
};

// 画布配置
struct CanvasConfig {
    int grid_divisions = 12;
};

// 引擎全局配置
struct EngineConfig {
    AppSettings app;
    ExportSettings export_settings;
    PreviewConfig preview;
    CanvasConfig canvas;
};

// 工程文件里的素材描述
struct MediaConfig {
    std::string id;
    std::string type;             // "video" 或 "image"
    std::string path;
    int width = 0;                // 0 表示由探测结果补齐
    int height = 0;
    double duration = 0.0;        // 视频时长（秒）
    double image_duration = 0.0;  // 图片展示时长（秒）
};

// 工程文件里的图层描述
struct LayerConfig {
    std::string id;
    std::string media_id;
    double x = 0.5;
    double y = 0.5;
    double width = 0.4;
    double height = 0.4;
    int z = 0;
    bool visible = true;
    double opacity = 1.0;
    double volume = 1.0;
    double image_duration = 0.0;  // 0 表示沿用素材设置
    double start_offset = 0.0;
    double rate = 1.0;
};

struct CompositionConfig {
    std::string name = "Untitled";
    std::string canvas = "9:16";
    bool loop = true;
    bool snap_to_grid = false;
    std::vector<LayerConfig> layers;
};

// 工程文件
struct ProjectDocument {
    std::vector<MediaConfig> media;
    CompositionConfig composition;
    std::string output_path;
};

} // namespace StackComposer

#endif // PROJECT_CONFIG_H
