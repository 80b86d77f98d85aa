#ifndef EXPORT_SETTINGS_H
#define EXPORT_SETTINGS_H

#include <QSize>
#include <cstdint>
#include <string>

#include "CanvasSize.h"

namespace StackComposer {

// 导出参数
struct ExportSettings {
    ExportResolution resolution = ExportResolution::HD_1080;
    int frameRate = 30;
    std::string videoCodec = "libx264";
    std::string audioCodec = "aac";
    std::string audioBitrate = "128k";
    std::string preset = "medium";
    int crf = 20;
    std::string container = "mov";
    std::string backgroundColor = "#1A1A1A";
    double emptyCompositionDuration = 1.0;  // 没有图层时输出的纯背景时长（秒）
    int progressIntervalMs = 100;

    int64_t targetBitrate() const { return videoBitrate(resolution); }

    // 码率 * 时长 / 8
    int64_t estimatedFileSize(double durationSeconds) const;

    QSize renderSize(CanvasSize canvas) const { return pixelSize(canvas, resolution); }

    // 文件扩展名
    std::string fileExtension() const;

    // 检查配置是否可用于导出
    bool validate(std::string &error) const;
};

} // namespace StackComposer

#endif // EXPORT_SETTINGS_H
