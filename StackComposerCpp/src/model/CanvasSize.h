#ifndef CANVAS_SIZE_H
#define CANVAS_SIZE_H

#include <QSize>
#include <QSizeF>
#include <cstdint>
#include <string>

namespace StackComposer {

// 画布比例
enum class CanvasSize {
    PORTRAIT_9x16,
    LANDSCAPE_16x9,
    SQUARE_1x1,
    PORTRAIT_4x5
};

// 导出分辨率档位
enum class ExportResolution {
    HD_1080,
    UHD_4K
};

// 宽 / 高
double aspectRatio(CanvasSize canvas);

std::string displayName(CanvasSize canvas);
std::string subtitle(CanvasSize canvas);

// 导出像素尺寸，例如 9:16 @ 1080p = 1080x1920
QSize pixelSize(CanvasSize canvas, ExportResolution resolution);

// 在容器内按比例放下画布的最大尺寸
QSizeF fittedSize(CanvasSize canvas, const QSizeF &container);

// 每档的目标视频码率（bps）
int64_t videoBitrate(ExportResolution resolution);

std::string toString(CanvasSize canvas);
std::string toString(ExportResolution resolution);
bool canvasSizeFromString(const std::string &value, CanvasSize &canvas);
bool exportResolutionFromString(const std::string &value, ExportResolution &resolution);

} // namespace StackComposer

#endif // CANVAS_SIZE_H
