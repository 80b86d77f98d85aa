#ifndef LAYER_TRANSFORM_H
#define LAYER_TRANSFORM_H

#include <QRect>
#include <QRectF>
#include <QSizeF>

#include "../model/MediaLayer.h"

namespace StackComposer
{

    // 素材放入图层矩形的方式
    enum class FitMode
    {
        ASPECT_FIT,   // 完整显示，可能留边
        ASPECT_FILL   // 铺满矩形，超出部分裁掉
    };

    // 像素坐标系原点
    enum class CoordinateOrigin
    {
        TOP_LEFT,
        BOTTOM_LEFT
    };

    struct FitResult
    {
        QRectF sourceRect;  // 源图中参与绘制的区域（源像素）
        QRectF destRect;    // 实际绘制的区域（画布像素）
        QRectF scaledRect;  // 源图整体缩放后的位置，fill 时会超出 destRect
        double scale = 0.0;

        bool isEmpty() const { return scale <= 0.0 || destRect.isEmpty(); }
    };

    namespace LayerTransform
    {
        // 归一化中心点/尺寸 -> 像素矩形，不做任何裁剪
        QRectF pixelFrame(const QPointF &position, const QSizeF &size, const QSizeF &canvasPixelSize,
                          CoordinateOrigin origin = CoordinateOrigin::TOP_LEFT);

        QRectF pixelFrame(const MediaLayer &layer, const QSizeF &canvasPixelSize,
                          CoordinateOrigin origin = CoordinateOrigin::TOP_LEFT);

        // 等比缩放源图到目标矩形，居中
        FitResult fitTransform(const QSizeF &sourceSize, const QRectF &targetRect, FitMode mode);

        // 四舍五入到整像素边界
        QRect toPixelRect(const QRectF &rect);

        FitMode fitModeFromString(const std::string &value);
    }

} // namespace StackComposer

#endif // LAYER_TRANSFORM_H
