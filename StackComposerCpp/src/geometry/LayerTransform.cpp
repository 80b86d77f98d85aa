#include "LayerTransform.h"

#include <algorithm>
#include <cmath>

namespace StackComposer
{
namespace LayerTransform
{

    QRectF pixelFrame(const QPointF &position, const QSizeF &size, const QSizeF &canvasPixelSize,
                      CoordinateOrigin origin)
    {
        const double width = size.width() * canvasPixelSize.width();
        const double height = size.height() * canvasPixelSize.height();
        const double x = position.x() * canvasPixelSize.width() - width / 2.0;

        double y = position.y() * canvasPixelSize.height() - height / 2.0;
        if (origin == CoordinateOrigin::BOTTOM_LEFT)
        {
            // 归一化坐标始终以左上为原点，这里只翻转 y
            y = (1.0 - position.y()) * canvasPixelSize.height() - height / 2.0;
        }

        return QRectF(x, y, width, height);
    }

    QRectF pixelFrame(const MediaLayer &layer, const QSizeF &canvasPixelSize, CoordinateOrigin origin)
    {
        return pixelFrame(layer.position, layer.size, canvasPixelSize, origin);
    }

    FitResult fitTransform(const QSizeF &sourceSize, const QRectF &targetRect, FitMode mode)
    {
        FitResult result;
        if (sourceSize.width() <= 0.0 || sourceSize.height() <= 0.0 ||
            targetRect.width() <= 0.0 || targetRect.height() <= 0.0)
        {
            return result;
        }

        const double scaleX = targetRect.width() / sourceSize.width();
        const double scaleY = targetRect.height() / sourceSize.height();
        result.scale = mode == FitMode::ASPECT_FILL ? std::max(scaleX, scaleY) : std::min(scaleX, scaleY);

        const double scaledWidth = sourceSize.width() * result.scale;
        const double scaledHeight = sourceSize.height() * result.scale;
        result.scaledRect = QRectF(targetRect.center().x() - scaledWidth / 2.0,
                                   targetRect.center().y() - scaledHeight / 2.0,
                                   scaledWidth, scaledHeight);

        if (mode == FitMode::ASPECT_FIT)
        {
            result.destRect = result.scaledRect;
            result.sourceRect = QRectF(QPointF(0.0, 0.0), sourceSize);
        }
        else
        {
            // 只取落在目标矩形内的那一部分源图
            result.destRect = targetRect;
            result.sourceRect = QRectF((targetRect.x() - result.scaledRect.x()) / result.scale,
                                       (targetRect.y() - result.scaledRect.y()) / result.scale,
                                       targetRect.width() / result.scale,
                                       targetRect.height() / result.scale);
        }
        return result;
    }

    QRect toPixelRect(const QRectF &rect)
    {
        const int left = static_cast<int>(std::lround(rect.left()));
        const int top = static_cast<int>(std::lround(rect.top()));
        const int right = static_cast<int>(std::lround(rect.left() + rect.width()));
        const int bottom = static_cast<int>(std::lround(rect.top() + rect.height()));
        return QRect(left, top, right - left, bottom - top);
    }

    FitMode fitModeFromString(const std::string &value)
    {
        return value == "fit" ? FitMode::ASPECT_FIT : FitMode::ASPECT_FILL;
    }

} // namespace LayerTransform
} // namespace StackComposer
