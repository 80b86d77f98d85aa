#include "CanvasSize.h"

namespace StackComposer
{

    double aspectRatio(CanvasSize canvas)
    {
        switch (canvas)
        {
        case CanvasSize::PORTRAIT_9x16:
            return 9.0 / 16.0;
        case CanvasSize::LANDSCAPE_16x9:
            return 16.0 / 9.0;
        case CanvasSize::SQUARE_1x1:
            return 1.0;
        case CanvasSize::PORTRAIT_4x5:
            return 4.0 / 5.0;
        }
        return 1.0;
    }

    std::string displayName(CanvasSize canvas)
    {
        switch (canvas)
        {
        case CanvasSize::PORTRAIT_9x16:
            return "9:16";
        case CanvasSize::LANDSCAPE_16x9:
            return "16:9";
        case CanvasSize::SQUARE_1x1:
            return "1:1";
        case CanvasSize::PORTRAIT_4x5:
            return "4:5";
        }
        return "";
    }

    std::string subtitle(CanvasSize canvas)
    {
        switch (canvas)
        {
        case CanvasSize::PORTRAIT_9x16:
            return "Stories / Reels";
        case CanvasSize::LANDSCAPE_16x9:
            return "YouTube";
        case CanvasSize::SQUARE_1x1:
            return "Square post";
        case CanvasSize::PORTRAIT_4x5:
            return "Portrait post";
        }
        return "";
    }

    QSize pixelSize(CanvasSize canvas, ExportResolution resolution)
    {
        const bool uhd = resolution == ExportResolution::UHD_4K;
        switch (canvas)
        {
        case CanvasSize::PORTRAIT_9x16:
            return uhd ? QSize(2160, 3840) : QSize(1080, 1920);
        case CanvasSize::LANDSCAPE_16x9:
            return uhd ? QSize(3840, 2160) : QSize(1920, 1080);
        case CanvasSize::SQUARE_1x1:
            return uhd ? QSize(2160, 2160) : QSize(1080, 1080);
        case CanvasSize::PORTRAIT_4x5:
            return uhd ? QSize(2160, 2700) : QSize(1080, 1350);
        }
        return QSize();
    }

    QSizeF fittedSize(CanvasSize canvas, const QSizeF &container)
    {
        if (container.width() <= 0.0 || container.height() <= 0.0)
        {
            return QSizeF(0.0, 0.0);
        }

        const double ratio = aspectRatio(canvas);
        if (container.width() / container.height() > ratio)
        {
            // 容器更宽，以高度为准
            return QSizeF(container.height() * ratio, container.height());
        }
        return QSizeF(container.width(), container.width() / ratio);
    }

    int64_t videoBitrate(ExportResolution resolution)
    {
        return resolution == ExportResolution::UHD_4K ? 35000000 : 10000000;
    }

    std::string toString(CanvasSize canvas)
    {
        return displayName(canvas);
    }

    std::string toString(ExportResolution resolution)
    {
        return resolution == ExportResolution::UHD_4K ? "4k" : "1080p";
    }

    bool canvasSizeFromString(const std::string &value, CanvasSize &canvas)
    {
        if (value == "9:16")
            canvas = CanvasSize::PORTRAIT_9x16;
        else if (value == "16:9")
            canvas = CanvasSize::LANDSCAPE_16x9;
        else if (value == "1:1")
            canvas = CanvasSize::SQUARE_1x1;
        else if (value == "4:5")
            canvas = CanvasSize::PORTRAIT_4x5;
        else
            return false;
        return true;
    }

    bool exportResolutionFromString(const std::string &value, ExportResolution &resolution)
    {
        if (value == "1080p")
            resolution = ExportResolution::HD_1080;
        else if (value == "4k" || value == "4K")
            resolution = ExportResolution::UHD_4K;
        else
            return false;
        return true;
    }

} // namespace StackComposer
