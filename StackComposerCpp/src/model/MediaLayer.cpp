#include "MediaLayer.h"

#include <QRandomGenerator>
#include <QUuid>

namespace StackComposer
{

    namespace
    {
        constexpr double kDefaultLayerWidth = 0.4;
        constexpr double kPositionJitter = 0.1;

        struct LayerKindVisitor
        {
            MediaKind operator()(const VideoTiming &) const { return MediaKind::VIDEO; }
            MediaKind operator()(const ImageTiming &) const { return MediaKind::IMAGE; }
        };

        struct LayerDurationVisitor
        {
            const MediaItem *item;

            double operator()(const VideoTiming &) const
            {
                return item ? item->videoDuration : 0.0;
            }

            double operator()(const ImageTiming &timing) const
            {
                return item ? timing.displayDuration : 0.0;
            }
        };

        double jitter()
        {
            return QRandomGenerator::global()->bounded(2.0 * kPositionJitter) - kPositionJitter;
        }
    }

    MediaKind MediaLayer::kind() const
    {
        return std::visit(LayerKindVisitor{}, timing);
    }

    float MediaLayer::audioVolume() const
    {
        const VideoTiming *video = videoTiming();
        return video ? video->volume : 0.0f;
    }

    double MediaLayer::contentDuration(const MediaItem *item) const
    {
        return std::visit(LayerDurationVisitor{item}, timing);
    }

    bool MediaLayer::isValid() const
    {
        return !id.empty() && !mediaId.empty() && size.width() > 0.0 && size.height() > 0.0;
    }

    MediaLayer MediaLayer::fromMedia(const MediaItem &item, int zIndex, const AppSettings &settings)
    {
        MediaLayer layer;
        layer.id = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
        layer.mediaId = item.id;
        layer.zIndex = zIndex;

        const double aspect = item.aspectRatio() > 0.0 ? item.aspectRatio() : 1.0;
        layer.size = QSizeF(kDefaultLayerWidth, kDefaultLayerWidth / aspect);
        layer.position = QPointF(0.5 + jitter(), 0.5 + jitter());

        if (item.isVideo())
        {
            layer.timing = VideoTiming{};
        }
        else
        {
            // 素材自身的展示时长优先，没有时用偏好设置
            const double duration = item.imageDuration > 0.0 ? item.imageDuration : settings.defaultImageDuration;
            layer.timing = ImageTiming{clampImageDuration(duration)};
        }
        return layer;
    }

} // namespace StackComposer
