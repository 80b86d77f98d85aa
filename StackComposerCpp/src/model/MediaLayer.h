#ifndef MEDIA_LAYER_H
#define MEDIA_LAYER_H

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <string>
#include <variant>

#include "AppSettings.h"
#include "MediaItem.h"

namespace StackComposer {

// 视频图层的时间与音频属性
struct VideoTiming {
    double startOffset = 0.0;   // 素材内起始偏移（秒）
    double playbackRate = 1.0;
    float volume = 1.0f;        // 0.0-1.0
};

// 图片图层的展示时长
struct ImageTiming {
    double displayDuration = 1.0;  // 秒
};

// 由素材类型决定，二者只能有其一
using LayerTiming = std::variant<VideoTiming, ImageTiming>;

// 画布上的一个图层，位置和尺寸都是画布归一化坐标
struct MediaLayer {
    std::string id;
    std::string mediaId;
    QPointF position{0.5, 0.5};  // 中心点
    QSizeF size{0.4, 0.4};
    int zIndex = 0;
    bool visible = true;
    float opacity = 1.0f;
    LayerTiming timing = ImageTiming{};

    MediaKind kind() const;
    bool isVideo() const { return kind() == MediaKind::VIDEO; }
    bool isImage() const { return kind() == MediaKind::IMAGE; }

    const VideoTiming *videoTiming() const { return std::get_if<VideoTiming>(&timing); }
    VideoTiming *videoTiming() { return std::get_if<VideoTiming>(&timing); }
    const ImageTiming *imageTiming() const { return std::get_if<ImageTiming>(&timing); }
    ImageTiming *imageTiming() { return std::get_if<ImageTiming>(&timing); }

    // 图片图层恒为 0
    float audioVolume() const;
    bool isMuted() const { return audioVolume() <= 0.0f; }

    // 参与合成时长计算的时长，item 为空时返回 0
    double contentDuration(const MediaItem *item) const;

    bool isValid() const;

    // 新图层默认居中，宽 0.4，高按素材比例，带少量随机偏移
    static MediaLayer fromMedia(const MediaItem &item, int zIndex, const AppSettings &settings);
};

} // namespace StackComposer

#endif // MEDIA_LAYER_H
