#ifndef EXPORT_TIMELINE_H
#define EXPORT_TIMELINE_H

#include <QColor>
#include <QPointF>
#include <QSize>
#include <QSizeF>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include "../model/MediaItem.h"

namespace StackComposer {

// 时间区间（秒）
struct TimeRange {
    double start = 0.0;
    double duration = 0.0;

    double end() const { return start + duration; }
    bool contains(double t) const { return t >= start && t < end(); }
};

// 按时间取值的音量参数，目前只在 0 时刻设置一次
struct VolumeRamp {
    std::map<double, float> keys;

    void setVolume(float volume, double at) { keys[at] = volume; }

    // 取 t 之前最近的关键帧，t 早于第一个关键帧时取第一个
    float valueAt(double t) const {
        if (keys.empty()) {
            return 1.0f;
        }
        auto it = keys.upper_bound(t);
        if (it == keys.begin()) {
            return it->second;
        }
        return std::prev(it)->second;
    }

    bool isConstant() const { return keys.size() <= 1; }
};

// 一个视频图层对应的视频轨
struct VideoTrackPlan {
    int trackId = 0;
    std::string layerId;
    std::string sourcePath;
    TimeRange range;            // 插入到合成时间线 0 时刻
    double sourceDuration = 0.0;
    double startOffset = 0.0;
    double playbackRate = 1.0;
    bool hasAudio = false;
    int audioTrackId = 0;       // 无音频时为 0
};

// 与视频轨配对的音频轨
struct AudioTrackPlan {
    int trackId = 0;
    std::string layerId;
    std::string sourcePath;
    TimeRange range;
    double startOffset = 0.0;
    double playbackRate = 1.0;
    VolumeRamp volume;
};

// 合成时每个图层的绘制指令
struct LayerInstruction {
    std::string layerId;
    MediaKind kind = MediaKind::IMAGE;
    int order = 0;              // 在合成中的插入顺序
    int zIndex = 0;
    QPointF position{0.5, 0.5};
    QSizeF size{0.4, 0.4};
    float opacity = 1.0f;
    int trackId = 0;            // 视频图层
    std::string imagePath;      // 图片图层
    double imageDuration = 0.0; // 图片图层的显示窗口 [0, imageDuration)
};

// 从合成快照构建的多轨时间线
struct ExportTimeline {
    double totalDuration = 0.0;
    int frameRate = 30;
    QSize renderSize;
    QColor backgroundColor{0x1A, 0x1A, 0x1A};
    std::vector<VideoTrackPlan> videoTracks;
    std::vector<AudioTrackPlan> audioTracks;
    std::vector<LayerInstruction> instructions;

    // [0, totalDuration) 内的帧数
    int64_t frameCount() const {
        if (totalDuration <= 0.0 || frameRate <= 0) {
            return 0;
        }
        return static_cast<int64_t>(std::ceil(totalDuration * frameRate - 1e-9));
    }

    double frameTime(int64_t index) const { return static_cast<double>(index) / frameRate; }

    const VideoTrackPlan *videoTrack(int trackId) const {
        for (const VideoTrackPlan &track : videoTracks) {
            if (track.trackId == trackId) {
                return &track;
            }
        }
        return nullptr;
    }
};

} // namespace StackComposer

#endif // EXPORT_TIMELINE_H
