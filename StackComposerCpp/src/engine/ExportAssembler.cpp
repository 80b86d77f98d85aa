#include "ExportAssembler.h"

#include <QDebug>
#include <algorithm>

namespace StackComposer
{

    ExportAssembler::ExportAssembler(IMediaProbe &probe)
        : m_probe(probe)
    {
    }

    bool ExportAssembler::build(const Composition &composition, const MediaLibrary &library,
                                const ExportSettings &settings, ExportTimeline &timeline)
    {
        m_error = ExportError();
        m_skippedLayers.clear();
        m_nextTrackId = 1;
        timeline = ExportTimeline();

        std::string settingsError;
        if (!settings.validate(settingsError))
        {
            m_error = ExportError::make(ExportErrorKind::COMPOSITION_FAILED, "导出设置无效: " + settingsError);
            return false;
        }

        timeline.frameRate = settings.frameRate;
        timeline.renderSize = settings.renderSize(composition.canvasSize());
        timeline.backgroundColor = QColor(QString::fromStdString(settings.backgroundColor));
        if (timeline.renderSize.isEmpty())
        {
            m_error = ExportError::make(ExportErrorKind::COMPOSITION_FAILED, "导出尺寸无效");
            return false;
        }

        // 已封顶的总时长，没有图层时输出一段纯背景
        timeline.totalDuration = composition.effectiveDuration(library);
        if (composition.isEmpty() || timeline.totalDuration <= 0.0)
        {
            timeline.totalDuration = std::min(settings.emptyCompositionDuration, Composition::kMaxDuration);
        }

        const std::vector<MediaLayer> &layers = composition.layers();
        for (size_t i = 0; i < layers.size(); ++i)
        {
            const MediaLayer &layer = layers[i];
            if (!layer.visible)
            {
                skipLayer(layer, "图层不可见");
                continue;
            }

            const MediaItem *item = library.find(layer.mediaId);
            if (!item)
            {
                skipLayer(layer, "素材不存在: " + layer.mediaId);
                continue;
            }

            if (layer.isVideo())
            {
                if (!addVideoLayer(layer, *item, static_cast<int>(i), timeline))
                {
                    return false;
                }
            }
            else
            {
                addImageLayer(layer, *item, static_cast<int>(i), timeline);
            }
        }

        qDebug() << "时间线构建完成: 时长" << timeline.totalDuration << "秒, 视频轨" << timeline.videoTracks.size()
                 << ", 音频轨" << timeline.audioTracks.size() << ", 图层" << timeline.instructions.size();
        return true;
    }

    bool ExportAssembler::addVideoLayer(const MediaLayer &layer, const MediaItem &item, int order, ExportTimeline &timeline)
    {
        MediaProbeInfo info;
        std::string probeError;
        if (!m_probe.probe(item.path, info, probeError))
        {
            m_error = ExportError::make(ExportErrorKind::SOURCE_UNREADABLE,
                                        "无法读取素材 " + item.path + ": " + probeError);
            return false;
        }

        if (!info.hasVideo)
        {
            skipLayer(layer, "素材没有视频流: " + item.path);
            return true;
        }

        const VideoTiming *timing = layer.videoTiming();
        const double sourceDuration = info.duration > 0.0 ? info.duration : item.videoDuration;

        VideoTrackPlan track;
        track.trackId = m_nextTrackId++;
        track.layerId = layer.id;
        track.sourcePath = item.path;
        track.range = TimeRange{0.0, std::min(sourceDuration, timeline.totalDuration)};
        track.sourceDuration = sourceDuration;
        track.startOffset = timing ? timing->startOffset : 0.0;
        track.playbackRate = timing && timing->playbackRate > 0.0 ? timing->playbackRate : 1.0;
        track.hasAudio = info.hasAudio;

        if (info.hasAudio)
        {
            AudioTrackPlan audio;
            audio.trackId = track.trackId + kAudioTrackIdOffset;
            audio.layerId = layer.id;
            audio.sourcePath = item.path;
            audio.range = track.range;
            audio.startOffset = track.startOffset;
            audio.playbackRate = track.playbackRate;
            audio.volume.setVolume(layer.audioVolume(), 0.0);
            track.audioTrackId = audio.trackId;
            timeline.audioTracks.push_back(audio);
        }
        timeline.videoTracks.push_back(track);

        LayerInstruction instruction;
        instruction.layerId = layer.id;
        instruction.kind = MediaKind::VIDEO;
        instruction.order = order;
        instruction.zIndex = layer.zIndex;
        instruction.position = layer.position;
        instruction.size = layer.size;
        instruction.opacity = layer.opacity;
        instruction.trackId = track.trackId;
        timeline.instructions.push_back(instruction);
        return true;
    }

    void ExportAssembler::addImageLayer(const MediaLayer &layer, const MediaItem &item, int order, ExportTimeline &timeline)
    {
        // 图片不占轨道，合成时直接绘制
        LayerInstruction instruction;
        instruction.layerId = layer.id;
        instruction.kind = MediaKind::IMAGE;
        instruction.order = order;
        instruction.zIndex = layer.zIndex;
        instruction.position = layer.position;
        instruction.size = layer.size;
        instruction.opacity = layer.opacity;
        instruction.imagePath = item.path;
        instruction.imageDuration = layer.contentDuration(&item);
        timeline.instructions.push_back(instruction);
    }

    void ExportAssembler::skipLayer(const MediaLayer &layer, const std::string &reason)
    {
        qWarning() << "跳过图层" << QString::fromStdString(layer.id) << ":" << QString::fromStdString(reason);
        m_skippedLayers.push_back(layer.id);
    }

} // namespace StackComposer
