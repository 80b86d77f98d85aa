#include "ExportRenderer.h"

#include <QDebug>
#include <future>
#include <vector>

namespace StackComposer
{

    ExportRenderer::ExportRenderer(IFrameSourceFactory &sources, IFrameEncoder &encoder)
        : m_sources(sources),
          m_encoder(encoder),
          m_compositor(RenderProfile::exportProfile())
    {
    }

    ExportRenderer::Result ExportRenderer::render(const ExportTimeline &timeline, const ExportSettings &settings,
                                                  const std::string &outputPath, const CancellationToken &token,
                                                  ExportProgress &progress)
    {
        m_error = ExportError();
        m_compositor.setBackgroundColor(timeline.backgroundColor);

        if (!openSources(timeline))
        {
            return Result::FAILED;
        }

        if (!m_encoder.open(timeline, settings, outputPath))
        {
            return fail(ExportErrorKind::ENCODE_FAILED, m_encoder.errorString());
        }

        const int64_t frameCount = timeline.frameCount();
        qDebug() << "开始渲染:" << frameCount << "帧," << timeline.renderSize << "@" << timeline.frameRate << "fps";

        QImage frame;
        for (int64_t i = 0; i < frameCount; ++i)
        {
            // 每帧之间检查取消，正在合成的帧会完成
            if (token.isCancelled())
            {
                qDebug() << "导出已取消，停止于第" << i << "帧";
                m_encoder.abort();
                m_error = ExportError::make(ExportErrorKind::CANCELLED, "导出已取消");
                return Result::CANCELLED;
            }

            if (!renderFrame(timeline, i, frame))
            {
                m_encoder.abort();
                return Result::FAILED;
            }

            if (!m_encoder.writeVideoFrame(frame, i))
            {
                const std::string reason = m_encoder.errorString();
                m_encoder.abort();
                return fail(ExportErrorKind::ENCODE_FAILED, reason);
            }

            progress.update(static_cast<double>(i + 1) / frameCount);
        }

        if (token.isCancelled())
        {
            m_encoder.abort();
            m_error = ExportError::make(ExportErrorKind::CANCELLED, "导出已取消");
            return Result::CANCELLED;
        }

        if (!m_encoder.finish())
        {
            const std::string reason = m_encoder.errorString();
            m_encoder.abort();
            return fail(ExportErrorKind::ENCODE_FAILED, reason);
        }

        progress.update(1.0);
        qDebug() << "渲染完成:" << QString::fromStdString(outputPath);
        return Result::COMPLETED;
    }

    bool ExportRenderer::openSources(const ExportTimeline &timeline)
    {
        m_videoSources.clear();
        m_images.clear();

        for (const VideoTrackPlan &track : timeline.videoTracks)
        {
            std::unique_ptr<IVideoFrameSource> source = m_sources.createVideoSource();
            if (!source || !source->open(track.sourcePath))
            {
                fail(ExportErrorKind::SOURCE_UNREADABLE,
                     "无法打开视频轨 " + std::to_string(track.trackId) + ": " +
                         (source ? source->errorString() : std::string("无法创建解码器")));
                return false;
            }
            m_videoSources[track.trackId] = std::move(source);
        }

        for (const LayerInstruction &instruction : timeline.instructions)
        {
            if (instruction.kind != MediaKind::IMAGE)
            {
                continue;
            }

            QImage image;
            std::string error;
            if (!m_sources.loadImage(instruction.imagePath, image, error))
            {
                // 单个图片不可用只跳过该图层
                qWarning() << "图片加载失败，跳过图层" << QString::fromStdString(instruction.layerId)
                           << ":" << QString::fromStdString(error);
                continue;
            }
            m_images[instruction.layerId] = image;
        }
        return true;
    }

    bool ExportRenderer::renderFrame(const ExportTimeline &timeline, int64_t frameIndex, QImage &frame)
    {
        const double t = timeline.frameTime(frameIndex);

        // 各视频轨并行解码，合成按 zIndex 串行
        std::vector<LayerContent> contents(timeline.instructions.size());
        std::vector<std::future<void>> decodes;
        for (size_t i = 0; i < timeline.instructions.size(); ++i)
        {
            const LayerInstruction &instruction = timeline.instructions[i];
            LayerContent &content = contents[i];
            content.layerId = instruction.layerId;
            content.zIndex = instruction.zIndex;
            content.order = instruction.order;
            content.position = instruction.position;
            content.size = instruction.size;
            content.opacity = instruction.opacity;

            if (instruction.kind == MediaKind::IMAGE)
            {
                auto it = m_images.find(instruction.layerId);
                if (it != m_images.end() && t < instruction.imageDuration)
                {
                    content.image = it->second;
                    content.status = ContentStatus::AVAILABLE;
                }
                continue;
            }

            const VideoTrackPlan *track = timeline.videoTrack(instruction.trackId);
            auto source = m_videoSources.find(instruction.trackId);
            if (!track || source == m_videoSources.end() || !track->range.contains(t))
            {
                continue;
            }

            const double sourceTime = track->startOffset + (t - track->range.start) * track->playbackRate;
            if (sourceTime >= track->sourceDuration)
            {
                continue;
            }
            IVideoFrameSource *decoder = source->second.get();
            decodes.push_back(std::async(std::launch::async, [decoder, sourceTime, &content]() {
                content.status = decoder->frameAt(sourceTime, content.image);
                if (content.status == ContentStatus::FAILED)
                {
                    content.error = decoder->errorString();
                }
            }));
        }

        for (auto &decode : decodes)
        {
            decode.get();
        }

        if (!m_compositor.composite(contents, timeline.renderSize, frame))
        {
            fail(ExportErrorKind::ENCODE_FAILED,
                 "第 " + std::to_string(frameIndex) + " 帧合成失败: " + m_compositor.errorString());
            return false;
        }
        return true;
    }

    ExportRenderer::Result ExportRenderer::fail(ExportErrorKind kind, const std::string &reason)
    {
        qWarning() << "导出失败:" << QString::fromStdString(reason);
        m_error = ExportError::make(kind, reason);
        return Result::FAILED;
    }

} // namespace StackComposer
