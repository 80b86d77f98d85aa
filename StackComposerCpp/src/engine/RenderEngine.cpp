#include "RenderEngine.h"
#include "../ffmpeg_utils/AvPacketWrapper.h"
#include <QDebug>
#include <QFile>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace StackComposer
{

    // Helper to parse bitrate strings (e.g., "128k", "5M")
    static int64_t parseBitrate(const std::string &bitrateStr)
    {
        if (bitrateStr.empty()) {
            return 0;
        }
        char last_char = bitrateStr.back();
        std::string num_part = bitrateStr;
        int64_t multiplier = 1;

        if (last_char == 'k' || last_char == 'K') {
            multiplier = 1000;
            num_part.pop_back();
        } else if (last_char == 'm' || last_char == 'M') {
            multiplier = 1000000;
            num_part.pop_back();
        }

        try {
            return static_cast<int64_t>(std::stoll(num_part) * multiplier);
        } catch (const std::invalid_argument &) {
            qDebug() << "Invalid bitrate value: " << bitrateStr.c_str();
            return 0;
        } catch (const std::out_of_range &) {
            qDebug() << "Bitrate value out of range: " << bitrateStr.c_str();
            return 0;
        }
    }

    RenderEngine::RenderEngine()
        : m_totalDuration(0.0), m_fps(30), m_headerWritten(false),
          m_videoStream(nullptr), m_audioStream(nullptr), m_frameCount(0), m_audioSamplesCount(0)
    {
    }

    RenderEngine::~RenderEngine()
    {
        releaseResources();
    }

    bool RenderEngine::open(const ExportTimeline &timeline, const ExportSettings &settings, const std::string &outputPath)
    {
        releaseResources();
        m_outputPath = outputPath;
        m_totalDuration = timeline.totalDuration;
        m_fps = timeline.frameRate;
        m_frameCount = 0;
        m_audioSamplesCount = 0;

        if (!createOutputContext(settings.container)) return false;
        if (!createVideoStream(settings, timeline.renderSize, timeline.frameRate)) return false;
        if (!createAudioStream(settings)) return false;

        if (!m_mixer.open(timeline.audioTracks)) {
            m_errorString = "音频混音初始化失败: " + m_mixer.getErrorString();
            return false;
        }
        if (!m_mixer.hasInputs()) {
            qDebug() << "没有可用的音频轨，输出静音音轨";
        }

        int ret = avformat_write_header(m_outputContext.get(), nullptr);
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "写入文件头失败");
            return false;
        }
        m_headerWritten = true;

        qDebug() << "编码器已就绪:" << timeline.renderSize << "," << m_fps << "fps, 音频轨" << timeline.audioTracks.size();
        return true;
    }

    bool RenderEngine::writeVideoFrame(const QImage &frame, int64_t frameIndex)
    {
        if (!m_headerWritten) {
            m_errorString = "编码器未打开";
            return false;
        }

        if (!encodeVideoFrame(frame, frameIndex)) return false;
        m_frameCount = frameIndex + 1;

        // 音频跟上视频进度
        return pumpAudioUntil(static_cast<double>(m_frameCount) / m_fps);
    }

    bool RenderEngine::finish()
    {
        if (!m_headerWritten) {
            m_errorString = "编码器未打开";
            return false;
        }

        if (!pumpAudioUntil(m_totalDuration)) return false;
        if (!flushAudio()) return false;

        if (!flushEncoder(m_videoCodecContext.get(), m_videoStream)) return false;
        if (!flushEncoder(m_audioCodecContext.get(), m_audioStream)) return false;

        int ret = av_write_trailer(m_outputContext.get());
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "写入文件尾失败");
            return false;
        }

        qDebug() << "视频编码完成！总帧数: " << m_frameCount;
        releaseResources();
        return true;
    }

    void RenderEngine::abort()
    {
        releaseResources();
        if (!m_outputPath.empty() && QFile::exists(QString::fromStdString(m_outputPath))) {
            if (!QFile::remove(QString::fromStdString(m_outputPath))) {
                qWarning() << "无法删除未完成的输出文件:" << m_outputPath.c_str();
            }
        }
    }

    bool RenderEngine::createOutputContext(const std::string &container)
    {
        AVFormatContext *temp_ctx = nullptr;
        // 输出文件带 .part 后缀，需要显式指定封装格式
        int ret = avformat_alloc_output_context2(&temp_ctx, nullptr, container.c_str(), m_outputPath.c_str());
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "创建输出上下文失败");
            return false;
        }
        m_outputContext.reset(temp_ctx);

        if (!(m_outputContext->oformat->flags & AVFMT_NOFILE)) {
            ret = avio_open(&m_outputContext->pb, m_outputPath.c_str(), AVIO_FLAG_WRITE);
            if (ret < 0) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法打开输出文件");
                return false;
            }
        }
        return true;
    }

    bool RenderEngine::createVideoStream(const ExportSettings &settings, const QSize &size, int fps)
    {
        const AVCodec *videoCodec = avcodec_find_encoder_by_name(settings.videoCodec.c_str());
        if (!videoCodec) {
            m_errorString = "找不到视频编码器: " + settings.videoCodec;
            return false;
        }
        m_videoStream = avformat_new_stream(m_outputContext.get(), videoCodec);
        if (!m_videoStream) {
            m_errorString = "创建视频流失败";
            return false;
        }
        m_videoStream->id = m_outputContext->nb_streams - 1;

        m_videoCodecContext = FFmpegUtils::createCodecContext(videoCodec);
        if (!m_videoCodecContext) {
            m_errorString = "创建视频编码器上下文失败";
            return false;
        }

        m_videoCodecContext->width = size.width();
        m_videoCodecContext->height = size.height();
        m_videoCodecContext->time_base = {1, fps};
        m_videoCodecContext->framerate = {fps, 1};
        m_videoCodecContext->pix_fmt = AV_PIX_FMT_YUV420P;
        m_videoCodecContext->gop_size = 12;
        // CRF 控制质量，档位码率作为上限
        m_videoCodecContext->rc_max_rate = settings.targetBitrate();
        m_videoCodecContext->rc_buffer_size = static_cast<int>(settings.targetBitrate() * 2);
        if (m_outputContext->oformat->flags & AVFMT_GLOBALHEADER) {
            m_videoCodecContext->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        av_opt_set(m_videoCodecContext->priv_data, "preset", settings.preset.c_str(), 0);
        av_opt_set_int(m_videoCodecContext->priv_data, "crf", settings.crf, 0);

        int ret = avcodec_open2(m_videoCodecContext.get(), videoCodec, nullptr);
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "打开视频编码器失败");
            return false;
        }

        ret = avcodec_parameters_from_context(m_videoStream->codecpar, m_videoCodecContext.get());
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "复制视频流参数失败");
            return false;
        }
        m_videoStream->time_base = m_videoCodecContext->time_base;

        m_yuvFrame = FFmpegUtils::createAvFrame(size.width(), size.height(), AV_PIX_FMT_YUV420P);
        if (!m_yuvFrame) {
            m_errorString = "分配视频帧失败";
            return false;
        }

        m_swsContext.reset(sws_getContext(size.width(), size.height(), AV_PIX_FMT_RGB32,
                                          size.width(), size.height(), AV_PIX_FMT_YUV420P,
                                          SWS_BICUBIC, nullptr, nullptr, nullptr));
        if (!m_swsContext) {
            m_errorString = "创建像素格式转换上下文失败";
            return false;
        }
        return true;
    }

    bool RenderEngine::createAudioStream(const ExportSettings &settings)
    {
        const AVCodec *audioCodec = avcodec_find_encoder_by_name(settings.audioCodec.c_str());
        if (!audioCodec) {
            m_errorString = "找不到音频编码器: " + settings.audioCodec;
            return false;
        }
        m_audioStream = avformat_new_stream(m_outputContext.get(), audioCodec);
        if (!m_audioStream) {
            m_errorString = "创建音频流失败";
            return false;
        }
        m_audioStream->id = m_outputContext->nb_streams - 1;

        m_audioCodecContext = FFmpegUtils::createCodecContext(audioCodec);
        if (!m_audioCodecContext) {
            m_errorString = "创建音频编码器上下文失败";
            return false;
        }

        m_audioCodecContext->sample_fmt = AV_SAMPLE_FMT_FLTP;
        m_audioCodecContext->bit_rate = parseBitrate(settings.audioBitrate);
        m_audioCodecContext->sample_rate = AudioDecoder::kOutputSampleRate;
        av_channel_layout_from_mask(&m_audioCodecContext->ch_layout, AV_CH_LAYOUT_STEREO);
        m_audioCodecContext->time_base = {1, m_audioCodecContext->sample_rate};
        if (m_outputContext->oformat->flags & AVFMT_GLOBALHEADER) {
            m_audioCodecContext->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        int ret = avcodec_open2(m_audioCodecContext.get(), audioCodec, nullptr);
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "打开音频编码器失败");
            return false;
        }
        ret = avcodec_parameters_from_context(m_audioStream->codecpar, m_audioCodecContext.get());
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "复制音频流参数失败");
            return false;
        }
        m_audioFifo.reset(av_audio_fifo_alloc(m_audioCodecContext->sample_fmt, m_audioCodecContext->ch_layout.nb_channels, 1));
        if (!m_audioFifo) {
            m_errorString = "创建音频FIFO缓冲区失败";
            return false;
        }
        m_audioStream->time_base = m_audioCodecContext->time_base;
        return true;
    }

    bool RenderEngine::encodeVideoFrame(const QImage &frame, int64_t pts)
    {
        if (frame.width() != m_videoCodecContext->width || frame.height() != m_videoCodecContext->height) {
            m_errorString = "合成帧尺寸与输出尺寸不一致";
            return false;
        }
        const QImage source = frame.format() == QImage::Format_ARGB32 ? frame : frame.convertToFormat(QImage::Format_ARGB32);

        int ret = av_frame_make_writable(m_yuvFrame.get());
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "使视频帧可写失败");
            return false;
        }

        const uint8_t *srcData[4] = {source.constBits(), nullptr, nullptr, nullptr};
        const int srcLinesize[4] = {static_cast<int>(source.bytesPerLine()), 0, 0, 0};
        sws_scale(m_swsContext.get(), srcData, srcLinesize, 0, source.height(), m_yuvFrame->data, m_yuvFrame->linesize);

        m_yuvFrame->pts = pts;
        ret = avcodec_send_frame(m_videoCodecContext.get(), m_yuvFrame.get());
        if (ret < 0) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "发送视频帧到编码器失败");
            return false;
        }

        auto packet = FFmpegUtils::createAvPacket();
        while ((ret = avcodec_receive_packet(m_videoCodecContext.get(), packet.get())) == 0) {
            packet->stream_index = m_videoStream->index;
            av_packet_rescale_ts(packet.get(), m_videoCodecContext->time_base, m_videoStream->time_base);
            ret = av_interleaved_write_frame(m_outputContext.get(), packet.get());
            if (ret < 0) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "写入视频包失败");
                return false;
            }
            av_packet_unref(packet.get());
        }
        if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "从编码器接收视频包失败");
            return false;
        }
        return true;
    }

    bool RenderEngine::pumpAudioUntil(double seconds)
    {
        const int64_t target = static_cast<int64_t>(std::llround(seconds * m_audioCodecContext->sample_rate));
        const int64_t queued = m_audioSamplesCount + av_audio_fifo_size(m_audioFifo.get());
        if (target > queued) {
            if (!m_mixer.fillFifo(m_audioFifo.get(), static_cast<int>(target - queued))) {
                m_errorString = "音频混音失败: " + m_mixer.getErrorString();
                return false;
            }
        }
        return sendBufferedAudioFrames();
    }

    bool RenderEngine::sendBufferedAudioFrames()
    {
        const int frame_size = m_audioCodecContext->frame_size > 0 ? m_audioCodecContext->frame_size : 1024;

        while (av_audio_fifo_size(m_audioFifo.get()) >= frame_size)
        {
            auto frame = FFmpegUtils::createAvFrame();
            frame->nb_samples = frame_size;
            av_channel_layout_copy(&frame->ch_layout, &m_audioCodecContext->ch_layout);
            frame->format = m_audioCodecContext->sample_fmt;
            frame->sample_rate = m_audioCodecContext->sample_rate;
            int ret = av_frame_get_buffer(frame.get(), 0);
            if (ret < 0) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "为音频帧分配缓冲区失败 (FIFO)");
                return false;
            }
            if (av_audio_fifo_read(m_audioFifo.get(), (void **)frame->data, frame_size) < 0) {
                m_errorString = "从FIFO读取音频数据失败";
                return false;
            }
            frame->pts = m_audioSamplesCount;
            m_audioSamplesCount += frame->nb_samples;
            ret = avcodec_send_frame(m_audioCodecContext.get(), frame.get());
            if (ret < 0) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "发送音频帧到编码器失败 (FIFO)");
                return false;
            }
            auto packet = FFmpegUtils::createAvPacket();
            while ((ret = avcodec_receive_packet(m_audioCodecContext.get(), packet.get())) == 0) {
                packet->stream_index = m_audioStream->index;
                av_packet_rescale_ts(packet.get(), m_audioCodecContext->time_base, m_audioStream->time_base);
                ret = av_interleaved_write_frame(m_outputContext.get(), packet.get());
                if (ret < 0) {
                    m_errorString = FFmpegUtils::formatFFmpegError(ret, "写入音频包失败 (FIFO)");
                    return false;
                }
                av_packet_unref(packet.get());
            }
            if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "从编码器接收音频包失败 (FIFO)");
                return false;
            }
        }
        return true;
    }

    bool RenderEngine::flushAudio()
    {
        const int frame_size = m_audioCodecContext->frame_size > 0 ? m_audioCodecContext->frame_size : 1024;
        const int remaining_samples = av_audio_fifo_size(m_audioFifo.get());
        if (remaining_samples > 0 && remaining_samples < frame_size) {
            // 最后不足一帧的部分补静音
            auto silenceFrame = FFmpegUtils::createAvFrame();
            const int silence_to_add = frame_size - remaining_samples;
            silenceFrame->nb_samples = silence_to_add;
            av_channel_layout_copy(&silenceFrame->ch_layout, &m_audioCodecContext->ch_layout);
            silenceFrame->format = m_audioCodecContext->sample_fmt;
            silenceFrame->sample_rate = m_audioCodecContext->sample_rate;
            int ret = av_frame_get_buffer(silenceFrame.get(), 0);
            if (ret < 0) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "为静音帧分配缓冲区失败 (Flush)");
                return false;
            }
            av_samples_set_silence(silenceFrame->data, 0, silence_to_add, silenceFrame->ch_layout.nb_channels,
                                   (AVSampleFormat)silenceFrame->format);
            if (av_audio_fifo_write(m_audioFifo.get(), (void **)silenceFrame->data, silence_to_add) < silence_to_add) {
                m_errorString = "写入静音数据到FIFO失败 (Flush)";
                return false;
            }
        }
        return sendBufferedAudioFrames();
    }

    bool RenderEngine::flushEncoder(AVCodecContext *codecCtx, AVStream *stream)
    {
        if (!codecCtx || !stream) return true;
        int ret = avcodec_send_frame(codecCtx, nullptr);
        if (ret < 0 && ret != AVERROR_EOF) {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "发送空帧到编码器以 flush 失败");
            return false;
        }
        auto packet = FFmpegUtils::createAvPacket();
        while (true)
        {
            ret = avcodec_receive_packet(codecCtx, packet.get());
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
            if (ret < 0) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "从编码器接收包失败 (flush)");
                return false;
            }
            packet->stream_index = stream->index;
            av_packet_rescale_ts(packet.get(), codecCtx->time_base, stream->time_base);
            ret = av_interleaved_write_frame(m_outputContext.get(), packet.get());
            if (ret < 0) {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "写入包失败 (flush)");
                return false;
            }
            av_packet_unref(packet.get());
        }
        return true;
    }

    void RenderEngine::releaseResources()
    {
        m_videoCodecContext.reset();
        m_audioCodecContext.reset();
        m_swsContext.reset();
        m_audioFifo.reset();
        m_yuvFrame.reset();
        // 关闭输出文件
        m_outputContext.reset();
        m_videoStream = nullptr;
        m_audioStream = nullptr;
        m_headerWritten = false;
    }

} // namespace StackComposer
