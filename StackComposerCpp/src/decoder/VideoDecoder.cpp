#include "VideoDecoder.h"
#include "../ffmpeg_utils/AvPacketWrapper.h"
#include <QDebug>

namespace StackComposer
{

    bool VideoDecoder::open(const std::string &filePath)
    {
        AVFormatContext *formatContext = nullptr;
        int ret = avformat_open_input(&formatContext, filePath.c_str(), nullptr, nullptr);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法打开视频文件: " + filePath);
            return false;
        }
        m_formatContext.reset(formatContext);

        ret = avformat_find_stream_info(m_formatContext.get(), nullptr);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法获取流信息");
            return false;
        }

        m_videoStreamIndex = av_find_best_stream(m_formatContext.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (m_videoStreamIndex < 0)
        {
            m_errorString = "未找到视频流: " + filePath;
            return false;
        }

        AVStream *stream = m_formatContext->streams[m_videoStreamIndex];
        const AVCodec *codec = avcodec_find_decoder(stream->codecpar->codec_id);
        if (!codec)
        {
            m_errorString = "未找到视频解码器";
            return false;
        }

        m_codecContext = FFmpegUtils::createCodecContext(codec);
        if (!m_codecContext)
        {
            m_errorString = "无法创建解码器上下文";
            return false;
        }

        ret = avcodec_parameters_to_context(m_codecContext.get(), stream->codecpar);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法复制解码器参数");
            return false;
        }

        // 导出要求结果确定，单线程解码
        m_codecContext->thread_count = 1;
        ret = avcodec_open2(m_codecContext.get(), codec, nullptr);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法打开视频解码器");
            return false;
        }

        m_startTime = stream->start_time != AV_NOPTS_VALUE ? stream->start_time * av_q2d(stream->time_base) : 0.0;
        if (stream->avg_frame_rate.num > 0 && stream->avg_frame_rate.den > 0)
        {
            m_frameInterval = 1.0 / av_q2d(stream->avg_frame_rate);
        }

        m_hasCurrent = false;
        m_hasPending = false;
        m_eof = false;
        m_draining = false;
        return true;
    }

    ContentStatus VideoDecoder::frameAt(double sourceTime, QImage &frame)
    {
        if (!m_formatContext || !m_codecContext)
        {
            m_errorString = "解码器未打开";
            return ContentStatus::FAILED;
        }

        // 时间回退，或者向前跳得太远
        const bool backwards = m_hasCurrent && sourceTime + 1e-6 < m_currentPts;
        const bool farAhead = m_hasCurrent && sourceTime > m_currentPts + 2.0;
        if (backwards || farAhead)
        {
            if (!seekTo(sourceTime))
            {
                return ContentStatus::FAILED;
            }
        }

        // 半帧容差，避免浮点误差导致取到上一帧
        const double threshold = sourceTime + m_frameInterval * 0.5;
        while (true)
        {
            if (!m_hasPending)
            {
                if (m_eof)
                {
                    break;
                }
                const int result = decodeNext(m_pending, m_pendingPts);
                if (result < 0)
                {
                    return ContentStatus::FAILED;
                }
                if (result == 0)
                {
                    m_eof = true;
                    break;
                }
                m_hasPending = true;
            }

            if (m_hasCurrent && m_pendingPts > threshold)
            {
                break;
            }

            m_current = m_pending;
            m_currentPts = m_pendingPts;
            m_hasCurrent = true;
            m_hasPending = false;
        }

        if (!m_hasCurrent)
        {
            return ContentStatus::UNAVAILABLE;
        }
        frame = m_current;
        return ContentStatus::AVAILABLE;
    }

    int VideoDecoder::decodeNext(QImage &image, double &pts)
    {
        auto packet = FFmpegUtils::createAvPacket();
        auto frame = FFmpegUtils::createAvFrame();
        AVStream *stream = m_formatContext->streams[m_videoStreamIndex];

        while (true)
        {
            int ret = avcodec_receive_frame(m_codecContext.get(), frame.get());
            if (ret == 0)
            {
                const int64_t timestamp = frame->best_effort_timestamp != AV_NOPTS_VALUE ? frame->best_effort_timestamp : frame->pts;
                pts = timestamp != AV_NOPTS_VALUE ? timestamp * av_q2d(stream->time_base) - m_startTime : 0.0;
                if (!m_converter.toImage(frame.get(), image))
                {
                    m_errorString = m_converter.getErrorString();
                    return -1;
                }
                return 1;
            }
            if (ret == AVERROR_EOF)
            {
                return 0;
            }
            if (ret != AVERROR(EAGAIN))
            {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "从解码器接收帧失败");
                return -1;
            }
            if (m_draining)
            {
                return 0;
            }

            ret = av_read_frame(m_formatContext.get(), packet.get());
            if (ret == AVERROR_EOF)
            {
                // 冲洗解码器中剩余的帧
                avcodec_send_packet(m_codecContext.get(), nullptr);
                m_draining = true;
                continue;
            }
            if (ret < 0)
            {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "读取数据包失败");
                return -1;
            }

            if (packet->stream_index == m_videoStreamIndex)
            {
                ret = avcodec_send_packet(m_codecContext.get(), packet.get());
                if (ret < 0 && ret != AVERROR(EAGAIN))
                {
                    av_packet_unref(packet.get());
                    m_errorString = FFmpegUtils::formatFFmpegError(ret, "发送数据包到解码器失败");
                    return -1;
                }
            }
            av_packet_unref(packet.get());
        }
    }

    bool VideoDecoder::seekTo(double sourceTime)
    {
        AVStream *stream = m_formatContext->streams[m_videoStreamIndex];
        const int64_t target = static_cast<int64_t>((sourceTime + m_startTime) / av_q2d(stream->time_base));
        int ret = av_seek_frame(m_formatContext.get(), m_videoStreamIndex, target, AVSEEK_FLAG_BACKWARD);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "视频跳转失败");
            return false;
        }
        avcodec_flush_buffers(m_codecContext.get());

        m_hasCurrent = false;
        m_hasPending = false;
        m_eof = false;
        m_draining = false;
        return true;
    }

} // namespace StackComposer
