#include "AudioDecoder.h"
#include "../ffmpeg_utils/AvPacketWrapper.h"
#include <QDebug>

namespace StackComposer
{

    AudioDecoder::AudioDecoder()
        : m_formatContext(nullptr), m_codecContext(nullptr), m_swrCtx(nullptr), m_audioStreamIndex(-1),
          m_sampleRate(0), m_channels(0), m_sampleFormat(AV_SAMPLE_FMT_NONE)
    {
    }

    AudioDecoder::~AudioDecoder()
    {
        cleanup();
    }

    bool AudioDecoder::open(const std::string &filePath)
    {
        cleanup();

        // 打开输入文件
        int ret = avformat_open_input(&m_formatContext, filePath.c_str(), nullptr, nullptr);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法打开音频文件: " + filePath);
            return false;
        }

        // 查找流信息
        if (avformat_find_stream_info(m_formatContext, nullptr) < 0)
        {
            m_errorString = "无法获取流信息";
            cleanup();
            return false;
        }

        // 查找音频流
        m_audioStreamIndex = av_find_best_stream(m_formatContext, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (m_audioStreamIndex < 0)
        {
            m_errorString = "未找到音频流";
            cleanup();
            return false;
        }

        AVStream *audioStream = m_formatContext->streams[m_audioStreamIndex];

        // 查找解码器
        const AVCodec *codec = avcodec_find_decoder(audioStream->codecpar->codec_id);
        if (!codec)
        {
            m_errorString = "未找到解码器";
            cleanup();
            return false;
        }

        m_codecContext = avcodec_alloc_context3(codec);
        if (!m_codecContext)
        {
            m_errorString = "无法创建解码器上下文";
            cleanup();
            return false;
        }

        if (avcodec_parameters_to_context(m_codecContext, audioStream->codecpar) < 0)
        {
            m_errorString = "无法复制解码器参数";
            cleanup();
            return false;
        }

        if (avcodec_open2(m_codecContext, codec, nullptr) < 0)
        {
            m_errorString = "无法打开解码器";
            cleanup();
            return false;
        }

        m_sampleRate = m_codecContext->sample_rate;
        m_channels = m_codecContext->ch_layout.nb_channels > 0 ? m_codecContext->ch_layout.nb_channels : 2;
        m_sampleFormat = m_codecContext->sample_fmt;

        // 初始化 SwrContext
        m_swrCtx = swr_alloc();
        if (!m_swrCtx)
        {
            m_errorString = "无法分配 SwrContext";
            cleanup();
            return false;
        }

        AVChannelLayout in_ch_layout, out_ch_layout;
        av_channel_layout_default(&in_ch_layout, m_channels);
        av_channel_layout_default(&out_ch_layout, 2);

        av_opt_set_chlayout(m_swrCtx, "in_chlayout", &in_ch_layout, 0);
        av_opt_set_int(m_swrCtx, "in_sample_rate", m_sampleRate, 0);
        av_opt_set_sample_fmt(m_swrCtx, "in_sample_fmt", m_sampleFormat, 0);

        av_opt_set_chlayout(m_swrCtx, "out_chlayout", &out_ch_layout, 0);
        av_opt_set_int(m_swrCtx, "out_sample_rate", kOutputSampleRate, 0);
        av_opt_set_sample_fmt(m_swrCtx, "out_sample_fmt", AV_SAMPLE_FMT_FLTP, 0);

        av_channel_layout_uninit(&in_ch_layout);
        av_channel_layout_uninit(&out_ch_layout);

        if (swr_init(m_swrCtx) < 0)
        {
            m_errorString = "无法初始化 SwrContext";
            cleanup();
            return false;
        }

        return true;
    }

    bool AudioDecoder::seek(double timestamp)
    {
        if (!m_formatContext || !m_codecContext)
            return false;
        const AVRational timeBase = m_formatContext->streams[m_audioStreamIndex]->time_base;
        int64_t target_ts = static_cast<int64_t>(timestamp / av_q2d(timeBase));
        if (av_seek_frame(m_formatContext, m_audioStreamIndex, target_ts, AVSEEK_FLAG_BACKWARD) < 0)
        {
            m_errorString = "音频跳转失败";
            return false;
        }
        avcodec_flush_buffers(m_codecContext);
        return true;
    }

    int AudioDecoder::decodeFrame(FFmpegUtils::AvFramePtr &outFrame)
    {
        if (!m_formatContext || !m_codecContext)
        {
            m_errorString = "解码器未打开";
            return -1;
        }

        auto packet = FFmpegUtils::createAvPacket();
        auto raw_frame = FFmpegUtils::createAvFrame();
        int response;

        while (true)
        {
            response = avcodec_receive_frame(m_codecContext, raw_frame.get());
            if (response >= 0)
            {
                break; // 成功获取一个原始帧
            }

            if (response == AVERROR_EOF)
            {
                return 0; // 文件结束
            }

            if (response != AVERROR(EAGAIN))
            {
                m_errorString = FFmpegUtils::formatFFmpegError(response, "从解码器接收帧时发生错误");
                return -1;
            }

            // 需要更多数据包
            response = av_read_frame(m_formatContext, packet.get());
            if (response < 0)
            {
                avcodec_send_packet(m_codecContext, nullptr); // Flush解码器
                continue;
            }

            if (packet->stream_index == m_audioStreamIndex)
            {
                if (avcodec_send_packet(m_codecContext, packet.get()) < 0)
                {
                    m_errorString = "发送数据包到解码器失败";
                    av_packet_unref(packet.get());
                    return -1;
                }
            }
            av_packet_unref(packet.get());
        }

        // 重采样
        auto resampled_frame = FFmpegUtils::createAvFrame();
        av_channel_layout_default(&resampled_frame->ch_layout, 2);
        resampled_frame->format = AV_SAMPLE_FMT_FLTP;
        resampled_frame->sample_rate = kOutputSampleRate;
        resampled_frame->nb_samples = static_cast<int>(av_rescale_rnd(swr_get_delay(m_swrCtx, raw_frame->sample_rate) + raw_frame->nb_samples,
                                                                      kOutputSampleRate, raw_frame->sample_rate, AV_ROUND_UP));

        if (av_frame_get_buffer(resampled_frame.get(), 0) < 0)
        {
            m_errorString = "为重采样后的音频帧分配缓冲区失败";
            return -1;
        }

        int converted_samples = swr_convert(m_swrCtx, resampled_frame->data, resampled_frame->nb_samples,
                                            (const uint8_t **)raw_frame->data, raw_frame->nb_samples);
        if (converted_samples < 0)
        {
            m_errorString = "swr_convert 转换失败";
            return -1;
        }
        resampled_frame->nb_samples = converted_samples;

        if (raw_frame->pts != AV_NOPTS_VALUE)
        {
            resampled_frame->pts = av_rescale_q(raw_frame->pts, m_formatContext->streams[m_audioStreamIndex]->time_base,
                                                AVRational{1, kOutputSampleRate});
        }

        outFrame = std::move(resampled_frame);
        return 1;
    }

    void AudioDecoder::close()
    {
        cleanup();
    }

    void AudioDecoder::cleanup()
    {
        if (m_codecContext)
        {
            avcodec_free_context(&m_codecContext);
            m_codecContext = nullptr;
        }
        if (m_formatContext)
        {
            avformat_close_input(&m_formatContext);
            m_formatContext = nullptr;
        }
        if (m_swrCtx)
        {
            swr_free(&m_swrCtx);
            m_swrCtx = nullptr;
        }
        m_audioStreamIndex = -1;
    }

} // namespace StackComposer
