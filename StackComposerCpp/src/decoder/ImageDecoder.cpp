#include "ImageDecoder.h"
#include "../ffmpeg_utils/AvPacketWrapper.h"

namespace StackComposer
{

    ImageDecoder::ImageDecoder()
        : m_formatContext(nullptr), m_codecContext(nullptr), m_videoStreamIndex(-1)
    {
    }

    ImageDecoder::~ImageDecoder()
    {
        cleanup();
    }

    bool ImageDecoder::open(const std::string &filePath)
    {
        cleanup();

        // 打开输入文件
        if (avformat_open_input(&m_formatContext, filePath.c_str(), nullptr, nullptr) < 0)
        {
            m_errorString = "无法打开图片文件: " + filePath;
            return false;
        }

        if (avformat_find_stream_info(m_formatContext, nullptr) < 0)
        {
            m_errorString = "无法获取流信息";
            cleanup();
            return false;
        }

        m_videoStreamIndex = av_find_best_stream(m_formatContext, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (m_videoStreamIndex < 0)
        {
            m_errorString = "未找到图像流";
            cleanup();
            return false;
        }

        AVStream *videoStream = m_formatContext->streams[m_videoStreamIndex];

        const AVCodec *codec = avcodec_find_decoder(videoStream->codecpar->codec_id);
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

        if (avcodec_parameters_to_context(m_codecContext, videoStream->codecpar) < 0)
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
        return true;
    }

    FFmpegUtils::AvFramePtr ImageDecoder::decode()
    {
        if (!m_formatContext || !m_codecContext)
        {
            m_errorString = "解码器未打开";
            return nullptr;
        }

        auto packet = FFmpegUtils::createAvPacket();
        auto frame = FFmpegUtils::createAvFrame();
        if (!packet || !frame)
        {
            m_errorString = "无法分配数据包或帧";
            return nullptr;
        }

        int response;
        while (av_read_frame(m_formatContext, packet.get()) >= 0)
        {
            if (packet->stream_index == m_videoStreamIndex)
            {
                response = avcodec_send_packet(m_codecContext, packet.get());
                av_packet_unref(packet.get());
                if (response < 0)
                {
                    m_errorString = FFmpegUtils::formatFFmpegError(response, "发送数据包到解码器失败");
                    return nullptr;
                }

                response = avcodec_receive_frame(m_codecContext, frame.get());
                if (response == AVERROR(EAGAIN))
                {
                    continue;
                }
                if (response < 0)
                {
                    m_errorString = FFmpegUtils::formatFFmpegError(response, "从解码器接收帧失败");
                    return nullptr;
                }
                return frame;
            }
            av_packet_unref(packet.get());
        }

        // 刷新解码器
        avcodec_send_packet(m_codecContext, nullptr);
        response = avcodec_receive_frame(m_codecContext, frame.get());
        if (response < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(response, "图片中没有可解码的帧");
            return nullptr;
        }
        return frame;
    }

    bool ImageDecoder::decodeToImage(QImage &image)
    {
        FFmpegUtils::AvFramePtr frame = decode();
        if (!frame)
        {
            return false;
        }
        if (!m_converter.toImage(frame.get(), image))
        {
            m_errorString = m_converter.getErrorString();
            return false;
        }
        return true;
    }

    void ImageDecoder::close()
    {
        cleanup();
    }

    void ImageDecoder::cleanup()
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

        m_videoStreamIndex = -1;
    }

} // namespace StackComposer
