#ifndef RENDER_ENGINE_H
#define RENDER_ENGINE_H

#include <string>
#include <memory>
#include "ExportInterfaces.h"
#include "AudioMixer.h"
#include "../ffmpeg_utils/FFmpegHeaders.h"
#include "../ffmpeg_utils/AvFrameWrapper.h"
#include "../ffmpeg_utils/AvFormatContextWrapper.h"
#include "../ffmpeg_utils/AvCodecContextWrapper.h"

namespace StackComposer
{

    // FFmpeg 编码器：合成帧 -> H.264，混音 -> AAC，封装为 mov/mp4
    class RenderEngine : public IFrameEncoder
    {
    public:
        RenderEngine();
        ~RenderEngine() override;

        bool open(const ExportTimeline &timeline, const ExportSettings &settings, const std::string &outputPath) override;

        // frame 需为 Format_ARGB32 且尺寸等于输出尺寸
        bool writeVideoFrame(const QImage &frame, int64_t frameIndex) override;

        bool finish() override;
        void abort() override;

        // 获取错误信息
        std::string errorString() const override { return m_errorString; }

    private:
        // 创建输出上下文
        bool createOutputContext(const std::string &container);

        // 创建视频流
        bool createVideoStream(const ExportSettings &settings, const QSize &size, int fps);

        // 创建音频流
        bool createAudioStream(const ExportSettings &settings);

        // 把 ARGB32 转为编码器的像素格式并送入编码器
        bool encodeVideoFrame(const QImage &frame, int64_t pts);

        // 把音频补到指定时间
        bool pumpAudioUntil(double seconds);

        // 从FIFO缓冲区读取并发送固定大小的音频帧
        bool sendBufferedAudioFrames();

        // 冲洗音频缓冲区
        bool flushAudio();

        // flush 编码器剩余包
        bool flushEncoder(AVCodecContext *codecCtx, AVStream *stream);

        void releaseResources();

        std::string m_outputPath;
        std::string m_errorString;
        double m_totalDuration;
        int m_fps;
        bool m_headerWritten;

        // FFmpeg资源
        FFmpegUtils::AvFormatContextPtr m_outputContext;
        FFmpegUtils::AvCodecContextPtr m_videoCodecContext;
        FFmpegUtils::AvCodecContextPtr m_audioCodecContext;
        FFmpegUtils::SwsContextPtr m_swsContext;
        FFmpegUtils::AvAudioFifoPtr m_audioFifo;
        FFmpegUtils::AvFramePtr m_yuvFrame;
        AVStream *m_videoStream;
        AVStream *m_audioStream;
        AudioMixer m_mixer;
        int64_t m_frameCount;
        int64_t m_audioSamplesCount;
    };

} // namespace StackComposer

#endif // RENDER_ENGINE_H
