#ifndef AUDIO_DECODER_H
#define AUDIO_DECODER_H

#include <string>
#include "../ffmpeg_utils/FFmpegHeaders.h"
#include "../ffmpeg_utils/AvFrameWrapper.h"

namespace StackComposer
{

    // 解码素材中的音频并重采样为 44100Hz / FLTP / 立体声
    class AudioDecoder
    {
    public:
        static constexpr int kOutputSampleRate = 44100;

        AudioDecoder();
        ~AudioDecoder();

        // 打开音频文件
        bool open(const std::string &filePath);

        // 1: 得到一帧  0: 文件结束  -1: 出错
        int decodeFrame(FFmpegUtils::AvFramePtr &outFrame);

        bool seek(double timestamp);

        // 关闭解码器
        void close();

        // 获取错误信息
        std::string getErrorString() const { return m_errorString; }

    private:
        // FFmpeg资源
        AVFormatContext *m_formatContext;
        AVCodecContext *m_codecContext;
        SwrContext *m_swrCtx;
        int m_audioStreamIndex;

        // 音频信息
        int m_sampleRate;
        int m_channels;
        AVSampleFormat m_sampleFormat;

        std::string m_errorString;

        // 清理资源
        void cleanup();
    };

} // namespace StackComposer

#endif // AUDIO_DECODER_H
