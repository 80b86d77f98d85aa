#ifndef IMAGE_DECODER_H
#define IMAGE_DECODER_H

#include <QImage>
#include <string>
#include "../ffmpeg_utils/FFmpegHeaders.h"
#include "../ffmpeg_utils/AvFrameWrapper.h"
#include "FrameConverter.h"

namespace StackComposer
{

    // 用 FFmpeg 解码静态图片
    class ImageDecoder
    {
    public:
        ImageDecoder();
        ~ImageDecoder();

        // 打开图片文件
        bool open(const std::string &filePath);

        // 解码第一帧
        FFmpegUtils::AvFramePtr decode();

        // 解码并转换为 ARGB32
        bool decodeToImage(QImage &image);

        // 关闭解码器
        void close();

        // 获取错误信息
        std::string getErrorString() const { return m_errorString; }

    private:
        AVFormatContext *m_formatContext;
        AVCodecContext *m_codecContext;
        int m_videoStreamIndex;

        FrameConverter m_converter;
        std::string m_errorString;

        // 清理资源
        void cleanup();
    };

} // namespace StackComposer

#endif // IMAGE_DECODER_H
