#ifndef FFMPEG_HEADERS_H
#define FFMPEG_HEADERS_H

#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace StackComposer
{
namespace FFmpegUtils
{

    // 将 FFmpeg 错误码转换为可读字符串
    inline std::string formatFFmpegError(int ret, const std::string &message)
    {
        char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
        return message + ": " + errbuf + " (code " + std::to_string(ret) + ")";
    }

} // namespace FFmpegUtils
} // namespace StackComposer

#endif // FFMPEG_HEADERS_H
