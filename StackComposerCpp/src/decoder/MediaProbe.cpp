#include "MediaProbe.h"
#include "../ffmpeg_utils/AvFormatContextWrapper.h"

namespace StackComposer
{

    bool MediaProbe::probe(const std::string &path, MediaProbeInfo &info, std::string &error)
    {
        info = MediaProbeInfo();

        AVFormatContext *rawContext = nullptr;
        int ret = avformat_open_input(&rawContext, path.c_str(), nullptr, nullptr);
        if (ret < 0)
        {
            error = FFmpegUtils::formatFFmpegError(ret, "无法打开文件");
            return false;
        }
        FFmpegUtils::AvInputContextPtr formatContext(rawContext);

        ret = avformat_find_stream_info(formatContext.get(), nullptr);
        if (ret < 0)
        {
            error = FFmpegUtils::formatFFmpegError(ret, "无法获取流信息");
            return false;
        }

        const int videoIndex = av_find_best_stream(formatContext.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        const int audioIndex = av_find_best_stream(formatContext.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        info.hasVideo = videoIndex >= 0;
        info.hasAudio = audioIndex >= 0;

        if (info.hasVideo)
        {
            const AVStream *stream = formatContext->streams[videoIndex];
            info.size = QSize(stream->codecpar->width, stream->codecpar->height);
            if (stream->duration != AV_NOPTS_VALUE)
            {
                info.duration = stream->duration * av_q2d(stream->time_base);
            }
        }

        if (info.duration <= 0.0 && formatContext->duration != AV_NOPTS_VALUE)
        {
            info.duration = static_cast<double>(formatContext->duration) / AV_TIME_BASE;
        }

        return true;
    }

} // namespace StackComposer
