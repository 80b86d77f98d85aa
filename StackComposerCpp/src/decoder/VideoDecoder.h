#ifndef VIDEO_DECODER_H
#define VIDEO_DECODER_H

#include <QImage>
#include <string>
#include "../engine/ExportInterfaces.h"
#include "../ffmpeg_utils/AvCodecContextWrapper.h"
#include "../ffmpeg_utils/AvFormatContextWrapper.h"
#include "../ffmpeg_utils/AvFrameWrapper.h"
#include "FrameConverter.h"

namespace StackComposer
{

    // 按时间顺序取帧的视频解码器，时间回退时自动跳转
    class VideoDecoder : public IVideoFrameSource
    {
    public:
        VideoDecoder() = default;
        ~VideoDecoder() override = default;

        bool open(const std::string &filePath) override;

        // 返回 pts <= sourceTime 的最后一帧
        ContentStatus frameAt(double sourceTime, QImage &frame) override;

        std::string errorString() const override { return m_errorString; }

    private:
        // 1: 得到一帧  0: 文件结束  -1: 出错
        int decodeNext(QImage &image, double &pts);
        bool seekTo(double sourceTime);

        FFmpegUtils::AvInputContextPtr m_formatContext;
        FFmpegUtils::AvCodecContextPtr m_codecContext;
        FrameConverter m_converter;
        int m_videoStreamIndex = -1;
        double m_startTime = 0.0;
        double m_frameInterval = 1.0 / 30.0;

        QImage m_current;
        double m_currentPts = -1.0;
        bool m_hasCurrent = false;

        QImage m_pending;
        double m_pendingPts = 0.0;
        bool m_hasPending = false;

        bool m_eof = false;
        bool m_draining = false;
        std::string m_errorString;
    };

} // namespace StackComposer

#endif // VIDEO_DECODER_H
