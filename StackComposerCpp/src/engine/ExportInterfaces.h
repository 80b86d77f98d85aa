#ifndef EXPORT_INTERFACES_H
#define EXPORT_INTERFACES_H

#include <QImage>
#include <QSize>
#include <memory>
#include <string>

#include "../compositor/FrameCompositor.h"
#include "../model/ExportSettings.h"
#include "ExportTimeline.h"

namespace StackComposer
{

    // 素材探测结果
    struct MediaProbeInfo
    {
        bool hasVideo = false;
        bool hasAudio = false;
        double duration = 0.0;
        QSize size;
    };

    // 读取素材流信息
    class IMediaProbe
    {
    public:
        virtual ~IMediaProbe() = default;
        virtual bool probe(const std::string &path, MediaProbeInfo &info, std::string &error) = 0;
    };

    // 按源时间取视频帧
    class IVideoFrameSource
    {
    public:
        virtual ~IVideoFrameSource() = default;
        virtual bool open(const std::string &path) = 0;
        virtual ContentStatus frameAt(double sourceTime, QImage &frame) = 0;
        virtual std::string errorString() const = 0;
    };

    class IFrameSourceFactory
    {
    public:
        virtual ~IFrameSourceFactory() = default;
        virtual std::unique_ptr<IVideoFrameSource> createVideoSource() = 0;
        virtual bool loadImage(const std::string &path, QImage &image, std::string &error) = 0;
    };

    // 视频编码 + 音频混音 + 封装
    class IFrameEncoder
    {
    public:
        virtual ~IFrameEncoder() = default;
        virtual bool open(const ExportTimeline &timeline, const ExportSettings &settings, const std::string &outputPath) = 0;
        virtual bool writeVideoFrame(const QImage &frame, int64_t frameIndex) = 0;
        virtual bool finish() = 0;

        // 放弃输出并删除未完成的文件
        virtual void abort() = 0;

        virtual std::string errorString() const = 0;
    };

    // 外部保存，导出成功后才会调用
    class IExportSink
    {
    public:
        virtual ~IExportSink() = default;
        virtual bool save(const std::string &filePath, std::string &error) = 0;
    };

} // namespace StackComposer

#endif // EXPORT_INTERFACES_H
