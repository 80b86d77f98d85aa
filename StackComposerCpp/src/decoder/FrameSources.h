#ifndef FRAME_SOURCES_H
#define FRAME_SOURCES_H

#include "../engine/ExportInterfaces.h"

namespace StackComposer
{

    // 视频帧用 VideoDecoder，图片用 ImageDecoder
    class FFmpegFrameSourceFactory : public IFrameSourceFactory
    {
    public:
        std::unique_ptr<IVideoFrameSource> createVideoSource() override;
        bool loadImage(const std::string &path, QImage &image, std::string &error) override;
    };

} // namespace StackComposer

#endif // FRAME_SOURCES_H
