#include "FrameSources.h"
#include "ImageDecoder.h"
#include "VideoDecoder.h"

namespace StackComposer
{

    std::unique_ptr<IVideoFrameSource> FFmpegFrameSourceFactory::createVideoSource()
    {
        return std::make_unique<VideoDecoder>();
    }

    bool FFmpegFrameSourceFactory::loadImage(const std::string &path, QImage &image, std::string &error)
    {
        ImageDecoder decoder;
        if (!decoder.open(path) || !decoder.decodeToImage(image))
        {
            error = decoder.getErrorString();
            return false;
        }
        return true;
    }

} // namespace StackComposer
