#ifndef AV_CODEC_CONTEXT_WRAPPER_H
#define AV_CODEC_CONTEXT_WRAPPER_H

#include <memory>
#include "FFmpegHeaders.h"

namespace StackComposer
{
namespace FFmpegUtils
{

    struct AvCodecContextDeleter {
        void operator()(AVCodecContext *ctx) const
        {
            if (ctx) {
                avcodec_free_context(&ctx);
            }
        }
    };

    using AvCodecContextPtr = std::unique_ptr<AVCodecContext, AvCodecContextDeleter>;

    inline AvCodecContextPtr createCodecContext(const AVCodec *codec)
    {
        return AvCodecContextPtr(avcodec_alloc_context3(codec));
    }

} // namespace FFmpegUtils
} // namespace StackComposer

#endif // AV_CODEC_CONTEXT_WRAPPER_H
