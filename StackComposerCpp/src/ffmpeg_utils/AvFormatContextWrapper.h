#ifndef AV_FORMAT_CONTEXT_WRAPPER_H
#define AV_FORMAT_CONTEXT_WRAPPER_H

#include <memory>
#include "FFmpegHeaders.h"

namespace StackComposer
{
namespace FFmpegUtils
{

    // 输出上下文：先关闭 IO 再释放上下文
    struct AvFormatContextDeleter {
        void operator()(AVFormatContext *ctx) const
        {
            if (ctx) {
                if (ctx->oformat && !(ctx->oformat->flags & AVFMT_NOFILE) && ctx->pb) {
                    avio_closep(&ctx->pb);
                }
                avformat_free_context(ctx);
            }
        }
    };

    // 输入上下文
    struct AvInputContextDeleter {
        void operator()(AVFormatContext *ctx) const
        {
            if (ctx) {
                avformat_close_input(&ctx);
            }
        }
    };

    using AvFormatContextPtr = std::unique_ptr<AVFormatContext, AvFormatContextDeleter>;
    using AvInputContextPtr = std::unique_ptr<AVFormatContext, AvInputContextDeleter>;

    struct SwsContextDeleter {
        void operator()(SwsContext *ctx) const
        {
            if (ctx) {
                sws_freeContext(ctx);
            }
        }
    };

    struct SwrContextDeleter {
        void operator()(SwrContext *ctx) const
        {
            if (ctx) {
                swr_free(&ctx);
            }
        }
    };

    struct AvFilterGraphDeleter {
        void operator()(AVFilterGraph *graph) const
        {
            if (graph) {
                avfilter_graph_free(&graph);
            }
        }
    };

    struct AvAudioFifoDeleter {
        void operator()(AVAudioFifo *fifo) const
        {
            if (fifo) {
                av_audio_fifo_free(fifo);
            }
        }
    };

    using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;
    using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;
    using AvFilterGraphPtr = std::unique_ptr<AVFilterGraph, AvFilterGraphDeleter>;
    using AvAudioFifoPtr = std::unique_ptr<AVAudioFifo, AvAudioFifoDeleter>;

} // namespace FFmpegUtils
} // namespace StackComposer

#endif // AV_FORMAT_CONTEXT_WRAPPER_H
