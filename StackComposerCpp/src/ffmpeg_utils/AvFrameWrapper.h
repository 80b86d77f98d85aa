#ifndef AV_FRAME_WRAPPER_H
#define AV_FRAME_WRAPPER_H

#include <memory>
#include "FFmpegHeaders.h"

namespace StackComposer
{
namespace FFmpegUtils
{

    struct AvFrameDeleter {
        void operator()(AVFrame *frame) const
        {
            if (frame) {
                av_frame_free(&frame);
            }
        }
    };

    using AvFramePtr = std::unique_ptr<AVFrame, AvFrameDeleter>;

    inline AvFramePtr createAvFrame()
    {
        return AvFramePtr(av_frame_alloc());
    }

    // 分配带缓冲区的视频帧
    inline AvFramePtr createAvFrame(int width, int height, AVPixelFormat format)
    {
        AvFramePtr frame(av_frame_alloc());
        if (!frame) {
            return nullptr;
        }
        frame->width = width;
        frame->height = height;
        frame->format = format;
        if (av_frame_get_buffer(frame.get(), 0) < 0) {
            return nullptr;
        }
        return frame;
    }

    // 深拷贝一帧（数据与属性）
    inline AvFramePtr copyAvFrame(const AVFrame *source)
    {
        if (!source) {
            return nullptr;
        }
        AvFramePtr frame(av_frame_alloc());
        if (!frame) {
            return nullptr;
        }
        frame->format = source->format;
        frame->width = source->width;
        frame->height = source->height;
        frame->nb_samples = source->nb_samples;
        frame->sample_rate = source->sample_rate;
        if (av_channel_layout_copy(&frame->ch_layout, &source->ch_layout) < 0) {
            return nullptr;
        }
        if (av_frame_get_buffer(frame.get(), 0) < 0) {
            return nullptr;
        }
        if (av_frame_copy(frame.get(), source) < 0 || av_frame_copy_props(frame.get(), source) < 0) {
            return nullptr;
        }
        return frame;
    }

} // namespace FFmpegUtils
} // namespace StackComposer

#endif // AV_FRAME_WRAPPER_H
