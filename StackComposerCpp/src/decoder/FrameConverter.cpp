#include "FrameConverter.h"

namespace StackComposer
{

    bool FrameConverter::toImage(const AVFrame *frame, QImage &image)
    {
        if (!frame || frame->width <= 0 || frame->height <= 0)
        {
            m_errorString = "无效的帧";
            return false;
        }

        // QImage::Format_ARGB32 与 AV_PIX_FMT_RGB32 的内存布局一致
        SwsContext *swsContext = sws_getCachedContext(m_swsOwner.release(),
                                                      frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                                                      frame->width, frame->height, AV_PIX_FMT_RGB32,
                                                      SWS_BILINEAR, nullptr, nullptr, nullptr);
        m_swsOwner.reset(swsContext);
        if (!swsContext)
        {
            m_errorString = "无法创建图像转换上下文";
            return false;
        }

        QImage converted(frame->width, frame->height, QImage::Format_ARGB32);
        if (converted.isNull())
        {
            m_errorString = "无法分配图像缓冲区";
            return false;
        }

        uint8_t *dstData[4] = {converted.bits(), nullptr, nullptr, nullptr};
        int dstLinesize[4] = {static_cast<int>(converted.bytesPerLine()), 0, 0, 0};
        const int rows = sws_scale(swsContext, frame->data, frame->linesize, 0, frame->height, dstData, dstLinesize);
        if (rows <= 0)
        {
            m_errorString = "图像格式转换失败";
            return false;
        }

        image = converted;
        return true;
    }

} // namespace StackComposer
