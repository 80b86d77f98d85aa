#ifndef FRAME_CONVERTER_H
#define FRAME_CONVERTER_H

#include <QImage>
#include <string>
#include "../ffmpeg_utils/AvFormatContextWrapper.h"

namespace StackComposer
{

    // AVFrame -> QImage(Format_ARGB32)，缓存 sws 上下文
    class FrameConverter
    {
    public:
        bool toImage(const AVFrame *frame, QImage &image);
        std::string getErrorString() const { return m_errorString; }

    private:
        FFmpegUtils::SwsContextPtr m_swsOwner;
        std::string m_errorString;
    };

} // namespace StackComposer

#endif // FRAME_CONVERTER_H
