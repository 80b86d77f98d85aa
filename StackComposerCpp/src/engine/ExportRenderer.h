#ifndef EXPORT_RENDERER_H
#define EXPORT_RENDERER_H

#include <map>
#include <memory>
#include <string>

#include "../compositor/FrameCompositor.h"
#include "CancellationToken.h"
#include "ExportError.h"
#include "ExportInterfaces.h"
#include "ExportTimeline.h"

namespace StackComposer
{

    // 渲染阶段：逐帧合成并送入编码器
    class ExportRenderer
    {
    public:
        enum class Result
        {
            COMPLETED,
            FAILED,
            CANCELLED
        };

        ExportRenderer(IFrameSourceFactory &sources, IFrameEncoder &encoder);

        Result render(const ExportTimeline &timeline, const ExportSettings &settings,
                      const std::string &outputPath, const CancellationToken &token,
                      ExportProgress &progress);

        const ExportError &error() const { return m_error; }
        std::string errorString() const { return m_error.reason; }

    private:
        bool openSources(const ExportTimeline &timeline);
        bool renderFrame(const ExportTimeline &timeline, int64_t frameIndex, QImage &frame);
        Result fail(ExportErrorKind kind, const std::string &reason);

        IFrameSourceFactory &m_sources;
        IFrameEncoder &m_encoder;
        FrameCompositor m_compositor;
        std::map<int, std::unique_ptr<IVideoFrameSource>> m_videoSources;  // 按视频轨 id
        std::map<std::string, QImage> m_images;                            // 按图层 id
        ExportError m_error;
    };

} // namespace StackComposer

#endif // EXPORT_RENDERER_H
