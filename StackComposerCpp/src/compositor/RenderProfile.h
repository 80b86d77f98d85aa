#ifndef RENDER_PROFILE_H
#define RENDER_PROFILE_H

#include <string>

#include "../geometry/LayerTransform.h"

namespace StackComposer
{

    // 同一套合成算法在预览与导出下的差异
    struct RenderProfile
    {
        std::string name;
        FitMode fitMode = FitMode::ASPECT_FILL;
        CoordinateOrigin origin = CoordinateOrigin::TOP_LEFT;

        // 预览可以丢帧追赶时钟，导出必须逐帧输出
        bool allowFrameSkip = false;

        // 预览把解码失败当作无内容跳过，导出则视为错误
        bool tolerateSourceErrors = false;

        static RenderProfile interactive(FitMode fitMode = FitMode::ASPECT_FILL)
        {
            RenderProfile profile;
            profile.name = "interactive";
            profile.fitMode = fitMode;
            profile.allowFrameSkip = true;
            profile.tolerateSourceErrors = true;
            return profile;
        }

        static RenderProfile exportProfile()
        {
            RenderProfile profile;
            profile.name = "export";
            profile.fitMode = FitMode::ASPECT_FILL;
            profile.allowFrameSkip = false;
            profile.tolerateSourceErrors = false;
            return profile;
        }
    };

} // namespace StackComposer

#endif // RENDER_PROFILE_H
