#include "ExportSettings.h"

#include <QColor>
#include <QString>
#include <cmath>

namespace StackComposer
{

    int64_t ExportSettings::estimatedFileSize(double durationSeconds) const
    {
        if (durationSeconds <= 0.0)
        {
            return 0;
        }
        return static_cast<int64_t>(std::llround(static_cast<double>(targetBitrate()) * durationSeconds / 8.0));
    }

    std::string ExportSettings::fileExtension() const
    {
        return container == "mp4" ? ".mp4" : ".mov";
    }

    bool ExportSettings::validate(std::string &error) const
    {
        if (frameRate <= 0 || frameRate > 120)
        {
            error = "帧率无效: " + std::to_string(frameRate);
            return false;
        }
        if (videoCodec.empty())
        {
            error = "未指定视频编码器";
            return false;
        }
        if (audioCodec.empty())
        {
            error = "未指定音频编码器";
            return false;
        }
        if (container != "mov" && container != "mp4")
        {
            error = "不支持的封装格式: " + container;
            return false;
        }
        if (!QColor::isValidColorName(QString::fromStdString(backgroundColor)))
        {
            error = "背景颜色无效: " + backgroundColor;
            return false;
        }
        if (emptyCompositionDuration <= 0.0)
        {
            error = "空合成时长必须大于 0";
            return false;
        }
        if (progressIntervalMs <= 0)
        {
            error = "进度上报间隔必须大于 0";
            return false;
        }
        return true;
    }

} // namespace StackComposer
