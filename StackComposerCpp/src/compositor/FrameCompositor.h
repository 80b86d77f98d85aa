#ifndef FRAME_COMPOSITOR_H
#define FRAME_COMPOSITOR_H

#include <QColor>
#include <QImage>
#include <string>
#include <vector>

#include "RenderProfile.h"

namespace StackComposer
{

    enum class ContentStatus
    {
        AVAILABLE,    // 本帧有内容
        UNAVAILABLE,  // 本帧无内容（超出时间范围等），跳过
        FAILED        // 解码出错
    };

    // 一个图层在某一时刻的输入
    struct LayerContent
    {
        std::string layerId;
        int zIndex = 0;
        int order = 0;          // 插入顺序，zIndex 相同时使用
        QPointF position{0.5, 0.5};
        QSizeF size{0.4, 0.4};
        float opacity = 1.0f;
        ContentStatus status = ContentStatus::UNAVAILABLE;
        QImage image;
        std::string error;
    };

    // 把若干图层按 zIndex 从后往前叠加到一张输出图上
    class FrameCompositor
    {
    public:
        explicit FrameCompositor(const RenderProfile &profile);

        void setBackgroundColor(const QColor &color) { m_backgroundColor = color; }
        QColor backgroundColor() const { return m_backgroundColor; }

        const RenderProfile &profile() const { return m_profile; }

        // 输出为 Format_ARGB32，失败时返回 false（仅在不容忍源错误时发生）
        bool composite(const std::vector<LayerContent> &layers, const QSize &outputSize, QImage &output);

        // 最近一次合成中被跳过的图层数
        int skippedLayers() const { return m_skippedLayers; }

        std::string errorString() const { return m_errorString; }

    private:
        void drawLayer(const LayerContent &layer, QImage &output);

        RenderProfile m_profile;
        QColor m_backgroundColor{0x1A, 0x1A, 0x1A};
        int m_skippedLayers = 0;
        std::string m_errorString;
    };

} // namespace StackComposer

#endif // FRAME_COMPOSITOR_H
