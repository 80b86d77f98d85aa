#include "FrameCompositor.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace StackComposer
{

    namespace
    {
        // 非预乘 source-over
        inline QRgb blendOver(QRgb dst, QRgb src, float opacity)
        {
            const float srcA = qAlpha(src) / 255.0f * opacity;
            if (srcA <= 0.0f)
            {
                return dst;
            }
            const float dstA = qAlpha(dst) / 255.0f;
            const float outA = srcA + dstA * (1.0f - srcA);
            if (outA <= 0.0f)
            {
                return qRgba(0, 0, 0, 0);
            }

            auto channel = [&](int s, int d) {
                const float value = (s * srcA + d * dstA * (1.0f - srcA)) / outA;
                return std::min(255, std::max(0, static_cast<int>(std::lround(value))));
            };

            return qRgba(channel(qRed(src), qRed(dst)),
                         channel(qGreen(src), qGreen(dst)),
                         channel(qBlue(src), qBlue(dst)),
                         std::min(255, static_cast<int>(std::lround(outA * 255.0f))));
        }
    }

    FrameCompositor::FrameCompositor(const RenderProfile &profile)
        : m_profile(profile)
    {
    }

    bool FrameCompositor::composite(const std::vector<LayerContent> &layers, const QSize &outputSize, QImage &output)
    {
        m_errorString.clear();
        m_skippedLayers = 0;

        if (outputSize.width() <= 0 || outputSize.height() <= 0)
        {
            m_errorString = "输出尺寸无效";
            return false;
        }

        // 排序只依赖 zIndex 和插入顺序，与传入顺序无关
        std::vector<const LayerContent *> ordered;
        ordered.reserve(layers.size());
        for (const LayerContent &layer : layers)
        {
            ordered.push_back(&layer);
        }
        std::stable_sort(ordered.begin(), ordered.end(), [](const LayerContent *a, const LayerContent *b) {
            if (a->zIndex != b->zIndex)
                return a->zIndex < b->zIndex;
            if (a->order != b->order)
                return a->order < b->order;
            return a->layerId < b->layerId;
        });

        if (output.size() != outputSize || output.format() != QImage::Format_ARGB32)
        {
            output = QImage(outputSize, QImage::Format_ARGB32);
        }
        output.fill(m_backgroundColor);

        for (const LayerContent *layer : ordered)
        {
            if (layer->status == ContentStatus::FAILED)
            {
                if (!m_profile.tolerateSourceErrors)
                {
                    m_errorString = "图层 " + layer->layerId + " 无法获取画面: " + layer->error;
                    return false;
                }
                qDebug() << "预览跳过无法解码的图层:" << QString::fromStdString(layer->layerId);
                m_skippedLayers++;
                continue;
            }

            if (layer->status != ContentStatus::AVAILABLE || layer->image.isNull() || layer->opacity <= 0.0f)
            {
                m_skippedLayers++;
                continue;
            }

            drawLayer(*layer, output);
        }

        return true;
    }

    void FrameCompositor::drawLayer(const LayerContent &layer, QImage &output)
    {
        const QSizeF canvas(output.width(), output.height());
        const QRectF frame = LayerTransform::pixelFrame(layer.position, layer.size, canvas, m_profile.origin);
        const FitResult fit = LayerTransform::fitTransform(QSizeF(layer.image.size()), frame, m_profile.fitMode);
        if (fit.isEmpty())
        {
            m_skippedLayers++;
            return;
        }

        const QRect destRect = LayerTransform::toPixelRect(fit.destRect);
        const QRect sourceRect = LayerTransform::toPixelRect(fit.sourceRect).intersected(layer.image.rect());
        if (destRect.isEmpty() || sourceRect.isEmpty())
        {
            m_skippedLayers++;
            return;
        }

        const QRect visible = destRect.intersected(output.rect());
        if (visible.isEmpty())
        {
            // 完全在画布外
            return;
        }

        QImage scaled = layer.image.copy(sourceRect)
                            .scaled(destRect.size(), Qt::IgnoreAspectRatio, Qt::SmoothTransformation)
                            .convertToFormat(QImage::Format_ARGB32);

        const float opacity = std::min(layer.opacity, 1.0f);
        for (int y = visible.top(); y <= visible.bottom(); ++y)
        {
            QRgb *dstLine = reinterpret_cast<QRgb *>(output.scanLine(y));
            const QRgb *srcLine = reinterpret_cast<const QRgb *>(scaled.constScanLine(y - destRect.top()));
            for (int x = visible.left(); x <= visible.right(); ++x)
            {
                const QRgb src = srcLine[x - destRect.left()];
                if (opacity >= 1.0f && qAlpha(src) == 255)
                {
                    dstLine[x] = src;
                }
                else
                {
                    dstLine[x] = blendOver(dstLine[x], src, opacity);
                }
            }
        }
    }

} // namespace StackComposer
