#include "Composition.h"

#include <QDebug>
#include <QUuid>
#include <algorithm>
#include <cmath>

namespace StackComposer
{

    Composition::Composition()
        : Composition(AppSettings())
    {
    }

    Composition::Composition(const AppSettings &settings, const std::string &name)
        : m_id(QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString()),
          m_name(name),
          m_canvasSize(settings.defaultCanvas),
          m_loopMedia(settings.loopMediaByDefault)
    {
    }

    void Composition::setGridDivisions(int divisions)
    {
        m_gridDivisions = std::max(1, divisions);
    }

    std::vector<MediaLayer> Composition::sortedLayers() const
    {
        std::vector<MediaLayer> sorted = m_layers;
        std::stable_sort(sorted.begin(), sorted.end(), [](const MediaLayer &a, const MediaLayer &b) {
            return a.zIndex < b.zIndex;
        });
        return sorted;
    }

    int Composition::insertionOrder(const std::string &layerId) const
    {
        for (size_t i = 0; i < m_layers.size(); ++i)
        {
            if (m_layers[i].id == layerId)
            {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    const MediaLayer *Composition::findLayer(const std::string &layerId) const
    {
        auto it = std::find_if(m_layers.begin(), m_layers.end(), [&](const MediaLayer &layer) {
            return layer.id == layerId;
        });
        return it == m_layers.end() ? nullptr : &(*it);
    }

    MediaLayer *Composition::mutableLayer(const std::string &layerId)
    {
        auto it = std::find_if(m_layers.begin(), m_layers.end(), [&](const MediaLayer &layer) {
            return layer.id == layerId;
        });
        if (it == m_layers.end())
        {
            m_errorString = "图层不存在: " + layerId;
            return nullptr;
        }
        return &(*it);
    }

    bool Composition::addLayer(const MediaLayer &layer, const MediaLibrary &library)
    {
        if (!layer.isValid())
        {
            m_errorString = "图层无效: " + layer.id;
            return false;
        }

        if (findLayer(layer.id))
        {
            m_errorString = "图层 id 重复: " + layer.id;
            return false;
        }

        const MediaItem *item = library.find(layer.mediaId);
        if (!item)
        {
            m_errorString = "图层引用了不存在的素材: " + layer.mediaId;
            return false;
        }

        if (item->kind != layer.kind())
        {
            m_errorString = "图层时间属性与素材类型不一致: " + layer.id;
            return false;
        }

        MediaLayer added = layer;
        if (m_snapToGrid)
        {
            added.position = snapPosition(added.position);
        }
        m_layers.push_back(added);
        return true;
    }

    std::string Composition::addLayer(const MediaItem &item, const AppSettings &settings)
    {
        const int zIndex = m_layers.empty() ? 0 : maxZIndex() + 1;
        MediaLayer layer = MediaLayer::fromMedia(item, zIndex, settings);
        if (m_snapToGrid)
        {
            layer.position = snapPosition(layer.position);
        }
        m_layers.push_back(layer);
        return layer.id;
    }

    bool Composition::removeLayer(const std::string &layerId)
    {
        auto it = std::find_if(m_layers.begin(), m_layers.end(), [&](const MediaLayer &layer) {
            return layer.id == layerId;
        });
        if (it == m_layers.end())
        {
            m_errorString = "图层不存在: " + layerId;
            return false;
        }

        m_layers.erase(it);
        reindexLayers();
        return true;
    }

    bool Composition::updateLayer(const MediaLayer &layer)
    {
        MediaLayer *existing = mutableLayer(layer.id);
        if (!existing)
        {
            return false;
        }

        if (!layer.isValid() || layer.mediaId != existing->mediaId || layer.kind() != existing->kind())
        {
            m_errorString = "图层更新无效: " + layer.id;
            return false;
        }

        *existing = layer;
        return true;
    }

    bool Composition::setLayerPosition(const std::string &layerId, const QPointF &position)
    {
        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }
        // 不限制在 [0,1]，允许超出画布
        layer->position = m_snapToGrid ? snapPosition(position) : position;
        return true;
    }

    bool Composition::setLayerSize(const std::string &layerId, const QSizeF &size)
    {
        if (size.width() <= 0.0 || size.height() <= 0.0)
        {
            m_errorString = "图层尺寸必须大于 0";
            return false;
        }

        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }
        layer->size = size;
        return true;
    }

    bool Composition::setLayerOpacity(const std::string &layerId, float opacity)
    {
        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }
        layer->opacity = std::min(std::max(opacity, 0.0f), 1.0f);
        return true;
    }

    bool Composition::setLayerVisible(const std::string &layerId, bool visible)
    {
        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }
        layer->visible = visible;
        return true;
    }

    bool Composition::bringToFront(const std::string &layerId)
    {
        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }

        const int top = maxZIndex();
        const bool alreadyOnTop = layer->zIndex == top &&
                                  std::count_if(m_layers.begin(), m_layers.end(), [top](const MediaLayer &l) {
                                      return l.zIndex == top;
                                  }) == 1;
        if (!alreadyOnTop)
        {
            layer->zIndex = top + 1;
        }
        return true;
    }

    bool Composition::sendToBack(const std::string &layerId)
    {
        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }

        const int bottom = minZIndex();
        const bool alreadyAtBottom = layer->zIndex == bottom &&
                                     std::count_if(m_layers.begin(), m_layers.end(), [bottom](const MediaLayer &l) {
                                         return l.zIndex == bottom;
                                     }) == 1;
        if (alreadyAtBottom)
        {
            return true;
        }

        layer->zIndex = bottom - 1;
        // 只有出现负数时才重新编号
        if (layer->zIndex < 0)
        {
            reindexLayers();
        }
        return true;
    }

    bool Composition::updateImageDuration(const std::string &layerId, double seconds)
    {
        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }

        ImageTiming *timing = layer->imageTiming();
        if (!timing)
        {
            m_errorString = "只有图片图层可以设置展示时长: " + layerId;
            return false;
        }
        timing->displayDuration = clampImageDuration(seconds);
        return true;
    }

    bool Composition::updateAudioVolume(const std::string &layerId, float volume)
    {
        MediaLayer *layer = mutableLayer(layerId);
        if (!layer)
        {
            return false;
        }

        VideoTiming *timing = layer->videoTiming();
        if (!timing)
        {
            m_errorString = "只有视频图层可以设置音量: " + layerId;
            return false;
        }
        timing->volume = std::min(std::max(volume, 0.0f), 1.0f);
        return true;
    }

    bool Composition::toggleMute(const std::string &layerId)
    {
        const MediaLayer *layer = findLayer(layerId);
        if (!layer)
        {
            m_errorString = "图层不存在: " + layerId;
            return false;
        }
        return updateAudioVolume(layerId, layer->isMuted() ? 1.0f : 0.0f);
    }

    void Composition::reset(const AppSettings &settings)
    {
        m_layers.clear();
        m_canvasSize = settings.defaultCanvas;
        m_loopMedia = settings.loopMediaByDefault;
        m_snapToGrid = false;
        m_errorString.clear();
    }

    double Composition::effectiveDuration(const MediaLibrary &library) const
    {
        double longest = 0.0;
        for (const MediaLayer &layer : m_layers)
        {
            // 隐藏图层不参与导出，也不计入时长
            if (!layer.visible)
            {
                continue;
            }
            longest = std::max(longest, layer.contentDuration(library.find(layer.mediaId)));
        }
        return std::min(longest, kMaxDuration);
    }

    CompositionSnapshot Composition::snapshot() const
    {
        return std::make_shared<const Composition>(*this);
    }

    void Composition::reindexLayers()
    {
        // 按当前相对顺序重新编号为 0..n-1
        std::vector<size_t> order(m_layers.size());
        for (size_t i = 0; i < order.size(); ++i)
        {
            order[i] = i;
        }
        std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
            return m_layers[a].zIndex < m_layers[b].zIndex;
        });
        for (size_t rank = 0; rank < order.size(); ++rank)
        {
            m_layers[order[rank]].zIndex = static_cast<int>(rank);
        }
    }

    QPointF Composition::snapPosition(const QPointF &position) const
    {
        const double step = 1.0 / m_gridDivisions;
        return QPointF(std::round(position.x() / step) * step,
                       std::round(position.y() / step) * step);
    }

    int Composition::maxZIndex() const
    {
        int top = 0;
        bool first = true;
        for (const MediaLayer &layer : m_layers)
        {
            if (first || layer.zIndex > top)
            {
                top = layer.zIndex;
                first = false;
            }
        }
        return top;
    }

    int Composition::minZIndex() const
    {
        int bottom = 0;
        bool first = true;
        for (const MediaLayer &layer : m_layers)
        {
            if (first || layer.zIndex < bottom)
            {
                bottom = layer.zIndex;
                first = false;
            }
        }
        return bottom;
    }

} // namespace StackComposer
