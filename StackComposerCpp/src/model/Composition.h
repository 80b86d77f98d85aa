#ifndef COMPOSITION_H
#define COMPOSITION_H

#include <memory>
#include <string>
#include <vector>

#include "AppSettings.h"
#include "CanvasSize.h"
#include "MediaItem.h"
#include "MediaLayer.h"

namespace StackComposer
{

    class Composition;

    // 只读快照，供预览与导出线程读取
    using CompositionSnapshot = std::shared_ptr<const Composition>;

    // 画布状态：比例、图层、循环与吸附开关
    // 只应在控制线程上修改
    class Composition
    {
    public:
        // 合成总时长上限（秒）
        static constexpr double kMaxDuration = 90.0;

        Composition();
        explicit Composition(const AppSettings &settings, const std::string &name = "Untitled");

        const std::string &id() const { return m_id; }
        const std::string &name() const { return m_name; }
        void setName(const std::string &name) { m_name = name; }

        CanvasSize canvasSize() const { return m_canvasSize; }
        void setCanvasSize(CanvasSize canvas) { m_canvasSize = canvas; }

        bool loopMedia() const { return m_loopMedia; }
        void setLoopMedia(bool loop) { m_loopMedia = loop; }

        bool snapToGrid() const { return m_snapToGrid; }
        void setSnapToGrid(bool snap) { m_snapToGrid = snap; }

        int gridDivisions() const { return m_gridDivisions; }
        void setGridDivisions(int divisions);

        // 按插入顺序存储
        const std::vector<MediaLayer> &layers() const { return m_layers; }

        // 按 zIndex 升序，相同时保持插入顺序
        std::vector<MediaLayer> sortedLayers() const;

        // 图层在存储中的位置，用于 zIndex 相同时的排序，找不到返回 -1
        int insertionOrder(const std::string &layerId) const;

        const MediaLayer *findLayer(const std::string &layerId) const;
        bool isEmpty() const { return m_layers.empty(); }
        size_t layerCount() const { return m_layers.size(); }

        // 添加现成的图层，素材必须存在于素材库且类型一致
        bool addLayer(const MediaLayer &layer, const MediaLibrary &library);

        // 从素材新建图层，放在最上层，返回新图层 id
        std::string addLayer(const MediaItem &item, const AppSettings &settings);

        bool removeLayer(const std::string &layerId);
        bool updateLayer(const MediaLayer &layer);

        bool setLayerPosition(const std::string &layerId, const QPointF &position);
        bool setLayerSize(const std::string &layerId, const QSizeF &size);
        bool setLayerOpacity(const std::string &layerId, float opacity);
        bool setLayerVisible(const std::string &layerId, bool visible);

        bool bringToFront(const std::string &layerId);
        bool sendToBack(const std::string &layerId);

        // 仅对图片图层生效
        bool updateImageDuration(const std::string &layerId, double seconds);

        // 仅对视频图层生效，音量限制在 [0, 1]
        bool updateAudioVolume(const std::string &layerId, float volume);
        bool toggleMute(const std::string &layerId);

        // 清空图层并恢复默认
        void reset(const AppSettings &settings);

        // min(可见图层时长最大值, 90 秒)
        double effectiveDuration(const MediaLibrary &library) const;

        CompositionSnapshot snapshot() const;

        std::string errorString() const { return m_errorString; }

    private:
        MediaLayer *mutableLayer(const std::string &layerId);
        void reindexLayers();
        QPointF snapPosition(const QPointF &position) const;
        int maxZIndex() const;
        int minZIndex() const;

        std::string m_id;
        std::string m_name;
        CanvasSize m_canvasSize = CanvasSize::PORTRAIT_9x16;
        std::vector<MediaLayer> m_layers;
        bool m_loopMedia = true;
        bool m_snapToGrid = false;
        int m_gridDivisions = 12;
        std::string m_errorString;
    };

} // namespace StackComposer

#endif // COMPOSITION_H
