#ifndef EXPORT_ASSEMBLER_H
#define EXPORT_ASSEMBLER_H

#include <string>
#include <vector>

#include "../model/Composition.h"
#include "../model/ExportSettings.h"
#include "ExportError.h"
#include "ExportInterfaces.h"
#include "ExportTimeline.h"

namespace StackComposer
{

    // 构建阶段：把合成快照映射为多轨时间线
    class ExportAssembler
    {
    public:
        // 音频轨 id = 视频轨 id + 100
        static constexpr int kAudioTrackIdOffset = 100;

        explicit ExportAssembler(IMediaProbe &probe);

        bool build(const Composition &composition, const MediaLibrary &library,
                   const ExportSettings &settings, ExportTimeline &timeline);

        const ExportError &error() const { return m_error; }
        std::string errorString() const { return m_error.reason; }

        // 本次构建中被跳过的图层 id
        const std::vector<std::string> &skippedLayers() const { return m_skippedLayers; }

    private:
        bool addVideoLayer(const MediaLayer &layer, const MediaItem &item, int order, ExportTimeline &timeline);
        void addImageLayer(const MediaLayer &layer, const MediaItem &item, int order, ExportTimeline &timeline);
        void skipLayer(const MediaLayer &layer, const std::string &reason);

        IMediaProbe &m_probe;
        ExportError m_error;
        std::vector<std::string> m_skippedLayers;
        int m_nextTrackId = 1;
    };

} // namespace StackComposer

#endif // EXPORT_ASSEMBLER_H
