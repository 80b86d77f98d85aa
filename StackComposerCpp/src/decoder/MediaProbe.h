#ifndef MEDIA_PROBE_H
#define MEDIA_PROBE_H

#include "../engine/ExportInterfaces.h"

namespace StackComposer
{

    // 用 avformat 读取素材的流信息与时长
    class MediaProbe : public IMediaProbe
    {
    public:
        bool probe(const std::string &path, MediaProbeInfo &info, std::string &error) override;
    };

} // namespace StackComposer

#endif // MEDIA_PROBE_H
