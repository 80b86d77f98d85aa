#ifndef AV_PACKET_WRAPPER_H
#define AV_PACKET_WRAPPER_H

#include <memory>
#include "FFmpegHeaders.h"

namespace StackComposer
{
namespace FFmpegUtils
{

    struct AvPacketDeleter {
        void operator()(AVPacket *packet) const
        {
            if (packet) {
                av_packet_free(&packet);
            }
        }
    };

    using AvPacketPtr = std::unique_ptr<AVPacket, AvPacketDeleter>;

    inline AvPacketPtr createAvPacket()
    {
        return AvPacketPtr(av_packet_alloc());
    }

} // namespace FFmpegUtils
} // namespace StackComposer

#endif // AV_PACKET_WRAPPER_H
