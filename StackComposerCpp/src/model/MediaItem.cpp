#include "MediaItem.h"
#include "AppSettings.h"

#include <cmath>
#include <cstdio>

namespace StackComposer
{

    double MediaItem::aspectRatio() const
    {
        if (nativeSize.height() <= 0)
        {
            return 1.0;
        }
        return static_cast<double>(nativeSize.width()) / nativeSize.height();
    }

    std::string MediaItem::formattedDuration() const
    {
        return isVideo() ? formatDisplayDuration(videoDuration) : "IMG";
    }

    MediaItem MediaItem::video(const std::string &id, const std::string &path, const QSize &size, double duration)
    {
        MediaItem item;
        item.id = id;
        item.kind = MediaKind::VIDEO;
        item.path = path;
        item.nativeSize = size;
        item.videoDuration = std::max(0.0, duration);
        return item;
    }

    MediaItem MediaItem::image(const std::string &id, const std::string &path, const QSize &size, double displayDuration)
    {
        MediaItem item;
        item.id = id;
        item.kind = MediaKind::IMAGE;
        item.path = path;
        item.nativeSize = size;
        item.imageDuration = clampImageDuration(displayDuration);
        return item;
    }

    std::string formatDisplayDuration(double seconds)
    {
        const int total = static_cast<int>(std::floor(std::max(0.0, seconds)));
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "%d:%02d", total / 60, total % 60);
        return buffer;
    }

    void MediaLibrary::add(const MediaItem &item)
    {
        m_items[item.id] = item;
    }

    bool MediaLibrary::remove(const std::string &id)
    {
        return m_items.erase(id) > 0;
    }

    const MediaItem *MediaLibrary::find(const std::string &id) const
    {
        auto it = m_items.find(id);
        return it == m_items.end() ? nullptr : &it->second;
    }

    MediaItem *MediaLibrary::find(const std::string &id)
    {
        auto it = m_items.find(id);
        return it == m_items.end() ? nullptr : &it->second;
    }


} // namespace StackComposer
