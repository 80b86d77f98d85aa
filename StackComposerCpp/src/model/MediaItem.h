#ifndef MEDIA_ITEM_H
#define MEDIA_ITEM_H

#include <QSize>
#include <map>
#include <string>
#include <vector>

namespace StackComposer {

enum class MediaKind {
    VIDEO,
    IMAGE
};

// 已导入的素材
struct MediaItem {
    std::string id;
    MediaKind kind = MediaKind::IMAGE;
    std::string path;
    QSize nativeSize;
    double videoDuration = 0.0;  // 仅视频（秒）
    double imageDuration = 1.0;  // 仅图片（秒）

    bool isVideo() const { return kind == MediaKind::VIDEO; }
    bool isImage() const { return kind == MediaKind::IMAGE; }

    // 视频取素材时长，图片取展示时长
    double duration() const { return isVideo() ? videoDuration : imageDuration; }

    double aspectRatio() const;

    // 视频 m:ss，图片 IMG
    std::string formattedDuration() const;

    static MediaItem video(const std::string &id, const std::string &path, const QSize &size, double duration);
    static MediaItem image(const std::string &id, const std::string &path, const QSize &size, double displayDuration);
};

std::string formatDisplayDuration(double seconds);

// 按 id 索引的素材库
class MediaLibrary
{
public:
    void add(const MediaItem &item);
    bool remove(const std::string &id);
    const MediaItem *find(const std::string &id) const;
    MediaItem *find(const std::string &id);
    bool contains(const std::string &id) const { return m_items.count(id) > 0; }
    size_t size() const { return m_items.size(); }

private:
    std::map<std::string, MediaItem> m_items;
};

} // namespace StackComposer

#endif // MEDIA_ITEM_H
