#ifndef APP_SETTINGS_H
#define APP_SETTINGS_H

#include <algorithm>
#include "CanvasSize.h"

namespace StackComposer {

constexpr double kMinImageDuration = 0.5;
constexpr double kMaxImageDuration = 5.0;

inline double clampImageDuration(double seconds) {
    return std::min(std::max(seconds, kMinImageDuration), kMaxImageDuration);
}

// 用户偏好，新建合成和新图层从这里取默认值
struct AppSettings {
    double defaultImageDuration = 1.0;  // 秒，0.5-5.0
    CanvasSize defaultCanvas = CanvasSize::PORTRAIT_9x16;
    bool loopMediaByDefault = true;
};

} // namespace StackComposer

#endif // APP_SETTINGS_H
