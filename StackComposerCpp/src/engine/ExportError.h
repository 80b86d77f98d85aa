#ifndef EXPORT_ERROR_H
#define EXPORT_ERROR_H

#include <string>

namespace StackComposer {

enum class ExportErrorKind {
    NONE,
    COMPOSITION_FAILED,  // 构建时间线失败（配置错误等）
    SOURCE_UNREADABLE,   // 素材无法读取
    ENCODE_FAILED,       // 渲染或编码出错
    SAVE_FAILED,         // 交给外部保存时失败
    CANCELLED            // 用户取消
};

struct ExportError {
    ExportErrorKind kind = ExportErrorKind::NONE;
    std::string reason;

    bool isError() const { return kind != ExportErrorKind::NONE; }

    static ExportError make(ExportErrorKind kind, const std::string &reason) {
        ExportError error;
        error.kind = kind;
        error.reason = reason;
        return error;
    }
};

inline std::string toString(ExportErrorKind kind) {
    switch (kind) {
    case ExportErrorKind::NONE:
        return "none";
    case ExportErrorKind::COMPOSITION_FAILED:
        return "composition failed";
    case ExportErrorKind::SOURCE_UNREADABLE:
        return "source unreadable";
    case ExportErrorKind::ENCODE_FAILED:
        return "encode failed";
    case ExportErrorKind::SAVE_FAILED:
        return "save failed";
    case ExportErrorKind::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

} // namespace StackComposer

#endif // EXPORT_ERROR_H
