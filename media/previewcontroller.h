#ifndef PREVIEWCONTROLLER_H
#define PREVIEWCONTROLLER_H

#include "compositor/FrameCompositor.h"
#include "engine/ExportInterfaces.h"
#include "model/Composition.h"
#include "model/ProjectConfig.h"
#include "playbacksynchronizer.h"
#include <QImage>
#include <QObject>
#include <QSize>
#include <QTimer>
#include <map>
#include <memory>
#include <string>

/**
 * @brief 实时预览
 *
 * 每次刷新读取合成快照，视频图层取各自播放器的当前帧，
 * 图片图层取缓存的解码结果，用交互模式的 FrameCompositor 合成。
 * 上一帧合成超时时跳过下一次刷新。
 */
class PreviewController : public QObject {
  Q_OBJECT

public:
  explicit PreviewController(QObject *parent = nullptr);
  ~PreviewController() override;

  void setConfig(const StackComposer::PreviewConfig &config);

  // 图片解码来源，默认使用 FFmpeg
  void setFrameSources(std::shared_ptr<StackComposer::IFrameSourceFactory> sources);

  // 预览区域大小，画布按比例放入其中
  void setViewportSize(const QSize &size);
  QSize outputSize() const;

  // 控制线程在每次编辑后调用
  void setComposition(StackComposer::CompositionSnapshot snapshot,
                      const StackComposer::MediaLibrary &library);

  PlaybackSynchronizer *synchronizer() const { return m_synchronizer; }
  const StackComposer::FrameCompositor &compositor() const { return m_compositor; }

  void start();
  void stop();
  bool isRunning() const { return m_timer->isActive(); }

  // 合成当前时刻的一帧
  bool renderFrame(QImage &frame);

  QImage lastFrame() const { return m_lastFrame; }
  int droppedFrames() const { return m_droppedFrames; }

signals:
  void frameReady(const QImage &frame);

private slots:
  void onTick();

private:
  const QImage &imageFor(const StackComposer::MediaItem &item);

  QTimer *m_timer = nullptr;
  PlaybackSynchronizer *m_synchronizer = nullptr;
  StackComposer::FrameCompositor m_compositor;
  std::shared_ptr<StackComposer::IFrameSourceFactory> m_sources;

  StackComposer::CompositionSnapshot m_snapshot;
  StackComposer::MediaLibrary m_library;

  // 按素材 id 缓存，解码失败的记为空图
  std::map<std::string, QImage> m_imageCache;

  StackComposer::PreviewConfig m_config;
  QSize m_viewportSize{1080, 1920};
  QImage m_lastFrame;
  qint64 m_lastRenderMs = 0;
  int m_droppedFrames = 0;
};

#endif // PREVIEWCONTROLLER_H
