#include "previewcontroller.h"
#include "decoder/FrameSources.h"
#include <QDebug>
#include <QElapsedTimer>
#include <vector>

using namespace StackComposer;

PreviewController::PreviewController(QObject *parent)
    : QObject(parent),
      m_compositor(RenderProfile::interactive()),
      m_sources(std::make_shared<FFmpegFrameSourceFactory>()) {
  m_timer = new QTimer(this);
  m_timer->setTimerType(Qt::PreciseTimer);
  m_timer->setInterval(m_config.tick_interval_ms);
  connect(m_timer, &QTimer::timeout, this, &PreviewController::onTick);

  m_synchronizer = new PlaybackSynchronizer(this);
  m_synchronizer->setSeekTolerance(m_config.seek_tolerance_ms);
}

PreviewController::~PreviewController() { stop(); }

void PreviewController::setConfig(const PreviewConfig &config) {
  m_config = config;
  m_timer->setInterval(config.tick_interval_ms);
  m_synchronizer->setSeekTolerance(config.seek_tolerance_ms);

  const QColor background = m_compositor.backgroundColor();
  m_compositor = FrameCompositor(RenderProfile::interactive(LayerTransform::fitModeFromString(config.fit_mode)));
  m_compositor.setBackgroundColor(background);
}

void PreviewController::setFrameSources(std::shared_ptr<IFrameSourceFactory> sources) {
  m_sources = std::move(sources);
  m_imageCache.clear();
}

void PreviewController::setViewportSize(const QSize &size) { m_viewportSize = size; }

QSize PreviewController::outputSize() const {
  if (!m_snapshot)
    return m_viewportSize;
  return fittedSize(m_snapshot->canvasSize(), QSizeF(m_viewportSize)).toSize();
}

void PreviewController::setComposition(CompositionSnapshot snapshot,
                                       const MediaLibrary &library) {
  m_snapshot = std::move(snapshot);
  m_library = library;

  for (auto it = m_imageCache.begin(); it != m_imageCache.end();) {
    if (m_library.contains(it->first))
      ++it;
    else
      it = m_imageCache.erase(it);
  }

  if (m_snapshot) {
    m_synchronizer->sync(*m_snapshot, m_library);
  } else {
    m_synchronizer->clear();
  }
}

void PreviewController::start() {
  if (m_timer->isActive())
    return;
  m_lastRenderMs = 0;
  m_timer->start();
}

void PreviewController::stop() { m_timer->stop(); }

bool PreviewController::renderFrame(QImage &frame) {
  std::vector<LayerContent> contents;

  if (m_snapshot) {
    const double t = m_synchronizer->position() / 1000.0;
    const std::vector<MediaLayer> &layers = m_snapshot->layers();
    contents.reserve(layers.size());
    for (size_t i = 0; i < layers.size(); ++i) {
      const MediaLayer &layer = layers[i];
      if (!layer.visible)
        continue;

      LayerContent content;
      content.layerId = layer.id;
      content.zIndex = layer.zIndex;
      content.order = static_cast<int>(i);
      content.position = layer.position;
      content.size = layer.size;
      content.opacity = layer.opacity;

      const MediaItem *item = m_library.find(layer.mediaId);
      if (!item) {
        content.status = ContentStatus::UNAVAILABLE;
      } else if (item->isVideo()) {
        content.image = m_synchronizer->currentFrame(layer.id);
        if (!content.image.isNull()) {
          content.status = ContentStatus::AVAILABLE;
        } else if (m_synchronizer->isExcluded(layer.id)) {
          content.status = ContentStatus::FAILED;
          content.error = "图层已从播放中排除";
        } else {
          // 播放器还没解出第一帧
          content.status = ContentStatus::UNAVAILABLE;
        }
      } else if (t >= layer.contentDuration(item)) {
        // 与导出一致，图片只在展示时长内可见
        content.status = ContentStatus::UNAVAILABLE;
      } else {
        content.image = imageFor(*item);
        if (content.image.isNull()) {
          content.status = ContentStatus::FAILED;
          content.error = "图片解码失败: " + item->path;
        } else {
          content.status = ContentStatus::AVAILABLE;
        }
      }
      contents.push_back(content);
    }
  }

  if (!m_compositor.composite(contents, outputSize(), frame)) {
    qWarning() << "PreviewController: 合成失败"
               << QString::fromStdString(m_compositor.errorString());
    return false;
  }
  return true;
}

void PreviewController::onTick() {
  m_synchronizer->tick();

  if (m_compositor.profile().allowFrameSkip && m_lastRenderMs > m_config.tick_interval_ms) {
    // 上一帧超时，跳过这次刷新追赶时钟
    ++m_droppedFrames;
    m_lastRenderMs = 0;
    return;
  }

  QElapsedTimer timer;
  timer.start();

  QImage frame;
  if (renderFrame(frame)) {
    m_lastFrame = frame;
    emit frameReady(frame);
  }
  m_lastRenderMs = timer.elapsed();
}

const QImage &PreviewController::imageFor(const MediaItem &item) {
  auto it = m_imageCache.find(item.id);
  if (it != m_imageCache.end())
    return it->second;

  QImage image;
  std::string error;
  if (!m_sources || !m_sources->loadImage(item.path, image, error)) {
    qWarning() << "PreviewController: 图片加载失败" << QString::fromStdString(item.path)
               << QString::fromStdString(error);
    image = QImage();
  }
  return m_imageCache.emplace(item.id, image).first->second;
}
