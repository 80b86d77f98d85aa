#include "playbacksynchronizer.h"
#include "layerplayer.h"
#include <QDebug>
#include <cmath>
#include <cstdlib>
#include <vector>

using namespace StackComposer;

PlaybackSynchronizer::PlaybackSynchronizer(QObject *parent)
    : QObject(parent),
      m_factory([](QObject *owner) -> ILayerPlayer * { return new LayerPlayer(owner); }) {}

PlaybackSynchronizer::~PlaybackSynchronizer() = default;

void PlaybackSynchronizer::setPlayerFactory(PlayerFactory factory) {
  m_factory = std::move(factory);
}

void PlaybackSynchronizer::sync(const Composition &composition,
                                const MediaLibrary &library) {
  m_durationMs = std::llround(composition.effectiveDuration(library) * 1000.0);
  if (composition.loopMedia() != m_looping)
    setLooping(composition.loopMedia());

  std::set<std::string> wanted;
  for (const MediaLayer &layer : composition.layers()) {
    const VideoTiming *timing = layer.videoTiming();
    if (!timing || !layer.visible)
      continue;

    const MediaItem *item = library.find(layer.mediaId);
    if (!item || !item->isVideo())
      continue;

    wanted.insert(layer.id);
    if (m_excluded.count(layer.id))
      continue;

    const qint64 startOffsetMs = std::llround(timing->startOffset * 1000.0);
    auto it = m_clocks.find(layer.id);
    if (it == m_clocks.end()) {
      LayerClock clock;
      clock.mediaId = item->id;
      clock.path = QString::fromStdString(item->path);
      clock.startOffsetMs = startOffsetMs;
      clock.rate = timing->playbackRate;
      clock.volume = timing->volume;
      addLayer(layer.id, clock);
      continue;
    }

    // 已有图层只更新变化的参数，不打断播放
    LayerClock &clock = it->second;
    if (clock.volume != timing->volume) {
      clock.volume = timing->volume;
      clock.player->setVolume(clock.volume);
    }
    if (clock.rate != timing->playbackRate) {
      clock.rate = timing->playbackRate;
      clock.player->setPlaybackRate(clock.rate);
    }
    if (clock.startOffsetMs != startOffsetMs) {
      clock.startOffsetMs = startOffsetMs;
      seekLayer(clock, position());
    }
  }

  std::vector<std::string> removed;
  for (const auto &entry : m_clocks) {
    if (!wanted.count(entry.first))
      removed.push_back(entry.first);
  }
  for (const std::string &layerId : removed)
    releaseLayer(layerId);

  for (auto it = m_excluded.begin(); it != m_excluded.end();) {
    if (wanted.count(*it))
      ++it;
    else
      it = m_excluded.erase(it);
  }
}

void PlaybackSynchronizer::clear() {
  std::vector<std::string> layerIds;
  for (const auto &entry : m_clocks)
    layerIds.push_back(entry.first);
  for (const std::string &layerId : layerIds)
    releaseLayer(layerId);

  m_excluded.clear();
  const bool wasPlaying = m_playing;
  m_playing = false;
  m_basePosition = 0;
  m_clock.invalidate();
  m_durationMs = 0;
  if (wasPlaying)
    emit playingChanged(false);
}

void PlaybackSynchronizer::play() {
  if (m_playing)
    return;

  // 不循环且已在末尾时从头开始
  if (!m_looping && m_durationMs > 0 && position() >= m_durationMs)
    seek(0);

  for (auto &entry : m_clocks)
    entry.second.player->play();

  m_clock.restart();
  m_playing = true;
  qDebug() << "PlaybackSynchronizer: 开始播放" << m_clocks.size() << "个图层，位置"
           << m_basePosition << "ms";
  emit playingChanged(true);
}

void PlaybackSynchronizer::pause() {
  if (!m_playing)
    return;

  m_basePosition = position();
  m_clock.invalidate();
  m_playing = false;

  for (auto &entry : m_clocks)
    entry.second.player->pause();

  qDebug() << "PlaybackSynchronizer: 暂停于" << m_basePosition << "ms";
  emit playingChanged(false);
}

void PlaybackSynchronizer::togglePlayback() {
  if (m_playing)
    pause();
  else
    play();
}

void PlaybackSynchronizer::seek(qint64 position) {
  if (position < 0)
    position = 0;
  if (position > m_durationMs)
    position = m_durationMs;

  m_basePosition = position;
  if (m_playing)
    m_clock.restart();

  for (auto &entry : m_clocks)
    seekLayer(entry.second, position);

  emit positionChanged(position);
}

void PlaybackSynchronizer::setLooping(bool looping) {
  m_basePosition = position();
  if (m_playing)
    m_clock.restart();
  m_looping = looping;

  for (auto &entry : m_clocks)
    entry.second.player->setLooping(looping);
}

void PlaybackSynchronizer::setLayerVolume(const std::string &layerId, float volume) {
  auto it = m_clocks.find(layerId);
  if (it == m_clocks.end()) {
    qDebug() << "PlaybackSynchronizer: 图层没有播放器" << QString::fromStdString(layerId);
    return;
  }

  it->second.volume = qBound(0.0f, volume, 1.0f);
  it->second.player->setVolume(it->second.volume);
}

void PlaybackSynchronizer::tick() {
  if (!m_playing)
    return;

  const qint64 current = position();
  if (!m_looping && current >= m_durationMs) {
    pause();
    m_basePosition = m_durationMs;
    emit positionChanged(m_durationMs);
    emit playbackFinished();
    return;
  }
  emit positionChanged(current);
}

qint64 PlaybackSynchronizer::position() const {
  if (m_durationMs <= 0)
    return 0;

  qint64 current = m_basePosition;
  if (m_playing && m_clock.isValid())
    current += m_clock.elapsed();

  if (m_looping)
    return current % m_durationMs;
  return qMin(current, m_durationMs);
}

ILayerPlayer *PlaybackSynchronizer::player(const std::string &layerId) const {
  auto it = m_clocks.find(layerId);
  return it != m_clocks.end() ? it->second.player : nullptr;
}

QImage PlaybackSynchronizer::currentFrame(const std::string &layerId) const {
  ILayerPlayer *layerPlayer = player(layerId);
  return layerPlayer ? layerPlayer->currentFrame() : QImage();
}

bool PlaybackSynchronizer::hasPlayer(const std::string &layerId) const {
  return m_clocks.count(layerId) > 0;
}

bool PlaybackSynchronizer::isExcluded(const std::string &layerId) const {
  return m_excluded.count(layerId) > 0;
}

int PlaybackSynchronizer::activeLayerCount() const {
  return static_cast<int>(m_clocks.size());
}

void PlaybackSynchronizer::addLayer(const std::string &layerId, const LayerClock &clock) {
  ILayerPlayer *layerPlayer = m_factory ? m_factory(this) : nullptr;
  if (!layerPlayer) {
    excludeLayer(layerId, "无法创建播放器");
    return;
  }

  LayerClock &entry = m_clocks[layerId];
  entry = clock;
  entry.player = layerPlayer;

  const QString id = QString::fromStdString(layerId);
  connect(layerPlayer, &ILayerPlayer::errorOccurred, this,
          [this, layerId](const QString &error) { excludeLayer(layerId, error); });
  connect(layerPlayer, &ILayerPlayer::looped, this,
          [this, id]() { emit layerLooped(id); });

  layerPlayer->setLooping(m_looping);
  layerPlayer->setVolume(entry.volume);
  layerPlayer->setPlaybackRate(entry.rate);

  const QString path = entry.path;
  if (!layerPlayer->load(path)) {
    excludeLayer(layerId, "无法打开素材: " + path);
    return;
  }

  // load 中同步报错时图层已被排除
  auto it = m_clocks.find(layerId);
  if (it == m_clocks.end())
    return;

  qDebug() << "PlaybackSynchronizer: 添加图层" << id << path;

  // 加入时对齐到当前合成时间
  const qint64 target = sourcePosition(it->second, position());
  if (target > 0)
    layerPlayer->seek(target);
  if (m_playing)
    layerPlayer->play();
}

void PlaybackSynchronizer::releaseLayer(const std::string &layerId) {
  auto it = m_clocks.find(layerId);
  if (it == m_clocks.end())
    return;

  ILayerPlayer *layerPlayer = it->second.player;
  m_clocks.erase(it);

  if (layerPlayer) {
    layerPlayer->disconnect(this);
    layerPlayer->stop();
    // 可能正处于该播放器自己的信号中
    layerPlayer->deleteLater();
  }
}

void PlaybackSynchronizer::excludeLayer(const std::string &layerId, const QString &reason) {
  if (m_excluded.count(layerId))
    return;

  const QString id = QString::fromStdString(layerId);
  qWarning() << "PlaybackSynchronizer: 图层" << id << "无法播放，已排除:" << reason;
  m_excluded.insert(layerId);
  releaseLayer(layerId);
  emit layerExcluded(id, reason);
}

void PlaybackSynchronizer::seekLayer(LayerClock &clock, qint64 compositionMs) {
  const qint64 target = sourcePosition(clock, compositionMs);
  if (std::llabs(clock.player->position() - target) <= m_seekToleranceMs)
    return;
  clock.player->seek(target);
}

qint64 PlaybackSynchronizer::sourcePosition(const LayerClock &clock,
                                            qint64 compositionMs) const {
  qint64 source = clock.startOffsetMs + std::llround(compositionMs * clock.rate);
  const qint64 total = clock.player ? clock.player->duration() : 0;
  if (total <= 0)
    return source;

  // 循环的图层按各自时长回绕
  if (m_looping)
    return source % total;
  return qMin(source, total);
}
