#include "layerplayer.h"
#include <QDebug>
#include <QFileInfo>

namespace {
// 比时钟超前这么多的帧视为 seek 前残留
constexpr qint64 kStaleFrameMs = 2000;
constexpr int kTickIntervalMs = 16;
} // namespace

LayerPlayer::LayerPlayer(QObject *parent) : ILayerPlayer(parent) {
  m_timer = new QTimer(this);
  m_timer->setTimerType(Qt::PreciseTimer);
  connect(m_timer, &QTimer::timeout, this, &LayerPlayer::onTimerFire);
}

LayerPlayer::~LayerPlayer() { cleanup(); }

bool LayerPlayer::load(const QString &filePath) {
  cleanup();

  QString path = filePath;
  if (path.startsWith("file://"))
    path.remove(0, 7);
  if (!QFileInfo::exists(path)) {
    qWarning() << "LayerPlayer: 文件不存在" << path;
    return false;
  }

  m_currentFilePath = path;
  m_basePosition = 0;
  m_lastFramePts = -1;
  m_reachedEof = false;

  m_demuxer = new Demuxer(this);
  connect(m_demuxer, &Demuxer::opened, this, &LayerPlayer::onDemuxerOpened);
  connect(m_demuxer, &Demuxer::endOfFile, this, &LayerPlayer::onDemuxerEndOfFile);
  connect(m_demuxer, &Demuxer::failedToOpen, this, &LayerPlayer::onDemuxerFailedToOpen);

  m_demuxer->setFilePath(path);
  m_demuxer->start(); // 在线程内打开文件
  return true;
}

void LayerPlayer::play() {
  if (m_playing)
    return;

  m_playing = true;
  m_clock.restart();
  resumeComponents();
}

void LayerPlayer::pause() {
  if (!m_playing)
    return;

  m_basePosition = clockPosition();
  m_clock.invalidate();
  m_playing = false;
  pauseComponents();
  emit positionChanged(m_basePosition);
}

void LayerPlayer::stop() { cleanup(); }

void LayerPlayer::seek(qint64 position) {
  const qint64 total = m_totalDuration.load();
  if (position < 0)
    position = 0;
  if (total > 0 && position > total)
    position = total;

  m_basePosition = position;
  if (m_playing)
    m_clock.restart();
  else
    m_clock.invalidate();
  m_lastFramePts = -1;
  m_reachedEof = false;

  if (m_opened && m_demuxer) {
    // 暂停所有组件，避免旧数据继续播放
    m_demuxer->requestPause();
    if (m_videoDecoder)
      m_videoDecoder->requestPause();
    if (m_audioDecoder)
      m_audioDecoder->requestPause();

    m_demuxer->requestSeek(position);

    if (m_audioDecoder) {
      m_audioDecoder->setDropUntil(position);
      m_audioDecoder->requestFlush();
    }
    if (m_videoDecoder) {
      m_videoDecoder->setDropUntil(position);
      m_videoDecoder->requestFlush();
      m_videoDecoder->clearFrameQueue();
    }

    m_demuxer->requestResume();
    if (m_videoDecoder)
      m_videoDecoder->requestResume();
    if (m_playing && m_audioDecoder)
      m_audioDecoder->requestResume();
  }

  emit positionChanged(position);
}

void LayerPlayer::setVolume(float volume) {
  m_volume = qBound(0.0f, volume, 1.0f);
  applyAudioVolume();
}

void LayerPlayer::setLooping(bool looping) { m_looping = looping; }

void LayerPlayer::setPlaybackRate(double rate) {
  if (rate <= 0.0) {
    qWarning() << "LayerPlayer: 无效的播放速率" << rate;
    return;
  }

  // 以当前位置为新的起点
  m_basePosition = clockPosition();
  if (m_playing)
    m_clock.restart();
  m_rate = rate;
  applyAudioVolume();
}

qint64 LayerPlayer::duration() const { return m_totalDuration.load(); }

qint64 LayerPlayer::position() const { return clockPosition(); }

bool LayerPlayer::isPlaying() const { return m_playing; }

QImage LayerPlayer::currentFrame() const {
  QReadLocker locker(&m_imageLock);
  return m_currentImage;
}

qint64 LayerPlayer::clockPosition() const {
  qint64 position = m_basePosition;
  if (m_clock.isValid())
    position += static_cast<qint64>(m_clock.elapsed() * m_rate);

  const qint64 total = m_totalDuration.load();
  if (total > 0 && position > total)
    position = total;
  return position;
}

void LayerPlayer::applyAudioVolume() {
  if (!m_audioDecoder)
    return;

  // 变速时预览不输出声音，导出会按速率处理音频
  if (qFuzzyCompare(m_rate, 1.0)) {
    m_audioDecoder->setVolume(m_volume);
  } else {
    m_audioDecoder->setVolume(0.0f);
  }
}

void LayerPlayer::pauseComponents() {
  if (m_audioDecoder)
    m_audioDecoder->requestPause();
}

void LayerPlayer::resumeComponents() {
  if (m_audioDecoder)
    m_audioDecoder->requestResume();
}

void LayerPlayer::restartFromBeginning() {
  qDebug() << "LayerPlayer: 循环播放" << m_currentFilePath;
  seek(0);
  emit looped();
}

void LayerPlayer::onDemuxerOpened(qint64 duration, int videoStreamIndex,
                                  int audioStreamIndex) {
  if (sender() != m_demuxer)
    return;

  m_totalDuration = duration;
  emit durationChanged(duration);

  if (videoStreamIndex == -1) {
    cleanup();
    emit errorOccurred("未找到可用的视频流");
    return;
  }

  m_videoDecoder = new VideoStreamDecoder(this);
  if (!m_videoDecoder->init(m_demuxer->formatContext(), videoStreamIndex)) {
    delete m_videoDecoder;
    m_videoDecoder = nullptr;
    cleanup();
    emit errorOccurred("视频解码器初始化失败");
    return;
  }
  m_videoDecoder->setDemuxer(m_demuxer);

  if (audioStreamIndex != -1) {
    m_audioDecoder = new AudioStreamDecoder(this);
    if (m_audioDecoder->init(m_demuxer->formatContext(), audioStreamIndex)) {
      m_audioDecoder->setDemuxer(m_demuxer);
      applyAudioVolume();
    } else {
      // 没有声音仍然可以预览画面
      qWarning() << "LayerPlayer: 音频解码器初始化失败，静音播放" << m_currentFilePath;
      delete m_audioDecoder;
      m_audioDecoder = nullptr;
    }
  }

  m_opened = true;

  // 打开之前收到的 seek
  if (m_basePosition > 0) {
    m_demuxer->requestSeek(m_basePosition);
    m_videoDecoder->setDropUntil(m_basePosition);
    if (m_audioDecoder)
      m_audioDecoder->setDropUntil(m_basePosition);
  }

  m_videoDecoder->start();
  if (m_audioDecoder) {
    if (!m_playing)
      m_audioDecoder->requestPause();
    m_audioDecoder->start();
  }

  if (m_playing)
    m_clock.restart();
  m_timer->start(kTickIntervalMs);
}

void LayerPlayer::onDemuxerEndOfFile() {
  if (sender() != m_demuxer)
    return;

  qDebug() << "LayerPlayer: 到达文件末尾，等待帧队列耗尽";
  m_reachedEof = true;
}

void LayerPlayer::onDemuxerFailedToOpen(const QString &error) {
  if (sender() != m_demuxer)
    return;

  qWarning() << "LayerPlayer: 文件打开失败:" << error;
  cleanup();
  emit errorOccurred(error);
}

void LayerPlayer::onTimerFire() {
  if (!m_videoDecoder)
    return;

  const qint64 position = clockPosition();

  VideoFrame head;
  VideoFrame frame;
  bool updated = false;
  while (m_videoDecoder->peekFrame(head)) {
    if (head.pts > position + kStaleFrameMs) {
      m_videoDecoder->popFrame(head);
      continue;
    }
    // seek 后的第一帧即使略晚于时钟也立即显示
    if (head.pts > position && m_lastFramePts >= 0)
      break;
    m_videoDecoder->popFrame(frame);
    m_lastFramePts = frame.pts;
    updated = true;
  }

  if (updated && !frame.image.isNull()) {
    {
      QWriteLocker locker(&m_imageLock);
      m_currentImage = frame.image;
    }
    emit frameChanged(frame.image);
  }

  if (m_playing)
    emit positionChanged(position);

  const bool drained = m_reachedEof && m_videoDecoder->frameQueueSize() == 0 &&
                       m_demuxer && m_demuxer->videoQueueSize() == 0;
  if (!m_playing || !drained || position < m_lastFramePts)
    return;

  if (m_looping) {
    restartFromBeginning();
    return;
  }

  m_basePosition = position;
  m_clock.invalidate();
  m_playing = false;
  pauseComponents();
  emit mediaEnded();
}

void LayerPlayer::cleanup() {
  m_timer->stop();

  // 先停所有线程，解码线程仍在读 Demuxer 的队列
  if (m_videoDecoder)
    m_videoDecoder->requestStop();
  if (m_audioDecoder)
    m_audioDecoder->requestStop();
  if (m_demuxer)
    m_demuxer->requestStop();

  if (m_videoDecoder) {
    m_videoDecoder->wait();
    delete m_videoDecoder;
    m_videoDecoder = nullptr;
  }
  if (m_audioDecoder) {
    m_audioDecoder->wait();
    delete m_audioDecoder;
    m_audioDecoder = nullptr;
  }
  if (m_demuxer) {
    m_demuxer->wait();
    delete m_demuxer;
    m_demuxer = nullptr;
  }

  {
    QWriteLocker locker(&m_imageLock);
    m_currentImage = QImage();
  }

  m_opened = false;
  m_playing = false;
  m_reachedEof = false;
  m_basePosition = 0;
  m_clock.invalidate();
  m_lastFramePts = -1;
  m_totalDuration = 0;
}
