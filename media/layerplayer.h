#ifndef LAYERPLAYER_H
#define LAYERPLAYER_H

#include "audiostreamdecoder.h"
#include "demuxer.h"
#include "ilayerplayer.h"
#include "videostreamdecoder.h"
#include <QElapsedTimer>
#include <QReadWriteLock>
#include <QString>
#include <QTimer>
#include <atomic>

/**
 * @brief 视频图层播放器
 *
 * Demuxer + 视频/音频解码线程。图层时钟由 QElapsedTimer 驱动，
 * 乘以播放速率；到达末尾时按 looping 决定从头开始还是停住。
 */
class LayerPlayer : public ILayerPlayer {
  Q_OBJECT

public:
  explicit LayerPlayer(QObject *parent = nullptr);
  ~LayerPlayer() override;

  bool load(const QString &filePath) override;
  void play() override;
  void pause() override;
  void stop() override;
  void seek(qint64 position) override;
  void setVolume(float volume) override;
  void setLooping(bool looping) override;
  void setPlaybackRate(double rate) override;

  qint64 duration() const override;
  qint64 position() const override;
  bool isPlaying() const override;
  float volume() const override { return m_volume; }
  QImage currentFrame() const override;

private slots:
  void onDemuxerOpened(qint64 duration, int videoStreamIndex, int audioStreamIndex);
  void onDemuxerEndOfFile();
  void onDemuxerFailedToOpen(const QString &error);
  void onTimerFire();

private:
  void cleanup();
  void pauseComponents();
  void resumeComponents();
  void applyAudioVolume();
  void restartFromBeginning();
  qint64 clockPosition() const;

  QTimer *m_timer = nullptr;
  QImage m_currentImage;
  mutable QReadWriteLock m_imageLock;

  Demuxer *m_demuxer = nullptr;
  AudioStreamDecoder *m_audioDecoder = nullptr;
  VideoStreamDecoder *m_videoDecoder = nullptr;

  std::atomic<qint64> m_totalDuration{0};
  QString m_currentFilePath;
  bool m_opened = false;
  bool m_playing = false;
  bool m_looping = false;
  bool m_reachedEof = false;
  double m_rate = 1.0;
  float m_volume = 1.0f;

  // 图层时钟：m_basePosition + 经过时间 * 速率
  qint64 m_basePosition = 0;
  QElapsedTimer m_clock;
  qint64 m_lastFramePts = -1;
};

#endif // LAYERPLAYER_H
