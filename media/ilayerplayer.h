#ifndef ILAYERPLAYER_H
#define ILAYERPLAYER_H

#include <QImage>
#include <QObject>
#include <QString>

/**
 * @brief 单个视频图层的播放器接口
 *
 * 每个视频图层拥有独立的媒体时钟，由 PlaybackSynchronizer
 * 统一发出播放/暂停/跳转命令。位置与时长均为素材内的毫秒数。
 */
class ILayerPlayer : public QObject {
  Q_OBJECT

public:
  explicit ILayerPlayer(QObject *parent = nullptr) : QObject(parent) {}
  ~ILayerPlayer() override = default;

  // === 媒体控制接口 ===
  // 打开是异步的，失败通过 errorOccurred 报告
  virtual bool load(const QString &filePath) = 0;
  virtual void play() = 0;
  virtual void pause() = 0;
  virtual void stop() = 0;
  virtual void seek(qint64 position) = 0;

  // 对正在播放的音频立即生效
  virtual void setVolume(float volume) = 0;

  // 到达素材末尾后从头开始，并发出 looped
  virtual void setLooping(bool looping) = 0;
  virtual void setPlaybackRate(double rate) = 0;

  // === 状态查询接口 ===
  virtual qint64 duration() const = 0;
  virtual qint64 position() const = 0;
  virtual bool isPlaying() const = 0;
  virtual float volume() const = 0;
  virtual QImage currentFrame() const = 0;

signals:
  void durationChanged(qint64 duration);
  void positionChanged(qint64 position);
  void frameChanged(const QImage &frame);
  void errorOccurred(const QString &error);
  void mediaEnded();
  void looped();
};

#endif // ILAYERPLAYER_H
