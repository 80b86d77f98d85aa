#ifndef PLAYBACKSYNCHRONIZER_H
#define PLAYBACKSYNCHRONIZER_H

#include "ilayerplayer.h"
#include "model/Composition.h"
#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <functional>
#include <map>
#include <set>
#include <string>

/**
 * @brief 预览播放的统一控制
 *
 * 每个视频图层一个 ILayerPlayer，play/pause/seek 同时作用于所有图层。
 * 循环是逐图层的：时长不同的图层各自回到开头，不会彼此对齐。
 * 某个图层打开或解码失败时只把它排除，其余图层继续播放。
 */
class PlaybackSynchronizer : public QObject {
  Q_OBJECT

public:
  using PlayerFactory = std::function<ILayerPlayer *(QObject *parent)>;

  explicit PlaybackSynchronizer(QObject *parent = nullptr);
  ~PlaybackSynchronizer() override;

  // 默认创建 LayerPlayer，测试时可替换
  void setPlayerFactory(PlayerFactory factory);

  // seek 时已在容差内的图层不重新定位
  void setSeekTolerance(qint64 ms) { m_seekToleranceMs = ms; }
  qint64 seekTolerance() const { return m_seekToleranceMs; }

  // 按合成同步播放器：新图层创建，删除的图层释放，已有图层只更新参数
  void sync(const StackComposer::Composition &composition,
            const StackComposer::MediaLibrary &library);
  void clear();

  // === 传输控制 ===
  void play();
  void pause();
  void togglePlayback();
  void seek(qint64 position);
  void setLooping(bool looping);

  // 立即作用于正在播放的音频，不重新开始播放
  void setLayerVolume(const std::string &layerId, float volume);

  // 由预览刷新调用：推进合成时钟，不循环时到达末尾后暂停
  void tick();

  // === 状态查询 ===
  bool isPlaying() const { return m_playing; }
  bool isLooping() const { return m_looping; }
  qint64 position() const;
  qint64 duration() const { return m_durationMs; }

  ILayerPlayer *player(const std::string &layerId) const;
  QImage currentFrame(const std::string &layerId) const;
  bool hasPlayer(const std::string &layerId) const;
  bool isExcluded(const std::string &layerId) const;
  int activeLayerCount() const;

signals:
  void playingChanged(bool playing);
  void positionChanged(qint64 position);
  void layerExcluded(const QString &layerId, const QString &reason);
  void layerLooped(const QString &layerId);
  void playbackFinished();

private:
  struct LayerClock {
    std::string mediaId;
    QString path;
    qint64 startOffsetMs = 0;
    double rate = 1.0;
    float volume = 1.0f;
    ILayerPlayer *player = nullptr;
  };

  void addLayer(const std::string &layerId, const LayerClock &clock);
  void releaseLayer(const std::string &layerId);
  void excludeLayer(const std::string &layerId, const QString &reason);
  void seekLayer(LayerClock &clock, qint64 compositionMs);
  qint64 sourcePosition(const LayerClock &clock, qint64 compositionMs) const;

  PlayerFactory m_factory;
  std::map<std::string, LayerClock> m_clocks;
  std::set<std::string> m_excluded;

  bool m_playing = false;
  bool m_looping = true;
  qint64 m_durationMs = 0;
  qint64 m_seekToleranceMs = 50;

  // 合成时钟
  qint64 m_basePosition = 0;
  QElapsedTimer m_clock;
};

#endif // PLAYBACKSYNCHRONIZER_H
