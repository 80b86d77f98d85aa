#ifndef AUDIOSTREAMDECODER_H
#define AUDIOSTREAMDECODER_H

#include <QAudioFormat>
#include <QAudioSink>
#include <QMediaDevices>
#include <QMutex>
#include <QThread>
#include <atomic>
#include <vector>

#include "ffmpeg_utils/AvCodecContextWrapper.h"
#include "ffmpeg_utils/AvFormatContextWrapper.h"
#include "ffmpeg_utils/AvFrameWrapper.h"

class Demuxer;

// 预览用音频解码线程：解码后重采样为 S16 立体声写入 QAudioSink
class AudioStreamDecoder : public QThread {
  Q_OBJECT

public:
  explicit AudioStreamDecoder(QObject *parent = nullptr);
  ~AudioStreamDecoder() override;

  bool init(AVFormatContext *formatCtx, int audioStreamIndex);
  void cleanup();

  // 直接作用于输出设备，不需要重新开始播放
  void setVolume(float volume);
  float volume() const;

  void requestPause();
  void requestResume();
  void requestFlush();
  void requestStop();
  void setDropUntil(qint64 ms) { m_dropUntilMs.store(ms); }

  void setDemuxer(Demuxer *demuxer) { m_demuxer = demuxer; }

  qint64 bytesFree() const;

protected:
  void run() override;

private:
  bool recreateAudioOutput();
  void processPacket(AVPacket *packet);

  StackComposer::FFmpegUtils::AvCodecContextPtr m_codecCtx;
  StackComposer::FFmpegUtils::AvFramePtr m_frame;
  StackComposer::FFmpegUtils::SwrContextPtr m_swrCtx;
  int m_streamIndex = -1;
  AVRational m_timeBase{0, 1};

  QAudioSink *m_audioSink = nullptr;
  QIODevice *m_audioDevice = nullptr;
  QAudioFormat m_outputFormat;
  float m_volume = 1.0f;

  // 重采样输出缓冲，按需增长
  std::vector<uint8_t> m_sampleBuffer;

  mutable QMutex m_mutex;

  Demuxer *m_demuxer = nullptr;

  // 线程控制
  std::atomic<bool> m_stopRequested{false};
  std::atomic<bool> m_pauseRequested{false};
  std::atomic<bool> m_flushRequested{false};
  std::atomic<qint64> m_dropUntilMs{-1};
};

#endif // AUDIOSTREAMDECODER_H
