#ifndef VIDEOSTREAMDECODER_H
#define VIDEOSTREAMDECODER_H

#include <QImage>
#include <QMutex>
#include <QQueue>
#include <QThread>
#include <QWaitCondition>
#include <atomic>

#include "decoder/FrameConverter.h"
#include "ffmpeg_utils/AvCodecContextWrapper.h"
#include "ffmpeg_utils/AvFrameWrapper.h"

class Demuxer;

// 视频帧，pts 为素材内毫秒数
struct VideoFrame {
  QImage image;
  qint64 pts = 0;
};

// 预览用视频解码线程：从 Demuxer 取包，解码为 ARGB32 放入帧队列
class VideoStreamDecoder : public QThread {
  Q_OBJECT

public:
  explicit VideoStreamDecoder(QObject *parent = nullptr);
  ~VideoStreamDecoder() override;

  bool init(AVFormatContext *formatCtx, int videoStreamIndex);
  QSize videoSize() const;

  void setDemuxer(Demuxer *demuxer) { m_demuxer = demuxer; }

  // 从帧队列获取帧 (供主线程调用)
  bool popFrame(VideoFrame &frame);
  bool peekFrame(VideoFrame &frame) const;
  int frameQueueSize() const;
  void clearFrameQueue();

  // 控制操作
  void requestFlush();
  void requestStop();
  void requestPause();
  void requestResume();

  // seek 之后丢弃早于目标的帧
  void setDropUntil(qint64 ms) { m_dropUntilMs.store(ms); }

  void cleanup();

protected:
  void run() override;

private:
  void processPacket(AVPacket *packet);
  qint64 framePts(const AVPacket *packet) const;

  AVFormatContext *m_formatCtx = nullptr;
  StackComposer::FFmpegUtils::AvCodecContextPtr m_codecCtx;
  StackComposer::FFmpegUtils::AvFramePtr m_frame;
  StackComposer::FrameConverter m_converter;
  int m_streamIndex = -1;

  // 帧队列
  QQueue<VideoFrame> m_frameQueue;
  mutable QMutex m_frameMutex;
  QWaitCondition m_frameCondition;
  static constexpr int MAX_FRAME_QUEUE_SIZE = 10;

  Demuxer *m_demuxer = nullptr;

  // 线程控制
  std::atomic<bool> m_stopRequested{false};
  std::atomic<bool> m_pauseRequested{false};
  std::atomic<bool> m_flushRequested{false};
  std::atomic<qint64> m_dropUntilMs{-1};

  QMutex m_mutex;
};

#endif // VIDEOSTREAMDECODER_H
