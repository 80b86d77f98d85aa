#include "videostreamdecoder.h"
#include "demuxer.h"
#include <QDebug>

using namespace StackComposer;

VideoStreamDecoder::VideoStreamDecoder(QObject *parent) : QThread(parent) {}

VideoStreamDecoder::~VideoStreamDecoder() {
  requestStop();
  wait();
  cleanup();
}

bool VideoStreamDecoder::init(AVFormatContext *formatCtx, int videoStreamIndex) {
  QMutexLocker locker(&m_mutex);

  if (!formatCtx || videoStreamIndex < 0)
    return false;

  m_streamIndex = videoStreamIndex;
  m_formatCtx = formatCtx;
  AVCodecParameters *vPar = formatCtx->streams[videoStreamIndex]->codecpar;

  const AVCodec *vCodec = avcodec_find_decoder(vPar->codec_id);
  if (!vCodec) {
    qDebug() << "VideoStreamDecoder: 无法找到视频解码器";
    return false;
  }

  m_codecCtx = FFmpegUtils::createCodecContext(vCodec);
  if (!m_codecCtx) {
    qDebug() << "VideoStreamDecoder: 无法分配解码器上下文";
    return false;
  }

  int ret = avcodec_parameters_to_context(m_codecCtx.get(), vPar);
  if (ret < 0) {
    qDebug() << "VideoStreamDecoder:"
             << QString::fromStdString(FFmpegUtils::formatFFmpegError(ret, "无法复制解码器参数"));
    m_codecCtx.reset();
    return false;
  }

  ret = avcodec_open2(m_codecCtx.get(), vCodec, nullptr);
  if (ret < 0) {
    qDebug() << "VideoStreamDecoder:"
             << QString::fromStdString(FFmpegUtils::formatFFmpegError(ret, "无法打开视频解码器"));
    m_codecCtx.reset();
    return false;
  }

  m_frame = FFmpegUtils::createAvFrame();
  if (!m_frame) {
    qDebug() << "VideoStreamDecoder: 无法分配视频帧";
    return false;
  }

  qDebug() << "VideoStreamDecoder: 初始化成功，尺寸:" << m_codecCtx->width << "x"
           << m_codecCtx->height;
  return true;
}

void VideoStreamDecoder::run() {
  qDebug() << "VideoStreamDecoder: 线程启动";

  while (!m_stopRequested.load()) {
    if (m_flushRequested.load()) {
      QMutexLocker locker(&m_mutex);
      if (m_codecCtx)
        avcodec_flush_buffers(m_codecCtx.get());
      clearFrameQueue();
      m_flushRequested.store(false);
      qDebug() << "VideoStreamDecoder: 缓冲区已刷新";
      continue;
    }

    if (m_pauseRequested.load()) {
      QThread::msleep(10);
      continue;
    }

    {
      QMutexLocker frameLocker(&m_frameMutex);
      if (m_frameQueue.size() >= MAX_FRAME_QUEUE_SIZE) {
        m_frameCondition.wait(&m_frameMutex, 10);
        continue;
      }
    }

    if (!m_demuxer) {
      QThread::msleep(10);
      continue;
    }

    AVPacket *packet = m_demuxer->popVideoPacket();
    if (!packet) {
      if (m_stopRequested.load())
        break;
      if (m_demuxer->reachedEof())
        QThread::msleep(10);
      continue;
    }

    processPacket(packet);
    av_packet_free(&packet);
  }

  qDebug() << "VideoStreamDecoder: 线程退出";
}

qint64 VideoStreamDecoder::framePts(const AVPacket *packet) const {
  AVRational timeBase = m_formatCtx->streams[m_streamIndex]->time_base;
  if (m_frame->best_effort_timestamp != AV_NOPTS_VALUE)
    return av_rescale_q(m_frame->best_effort_timestamp, timeBase, AVRational{1, 1000});
  if (m_frame->pts != AV_NOPTS_VALUE)
    return av_rescale_q(m_frame->pts, timeBase, AVRational{1, 1000});
  if (packet && packet->pts != AV_NOPTS_VALUE)
    return av_rescale_q(packet->pts, timeBase, AVRational{1, 1000});
  return 0;
}

void VideoStreamDecoder::processPacket(AVPacket *packet) {
  QMutexLocker locker(&m_mutex);

  if (!m_codecCtx || !m_frame || !m_formatCtx)
    return;

  int ret = avcodec_send_packet(m_codecCtx.get(), packet);
  if (ret < 0 && ret != AVERROR(EAGAIN)) {
    qDebug() << "VideoStreamDecoder:"
             << QString::fromStdString(FFmpegUtils::formatFFmpegError(ret, "发送数据包失败"));
    return;
  }

  while (avcodec_receive_frame(m_codecCtx.get(), m_frame.get()) == 0) {
    const qint64 pts = framePts(packet);

    // 容忍 30ms 的偏差
    const qint64 dropUntil = m_dropUntilMs.load();
    if (dropUntil >= 0) {
      if (pts + 30 < dropUntil) {
        av_frame_unref(m_frame.get());
        continue;
      }
      m_dropUntilMs.store(-1);
    }

    VideoFrame frame;
    frame.pts = pts;
    if (!m_converter.toImage(m_frame.get(), frame.image)) {
      qDebug() << "VideoStreamDecoder:" << QString::fromStdString(m_converter.getErrorString());
      av_frame_unref(m_frame.get());
      continue;
    }
    av_frame_unref(m_frame.get());

    QMutexLocker frameLocker(&m_frameMutex);
    m_frameQueue.enqueue(frame);
    m_frameCondition.wakeOne();
  }
}

bool VideoStreamDecoder::popFrame(VideoFrame &frame) {
  QMutexLocker locker(&m_frameMutex);

  if (m_frameQueue.isEmpty())
    return false;

  frame = m_frameQueue.dequeue();
  m_frameCondition.wakeOne();
  return true;
}

bool VideoStreamDecoder::peekFrame(VideoFrame &frame) const {
  QMutexLocker locker(&m_frameMutex);

  if (m_frameQueue.isEmpty())
    return false;

  frame = m_frameQueue.head();
  return true;
}

int VideoStreamDecoder::frameQueueSize() const {
  QMutexLocker locker(&m_frameMutex);
  return m_frameQueue.size();
}

void VideoStreamDecoder::clearFrameQueue() {
  QMutexLocker locker(&m_frameMutex);
  m_frameQueue.clear();
  m_frameCondition.wakeAll();
}

void VideoStreamDecoder::cleanup() {
  QMutexLocker locker(&m_mutex);

  clearFrameQueue();
  m_codecCtx.reset();
  m_frame.reset();
  m_streamIndex = -1;
  m_formatCtx = nullptr;

  qDebug() << "VideoStreamDecoder: 资源清理完成";
}

void VideoStreamDecoder::requestFlush() { m_flushRequested.store(true); }

void VideoStreamDecoder::requestStop() {
  m_stopRequested.store(true);
  m_frameCondition.wakeAll();
}

void VideoStreamDecoder::requestPause() { m_pauseRequested.store(true); }

void VideoStreamDecoder::requestResume() { m_pauseRequested.store(false); }

QSize VideoStreamDecoder::videoSize() const {
  if (m_codecCtx)
    return QSize(m_codecCtx->width, m_codecCtx->height);
  return QSize();
}
