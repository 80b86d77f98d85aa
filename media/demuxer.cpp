#include "demuxer.h"
#include <QDebug>

using StackComposer::FFmpegUtils::formatFFmpegError;

Demuxer::Demuxer(QObject *parent) : QThread(parent) {}

Demuxer::~Demuxer() {
  requestStop();
  wait();
  clearQueues();
}

void Demuxer::setFilePath(const QString &filePath) {
  m_filePath = filePath;
  if (m_filePath.startsWith("file://"))
    m_filePath.remove(0, 7);
}

bool Demuxer::openInput() {
  if (m_filePath.isEmpty()) {
    qDebug() << "Demuxer: 未设置输入源";
    emit failedToOpen("没有设置文件路径");
    return false;
  }

  AVFormatContext *formatCtx = nullptr;
  int ret = avformat_open_input(&formatCtx, m_filePath.toStdString().c_str(),
                                nullptr, nullptr);
  if (ret < 0) {
    qDebug() << "Demuxer: 无法打开文件" << m_filePath;
    emit failedToOpen(QString::fromStdString(formatFFmpegError(ret, "无法打开文件")));
    return false;
  }
  m_formatCtx.reset(formatCtx);

  m_formatCtx->probesize = 1024 * 1024;
  m_formatCtx->max_analyze_duration = 100000;

  ret = avformat_find_stream_info(m_formatCtx.get(), nullptr);
  if (ret < 0) {
    qDebug() << "Demuxer: 无法获取流信息";
    emit failedToOpen(QString::fromStdString(formatFFmpegError(ret, "无法获取流信息")));
    m_formatCtx.reset();
    return false;
  }

  m_duration = m_formatCtx->duration != AV_NOPTS_VALUE
                   ? m_formatCtx->duration * 1000 / AV_TIME_BASE
                   : 0;

  // 查找视频流和音频流，跳过封面图
  m_videoStreamIndex = -1;
  m_audioStreamIndex = -1;
  for (unsigned int i = 0; i < m_formatCtx->nb_streams; i++) {
    AVStream *stream = m_formatCtx->streams[i];
    if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC)
      continue;
    if (stream->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      if (m_videoStreamIndex == -1)
        m_videoStreamIndex = static_cast<int>(i);
    } else if (stream->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
      if (m_audioStreamIndex == -1)
        m_audioStreamIndex = static_cast<int>(i);
    }
  }

  qDebug() << "Demuxer: 输入打开成功" << m_filePath
           << "视频流:" << m_videoStreamIndex
           << "音频流:" << m_audioStreamIndex << "时长:" << m_duration << "ms";

  emit opened(m_duration, m_videoStreamIndex, m_audioStreamIndex);
  return true;
}

void Demuxer::run() {
  qDebug() << "Demuxer: 线程启动";

  if (!openInput()) {
    qDebug() << "Demuxer: 打开输入失败，线程退出";
    return;
  }

  while (!m_stopRequested.load()) {
    if (m_seekRequested.load()) {
      qint64 targetMs = m_seekTarget.load();
      qDebug() << "Demuxer: 执行 seek 到" << targetMs << "ms";

      clearQueues();

      int64_t targetTs = targetMs * AV_TIME_BASE / 1000;
      int ret = av_seek_frame(m_formatCtx.get(), -1, targetTs, AVSEEK_FLAG_BACKWARD);
      if (ret < 0) {
        qWarning() << "Demuxer:" << QString::fromStdString(formatFFmpegError(ret, "seek 失败"));
      }

      m_eof.store(false);
      m_seekRequested.store(false);
    }

    if (m_pauseRequested.load() || m_eof.load()) {
      QThread::msleep(10);
      continue;
    }

    bool audioFull =
        (m_audioStreamIndex >= 0 && audioQueueSize() >= MAX_QUEUE_SIZE);
    bool videoFull =
        (m_videoStreamIndex >= 0 && videoQueueSize() >= MAX_QUEUE_SIZE);
    if (audioFull || videoFull) {
      QThread::msleep(10);
      continue;
    }

    AVPacket *packet = av_packet_alloc();
    if (!packet) {
      qWarning() << "Demuxer: 无法分配数据包";
      break;
    }

    int ret = av_read_frame(m_formatCtx.get(), packet);
    if (ret < 0) {
      av_packet_free(&packet);
      if (ret == AVERROR_EOF) {
        qDebug() << "Demuxer: 到达文件末尾";
      } else {
        qWarning() << "Demuxer:" << QString::fromStdString(formatFFmpegError(ret, "读取数据包失败"));
      }
      // 读错误按末尾处理，等待 seek 重新开始
      m_eof.store(true);
      emit endOfFile();
      continue;
    }

    if (packet->stream_index == m_audioStreamIndex) {
      pushAudioPacket(packet);
    } else if (packet->stream_index == m_videoStreamIndex) {
      pushVideoPacket(packet);
    } else {
      av_packet_free(&packet);
    }
  }

  qDebug() << "Demuxer: 线程退出";
}

void Demuxer::clearQueues() {
  {
    QMutexLocker locker(&m_audioMutex);
    while (!m_audioQueue.isEmpty()) {
      AVPacket *packet = m_audioQueue.dequeue();
      av_packet_free(&packet);
    }
    m_audioCondition.wakeAll();
  }

  {
    QMutexLocker locker(&m_videoMutex);
    while (!m_videoQueue.isEmpty()) {
      AVPacket *packet = m_videoQueue.dequeue();
      av_packet_free(&packet);
    }
    m_videoCondition.wakeAll();
  }
}

void Demuxer::pushAudioPacket(AVPacket *packet) {
  QMutexLocker locker(&m_audioMutex);
  m_audioQueue.enqueue(packet);
  m_audioCondition.wakeOne();
}

void Demuxer::pushVideoPacket(AVPacket *packet) {
  QMutexLocker locker(&m_videoMutex);
  m_videoQueue.enqueue(packet);
  m_videoCondition.wakeOne();
}

AVPacket *Demuxer::popAudioPacket() {
  QMutexLocker locker(&m_audioMutex);

  while (m_audioQueue.isEmpty() && !m_stopRequested.load()) {
    m_audioCondition.wait(&m_audioMutex, 100);
    if (m_eof.load())
      break;
  }

  if (m_stopRequested.load() || m_audioQueue.isEmpty())
    return nullptr;

  return m_audioQueue.dequeue();
}

AVPacket *Demuxer::popVideoPacket() {
  QMutexLocker locker(&m_videoMutex);

  while (m_videoQueue.isEmpty() && !m_stopRequested.load()) {
    m_videoCondition.wait(&m_videoMutex, 100);
    if (m_eof.load())
      break;
  }

  if (m_stopRequested.load() || m_videoQueue.isEmpty())
    return nullptr;

  return m_videoQueue.dequeue();
}

int Demuxer::audioQueueSize() const {
  QMutexLocker locker(&m_audioMutex);
  return m_audioQueue.size();
}

int Demuxer::videoQueueSize() const {
  QMutexLocker locker(&m_videoMutex);
  return m_videoQueue.size();
}

void Demuxer::requestSeek(qint64 ms) {
  m_seekTarget.store(ms);
  m_seekRequested.store(true);
}

void Demuxer::requestStop() {
  m_stopRequested.store(true);
  m_audioCondition.wakeAll();
  m_videoCondition.wakeAll();
}

void Demuxer::requestPause() { m_pauseRequested.store(true); }

void Demuxer::requestResume() { m_pauseRequested.store(false); }
