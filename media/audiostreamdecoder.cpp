#include "audiostreamdecoder.h"
#include "demuxer.h"
#include <QDebug>

using namespace StackComposer;

namespace {
constexpr int kBytesPerSample = 2; // S16
constexpr int kChannels = 2;
constexpr qint64 kMinFreeBytes = 16384;
constexpr qint64 kDropTolerance = 30;
} // namespace

AudioStreamDecoder::AudioStreamDecoder(QObject *parent) : QThread(parent) {}

AudioStreamDecoder::~AudioStreamDecoder() {
  requestStop();
  wait();
  cleanup();
}

bool AudioStreamDecoder::init(AVFormatContext *formatCtx, int audioStreamIndex) {
  QMutexLocker locker(&m_mutex);

  if (!formatCtx || audioStreamIndex < 0)
    return false;

  m_streamIndex = audioStreamIndex;
  AVCodecParameters *codecPar = formatCtx->streams[audioStreamIndex]->codecpar;
  m_timeBase = formatCtx->streams[audioStreamIndex]->time_base;

  const AVCodec *codec = avcodec_find_decoder(codecPar->codec_id);
  if (!codec) {
    qDebug() << "AudioStreamDecoder: 无法找到音频解码器";
    return false;
  }

  m_codecCtx = FFmpegUtils::createCodecContext(codec);
  if (!m_codecCtx)
    return false;

  if (avcodec_parameters_to_context(m_codecCtx.get(), codecPar) < 0 ||
      avcodec_open2(m_codecCtx.get(), codec, nullptr) < 0) {
    qDebug() << "AudioStreamDecoder: 无法打开音频解码器";
    m_codecCtx.reset();
    return false;
  }

  m_frame = FFmpegUtils::createAvFrame();
  if (!m_frame)
    return false;

  // 配置音频输出格式
  int targetSampleRate = 48000;
  QAudioFormat format;
  format.setSampleRate(targetSampleRate);
  format.setChannelConfig(QAudioFormat::ChannelConfigStereo);
  format.setSampleFormat(QAudioFormat::Int16);

  QAudioDevice device = QMediaDevices::defaultAudioOutput();
  if (!device.isFormatSupported(format)) {
    qDebug() << "AudioStreamDecoder: 输出设备不支持 48kHz，改用设备默认采样率";
    format.setSampleRate(device.preferredFormat().sampleRate());
    targetSampleRate = format.sampleRate();
  }
  m_outputFormat = format;

  if (!recreateAudioOutput())
    return false;

  AVChannelLayout outLayout = AV_CHANNEL_LAYOUT_STEREO;
  SwrContext *swrCtx = nullptr;
  int ret = swr_alloc_set_opts2(&swrCtx, &outLayout, AV_SAMPLE_FMT_S16,
                                targetSampleRate, &m_codecCtx->ch_layout,
                                m_codecCtx->sample_fmt, m_codecCtx->sample_rate,
                                0, nullptr);
  if (ret < 0 || !swrCtx) {
    qDebug() << "AudioStreamDecoder: 无法创建重采样器";
    return false;
  }
  m_swrCtx.reset(swrCtx);

  ret = swr_init(m_swrCtx.get());
  if (ret < 0) {
    qDebug() << "AudioStreamDecoder:"
             << QString::fromStdString(FFmpegUtils::formatFFmpegError(ret, "重采样器初始化失败"));
    return false;
  }

  qDebug() << "AudioStreamDecoder: 初始化成功，采样率:" << targetSampleRate;
  return true;
}

void AudioStreamDecoder::run() {
  qDebug() << "AudioStreamDecoder: 线程启动";

  while (!m_stopRequested.load()) {
    if (m_flushRequested.load()) {
      QMutexLocker locker(&m_mutex);
      if (m_codecCtx)
        avcodec_flush_buffers(m_codecCtx.get());
      if (m_audioSink)
        recreateAudioOutput();
      m_flushRequested.store(false);
      qDebug() << "AudioStreamDecoder: 缓冲区已刷新";
      continue;
    }

    if (m_pauseRequested.load()) {
      QThread::msleep(10);
      continue;
    }

    // 输出缓冲快满时等待，保证音频按实时速度消耗
    if (bytesFree() < kMinFreeBytes) {
      QThread::msleep(10);
      continue;
    }

    if (!m_demuxer) {
      QThread::msleep(10);
      continue;
    }

    AVPacket *packet = m_demuxer->popAudioPacket();
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

  qDebug() << "AudioStreamDecoder: 线程退出";
}

void AudioStreamDecoder::processPacket(AVPacket *packet) {
  QMutexLocker locker(&m_mutex);

  if (!m_codecCtx || !m_audioDevice || !m_swrCtx)
    return;

  if (avcodec_send_packet(m_codecCtx.get(), packet) < 0)
    return;

  const int dstRate = m_outputFormat.sampleRate() > 0 ? m_outputFormat.sampleRate() : 48000;

  while (avcodec_receive_frame(m_codecCtx.get(), m_frame.get()) == 0) {
    qint64 ptsMs = 0;
    if (m_frame->best_effort_timestamp != AV_NOPTS_VALUE) {
      ptsMs = av_rescale_q(m_frame->best_effort_timestamp, m_timeBase, AVRational{1, 1000});
    } else if (packet->pts != AV_NOPTS_VALUE) {
      ptsMs = av_rescale_q(packet->pts, m_timeBase, AVRational{1, 1000});
    }

    const qint64 dropUntil = m_dropUntilMs.load();
    if (dropUntil >= 0) {
      if (ptsMs + kDropTolerance < dropUntil) {
        av_frame_unref(m_frame.get());
        continue;
      }
      m_dropUntilMs.store(-1);
    }

    const int outSamples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(m_swrCtx.get(), m_codecCtx->sample_rate) + m_frame->nb_samples,
        dstRate, m_codecCtx->sample_rate, AV_ROUND_UP));
    const size_t needed = static_cast<size_t>(outSamples) * kChannels * kBytesPerSample;
    if (m_sampleBuffer.size() < needed)
      m_sampleBuffer.resize(needed);

    uint8_t *out = m_sampleBuffer.data();
    const int converted = swr_convert(m_swrCtx.get(), &out, outSamples,
                                      const_cast<const uint8_t **>(m_frame->extended_data),
                                      m_frame->nb_samples);
    av_frame_unref(m_frame.get());

    if (converted > 0) {
      m_audioDevice->write(reinterpret_cast<const char *>(out),
                           converted * kChannels * kBytesPerSample);
    }
  }
}

bool AudioStreamDecoder::recreateAudioOutput() {
  if (m_audioSink) {
    m_audioSink->stop();
    delete m_audioSink;
    m_audioSink = nullptr;
  }
  m_audioDevice = nullptr;

  QAudioDevice device = QMediaDevices::defaultAudioOutput();
  m_audioSink = new QAudioSink(device, m_outputFormat);

  // 约 0.5 秒缓冲
  const int bytesPerSec = m_outputFormat.sampleRate() * kChannels * kBytesPerSample;
  m_audioSink->setBufferSize(bytesPerSec / 2);
  m_audioSink->setVolume(m_volume);

  m_audioDevice = m_audioSink->start();
  if (!m_audioDevice) {
    qDebug() << "AudioStreamDecoder: 无法启动音频输出设备";
    return false;
  }
  return true;
}

qint64 AudioStreamDecoder::bytesFree() const {
  QMutexLocker locker(&m_mutex);
  if (m_audioSink)
    return m_audioSink->bytesFree();
  return 0;
}

void AudioStreamDecoder::cleanup() {
  QMutexLocker locker(&m_mutex);

  if (m_audioSink) {
    m_audioSink->stop();
    delete m_audioSink;
    m_audioSink = nullptr;
  }
  m_audioDevice = nullptr;

  m_codecCtx.reset();
  m_frame.reset();
  m_swrCtx.reset();
  m_sampleBuffer.clear();
  m_streamIndex = -1;
}

void AudioStreamDecoder::setVolume(float volume) {
  QMutexLocker locker(&m_mutex);
  m_volume = volume;
  if (m_audioSink)
    m_audioSink->setVolume(volume);
}

float AudioStreamDecoder::volume() const {
  QMutexLocker locker(&m_mutex);
  return m_volume;
}

void AudioStreamDecoder::requestPause() {
  m_pauseRequested.store(true);
  QMutexLocker locker(&m_mutex);
  if (m_audioSink)
    m_audioSink->suspend();
}

void AudioStreamDecoder::requestResume() {
  m_pauseRequested.store(false);
  QMutexLocker locker(&m_mutex);
  if (m_audioSink)
    m_audioSink->resume();
}

void AudioStreamDecoder::requestFlush() { m_flushRequested.store(true); }

void AudioStreamDecoder::requestStop() { m_stopRequested.store(true); }
