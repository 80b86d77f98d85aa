#include "AudioMixer.h"
#include "AudioMixPlan.h"
#include "../ffmpeg_utils/AvFrameWrapper.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

namespace StackComposer
{

    bool AudioMixer::open(const std::vector<AudioTrackPlan> &tracks)
    {
        m_inputs.clear();
        m_graph.reset();
        m_sink = nullptr;
        m_sinkEof = false;

        std::vector<AudioTrackPlan> usable;
        for (const AudioTrackPlan &track : tracks)
        {
            auto decoder = std::make_unique<AudioDecoder>();
            if (!decoder->open(track.sourcePath))
            {
                qWarning() << "音频轨" << track.trackId << "无法打开，跳过:" << decoder->getErrorString().c_str();
                continue;
            }
            if (track.startOffset > 0.0 && !decoder->seek(track.startOffset))
            {
                qWarning() << "音频轨" << track.trackId << "跳转失败，从头开始:" << decoder->getErrorString().c_str();
            }

            Input input;
            input.decoder = std::move(decoder);
            const double sourceSpan = track.range.duration * std::max(track.playbackRate, 0.5) + 1.0;
            input.endPts = static_cast<int64_t>(std::ceil(sourceSpan * AudioDecoder::kOutputSampleRate));
            m_inputs.push_back(std::move(input));
            usable.push_back(track);
        }

        if (m_inputs.empty())
        {
            return true;
        }

        m_graph.reset(avfilter_graph_alloc());
        if (!m_graph)
        {
            m_errorString = "无法分配 Filter Graph";
            return false;
        }

        const AVFilter *abuffer_src = avfilter_get_by_name("abuffer");
        const AVFilter *abuffer_sink = avfilter_get_by_name("abuffersink");
        const std::string args = AudioMixPlan::bufferSourceArgs(AudioDecoder::kOutputSampleRate);

        // 每条轨一个源 filter
        AVFilterInOut *outputs = nullptr;
        for (size_t i = m_inputs.size(); i-- > 0;)
        {
            const std::string name = AudioMixPlan::inputPadName(i);
            int ret = avfilter_graph_create_filter(&m_inputs[i].source, abuffer_src, name.c_str(), args.c_str(), nullptr, m_graph.get());
            if (ret < 0)
            {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法创建源 filter");
                avfilter_inout_free(&outputs);
                return false;
            }

            AVFilterInOut *entry = avfilter_inout_alloc();
            if (!entry)
            {
                m_errorString = "无法分配 filter inout";
                avfilter_inout_free(&outputs);
                return false;
            }
            entry->name = av_strdup(name.c_str());
            entry->filter_ctx = m_inputs[i].source;
            entry->pad_idx = 0;
            entry->next = outputs;
            outputs = entry;
        }

        int ret = avfilter_graph_create_filter(&m_sink, abuffer_sink, "out", nullptr, nullptr, m_graph.get());
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法创建汇 filter");
            avfilter_inout_free(&outputs);
            return false;
        }

        AVFilterInOut *inputs = avfilter_inout_alloc();
        if (!inputs)
        {
            m_errorString = "无法分配 filter inout";
            avfilter_inout_free(&outputs);
            return false;
        }
        inputs->name = av_strdup("out");
        inputs->filter_ctx = m_sink;
        inputs->pad_idx = 0;
        inputs->next = nullptr;

        const std::string description = AudioMixPlan::filterDescription(usable, AudioDecoder::kOutputSampleRate);
        qDebug() << "音频混音滤镜:" << description.c_str();

        ret = avfilter_graph_parse_ptr(m_graph.get(), description.c_str(), &inputs, &outputs, nullptr);
        avfilter_inout_free(&inputs);
        avfilter_inout_free(&outputs);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法解析 filter chain");
            return false;
        }

        ret = avfilter_graph_config(m_graph.get(), nullptr);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "无法配置 filter graph");
            return false;
        }
        return true;
    }

    bool AudioMixer::fillFifo(AVAudioFifo *fifo, int samples)
    {
        int written = 0;
        while (written < samples)
        {
            if (m_inputs.empty() || m_sinkEof)
            {
                if (!writeSilence(fifo, samples - written))
                {
                    return false;
                }
                return true;
            }

            auto frame = FFmpegUtils::createAvFrame();
            int ret = av_buffersink_get_frame(m_sink, frame.get());
            if (ret == 0)
            {
                if (av_audio_fifo_write(fifo, (void **)frame->data, frame->nb_samples) < frame->nb_samples)
                {
                    m_errorString = "写入FIFO缓冲区失败";
                    return false;
                }
                written += frame->nb_samples;
                continue;
            }
            if (ret == AVERROR_EOF)
            {
                m_sinkEof = true;
                continue;
            }
            if (ret != AVERROR(EAGAIN))
            {
                m_errorString = FFmpegUtils::formatFFmpegError(ret, "从混音滤镜获取帧失败");
                return false;
            }

            // 优先补充进度最慢的输入
            Input *next = nullptr;
            for (Input &input : m_inputs)
            {
                if (!input.finished && (!next || input.nextPts < next->nextPts))
                {
                    next = &input;
                }
            }
            if (!next)
            {
                m_sinkEof = true;
                continue;
            }
            if (!feedInput(*next))
            {
                return false;
            }
        }
        return true;
    }

    bool AudioMixer::feedInput(Input &input)
    {
        if (input.nextPts >= input.endPts)
        {
            return closeInput(input);
        }

        FFmpegUtils::AvFramePtr frame;
        const int result = input.decoder->decodeFrame(frame);
        if (result < 0)
        {
            // 单条音频出错不影响其余轨道
            qWarning() << "音频解码失败，该轨静音:" << input.decoder->getErrorString().c_str();
            return closeInput(input);
        }
        if (result == 0 || !frame)
        {
            return closeInput(input);
        }

        frame->pts = input.nextPts;
        input.nextPts += frame->nb_samples;
        int ret = av_buffersrc_add_frame(input.source, frame.get());
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "发送帧到 filter graph 失败");
            return false;
        }
        return true;
    }

    bool AudioMixer::closeInput(Input &input)
    {
        input.finished = true;
        input.decoder->close();
        int ret = av_buffersrc_add_frame(input.source, nullptr);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "发送EOF到filter graph失败");
            return false;
        }
        return true;
    }

    bool AudioMixer::writeSilence(AVAudioFifo *fifo, int samples)
    {
        if (samples <= 0)
        {
            return true;
        }

        auto silenceFrame = FFmpegUtils::createAvFrame();
        silenceFrame->nb_samples = samples;
        av_channel_layout_default(&silenceFrame->ch_layout, 2);
        silenceFrame->format = AV_SAMPLE_FMT_FLTP;
        silenceFrame->sample_rate = AudioDecoder::kOutputSampleRate;
        int ret = av_frame_get_buffer(silenceFrame.get(), 0);
        if (ret < 0)
        {
            m_errorString = FFmpegUtils::formatFFmpegError(ret, "为静音帧分配缓冲区失败");
            return false;
        }
        av_samples_set_silence(silenceFrame->data, 0, samples, 2, AV_SAMPLE_FMT_FLTP);
        if (av_audio_fifo_write(fifo, (void **)silenceFrame->data, samples) < samples)
        {
            m_errorString = "写入静音数据到FIFO失败";
            return false;
        }
        return true;
    }

} // namespace StackComposer
