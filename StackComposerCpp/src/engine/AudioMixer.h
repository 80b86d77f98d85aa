#ifndef AUDIO_MIXER_H
#define AUDIO_MIXER_H

#include <memory>
#include <string>
#include <vector>

#include "../decoder/AudioDecoder.h"
#include "../ffmpeg_utils/AvFormatContextWrapper.h"
#include "ExportTimeline.h"

namespace StackComposer
{

    // 多条音频轨经 avfilter 混音，输出 44100Hz FLTP 立体声
    class AudioMixer
    {
    public:
        AudioMixer() = default;

        // 打不开的轨道会被跳过；没有可用轨道时 hasInputs() 为 false
        bool open(const std::vector<AudioTrackPlan> &tracks);

        bool hasInputs() const { return !m_inputs.empty(); }

        // 向 fifo 写入至少 samples 个样本，输入耗尽后补静音
        bool fillFifo(AVAudioFifo *fifo, int samples);

        std::string getErrorString() const { return m_errorString; }

    private:
        struct Input
        {
            std::unique_ptr<AudioDecoder> decoder;
            AVFilterContext *source = nullptr;
            int64_t nextPts = 0;
            int64_t endPts = 0;   // 超过后不再解码
            bool finished = false;
        };

        bool feedInput(Input &input);
        bool closeInput(Input &input);
        bool writeSilence(AVAudioFifo *fifo, int samples);

        std::vector<Input> m_inputs;
        FFmpegUtils::AvFilterGraphPtr m_graph;
        AVFilterContext *m_sink = nullptr;
        bool m_sinkEof = false;
        std::string m_errorString;
    };

} // namespace StackComposer

#endif // AUDIO_MIXER_H
