#ifndef AUDIO_MIX_PLAN_H
#define AUDIO_MIX_PLAN_H

#include <string>
#include <vector>

#include "ExportTimeline.h"

namespace StackComposer
{
namespace AudioMixPlan
{

    // volume 滤镜表达式，常量时直接输出数值
    std::string volumeExpression(const VolumeRamp &ramp);

    // abuffer 的参数
    std::string bufferSourceArgs(int sampleRate);

    // 输入 pad 名称 in0..inN-1，输出 pad 名称 out
    std::string filterDescription(const std::vector<AudioTrackPlan> &tracks, int sampleRate);

    std::string inputPadName(size_t index);

    // 变速滤镜链，结尾带逗号，原速时为空
    std::string tempoChain(double rate);

} // namespace AudioMixPlan
} // namespace StackComposer

#endif // AUDIO_MIX_PLAN_H
