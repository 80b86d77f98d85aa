#include "AudioMixPlan.h"

#include <sstream>

namespace StackComposer
{
namespace AudioMixPlan
{

    std::string volumeExpression(const VolumeRamp &ramp)
    {
        std::ostringstream expr;
        if (ramp.keys.empty())
        {
            return "1";
        }
        if (ramp.isConstant())
        {
            expr << ramp.keys.begin()->second;
            return expr.str();
        }

        // 阶梯函数：if(lt(t,k1),v0,if(lt(t,k2),v1,v2))
        auto it = ramp.keys.begin();
        size_t depth = 0;
        float value = it->second;
        for (++it; it != ramp.keys.end(); ++it)
        {
            expr << "if(lt(t," << it->first << ")," << value << ",";
            value = it->second;
            ++depth;
        }
        expr << value << std::string(depth, ')');
        return expr.str();
    }

    std::string bufferSourceArgs(int sampleRate)
    {
        std::ostringstream args;
        args << "time_base=1/" << sampleRate
             << ":sample_rate=" << sampleRate
             << ":sample_fmt=fltp"
             << ":channel_layout=stereo";
        return args.str();
    }

    std::string tempoChain(double rate)
    {
        std::ostringstream chain;
        if (rate <= 0.0 || rate == 1.0)
        {
            return std::string();
        }

        // 单个 atempo 只接受 [0.5, 2]，超出范围时拆成多级
        while (rate > 2.0)
        {
            chain << "atempo=2,";
            rate /= 2.0;
        }
        while (rate < 0.5)
        {
            chain << "atempo=0.5,";
            rate /= 0.5;
        }
        chain << "atempo=" << rate << ",";
        return chain.str();
    }

    std::string inputPadName(size_t index)
    {
        return "in" + std::to_string(index);
    }

    std::string filterDescription(const std::vector<AudioTrackPlan> &tracks, int sampleRate)
    {
        if (tracks.empty())
        {
            return std::string();
        }

        std::ostringstream description;
        for (size_t i = 0; i < tracks.size(); ++i)
        {
            const AudioTrackPlan &track = tracks[i];
            description << "[" << inputPadName(i) << "]";
            description << tempoChain(track.playbackRate);
            description << "atrim=end=" << track.range.duration
                        << ",volume=volume='" << volumeExpression(track.volume) << "'"
                        << (track.volume.isConstant() ? "" : ":eval=frame")
                        << "[a" << i << "];";
        }

        for (size_t i = 0; i < tracks.size(); ++i)
        {
            description << "[a" << i << "]";
        }
        if (tracks.size() > 1)
        {
            // normalize=0 保持各轨音量不被平均
            description << "amix=inputs=" << tracks.size() << ":duration=longest:normalize=0,";
        }
        description << "aformat=sample_fmts=fltp:sample_rates=" << sampleRate << ":channel_layouts=stereo[out]";
        return description.str();
    }

} // namespace AudioMixPlan
} // namespace StackComposer
