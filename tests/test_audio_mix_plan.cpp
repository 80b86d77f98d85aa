// 音频混音滤镜图的描述字符串
#include <catch2/catch.hpp>

#include "engine/AudioMixPlan.h"

using namespace StackComposer;

namespace {

AudioTrackPlan makeTrack(int id, double duration, float volume, double rate = 1.0) {
    AudioTrackPlan track;
    track.trackId = id;
    track.range = TimeRange{0.0, duration};
    track.playbackRate = rate;
    track.volume.setVolume(volume, 0.0);
    return track;
}

} // namespace

TEST_CASE("Volume expressions", "[audio]") {
    VolumeRamp ramp;
    REQUIRE(AudioMixPlan::volumeExpression(ramp) == "1");

    ramp.setVolume(0.5f, 0.0);
    REQUIRE(AudioMixPlan::volumeExpression(ramp) == "0.5");

    ramp.setVolume(0.0f, 2.0);
    ramp.setVolume(1.0f, 4.0);
    REQUIRE_FALSE(ramp.isConstant());
    REQUIRE(AudioMixPlan::volumeExpression(ramp) == "if(lt(t,2),0.5,if(lt(t,4),0,1))");

    REQUIRE(ramp.valueAt(1.0) == Approx(0.5f));
    REQUIRE(ramp.valueAt(3.0) == Approx(0.0f));
    REQUIRE(ramp.valueAt(10.0) == Approx(1.0f));
}

TEST_CASE("Buffer source arguments", "[audio]") {
    REQUIRE(AudioMixPlan::bufferSourceArgs(48000) ==
            "time_base=1/48000:sample_rate=48000:sample_fmt=fltp:channel_layout=stereo");
    REQUIRE(AudioMixPlan::inputPadName(3) == "in3");
}

TEST_CASE("Tempo chain follows the video rate", "[audio]") {
    REQUIRE(AudioMixPlan::tempoChain(1.0).empty());
    REQUIRE(AudioMixPlan::tempoChain(1.5) == "atempo=1.5,");
    REQUIRE(AudioMixPlan::tempoChain(4.0) == "atempo=2,atempo=2,");
    REQUIRE(AudioMixPlan::tempoChain(3.0) == "atempo=2,atempo=1.5,");
    REQUIRE(AudioMixPlan::tempoChain(0.25) == "atempo=0.5,atempo=0.5,");
}

TEST_CASE("Filter graph description", "[audio]") {
    SECTION("no tracks means no audio") {
        REQUIRE(AudioMixPlan::filterDescription({}, 48000).empty());
    }

    SECTION("single track skips the mixer") {
        const std::string description = AudioMixPlan::filterDescription({makeTrack(101, 12, 0.25f)}, 44100);
        REQUIRE(description ==
                "[in0]atrim=end=12,volume=volume='0.25'[a0];"
                "[a0]aformat=sample_fmts=fltp:sample_rates=44100:channel_layouts=stereo[out]");
    }

    SECTION("several tracks are summed without normalization") {
        const std::string description =
            AudioMixPlan::filterDescription({makeTrack(101, 10, 1.0f), makeTrack(102, 4.5, 0.0f, 1.5)}, 48000);
        REQUIRE(description ==
                "[in0]atrim=end=10,volume=volume='1'[a0];"
                "[in1]atempo=1.5,atrim=end=4.5,volume=volume='0'[a1];"
                "[a0][a1]amix=inputs=2:duration=longest:normalize=0,"
                "aformat=sample_fmts=fltp:sample_rates=48000:channel_layouts=stereo[out]");
    }

    SECTION("rates beyond a single stage are chained") {
        const std::string description = AudioMixPlan::filterDescription({makeTrack(101, 6, 1.0f, 4.0)}, 48000);
        REQUIRE(description ==
                "[in0]atempo=2,atempo=2,atrim=end=6,volume=volume='1'[a0];"
                "[a0]aformat=sample_fmts=fltp:sample_rates=48000:channel_layouts=stereo[out]");
    }
}
