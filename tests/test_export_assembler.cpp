// 构建阶段：合成快照到多轨时间线的映射
#include <catch2/catch.hpp>

#include "FakeMedia.h"
#include "engine/ExportAssembler.h"

using namespace StackComposer;
using StackTest::FakeProbe;

namespace {

struct AssemblerFixture {
    FakeProbe probe;
    MediaLibrary library;
    Composition composition;
    ExportSettings settings;
    ExportTimeline timeline;

    std::string addVideo(const std::string &id, double libraryDuration) {
        const MediaItem item = MediaItem::video(id, "/media/" + id + ".mov", QSize(1920, 1080), libraryDuration);
        library.add(item);
        return composition.addLayer(item, AppSettings());
    }

    std::string addImage(const std::string &id, double seconds) {
        const MediaItem item = MediaItem::image(id, "/media/" + id + ".png", QSize(800, 800), seconds);
        library.add(item);
        return composition.addLayer(item, AppSettings());
    }
};

} // namespace

TEST_CASE_METHOD(AssemblerFixture, "Video layers become paired video and audio tracks", "[assembler]") {
    const std::string first = addVideo("a", 12.0);
    const std::string second = addVideo("b", 6.0);
    probe.addVideo("/media/a.mov", 12.0);
    probe.addVideo("/media/b.mov", 6.0, false);
    composition.updateAudioVolume(first, 0.25f);

    ExportAssembler assembler(probe);
    REQUIRE(assembler.build(composition, library, settings, timeline));

    REQUIRE(timeline.totalDuration == Approx(12.0));
    REQUIRE(timeline.videoTracks.size() == 2);
    REQUIRE(timeline.videoTracks[0].trackId == 1);
    REQUIRE(timeline.videoTracks[0].layerId == first);
    REQUIRE(timeline.videoTracks[1].trackId == 2);
    REQUIRE(timeline.videoTracks[1].layerId == second);

    SECTION("audio track id is the video track id plus 100") {
        REQUIRE(timeline.audioTracks.size() == 1);
        const AudioTrackPlan &audio = timeline.audioTracks[0];
        REQUIRE(audio.trackId == 101);
        REQUIRE(audio.layerId == first);
        REQUIRE(timeline.videoTracks[0].audioTrackId == 101);
        REQUIRE(timeline.videoTracks[0].hasAudio);
    }

    SECTION("layer volume is applied at time zero") {
        const AudioTrackPlan &audio = timeline.audioTracks[0];
        REQUIRE(audio.volume.isConstant());
        REQUIRE(audio.volume.valueAt(0.0) == Approx(0.25f));
        REQUIRE(audio.volume.valueAt(5.0) == Approx(0.25f));
    }

    SECTION("sources without audio get no audio track") {
        REQUIRE_FALSE(timeline.videoTracks[1].hasAudio);
        REQUIRE(timeline.videoTracks[1].audioTrackId == 0);
    }

    SECTION("every track starts at zero and lasts as long as its source") {
        REQUIRE(timeline.videoTracks[0].range.start == Approx(0.0));
        REQUIRE(timeline.videoTracks[0].range.duration == Approx(12.0));
        REQUIRE(timeline.videoTracks[1].range.duration == Approx(6.0));
        REQUIRE(timeline.audioTracks[0].range.duration == Approx(12.0));
    }

    SECTION("instructions reference the tracks in insertion order") {
        REQUIRE(timeline.instructions.size() == 2);
        REQUIRE(timeline.instructions[0].kind == MediaKind::VIDEO);
        REQUIRE(timeline.instructions[0].trackId == 1);
        REQUIRE(timeline.instructions[0].order == 0);
        REQUIRE(timeline.instructions[1].trackId == 2);
        REQUIRE(timeline.instructions[1].order == 1);
        REQUIRE(timeline.instructions[1].zIndex == 1);
    }
}

TEST_CASE_METHOD(AssemblerFixture, "Long sources are clipped to 90 seconds", "[assembler]") {
    addVideo("long", 120.0);
    addImage("still", 3.0);
    probe.addVideo("/media/long.mov", 120.0);

    ExportAssembler assembler(probe);
    REQUIRE(assembler.build(composition, library, settings, timeline));

    REQUIRE(timeline.totalDuration == Approx(90.0));
    REQUIRE(timeline.videoTracks[0].range.duration == Approx(90.0));
    REQUIRE(timeline.videoTracks[0].sourceDuration == Approx(120.0));
    REQUIRE(timeline.audioTracks[0].range.duration == Approx(90.0));
    REQUIRE(timeline.frameCount() == 90 * 30);
}

TEST_CASE_METHOD(AssemblerFixture, "Image layers carry their display window", "[assembler]") {
    const std::string image = addImage("still", 2.5);
    composition.setLayerOpacity(image, 0.75f);

    ExportAssembler assembler(probe);
    REQUIRE(assembler.build(composition, library, settings, timeline));

    REQUIRE(timeline.videoTracks.empty());
    REQUIRE(timeline.audioTracks.empty());
    REQUIRE(timeline.totalDuration == Approx(2.5));
    REQUIRE(timeline.instructions.size() == 1);

    const LayerInstruction &instruction = timeline.instructions[0];
    REQUIRE(instruction.kind == MediaKind::IMAGE);
    REQUIRE(instruction.imagePath == "/media/still.png");
    REQUIRE(instruction.imageDuration == Approx(2.5));
    REQUIRE(instruction.opacity == Approx(0.75f));
    REQUIRE(instruction.trackId == 0);
}

TEST_CASE_METHOD(AssemblerFixture, "Layers that cannot contribute are skipped", "[assembler]") {
    const std::string visible = addVideo("v", 8.0);
    probe.addVideo("/media/v.mov", 8.0);

    SECTION("hidden layer") {
        const std::string hidden = addImage("hidden", 1.0);
        composition.setLayerVisible(hidden, false);

        ExportAssembler assembler(probe);
        REQUIRE(assembler.build(composition, library, settings, timeline));
        REQUIRE(timeline.instructions.size() == 1);
        REQUIRE(timeline.instructions[0].layerId == visible);
        REQUIRE(assembler.skippedLayers() == std::vector<std::string>{hidden});
    }

    SECTION("hidden long video does not stretch the export") {
        const std::string hidden = addVideo("long", 60.0);
        probe.addVideo("/media/long.mov", 60.0);
        composition.setLayerVisible(hidden, false);

        ExportAssembler assembler(probe);
        REQUIRE(assembler.build(composition, library, settings, timeline));
        REQUIRE(timeline.totalDuration == Approx(8.0));
        REQUIRE(timeline.videoTracks.size() == 1);
    }

    SECTION("media removed from the library") {
        const std::string orphan = addImage("gone", 1.0);
        library.remove("gone");

        ExportAssembler assembler(probe);
        REQUIRE(assembler.build(composition, library, settings, timeline));
        REQUIRE(timeline.instructions.size() == 1);
        REQUIRE(assembler.skippedLayers() == std::vector<std::string>{orphan});
    }

    SECTION("source without a video stream") {
        const std::string silentVideo = addVideo("audio-only", 5.0);
        probe.addAudioOnly("/media/audio-only.mov", 5.0);

        ExportAssembler assembler(probe);
        REQUIRE(assembler.build(composition, library, settings, timeline));
        REQUIRE(timeline.videoTracks.size() == 1);
        REQUIRE(timeline.audioTracks.size() == 1);
        REQUIRE(assembler.skippedLayers() == std::vector<std::string>{silentVideo});
    }
}

TEST_CASE_METHOD(AssemblerFixture, "Unreadable video source fails the build", "[assembler]") {
    addVideo("ok", 4.0);
    addVideo("broken", 4.0);
    probe.addVideo("/media/ok.mov", 4.0);

    ExportAssembler assembler(probe);
    REQUIRE_FALSE(assembler.build(composition, library, settings, timeline));
    REQUIRE(assembler.error().kind == ExportErrorKind::SOURCE_UNREADABLE);
    REQUIRE(assembler.errorString().find("/media/broken.mov") != std::string::npos);
}

TEST_CASE_METHOD(AssemblerFixture, "Empty composition renders a background clip", "[assembler]") {
    settings.emptyCompositionDuration = 2.0;
    settings.frameRate = 25;

    ExportAssembler assembler(probe);
    REQUIRE(assembler.build(composition, library, settings, timeline));
    REQUIRE(timeline.totalDuration == Approx(2.0));
    REQUIRE(timeline.frameCount() == 50);
    REQUIRE(timeline.instructions.empty());
}

TEST_CASE_METHOD(AssemblerFixture, "Render settings follow canvas and resolution", "[assembler]") {
    addImage("still", 1.0);
    settings.backgroundColor = "#FF0000";

    SECTION("1080p portrait") {
        ExportAssembler assembler(probe);
        REQUIRE(assembler.build(composition, library, settings, timeline));
        REQUIRE(timeline.renderSize == QSize(1080, 1920));
        REQUIRE(timeline.backgroundColor == QColor(Qt::red));
        REQUIRE(timeline.frameRate == 30);
    }

    SECTION("4k landscape") {
        composition.setCanvasSize(CanvasSize::LANDSCAPE_16x9);
        settings.resolution = ExportResolution::UHD_4K;
        ExportAssembler assembler(probe);
        REQUIRE(assembler.build(composition, library, settings, timeline));
        REQUIRE(timeline.renderSize == QSize(3840, 2160));
    }
}

TEST_CASE_METHOD(AssemblerFixture, "Invalid export settings fail before any probing", "[assembler]") {
    addVideo("v", 3.0);
    settings.container = "avi";

    ExportAssembler assembler(probe);
    REQUIRE_FALSE(assembler.build(composition, library, settings, timeline));
    REQUIRE(assembler.error().kind == ExportErrorKind::COMPOSITION_FAILED);
}

TEST_CASE("Timeline frame arithmetic", "[assembler]") {
    ExportTimeline timeline;
    timeline.frameRate = 30;

    timeline.totalDuration = 1.0;
    REQUIRE(timeline.frameCount() == 30);
    timeline.totalDuration = 1.01;
    REQUIRE(timeline.frameCount() == 31);
    timeline.totalDuration = 0.0;
    REQUIRE(timeline.frameCount() == 0);

    REQUIRE(timeline.frameTime(15) == Approx(0.5));

    TimeRange range{0.0, 2.0};
    REQUIRE(range.contains(0.0));
    REQUIRE(range.contains(1.999));
    REQUIRE_FALSE(range.contains(2.0));
}
