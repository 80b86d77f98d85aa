// 合成数据模型：图层增删、层级、时长与参数限制
#include <catch2/catch.hpp>

#include "model/Composition.h"

using namespace StackComposer;

namespace {

MediaItem makeVideo(const std::string &id, double seconds) {
    return MediaItem::video(id, "/media/" + id + ".mov", QSize(1920, 1080), seconds);
}

MediaItem makeImage(const std::string &id, double seconds) {
    return MediaItem::image(id, "/media/" + id + ".png", QSize(1000, 1000), seconds);
}

std::string addItem(Composition &composition, MediaLibrary &library, const MediaItem &item) {
    library.add(item);
    return composition.addLayer(item, AppSettings());
}

int zOf(const Composition &composition, const std::string &layerId) {
    const MediaLayer *layer = composition.findLayer(layerId);
    REQUIRE(layer != nullptr);
    return layer->zIndex;
}

} // namespace

TEST_CASE("Effective duration is the longest layer capped at 90 seconds", "[composition]") {
    Composition composition;
    MediaLibrary library;

    SECTION("empty composition has no duration") {
        REQUIRE(composition.effectiveDuration(library) == Approx(0.0));
    }

    SECTION("video and image") {
        addItem(composition, library, makeVideo("v", 40.0));
        addItem(composition, library, makeImage("i", 2.0));
        REQUIRE(composition.effectiveDuration(library) == Approx(40.0));
    }

    SECTION("long video is clipped") {
        addItem(composition, library, makeVideo("a", 10.0));
        addItem(composition, library, makeVideo("b", 30.0));
        addItem(composition, library, makeVideo("c", 95.0));
        REQUIRE(composition.effectiveDuration(library) == Approx(Composition::kMaxDuration));
    }

    SECTION("image only uses the display duration") {
        addItem(composition, library, makeImage("i", 3.0));
        REQUIRE(composition.effectiveDuration(library) == Approx(3.0));
    }

    SECTION("layers with missing media contribute nothing") {
        addItem(composition, library, makeVideo("v", 12.0));
        library.remove("v");
        REQUIRE(composition.effectiveDuration(library) == Approx(0.0));
    }

    SECTION("hidden layers do not extend the duration") {
        addItem(composition, library, makeVideo("short", 10.0));
        const std::string hidden = addItem(composition, library, makeVideo("long", 60.0));
        REQUIRE(composition.effectiveDuration(library) == Approx(60.0));

        REQUIRE(composition.setLayerVisible(hidden, false));
        REQUIRE(composition.effectiveDuration(library) == Approx(10.0));

        REQUIRE(composition.setLayerVisible(hidden, true));
        REQUIRE(composition.effectiveDuration(library) == Approx(60.0));
    }
}

TEST_CASE("Adding layers stacks them on top", "[composition]") {
    Composition composition;
    MediaLibrary library;

    const std::string first = addItem(composition, library, makeVideo("a", 5.0));
    const std::string second = addItem(composition, library, makeImage("b", 1.0));
    const std::string third = addItem(composition, library, makeVideo("c", 5.0));

    REQUIRE(composition.layerCount() == 3);
    REQUIRE(zOf(composition, first) == 0);
    REQUIRE(zOf(composition, second) == 1);
    REQUIRE(zOf(composition, third) == 2);
    REQUIRE(first != second);

    SECTION("new layers carry the timing of their media kind") {
        REQUIRE(composition.findLayer(first)->isVideo());
        REQUIRE(composition.findLayer(second)->isImage());
        REQUIRE(composition.findLayer(first)->audioVolume() == Approx(1.0f));
        REQUIRE(composition.findLayer(second)->audioVolume() == Approx(0.0f));
    }

    SECTION("new layers are sized by the media aspect ratio") {
        const MediaLayer *layer = composition.findLayer(first);
        REQUIRE(layer->size.width() == Approx(0.4));
        REQUIRE(layer->size.height() == Approx(0.4 * 1080.0 / 1920.0));
        REQUIRE(layer->position.x() >= 0.4);
        REQUIRE(layer->position.x() <= 0.6);
    }

    SECTION("z index keeps growing after a gap") {
        REQUIRE(composition.bringToFront(first));
        const std::string fourth = addItem(composition, library, makeImage("d", 1.0));
        REQUIRE(zOf(composition, fourth) == zOf(composition, first) + 1);
    }
}

TEST_CASE("Layer ordering operations", "[composition]") {
    Composition composition;
    MediaLibrary library;
    const std::string bottom = addItem(composition, library, makeImage("a", 1.0));
    const std::string middle = addItem(composition, library, makeImage("b", 1.0));
    const std::string top = addItem(composition, library, makeImage("c", 1.0));

    SECTION("bring to front puts the layer above every other") {
        REQUIRE(composition.bringToFront(bottom));
        REQUIRE(zOf(composition, bottom) == 3);
        REQUIRE(composition.sortedLayers().back().id == bottom);
    }

    SECTION("bring to front on the sole top layer changes nothing") {
        REQUIRE(composition.bringToFront(top));
        REQUIRE(zOf(composition, top) == 2);
    }

    SECTION("send to back renumbers when the index would go negative") {
        REQUIRE(composition.sendToBack(top));
        REQUIRE(zOf(composition, top) == 0);
        REQUIRE(zOf(composition, bottom) == 1);
        REQUIRE(zOf(composition, middle) == 2);
        REQUIRE(composition.sortedLayers().front().id == top);
    }

    SECTION("send to back keeps indices when there is room below") {
        REQUIRE(composition.bringToFront(bottom));
        REQUIRE(composition.bringToFront(middle));
        // bottom=3, middle=4, top=2
        REQUIRE(composition.sendToBack(middle));
        REQUIRE(zOf(composition, middle) == 1);
        REQUIRE(zOf(composition, top) == 2);
        REQUIRE(zOf(composition, bottom) == 3);
    }

    SECTION("remove renumbers the remaining layers") {
        REQUIRE(composition.removeLayer(middle));
        REQUIRE(composition.layerCount() == 2);
        REQUIRE(zOf(composition, bottom) == 0);
        REQUIRE(zOf(composition, top) == 1);
        REQUIRE(composition.findLayer(middle) == nullptr);
    }

    SECTION("unknown layers are reported") {
        REQUIRE_FALSE(composition.removeLayer("missing"));
        REQUIRE_FALSE(composition.bringToFront("missing"));
        REQUIRE_FALSE(composition.errorString().empty());
    }

    SECTION("equal z keeps insertion order") {
        MediaLayer layer = *composition.findLayer(top);
        layer.zIndex = 0;
        REQUIRE(composition.updateLayer(layer));
        const std::vector<MediaLayer> sorted = composition.sortedLayers();
        REQUIRE(sorted[0].id == bottom);
        REQUIRE(sorted[1].id == top);
        REQUIRE(composition.insertionOrder(bottom) < composition.insertionOrder(top));
    }
}

TEST_CASE("Reordering does not change the duration", "[composition]") {
    Composition composition;
    MediaLibrary library;
    const std::string video = addItem(composition, library, makeVideo("v", 25.0));
    addItem(composition, library, makeImage("i", 4.0));

    const double before = composition.effectiveDuration(library);
    composition.sendToBack(video);
    composition.bringToFront(video);
    REQUIRE(composition.effectiveDuration(library) == Approx(before));
}

TEST_CASE("Audio volume applies to video layers only", "[composition]") {
    Composition composition;
    MediaLibrary library;
    const std::string video = addItem(composition, library, makeVideo("v", 5.0));
    const std::string image = addItem(composition, library, makeImage("i", 1.0));

    SECTION("volume is clamped") {
        REQUIRE(composition.updateAudioVolume(video, 1.5f));
        REQUIRE(composition.findLayer(video)->audioVolume() == Approx(1.0f));
        REQUIRE(composition.updateAudioVolume(video, -0.2f));
        REQUIRE(composition.findLayer(video)->audioVolume() == Approx(0.0f));
        REQUIRE(composition.updateAudioVolume(video, 0.35f));
        REQUIRE(composition.findLayer(video)->audioVolume() == Approx(0.35f));
    }

    SECTION("toggle mute switches between silent and full volume") {
        REQUIRE(composition.toggleMute(video));
        REQUIRE(composition.findLayer(video)->isMuted());
        REQUIRE(composition.toggleMute(video));
        REQUIRE(composition.findLayer(video)->audioVolume() == Approx(1.0f));

        REQUIRE(composition.updateAudioVolume(video, 0.4f));
        REQUIRE(composition.toggleMute(video));
        REQUIRE(composition.findLayer(video)->audioVolume() == Approx(0.0f));
    }

    SECTION("image layers reject volume changes") {
        REQUIRE_FALSE(composition.updateAudioVolume(image, 0.5f));
        REQUIRE_FALSE(composition.toggleMute(image));
        REQUIRE(composition.findLayer(image)->audioVolume() == Approx(0.0f));
    }
}

TEST_CASE("Image display duration is clamped to half a second through five seconds", "[composition]") {
    Composition composition;
    MediaLibrary library;
    const std::string image = addItem(composition, library, makeImage("i", 1.0));
    const std::string video = addItem(composition, library, makeVideo("v", 5.0));

    REQUIRE(composition.updateImageDuration(image, 10.0));
    REQUIRE(composition.findLayer(image)->imageTiming()->displayDuration == Approx(5.0));
    REQUIRE(composition.updateImageDuration(image, 0.1));
    REQUIRE(composition.findLayer(image)->imageTiming()->displayDuration == Approx(0.5));
    REQUIRE_FALSE(composition.updateImageDuration(video, 2.0));

    REQUIRE(MediaItem::image("x", "/x.png", QSize(10, 10), 9.0).imageDuration == Approx(5.0));
}

TEST_CASE("Layer geometry edits", "[composition]") {
    Composition composition;
    MediaLibrary library;
    const std::string layer = addItem(composition, library, makeImage("i", 1.0));

    SECTION("positions outside the canvas are kept") {
        REQUIRE(composition.setLayerPosition(layer, QPointF(-0.2, 1.3)));
        REQUIRE(composition.findLayer(layer)->position == QPointF(-0.2, 1.3));
    }

    SECTION("size must be positive") {
        REQUIRE_FALSE(composition.setLayerSize(layer, QSizeF(0.0, 0.5)));
        REQUIRE(composition.setLayerSize(layer, QSizeF(1.2, 0.5)));
        REQUIRE(composition.findLayer(layer)->size == QSizeF(1.2, 0.5));
    }

    SECTION("opacity is clamped") {
        REQUIRE(composition.setLayerOpacity(layer, 2.0f));
        REQUIRE(composition.findLayer(layer)->opacity == Approx(1.0f));
        REQUIRE(composition.setLayerOpacity(layer, -1.0f));
        REQUIRE(composition.findLayer(layer)->opacity == Approx(0.0f));
    }

    SECTION("snap to grid rounds to the nearest division") {
        composition.setGridDivisions(4);
        composition.setSnapToGrid(true);
        REQUIRE(composition.setLayerPosition(layer, QPointF(0.3, 0.6)));
        REQUIRE(composition.findLayer(layer)->position.x() == Approx(0.25));
        REQUIRE(composition.findLayer(layer)->position.y() == Approx(0.5));
    }
}

TEST_CASE("Adding prepared layers validates media and kind", "[composition]") {
    Composition composition;
    MediaLibrary library;
    library.add(makeVideo("v", 5.0));
    library.add(makeImage("i", 1.0));

    MediaLayer layer;
    layer.id = "layer-1";
    layer.mediaId = "v";
    layer.timing = VideoTiming{};

    REQUIRE(composition.addLayer(layer, library));

    SECTION("duplicate ids are rejected") {
        REQUIRE_FALSE(composition.addLayer(layer, library));
    }

    SECTION("timing must match the media kind") {
        MediaLayer wrongKind = layer;
        wrongKind.id = "layer-2";
        wrongKind.mediaId = "i";
        REQUIRE_FALSE(composition.addLayer(wrongKind, library));
    }

    SECTION("media must exist") {
        MediaLayer missing = layer;
        missing.id = "layer-3";
        missing.mediaId = "nope";
        REQUIRE_FALSE(composition.addLayer(missing, library));
    }

    SECTION("zero size is invalid") {
        MediaLayer empty = layer;
        empty.id = "layer-4";
        empty.size = QSizeF(0.0, 0.4);
        REQUIRE_FALSE(composition.addLayer(empty, library));
    }

    REQUIRE(composition.layerCount() == 1);
}

TEST_CASE("Snapshots do not follow later edits", "[composition]") {
    Composition composition;
    MediaLibrary library;
    const std::string layer = addItem(composition, library, makeVideo("v", 5.0));

    const CompositionSnapshot snapshot = composition.snapshot();
    composition.updateAudioVolume(layer, 0.0f);
    addItem(composition, library, makeImage("i", 1.0));

    REQUIRE(snapshot->layerCount() == 1);
    REQUIRE(snapshot->findLayer(layer)->audioVolume() == Approx(1.0f));
    REQUIRE(composition.layerCount() == 2);
}

TEST_CASE("Reset restores preferences", "[composition]") {
    AppSettings settings;
    settings.defaultCanvas = CanvasSize::SQUARE_1x1;
    settings.loopMediaByDefault = false;

    Composition composition;
    MediaLibrary library;
    addItem(composition, library, makeImage("i", 1.0));
    composition.setSnapToGrid(true);

    composition.reset(settings);
    REQUIRE(composition.isEmpty());
    REQUIRE(composition.canvasSize() == CanvasSize::SQUARE_1x1);
    REQUIRE_FALSE(composition.loopMedia());
    REQUIRE_FALSE(composition.snapToGrid());
}

TEST_CASE("Media display durations", "[composition]") {
    REQUIRE(makeVideo("v", 75.4).formattedDuration() == "1:15");
    REQUIRE(makeVideo("v", 9.0).formattedDuration() == "0:09");
    REQUIRE(makeImage("i", 2.0).formattedDuration() == "IMG");
}

TEST_CASE("Canvas presets", "[composition]") {
    REQUIRE(pixelSize(CanvasSize::PORTRAIT_9x16, ExportResolution::HD_1080) == QSize(1080, 1920));
    REQUIRE(pixelSize(CanvasSize::LANDSCAPE_16x9, ExportResolution::UHD_4K) == QSize(3840, 2160));
    REQUIRE(pixelSize(CanvasSize::PORTRAIT_4x5, ExportResolution::HD_1080) == QSize(1080, 1350));

    const QSizeF fitted = fittedSize(CanvasSize::PORTRAIT_9x16, QSizeF(1000, 1000));
    REQUIRE(fitted.height() == Approx(1000.0));
    REQUIRE(fitted.width() == Approx(562.5));
}
