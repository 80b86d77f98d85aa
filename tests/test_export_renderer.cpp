// 渲染阶段：逐帧的图层取舍与源时间映射
#include <catch2/catch.hpp>

#include <QTemporaryDir>

#include "FakeMedia.h"
#include "engine/ExportAssembler.h"
#include "engine/ExportRenderer.h"

using namespace StackComposer;
using namespace StackTest;

namespace {

struct RendererFixture {
    FakeProbe probe;
    FakeFrameSourceFactory sources;
    std::shared_ptr<EncoderLog> log = std::make_shared<EncoderLog>();
    QTemporaryDir dir;
    MediaLibrary library;
    Composition composition;
    ExportSettings settings;

    RendererFixture() {
        settings.frameRate = 10;
        composition.setCanvasSize(CanvasSize::SQUARE_1x1);
    }

    void fillCanvas(const std::string &layerId) {
        MediaLayer layer = *composition.findLayer(layerId);
        layer.position = QPointF(0.5, 0.5);
        layer.size = QSizeF(1.0, 1.0);
        REQUIRE(composition.updateLayer(layer));
    }

    std::string addVideo(const std::string &id, double seconds, const QColor &color) {
        const std::string path = "/media/" + id + ".mov";
        library.add(MediaItem::video(id, path, QSize(1080, 1080), seconds));
        probe.addVideo(path, seconds);
        sources.colors[path] = color;
        const std::string layerId = composition.addLayer(*library.find(id), AppSettings());
        fillCanvas(layerId);
        return layerId;
    }

    std::string addImage(const std::string &id, double seconds, const QColor &color) {
        const std::string path = "/media/" + id + ".png";
        library.add(MediaItem::image(id, path, QSize(1080, 1080), seconds));
        sources.colors[path] = color;
        const std::string layerId = composition.addLayer(*library.find(id), AppSettings());
        REQUIRE(composition.updateImageDuration(layerId, seconds));
        fillCanvas(layerId);
        return layerId;
    }

    void render() {
        ExportAssembler assembler(probe);
        ExportTimeline timeline;
        REQUIRE(assembler.build(composition, library, settings, timeline));

        FakeEncoder encoder(log);
        ExportRenderer renderer(sources, encoder);
        CancellationToken token;
        ExportProgress progress;
        REQUIRE(renderer.render(timeline, settings, dir.filePath("out.mov").toStdString(), token, progress) ==
                ExportRenderer::Result::COMPLETED);
    }

    QRgb pixelAt(size_t frame) {
        std::lock_guard<std::mutex> lock(log->mutex);
        REQUIRE(frame < log->centerPixels.size());
        return log->centerPixels[frame];
    }
};

const QRgb kBackground = qRgb(0x1A, 0x1A, 0x1A);

} // namespace

TEST_CASE_METHOD(RendererFixture, "Image leaves after its window and video follows offset and rate", "[renderer]") {
    const std::string clip = addVideo("clip", 3.0, Qt::blue);
    addImage("title", 1.0, Qt::red);

    MediaLayer layer = *composition.findLayer(clip);
    layer.videoTiming()->startOffset = 0.5;
    layer.videoTiming()->playbackRate = 2.0;
    REQUIRE(composition.updateLayer(layer));

    render();
    REQUIRE(log->framesWritten.load() == 30);

    // 图片只在前 1 秒
    for (size_t i = 0; i < 10; ++i) {
        REQUIRE(pixelAt(i) == QColor(Qt::red).rgb());
    }

    // 源时间 0.5 + 2t，到达 3 秒后视频不再有画面
    for (size_t i = 10; i < 13; ++i) {
        REQUIRE(pixelAt(i) == QColor(Qt::blue).rgb());
    }
    for (size_t i = 13; i < 30; ++i) {
        REQUIRE(pixelAt(i) == kBackground);
    }

    const std::vector<double> requested = sources.requests->times("/media/clip.mov");
    REQUIRE(requested.size() == 13);
    for (size_t i = 0; i < requested.size(); ++i) {
        REQUIRE(requested[i] == Approx(0.5 + 0.2 * i));
    }
}

TEST_CASE_METHOD(RendererFixture, "Short video drops out after its own range", "[renderer]") {
    addVideo("long", 3.0, Qt::green);
    addVideo("short", 1.0, Qt::blue);

    render();
    REQUIRE(log->framesWritten.load() == 30);

    REQUIRE(pixelAt(0) == QColor(Qt::blue).rgb());
    REQUIRE(pixelAt(9) == QColor(Qt::blue).rgb());
    REQUIRE(pixelAt(10) == QColor(Qt::green).rgb());
    REQUIRE(pixelAt(29) == QColor(Qt::green).rgb());

    const std::vector<double> shortRequests = sources.requests->times("/media/short.mov");
    REQUIRE(shortRequests.size() == 10);
    REQUIRE(shortRequests.back() == Approx(0.9));

    const std::vector<double> longRequests = sources.requests->times("/media/long.mov");
    REQUIRE(longRequests.size() == 30);
    REQUIRE(longRequests[25] == Approx(2.5));
}
