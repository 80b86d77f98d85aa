// 图层合成：背景、层级、透明度、跳过规则，以及预览/导出两种模式
#include <catch2/catch.hpp>

#include <algorithm>
#include <cstdlib>

#include "FakeMedia.h"
#include "compositor/FrameCompositor.h"

using namespace StackComposer;
using StackTest::solidImage;

namespace {

LayerContent fullCanvasLayer(const std::string &id, const QColor &color, int z, int order = 0) {
    LayerContent layer;
    layer.layerId = id;
    layer.zIndex = z;
    layer.order = order;
    layer.position = QPointF(0.5, 0.5);
    layer.size = QSizeF(1.0, 1.0);
    layer.status = ContentStatus::AVAILABLE;
    layer.image = solidImage(color);
    return layer;
}

bool allPixels(const QImage &image, QRgb expected) {
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            if (image.pixel(x, y) != expected)
                return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("Empty composition is the background color", "[compositor]") {
    FrameCompositor compositor(RenderProfile::exportProfile());
    QImage output;
    REQUIRE(compositor.composite({}, QSize(20, 10), output));
    REQUIRE(output.size() == QSize(20, 10));
    REQUIRE(output.format() == QImage::Format_ARGB32);
    REQUIRE(allPixels(output, qRgb(0x1A, 0x1A, 0x1A)));

    compositor.setBackgroundColor(QColor(Qt::green));
    REQUIRE(compositor.composite({}, QSize(4, 4), output));
    REQUIRE(allPixels(output, QColor(Qt::green).rgb()));
}

TEST_CASE("Invalid output size fails", "[compositor]") {
    FrameCompositor compositor(RenderProfile::interactive());
    QImage output;
    REQUIRE_FALSE(compositor.composite({}, QSize(0, 10), output));
    REQUIRE_FALSE(compositor.errorString().empty());
}

TEST_CASE("Higher z index is drawn on top", "[compositor]") {
    FrameCompositor compositor(RenderProfile::exportProfile());
    const std::vector<LayerContent> layers = {
        fullCanvasLayer("red", Qt::red, 0),
        fullCanvasLayer("blue", Qt::blue, 1),
    };

    QImage output;
    REQUIRE(compositor.composite(layers, QSize(8, 8), output));
    REQUIRE(allPixels(output, QColor(Qt::blue).rgb()));

    SECTION("input order does not matter") {
        std::vector<LayerContent> reversed(layers.rbegin(), layers.rend());
        QImage other;
        REQUIRE(compositor.composite(reversed, QSize(8, 8), other));
        REQUIRE(other == output);
    }

    SECTION("equal z falls back to insertion order") {
        std::vector<LayerContent> tied = {
            fullCanvasLayer("second", Qt::yellow, 3, 1),
            fullCanvasLayer("first", Qt::cyan, 3, 0),
        };
        QImage tiedOutput;
        REQUIRE(compositor.composite(tied, QSize(8, 8), tiedOutput));
        REQUIRE(allPixels(tiedOutput, QColor(Qt::yellow).rgb()));

        std::reverse(tied.begin(), tied.end());
        REQUIRE(compositor.composite(tied, QSize(8, 8), tiedOutput));
        REQUIRE(allPixels(tiedOutput, QColor(Qt::yellow).rgb()));
    }
}

TEST_CASE("Compositing is deterministic", "[compositor]") {
    FrameCompositor compositor(RenderProfile::exportProfile());
    LayerContent small = fullCanvasLayer("small", Qt::magenta, 1);
    small.position = QPointF(0.3, 0.6);
    small.size = QSizeF(0.35, 0.2);
    small.opacity = 0.6f;
    const std::vector<LayerContent> layers = {fullCanvasLayer("base", Qt::darkGreen, 0), small};

    QImage first;
    QImage second;
    REQUIRE(compositor.composite(layers, QSize(64, 48), first));
    REQUIRE(compositor.composite(layers, QSize(64, 48), second));
    REQUIRE(first == second);
}

TEST_CASE("Opacity blends over what is below", "[compositor]") {
    FrameCompositor compositor(RenderProfile::exportProfile());
    compositor.setBackgroundColor(QColor(Qt::black));

    LayerContent white = fullCanvasLayer("white", Qt::white, 0);
    white.opacity = 0.5f;

    QImage output;
    REQUIRE(compositor.composite({white}, QSize(4, 4), output));
    const QRgb pixel = output.pixel(2, 2);
    REQUIRE(std::abs(qRed(pixel) - 128) <= 1);
    REQUIRE(std::abs(qGreen(pixel) - 128) <= 1);
    REQUIRE(qAlpha(pixel) == 255);
}

TEST_CASE("Layers without content are skipped", "[compositor]") {
    FrameCompositor compositor(RenderProfile::exportProfile());
    const QRgb background = qRgb(0x1A, 0x1A, 0x1A);

    SECTION("unavailable") {
        LayerContent layer = fullCanvasLayer("late", Qt::red, 0);
        layer.status = ContentStatus::UNAVAILABLE;
        QImage output;
        REQUIRE(compositor.composite({layer}, QSize(4, 4), output));
        REQUIRE(allPixels(output, background));
        REQUIRE(compositor.skippedLayers() == 1);
    }

    SECTION("fully transparent") {
        LayerContent layer = fullCanvasLayer("hidden", Qt::red, 0);
        layer.opacity = 0.0f;
        QImage output;
        REQUIRE(compositor.composite({layer}, QSize(4, 4), output));
        REQUIRE(allPixels(output, background));
        REQUIRE(compositor.skippedLayers() == 1);
    }

    SECTION("entirely off the canvas") {
        LayerContent layer = fullCanvasLayer("away", Qt::red, 0);
        layer.position = QPointF(3.0, 3.0);
        QImage output;
        REQUIRE(compositor.composite({layer}, QSize(4, 4), output));
        REQUIRE(allPixels(output, background));
        REQUIRE(compositor.skippedLayers() == 0);
    }
}

TEST_CASE("Decode failures depend on the render profile", "[compositor]") {
    LayerContent broken = fullCanvasLayer("broken", Qt::red, 1);
    broken.status = ContentStatus::FAILED;
    broken.image = QImage();
    broken.error = "bad packet";
    const std::vector<LayerContent> layers = {fullCanvasLayer("ok", Qt::blue, 0), broken};

    SECTION("export stops") {
        FrameCompositor compositor(RenderProfile::exportProfile());
        QImage output;
        REQUIRE_FALSE(compositor.composite(layers, QSize(4, 4), output));
        REQUIRE(compositor.errorString().find("broken") != std::string::npos);
    }

    SECTION("preview skips the layer and keeps the rest") {
        FrameCompositor compositor(RenderProfile::interactive());
        QImage output;
        REQUIRE(compositor.composite(layers, QSize(4, 4), output));
        REQUIRE(allPixels(output, QColor(Qt::blue).rgb()));
        REQUIRE(compositor.skippedLayers() == 1);
    }
}

TEST_CASE("Fit leaves bars where fill covers", "[compositor]") {
    // 2:1 的红色素材放进正方形图层
    LayerContent wide = fullCanvasLayer("wide", Qt::red, 0);
    wide.image = solidImage(Qt::red, QSize(200, 100));

    SECTION("fill") {
        FrameCompositor compositor(RenderProfile::interactive(FitMode::ASPECT_FILL));
        compositor.setBackgroundColor(QColor(Qt::black));
        QImage output;
        REQUIRE(compositor.composite({wide}, QSize(100, 100), output));
        REQUIRE(output.pixel(50, 5) == QColor(Qt::red).rgb());
        REQUIRE(output.pixel(50, 50) == QColor(Qt::red).rgb());
    }

    SECTION("fit") {
        FrameCompositor compositor(RenderProfile::interactive(FitMode::ASPECT_FIT));
        compositor.setBackgroundColor(QColor(Qt::black));
        QImage output;
        REQUIRE(compositor.composite({wide}, QSize(100, 100), output));
        REQUIRE(output.pixel(50, 5) == QColor(Qt::black).rgb());
        REQUIRE(output.pixel(50, 50) == QColor(Qt::red).rgb());
        REQUIRE(output.pixel(50, 95) == QColor(Qt::black).rgb());
    }
}

TEST_CASE("Render profiles", "[compositor]") {
    const RenderProfile preview = RenderProfile::interactive();
    const RenderProfile exported = RenderProfile::exportProfile();
    REQUIRE(preview.allowFrameSkip);
    REQUIRE(preview.tolerateSourceErrors);
    REQUIRE_FALSE(exported.allowFrameSkip);
    REQUIRE_FALSE(exported.tolerateSourceErrors);
    REQUIRE(preview.fitMode == exported.fitMode);
    REQUIRE(preview.origin == exported.origin);
}
