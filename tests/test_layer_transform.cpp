// 归一化坐标到像素矩形的映射，以及 fit / fill 缩放
#include <catch2/catch.hpp>

#include "geometry/LayerTransform.h"

using namespace StackComposer;

TEST_CASE("Centered layer maps to pixel frame on 9:16 export canvas", "[transform]") {
    const QRectF frame = LayerTransform::pixelFrame(QPointF(0.5, 0.5), QSizeF(0.4, 0.4), QSizeF(1080, 1920));
    REQUIRE(frame.x() == Approx(324.0));
    REQUIRE(frame.y() == Approx(576.0));
    REQUIRE(frame.width() == Approx(432.0));
    REQUIRE(frame.height() == Approx(768.0));
}

TEST_CASE("Pixel frame scales linearly with canvas size", "[transform]") {
    const QPointF position(0.3, 0.7);
    const QSizeF size(0.25, 0.5);
    const QRectF preview = LayerTransform::pixelFrame(position, size, QSizeF(270, 480));
    const QRectF exported = LayerTransform::pixelFrame(position, size, QSizeF(1080, 1920));

    REQUIRE(exported.x() == Approx(preview.x() * 4.0));
    REQUIRE(exported.y() == Approx(preview.y() * 4.0));
    REQUIRE(exported.width() == Approx(preview.width() * 4.0));
    REQUIRE(exported.height() == Approx(preview.height() * 4.0));
}

TEST_CASE("Layers may extend past the canvas", "[transform]") {
    const QRectF frame = LayerTransform::pixelFrame(QPointF(0.0, 1.2), QSizeF(0.5, 0.5), QSizeF(100, 100));
    REQUIRE(frame.x() == Approx(-25.0));
    REQUIRE(frame.y() == Approx(95.0));
    REQUIRE(frame.width() == Approx(50.0));
}

TEST_CASE("Bottom-left origin only flips the vertical axis", "[transform]") {
    const QPointF position(0.4, 0.25);
    const QSizeF size(0.2, 0.1);
    const QSizeF canvas(1000, 1000);

    const QRectF topLeft = LayerTransform::pixelFrame(position, size, canvas, CoordinateOrigin::TOP_LEFT);
    const QRectF bottomLeft = LayerTransform::pixelFrame(position, size, canvas, CoordinateOrigin::BOTTOM_LEFT);

    REQUIRE(topLeft.x() == Approx(bottomLeft.x()));
    REQUIRE(topLeft.width() == Approx(bottomLeft.width()));
    REQUIRE(topLeft.y() == Approx(200.0));
    REQUIRE(bottomLeft.y() == Approx(700.0));
}

TEST_CASE("Layer overload uses position and size of the layer", "[transform]") {
    MediaLayer layer;
    layer.position = QPointF(0.25, 0.75);
    layer.size = QSizeF(0.5, 0.5);
    const QRectF frame = LayerTransform::pixelFrame(layer, QSizeF(200, 400));
    REQUIRE(frame == QRectF(0, 200, 100, 200));
}

TEST_CASE("Aspect fit and aspect fill", "[transform]") {
    // 16:9 素材放进 9:16 画布上的图层
    const QSizeF source(1920, 1080);
    const QRectF target(324, 576, 432, 768);

    SECTION("fit keeps the whole source inside the target") {
        const FitResult fit = LayerTransform::fitTransform(source, target, FitMode::ASPECT_FIT);
        REQUIRE_FALSE(fit.isEmpty());
        REQUIRE(fit.scale == Approx(0.225));
        REQUIRE(fit.sourceRect == QRectF(QPointF(0, 0), source));
        REQUIRE(fit.destRect.width() == Approx(432.0));
        REQUIRE(fit.destRect.height() == Approx(243.0));
        REQUIRE(fit.destRect.center().x() == Approx(target.center().x()));
        REQUIRE(fit.destRect.center().y() == Approx(target.center().y()));
        REQUIRE(target.contains(fit.destRect));
    }

    SECTION("fill covers the target and crops the source") {
        const FitResult fill = LayerTransform::fitTransform(source, target, FitMode::ASPECT_FILL);
        REQUIRE_FALSE(fill.isEmpty());
        REQUIRE(fill.scale == Approx(768.0 / 1080.0));
        REQUIRE(fill.destRect == target);
        REQUIRE(fill.scaledRect.width() > target.width());
        REQUIRE(fill.scaledRect.height() == Approx(target.height()));
        REQUIRE(fill.sourceRect.height() == Approx(1080.0));
        REQUIRE(fill.sourceRect.width() == Approx(432.0 / (768.0 / 1080.0)));
        REQUIRE(fill.sourceRect.center().x() == Approx(960.0));
    }

    SECTION("the two modes give different results") {
        const FitResult fit = LayerTransform::fitTransform(source, target, FitMode::ASPECT_FIT);
        const FitResult fill = LayerTransform::fitTransform(source, target, FitMode::ASPECT_FILL);
        REQUIRE(fit.scale < fill.scale);
        REQUIRE(fit.destRect != fill.destRect);
    }

    SECTION("matching aspect ratio behaves the same in both modes") {
        const QRectF wide(0, 0, 640, 360);
        const FitResult fit = LayerTransform::fitTransform(source, wide, FitMode::ASPECT_FIT);
        const FitResult fill = LayerTransform::fitTransform(source, wide, FitMode::ASPECT_FILL);
        REQUIRE(fit.scale == Approx(fill.scale));
        REQUIRE(fit.destRect == wide);
        REQUIRE(fill.destRect == wide);
    }
}

TEST_CASE("Degenerate sizes produce an empty fit", "[transform]") {
    REQUIRE(LayerTransform::fitTransform(QSizeF(0, 100), QRectF(0, 0, 10, 10), FitMode::ASPECT_FIT).isEmpty());
    REQUIRE(LayerTransform::fitTransform(QSizeF(100, 100), QRectF(0, 0, 0, 10), FitMode::ASPECT_FILL).isEmpty());
}

TEST_CASE("Pixel rect rounds edges rather than size", "[transform]") {
    const QRect rect = LayerTransform::toPixelRect(QRectF(0.4, 0.6, 10.2, 10.2));
    REQUIRE(rect == QRect(0, 1, 11, 10));
}

TEST_CASE("Fit mode names", "[transform]") {
    REQUIRE(LayerTransform::fitModeFromString("fit") == FitMode::ASPECT_FIT);
    REQUIRE(LayerTransform::fitModeFromString("fill") == FitMode::ASPECT_FILL);
    REQUIRE(LayerTransform::fitModeFromString("stretch") == FitMode::ASPECT_FILL);
}
