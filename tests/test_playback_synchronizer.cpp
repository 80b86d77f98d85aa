// 预览播放：各图层播放器的统一控制、排除与逐图层循环
#include <catch2/catch.hpp>

#include <QPointer>
#include <QStringList>
#include <vector>

#include "FakeMedia.h"
#include "playbacksynchronizer.h"

using namespace StackComposer;
using StackTest::FakeLayerPlayer;

namespace {

struct SyncFixture {
    MediaLibrary library;
    Composition composition;
    PlaybackSynchronizer synchronizer;
    std::vector<QPointer<FakeLayerPlayer>> players;
    std::map<QString, qint64> durations;
    bool failNextLoad = false;

    SyncFixture() {
        synchronizer.setPlayerFactory([this](QObject *parent) -> ILayerPlayer * {
            auto *player = new FakeLayerPlayer(parent, durations);
            player->failLoad = failNextLoad;
            failNextLoad = false;
            players.push_back(player);
            return player;
        });
    }

    std::string addVideo(const std::string &id, double seconds) {
        const std::string path = "/media/" + id + ".mov";
        library.add(MediaItem::video(id, path, QSize(1280, 720), seconds));
        durations[QString::fromStdString(path)] = static_cast<qint64>(seconds * 1000);
        return composition.addLayer(*library.find(id), AppSettings());
    }

    std::string addImage(const std::string &id) {
        library.add(MediaItem::image(id, "/media/" + id + ".png", QSize(100, 100), 2.0));
        return composition.addLayer(*library.find(id), AppSettings());
    }

    FakeLayerPlayer *playerFor(const std::string &layerId) {
        return qobject_cast<FakeLayerPlayer *>(synchronizer.player(layerId));
    }

    void sync() { synchronizer.sync(composition, library); }
};

} // namespace

TEST_CASE_METHOD(SyncFixture, "Each visible video layer gets its own player", "[playback]") {
    const std::string a = addVideo("a", 10.0);
    const std::string b = addVideo("b", 4.0);
    addImage("still");
    const std::string hidden = addVideo("hidden", 3.0);
    composition.setLayerVisible(hidden, false);
    sync();

    REQUIRE(synchronizer.activeLayerCount() == 2);
    REQUIRE(players.size() == 2);
    REQUIRE(synchronizer.hasPlayer(a));
    REQUIRE(synchronizer.hasPlayer(b));
    REQUIRE_FALSE(synchronizer.hasPlayer(hidden));

    REQUIRE(playerFor(a)->loadedPath == "/media/a.mov");
    REQUIRE(playerFor(a)->looping);
    REQUIRE(synchronizer.duration() == 10000);

    SECTION("syncing again reuses the players") {
        sync();
        REQUIRE(players.size() == 2);
        REQUIRE(playerFor(a)->seekCount == 0);
    }

    SECTION("removed layers are released") {
        FakeLayerPlayer *released = playerFor(b);
        REQUIRE(composition.removeLayer(b));
        sync();
        REQUIRE_FALSE(synchronizer.hasPlayer(b));
        REQUIRE(released->stopCount == 1);
        REQUIRE(synchronizer.duration() == 10000);
    }

    SECTION("clear releases everything") {
        synchronizer.clear();
        REQUIRE(synchronizer.activeLayerCount() == 0);
        REQUIRE(synchronizer.duration() == 0);
        REQUIRE(synchronizer.position() == 0);
    }
}

TEST_CASE_METHOD(SyncFixture, "Transport commands reach every player", "[playback]") {
    const std::string a = addVideo("a", 10.0);
    const std::string b = addVideo("b", 6.0);
    sync();

    synchronizer.play();
    REQUIRE(synchronizer.isPlaying());
    REQUIRE(playerFor(a)->playCount == 1);
    REQUIRE(playerFor(b)->playCount == 1);

    synchronizer.play();
    REQUIRE(playerFor(a)->playCount == 1);

    synchronizer.pause();
    REQUIRE_FALSE(synchronizer.isPlaying());
    REQUIRE(playerFor(a)->pauseCount == 1);
    REQUIRE(playerFor(b)->pauseCount == 1);

    synchronizer.togglePlayback();
    REQUIRE(synchronizer.isPlaying());
    REQUIRE(playerFor(a)->playCount == 2);

    SECTION("layers added while playing start playing") {
        const std::string c = addVideo("c", 5.0);
        sync();
        REQUIRE(playerFor(c)->playCount == 1);
    }
}

TEST_CASE_METHOD(SyncFixture, "Volume changes do not restart playback", "[playback]") {
    const std::string a = addVideo("a", 10.0);
    const std::string b = addVideo("b", 10.0);
    sync();
    synchronizer.play();

    FakeLayerPlayer *player = playerFor(a);
    const int volumeCalls = player->volumeCount;

    SECTION("mute through the composition") {
        REQUIRE(composition.toggleMute(a));
        sync();
        REQUIRE(player->volume() == Approx(0.0f));
        REQUIRE(player->volumeCount == volumeCalls + 1);
    }

    SECTION("direct volume change is clamped") {
        synchronizer.setLayerVolume(a, 2.0f);
        REQUIRE(player->volume() == Approx(1.0f));
        synchronizer.setLayerVolume(a, 0.3f);
        REQUIRE(player->volume() == Approx(0.3f));
    }

    REQUIRE(player->playCount == 1);
    REQUIRE(player->seekCount == 0);
    REQUIRE(player->stopCount == 0);
    REQUIRE(playerFor(b)->volume() == Approx(1.0f));
    REQUIRE(synchronizer.isPlaying());
}

TEST_CASE_METHOD(SyncFixture, "A failing layer is excluded and the rest keep playing", "[playback]") {
    const std::string a = addVideo("a", 10.0);
    const std::string b = addVideo("b", 10.0);
    sync();
    synchronizer.play();

    std::vector<std::pair<QString, QString>> excluded;
    QObject::connect(&synchronizer, &PlaybackSynchronizer::layerExcluded,
                     [&](const QString &layerId, const QString &reason) { excluded.emplace_back(layerId, reason); });

    QPointer<FakeLayerPlayer> failing = playerFor(a);
    failing->emitError("decode error");

    REQUIRE(synchronizer.isExcluded(a));
    REQUIRE_FALSE(synchronizer.hasPlayer(a));
    REQUIRE(excluded.size() == 1);
    REQUIRE(excluded[0].first == QString::fromStdString(a));
    REQUIRE(excluded[0].second == "decode error");

    REQUIRE(synchronizer.isPlaying());
    REQUIRE(playerFor(b)->isPlaying());
    REQUIRE(playerFor(b)->stopCount == 0);

    // 释放走 deleteLater
    REQUIRE(StackTest::waitUntil([&]() {
        QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
        return failing.isNull();
    }));

    SECTION("excluded layers are not recreated") {
        sync();
        REQUIRE(players.size() == 2);
        REQUIRE(synchronizer.isExcluded(a));
    }

    SECTION("exclusion is forgotten once the layer is removed") {
        composition.removeLayer(a);
        sync();
        REQUIRE_FALSE(synchronizer.isExcluded(a));
    }
}

TEST_CASE_METHOD(SyncFixture, "Layers that cannot be opened are excluded", "[playback]") {
    const std::string a = addVideo("a", 10.0);
    failNextLoad = true;
    sync();

    REQUIRE(synchronizer.isExcluded(a));
    REQUIRE(synchronizer.activeLayerCount() == 0);
}

TEST_CASE_METHOD(SyncFixture, "Seeking maps composition time onto each layer", "[playback]") {
    const std::string longLayer = addVideo("long", 10.0);
    const std::string shortLayer = addVideo("short", 4.0);
    sync();

    synchronizer.seek(2000);
    REQUIRE(playerFor(longLayer)->lastSeek == 2000);
    REQUIRE(playerFor(shortLayer)->lastSeek == 2000);
    REQUIRE(synchronizer.position() == 2000);

    SECTION("looping layers wrap at their own duration") {
        synchronizer.seek(6000);
        REQUIRE(playerFor(longLayer)->lastSeek == 6000);
        REQUIRE(playerFor(shortLayer)->lastSeek == 2000);
    }

    SECTION("without looping short layers hold their last frame") {
        synchronizer.setLooping(false);
        synchronizer.seek(6000);
        REQUIRE(playerFor(shortLayer)->lastSeek == 4000);
    }

    SECTION("players already close to the target are left alone") {
        const int seeks = playerFor(longLayer)->seekCount;
        synchronizer.seek(2030);
        REQUIRE(playerFor(longLayer)->seekCount == seeks);

        synchronizer.setSeekTolerance(10);
        synchronizer.seek(2060);
        REQUIRE(playerFor(longLayer)->seekCount == seeks + 1);
    }

    SECTION("seek is clamped to the composition") {
        synchronizer.seek(-500);
        REQUIRE(synchronizer.position() == 0);
        synchronizer.setLooping(false);
        synchronizer.seek(50000);
        REQUIRE(synchronizer.position() == 10000);
    }

    SECTION("start offset and rate shift the source time") {
        MediaLayer layer = *composition.findLayer(longLayer);
        layer.videoTiming()->startOffset = 1.0;
        layer.videoTiming()->playbackRate = 2.0;
        REQUIRE(composition.updateLayer(layer));
        sync();
        REQUIRE(playerFor(longLayer)->rate == Approx(2.0));
        REQUIRE(playerFor(longLayer)->lastSeek == 5000);
    }
}

TEST_CASE_METHOD(SyncFixture, "Composition clock", "[playback]") {
    addVideo("a", 10.0);

    SECTION("looping wraps the position") {
        sync();
        synchronizer.seek(10000);
        REQUIRE(synchronizer.position() == 0);
    }

    SECTION("reaching the end without looping finishes playback") {
        composition.setLoopMedia(false);
        sync();
        REQUIRE_FALSE(synchronizer.isLooping());

        int finished = 0;
        QObject::connect(&synchronizer, &PlaybackSynchronizer::playbackFinished, [&]() { ++finished; });

        synchronizer.play();
        synchronizer.seek(10000);
        synchronizer.tick();

        REQUIRE(finished == 1);
        REQUIRE_FALSE(synchronizer.isPlaying());
        REQUIRE(synchronizer.position() == 10000);

        // 再次播放从头开始
        synchronizer.play();
        REQUIRE(synchronizer.position() < 1000);
    }

    SECTION("layer loop notifications are forwarded") {
        sync();
        QStringList looped;
        QObject::connect(&synchronizer, &PlaybackSynchronizer::layerLooped,
                         [&](const QString &layerId) { looped << layerId; });
        qobject_cast<FakeLayerPlayer *>(synchronizer.player(composition.layers()[0].id))->emitLooped();
        REQUIRE(looped.size() == 1);
    }
}
