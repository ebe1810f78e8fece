#include <gtest/gtest.h>
#include "TestFixtures.hpp"
#include "project/ProjectStore.hpp"
#include "project/VersionEngine.hpp"
#include "storage/LocalStorageBackend.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <map>
#include <spdlog/sinks/ringbuffer_sink.h>

namespace fs = std::filesystem;
using namespace rv::project;
using namespace rv::storage;
using namespace rv::types;
using namespace rv::test;

namespace {

// Refuses to store assets with one particular filename.
class RejectingBackend : public LocalStorageBackend {
public:
    RejectingBackend(fs::path root, std::string rejected)
        : LocalStorageBackend(std::move(root)), rejected_(std::move(rejected)) {}

    void copyIn(const fs::path& localPath, const std::string& key) override {
        if (localPath.filename() == rejected_) throw std::runtime_error("simulated copy failure: " + key);
        LocalStorageBackend::copyIn(localPath, key);
    }

private:
    std::string rejected_;
};

}

class VersionEngineTest : public ::testing::Test {
protected:
    TempDir dir{"reelvault-engine"};
    std::shared_ptr<LocalStorageBackend> backend;
    std::shared_ptr<ProjectStore> store;
    std::unique_ptr<VersionEngine> engine;
    fs::path work, file;

    void SetUp() override {
        backend = std::make_shared<LocalStorageBackend>(dir / "storage");
        store = std::make_shared<ProjectStore>(".reelvault");
        engine = std::make_unique<VersionEngine>(backend, store);
        work = dir / "work";
        file = work / "scene.aepx";
    }

    [[nodiscard]] fs::path storePath() const { return store->storePathFor(file); }
};

TEST_F(VersionEngineTest, InitializeCreatesVersionZero) {
    writeBytes(work / "a.png", 10);
    writeProject(file, {"a.png", "missing.mov"});

    const auto p = engine->initialize(file);

    EXPECT_EQ(p.name, "scene.aepx");
    EXPECT_EQ(p.id(), "scene");
    EXPECT_EQ(p.backend, BackendType::Local);
    ASSERT_EQ(p.versions.size(), 1u);

    const auto& v0 = p.versions.front();
    EXPECT_EQ(v0.number, 0);
    EXPECT_EQ(v0.message, VersionEngine::INITIAL_MESSAGE);
    EXPECT_EQ(v0.backend_key, "scene/v000/scene.aepx");
    EXPECT_EQ(v0.asset_count, 1u);
    EXPECT_EQ(v0.total_size, 10u);
    EXPECT_EQ(v0.size, fs::file_size(file));
    EXPECT_TRUE(backend->exists("scene/v000/scene.aepx"));
    EXPECT_TRUE(backend->exists("scene/assets/a.png"));
    EXPECT_TRUE(backend->exists("scene/v000/asset-tracking.json"));

    EXPECT_TRUE(ProjectStore::exists(storePath()));
    EXPECT_EQ(ProjectStore::load(storePath()), p);
}

TEST_F(VersionEngineTest, InitializeRefusesExistingProjectWithoutForce) {
    writeProject(file, {});
    (void)engine->initialize(file);
    EXPECT_THROW((void)engine->initialize(file), std::invalid_argument);
    EXPECT_NO_THROW((void)engine->initialize(file, true));
}

TEST_F(VersionEngineTest, InitializeMissingFileThrows) {
    EXPECT_THROW((void)engine->initialize(work / "absent.aepx"), std::invalid_argument);
}

TEST_F(VersionEngineTest, CommitsAreNumberedByOrdinal) {
    writeProject(file, {});
    auto p = engine->initialize(file);

    const auto v1 = engine->commit(p, storePath(), "first edit", file);
    const auto v2 = engine->commit(p, storePath(), "second edit", file);

    EXPECT_EQ(v1.number, 1);
    EXPECT_EQ(v2.number, 2);
    EXPECT_EQ(v2.backend_key, "scene/v002/scene.aepx");
    ASSERT_EQ(p.versions.size(), 3u);
    EXPECT_EQ(ProjectStore::load(storePath()).versions.size(), 3u);
}

TEST_F(VersionEngineTest, TotalSizeSumsAssetBytes) {
    writeBytes(work / "footage.mov", 10 * 1024 * 1024);
    writeBytes(work / "music.wav", 2 * 1024 * 1024);
    writeProject(file, {"footage.mov", "music.wav"});

    const auto p = engine->initialize(file);
    EXPECT_EQ(p.versions.front().total_size, 12582912u);
    EXPECT_EQ(p.versions.front().asset_count, 2u);
}

TEST_F(VersionEngineTest, TrackingRecordsSwappedAsset) {
    writeBytes(work / "image1.png", 5);
    writeProject(file, {"image1.png"});
    auto p = engine->initialize(file);

    writeBytes(work / "image2.png", 7);
    writeProject(file, {"image2.png"});
    (void)engine->commit(p, storePath(), "swap image", file);

    const auto t = engine->loadTracking(p, 1);
    EXPECT_EQ(t.version, 1);
    EXPECT_EQ(t.commit_message, "swap image");
    EXPECT_EQ(t.new_assets, 1u);
    EXPECT_EQ(t.removed_assets, 1u);
    ASSERT_EQ(t.assets.size(), 2u);
    EXPECT_EQ(t.assets[0].filename, "image2.png");
    EXPECT_EQ(t.assets[0].status, AssetState::New);
    EXPECT_EQ(t.assets[1].filename, "image1.png");
    EXPECT_EQ(t.assets[1].status, AssetState::Removed);
}

TEST_F(VersionEngineTest, GetVersionRejectsOutOfRange) {
    writeProject(file, {});
    auto p = engine->initialize(file);
    (void)engine->commit(p, storePath(), "one", file);

    EXPECT_EQ(VersionEngine::getVersion(p, 1).message, "one");
    EXPECT_THROW((void)VersionEngine::getVersion(p, -1), std::out_of_range);
    EXPECT_THROW((void)VersionEngine::getVersion(p, static_cast<int>(p.versions.size())), std::out_of_range);
}

TEST_F(VersionEngineTest, RemoveVersionKeepsOtherNumbers) {
    writeProject(file, {});
    auto p = engine->initialize(file);
    (void)engine->commit(p, storePath(), "one", file);
    (void)engine->commit(p, storePath(), "two", file);

    engine->removeVersion(p, storePath(), 1);

    ASSERT_EQ(p.versions.size(), 2u);
    EXPECT_EQ(p.versions[0].number, 0);
    EXPECT_EQ(p.versions[1].number, 2);
    EXPECT_EQ(ProjectStore::load(storePath()).versions.size(), 2u);
    EXPECT_THROW(engine->removeVersion(p, storePath(), 1), std::out_of_range);
}

TEST_F(VersionEngineTest, PruneDropsVersionsMissingFromStorage) {
    writeProject(file, {});
    auto p = engine->initialize(file);
    (void)engine->commit(p, storePath(), "one", file);
    (void)engine->commit(p, storePath(), "two", file);

    EXPECT_EQ(engine->pruneMissingBackedVersions(p, storePath()), 0u);

    fs::remove(backend->resolve("scene/v001/scene.aepx"));
    EXPECT_EQ(engine->pruneMissingBackedVersions(p, storePath()), 1u);

    ASSERT_EQ(p.versions.size(), 2u);
    EXPECT_EQ(p.versions[1].number, 2);
    EXPECT_EQ(ProjectStore::load(storePath()).versions.size(), 2u);
}

TEST_F(VersionEngineTest, RestoreRelinksMovedAssets) {
    writeBytes(work / "media" / "kept.png", 3);
    writeBytes(work / "media" / "lost.png", 4);
    writeProject(file, {"media/kept.png", "media/lost.png"});
    const auto p = engine->initialize(file);

    fs::remove(work / "media" / "lost.png");

    const auto out = dir / "restore";
    const auto restored = engine->restoreVersion(p, 0, out);

    EXPECT_EQ(restored, out / "scene.aepx");
    ASSERT_TRUE(fs::exists(restored));
    EXPECT_TRUE(fs::exists(out / "assets" / "lost.png"));
    EXPECT_FALSE(fs::exists(out / "assets" / "kept.png"));

    const auto xml = rv::util::readFileToString(restored);
    EXPECT_NE(xml.find((fs::absolute(out / "assets" / "lost.png")).lexically_normal().string()), std::string::npos);
    EXPECT_NE(xml.find("media/kept.png"), std::string::npos);
}

TEST_F(VersionEngineTest, DeleteProjectRemovesStorageAndRecord) {
    writeBytes(work / "a.png", 1);
    writeProject(file, {"a.png"});
    const auto p = engine->initialize(file);

    engine->deleteProject(p, storePath());

    EXPECT_FALSE(backend->exists("scene"));
    EXPECT_FALSE(fs::exists(storePath().parent_path()));
    EXPECT_TRUE(fs::exists(file));
}

TEST_F(VersionEngineTest, VideoAndImageScenario) {
    writeBytes(work / "video1.mp4", 10 * 1024 * 1024);
    writeBytes(work / "image1.png", 2 * 1024 * 1024);
    writeProject(file, {"video1.mp4", "image1.png"});
    auto p = engine->initialize(file);
    EXPECT_EQ(p.versions[0].asset_count, 2u);
    EXPECT_EQ(p.versions[0].total_size, 12582912u);

    writeBytes(work / "image2.png", 1024);
    writeProject(file, {"video1.mp4", "image2.png"});
    (void)engine->commit(p, storePath(), "replace image", file);

    const auto t = engine->loadTracking(p, 1);
    std::map<std::string, AssetState> states;
    for (const auto& s : t.assets) states[s.filename] = s.status;
    EXPECT_EQ(states.at("video1.mp4"), AssetState::Present);
    EXPECT_EQ(states.at("image1.png"), AssetState::Removed);
    EXPECT_EQ(states.at("image2.png"), AssetState::New);

    // the pooled video is shared by both versions
    EXPECT_EQ(p.versions[0].assets[1].backend_key, p.versions[1].assets[1].backend_key);
}

TEST_F(VersionEngineTest, FailedLookupLeavesProjectUnchanged) {
    writeProject(file, {});
    auto p = engine->initialize(file);
    const auto before = p;
    EXPECT_THROW((void)VersionEngine::getVersion(p, 5), std::out_of_range);
    EXPECT_THROW(engine->removeVersion(p, storePath(), 5), std::out_of_range);
    EXPECT_EQ(p, before);
    EXPECT_EQ(ProjectStore::load(storePath()), before);
}

TEST_F(VersionEngineTest, CommitRollsBackWhenRecordCannotBeSaved) {
    writeProject(file, {});
    auto p = engine->initialize(file);
    const auto before = p;

    // a regular file where the record's directory would have to be
    writeText(work / "blocker", "x");
    const auto unwritable = work / "blocker" / "config.json";

    const auto other = work / "other.aepx";
    writeProject(other, {});

    EXPECT_THROW((void)engine->commit(p, unwritable, "lost", other), std::runtime_error);
    EXPECT_EQ(p.versions.size(), before.versions.size());
    EXPECT_EQ(p.project_path, before.project_path);
    EXPECT_EQ(p, before);
}

TEST_F(VersionEngineTest, CommitOfMissingFileChangesNothing) {
    writeProject(file, {});
    auto p = engine->initialize(file);
    const auto before = p;

    EXPECT_THROW((void)engine->commit(p, storePath(), "ghost", work / "absent.aepx"), std::invalid_argument);
    EXPECT_EQ(p, before);
    EXPECT_EQ(ProjectStore::load(storePath()), before);
    EXPECT_FALSE(backend->exists("scene/v001"));
}

TEST_F(VersionEngineTest, AssetCountFollowsExtractorWhenStoringFails) {
    const auto rejecting = std::make_shared<RejectingBackend>(dir / "storage", "broken.png");
    VersionEngine e(rejecting, store);

    writeBytes(work / "good.png", 3);
    writeBytes(work / "broken.png", 5);
    writeProject(file, {"good.png", "broken.png"});

    auto p = e.initialize(file);
    const auto v1 = e.commit(p, storePath(), "again", file);

    for (const auto& v : {p.versions[0], v1}) {
        EXPECT_EQ(v.asset_count, 2u);
        EXPECT_EQ(v.total_size, 8u);
        ASSERT_EQ(v.assets.size(), 1u);
        EXPECT_EQ(v.assets[0].filename, "good.png");
    }
}

TEST_F(VersionEngineTest, WarnsWhenCommitReusesARemovedNumber) {
    writeProject(file, {});
    auto p = engine->initialize(file);
    (void)engine->commit(p, storePath(), "one", file);
    (void)engine->commit(p, storePath(), "two", file);
    engine->removeVersion(p, storePath(), 1);

    const auto logger = rv::logging::LogRegistry::project();
    const auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    ring->set_level(spdlog::level::warn);
    logger->sinks().push_back(ring);

    const auto v = engine->commit(p, storePath(), "three", file);
    logger->sinks().pop_back();

    EXPECT_EQ(v.number, 2);
    ASSERT_EQ(p.versions.size(), 3u);
    EXPECT_EQ(p.versions[1].number, 2);
    EXPECT_EQ(p.versions[2].number, 2);

    const auto lines = ring->last_formatted();
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("Version 2 of scene already exists"), std::string::npos);
}
