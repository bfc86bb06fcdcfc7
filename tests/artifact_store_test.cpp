#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <regex>
#include <string>
#include <thread>
#include <vector>
#include "core/artifact_store.hpp"
#include "core/pipeline_errors.hpp"
#include "test_base.hpp"

namespace
{
    std::vector<uint8_t> bytesOf(const std::string &text)
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

class ArtifactStoreTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        store_ = std::make_unique<FileSystemArtifactStore>(testDir() / "storage", "https://cdn.example.com/media/",
                                                           "s3cret", 3600);
    }

    std::unique_ptr<FileSystemArtifactStore> store_;
};

TEST_F(ArtifactStoreTest, PutThenGet)
{
    std::string ref = store_->put("jobs/job-1/poses.json", bytesOf("{\"frames\":[]}"));

    EXPECT_EQ(ref, "jobs/job-1/poses.json");
    EXPECT_TRUE(store_->exists(ref));
    EXPECT_EQ(store_->size(ref), 13u);
    EXPECT_EQ(store_->get(ref), bytesOf("{\"frames\":[]}"));
    EXPECT_TRUE(std::filesystem::is_regular_file(store_->root() / "jobs" / "job-1" / "poses.json"));
}

TEST_F(ArtifactStoreTest, OverwriteReplacesContent)
{
    store_->put("jobs/job-1/result.json", bytesOf("first version"));
    store_->put("jobs/job-1/result.json", bytesOf("second"));

    EXPECT_EQ(store_->get("jobs/job-1/result.json"), bytesOf("second"));

    // No temporary files left next to the object
    size_t entries = 0;
    for (const auto &entry : std::filesystem::directory_iterator(store_->root() / "jobs" / "job-1"))
    {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(ArtifactStoreTest, EmptyObjectIsStored)
{
    store_->put("uploads/empty.mp4", {});
    EXPECT_TRUE(store_->exists("uploads/empty.mp4"));
    EXPECT_EQ(store_->size("uploads/empty.mp4"), 0u);
}

TEST_F(ArtifactStoreTest, MissingObject)
{
    EXPECT_FALSE(store_->exists("uploads/missing.mp4"));
    EXPECT_THROW(store_->get("uploads/missing.mp4"), TransientIOError);
    EXPECT_THROW(store_->size("uploads/missing.mp4"), TransientIOError);
}

TEST_F(ArtifactStoreTest, RejectsKeysOutsideRoot)
{
    EXPECT_THROW(store_->put("", bytesOf("x")), ValidationError);
    EXPECT_THROW(store_->put("/etc/passwd", bytesOf("x")), ValidationError);
    EXPECT_THROW(store_->put("jobs/../../escape", bytesOf("x")), ValidationError);
    EXPECT_THROW(store_->get("../outside"), ValidationError);
    EXPECT_THROW(store_->presign("../outside"), ValidationError);
}

TEST_F(ArtifactStoreTest, RemovePrefixDeletesOnlyMatchingObjects)
{
    store_->put("jobs/job-1/poses.json", bytesOf("a"));
    store_->put("jobs/job-1/segments.json", bytesOf("b"));
    store_->put("jobs/job-10/poses.json", bytesOf("c"));
    store_->put("uploads/run.mp4", bytesOf("d"));

    EXPECT_EQ(store_->removePrefix("jobs/job-1/"), 2u);

    EXPECT_FALSE(store_->exists("jobs/job-1/poses.json"));
    EXPECT_FALSE(std::filesystem::exists(store_->root() / "jobs" / "job-1"));
    EXPECT_TRUE(store_->exists("jobs/job-10/poses.json"));
    EXPECT_TRUE(store_->exists("uploads/run.mp4"));
    EXPECT_EQ(store_->removePrefix("jobs/job-1/"), 0u);
}

TEST_F(ArtifactStoreTest, RemovePrefixMatchesPartialNames)
{
    store_->put("jobs/job-1/poses.json", bytesOf("a"));
    store_->put("jobs/job-10/poses.json", bytesOf("b"));
    store_->put("jobs/other/poses.json", bytesOf("c"));

    EXPECT_EQ(store_->removePrefix("jobs/job-1"), 2u);
    EXPECT_FALSE(store_->exists("jobs/job-10/poses.json"));
    EXPECT_TRUE(store_->exists("jobs/other/poses.json"));
    EXPECT_EQ(store_->removePrefix("missing/dir/"), 0u);
    EXPECT_THROW(store_->removePrefix(""), ValidationError);
}

TEST_F(ArtifactStoreTest, RemovePrefixIgnoresConcurrentCleanupOfOtherJobs)
{
    store_->put("jobs/seed.json", bytesOf("{}"));
    std::atomic<bool> stop{false};
    std::vector<std::thread> neighbours;
    for (int t = 0; t < 4; ++t)
    {
        neighbours.emplace_back([this, t, &stop]()
                                {
            for (int round = 0; !stop.load(); ++round)
            {
                const std::string prefix = "jobs/other-" + std::to_string(t) + "-" + std::to_string(round) + "/";
                store_->put(prefix + "animation.avi", bytesOf("frames"));
                store_->removePrefix(prefix);
            } });
    }

    int survivors = 0;
    for (int round = 0; round < 300; ++round)
    {
        store_->put("jobs/A/animation.avi", bytesOf("frames"));
        EXPECT_EQ(store_->removePrefix("jobs/A/"), 1u);
        if (store_->exists("jobs/A/animation.avi"))
            ++survivors;
    }

    stop.store(true);
    for (auto &thread : neighbours)
        thread.join();
    EXPECT_EQ(survivors, 0);
}

TEST_F(ArtifactStoreTest, PresignedUrlFormat)
{
    std::string url = store_->presignUntil("jobs/job-1/animation.avi", 1700000000);

    std::regex pattern(R"(https://cdn\.example\.com/media/jobs/job-1/animation\.avi\?expires=1700000000&signature=[0-9a-f]{64})");
    EXPECT_TRUE(std::regex_match(url, pattern)) << url;

    std::string signature = url.substr(url.find("signature=") + 10);
    EXPECT_EQ(signature, FileSystemArtifactStore::sign("s3cret", "jobs/job-1/animation.avi", 1700000000));
    EXPECT_TRUE(store_->verify("jobs/job-1/animation.avi", 1700000000, signature));
}

TEST_F(ArtifactStoreTest, SignatureBindsKeyExpiryAndSecret)
{
    const std::string base = FileSystemArtifactStore::sign("s3cret", "jobs/a/highlight.avi", 100);

    EXPECT_EQ(base, FileSystemArtifactStore::sign("s3cret", "jobs/a/highlight.avi", 100));
    EXPECT_NE(base, FileSystemArtifactStore::sign("s3cret", "jobs/a/highlight.avi", 101));
    EXPECT_NE(base, FileSystemArtifactStore::sign("s3cret", "jobs/b/highlight.avi", 100));
    EXPECT_NE(base, FileSystemArtifactStore::sign("other", "jobs/a/highlight.avi", 100));

    EXPECT_FALSE(store_->verify("jobs/a/highlight.avi", 101, base));
    EXPECT_FALSE(store_->verify("jobs/a/highlight.avi", 100, base.substr(1)));
}

TEST_F(ArtifactStoreTest, PresignExpiresInTheFuture)
{
    const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    std::string url = store_->presign("jobs/job-1/highlight.avi");

    size_t start = url.find("expires=") + 8;
    int64_t expires = std::stoll(url.substr(start, url.find('&') - start));
    EXPECT_GE(expires, now + 3600);
    EXPECT_LE(expires, now + 3602);
}
