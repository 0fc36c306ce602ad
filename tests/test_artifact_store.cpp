#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "storage/artifact_store.hpp"
#include "utils/common.hpp"
#include "utils/encoding.hpp"

namespace anabox::storage {
namespace {

namespace fs = std::filesystem;

class ArtifactStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("anabox-store-" + std::to_string(utils::NowMs()));
        fs::remove_all(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    static std::string ReadFile(const fs::path& path) {
        std::ifstream input(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    }

    fs::path dir_;
};

TEST_F(ArtifactStoreTest, WritesContentAddressedFile) {
    FileArtifactStore store(dir_, "https://cdn.test/artifacts/");
    const std::string bytes("\x89PNG\0data", 9);
    const auto url = store.Store(bytes, "image/png", "s1", "c1");
    const auto name = utils::Sha256Hex(bytes) + ".png";
    EXPECT_EQ(url, "https://cdn.test/artifacts/s1/" + name);
    EXPECT_EQ(ReadFile(dir_ / "s1" / name), bytes);
    EXPECT_EQ(std::distance(fs::directory_iterator(dir_ / "s1"), fs::directory_iterator()), 1);
}

TEST_F(ArtifactStoreTest, IdenticalBytesShareOneFile) {
    FileArtifactStore store(dir_, "http://x");
    const auto first = store.Store("same", "image/gif", "s1", "a");
    const auto second = store.Store("same", "image/gif", "s1", "b");
    EXPECT_EQ(first, second);
    EXPECT_EQ(std::distance(fs::directory_iterator(dir_ / "s1"), fs::directory_iterator()), 1);
}

TEST_F(ArtifactStoreTest, ConcurrentStoresOfSameBytesAllSucceed) {
    FileArtifactStore store(dir_, "http://x");
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, &failures, t] {
            for (int i = 0; i < 20; ++i) {
                try {
                    store.Store("shared chart bytes", "image/png", "s1", "t" + std::to_string(t));
                } catch (const ArtifactStoreError&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(std::distance(fs::directory_iterator(dir_ / "s1"), fs::directory_iterator()), 1);
}

TEST_F(ArtifactStoreTest, FileUrlWithoutBaseUrl) {
    FileArtifactStore store(dir_);
    const auto url = store.Store("jpeg", "image/jpeg", "s1", "c1");
    EXPECT_EQ(url.rfind("file://", 0), 0u);
    EXPECT_TRUE(fs::exists(url.substr(7)));
    EXPECT_EQ(fs::path(url.substr(7)).extension(), ".jpg");
}

TEST_F(ArtifactStoreTest, SessionIdIsSanitized) {
    FileArtifactStore store(dir_, "http://x");
    EXPECT_NE(store.Store("a", "image/png", "../evil", "c").find("/.._evil/"), std::string::npos);
    EXPECT_NE(store.Store("b", "image/png", "", "c").find("/default/"), std::string::npos);
    EXPECT_NE(store.Store("c", "image/png", "..", "c").find("/default/"), std::string::npos);
    EXPECT_TRUE(fs::exists(dir_ / ".._evil"));
    EXPECT_FALSE(fs::exists(dir_.parent_path() / "evil"));
}

TEST_F(ArtifactStoreTest, EmptyBytesAreRefused) {
    FileArtifactStore store(dir_);
    EXPECT_THROW(store.Store("", "image/png", "s1", "c1"), ArtifactStoreError);
}

TEST_F(ArtifactStoreTest, ExtensionsForMime) {
    EXPECT_EQ(ExtensionForMime("image/PNG"), "png");
    EXPECT_EQ(ExtensionForMime("image/jpg"), "jpg");
    EXPECT_EQ(ExtensionForMime("image/webp"), "webp");
    EXPECT_EQ(ExtensionForMime("image/svg+xml"), "svg");
    EXPECT_EQ(ExtensionForMime("application/pdf"), "bin");
}

}  // namespace
}  // namespace anabox::storage
