#pragma once

#include <filesystem>
#include <string>

namespace anabox::sandbox {

// Execution-exclusive temporary tree: <root>/<prefix>-<random>/{work/}.
// Removed recursively when the owner goes away.
class ScratchDirectory {
public:
    ScratchDirectory() = default;
    ~ScratchDirectory();

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    // Throws std::filesystem::filesystem_error.
    static ScratchDirectory Create(const std::filesystem::path& root, const std::string& prefix);

    bool Empty() const { return root_.empty(); }
    const std::filesystem::path& Root() const { return root_; }
    std::filesystem::path WorkDir() const { return root_ / "work"; }

private:
    explicit ScratchDirectory(std::filesystem::path root);
    void Remove() noexcept;

    std::filesystem::path root_;
};

}  // namespace anabox::sandbox
