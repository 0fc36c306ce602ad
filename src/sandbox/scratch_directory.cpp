#include "sandbox/scratch_directory.hpp"

#include <cctype>
#include <random>
#include <sstream>
#include <system_error>

#include "utils/logging.hpp"

namespace anabox::sandbox {
namespace {

std::string SanitizeComponent(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
        if (out.size() >= 48) {
            break;
        }
    }
    return out.empty() ? std::string("run") : out;
}

std::string RandomSuffix() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << engine();
    return oss.str();
}

}  // namespace

ScratchDirectory::ScratchDirectory(std::filesystem::path root)
    : root_(std::move(root)) {}

ScratchDirectory::~ScratchDirectory() {
    Remove();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : root_(std::move(other.root_)) {
    other.root_.clear();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        Remove();
        root_ = std::move(other.root_);
        other.root_.clear();
    }
    return *this;
}

ScratchDirectory ScratchDirectory::Create(const std::filesystem::path& root, const std::string& prefix) {
    std::filesystem::create_directories(root);
    const auto base = "anabox-" + SanitizeComponent(prefix) + "-";
    for (int attempt = 0; attempt < 16; ++attempt) {
        const auto candidate = root / (base + RandomSuffix());
        if (!std::filesystem::create_directory(candidate)) {
            continue;
        }
        ScratchDirectory scratch(candidate);
        std::filesystem::permissions(candidate, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);
        std::filesystem::create_directory(scratch.WorkDir());
        return scratch;
    }
    throw std::filesystem::filesystem_error(
        "cannot allocate a unique scratch directory", root,
        std::make_error_code(std::errc::file_exists));
}

void ScratchDirectory::Remove() noexcept {
    if (root_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        utils::LogWarn("sandbox", "failed to remove scratch directory " + root_.string() + ": " + ec.message());
    }
    root_.clear();
}

}  // namespace anabox::sandbox
