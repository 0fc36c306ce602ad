#include "storage/artifact_store.hpp"

#include <atomic>
#include <cctype>
#include <fstream>
#include <system_error>

#include <unistd.h>

#include "utils/common.hpp"
#include "utils/encoding.hpp"
#include "utils/logging.hpp"

namespace anabox::storage {
namespace {

namespace fs = std::filesystem;

// Session ids come from callers; keep them to one safe path component.
std::string SanitizeComponent(const std::string& value) {
    std::string cleaned;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            cleaned.push_back(static_cast<char>(c));
        } else {
            cleaned.push_back('_');
        }
    }
    if (cleaned.empty() || cleaned == "." || cleaned == "..") {
        return "default";
    }
    return cleaned;
}

}  // namespace

std::string ExtensionForMime(const std::string& mime) {
    const auto lowered = utils::ToLower(mime);
    if (lowered == "image/png") {
        return "png";
    }
    if (lowered == "image/jpeg" || lowered == "image/jpg") {
        return "jpg";
    }
    if (lowered == "image/gif") {
        return "gif";
    }
    if (lowered == "image/webp") {
        return "webp";
    }
    if (lowered == "image/svg+xml") {
        return "svg";
    }
    return "bin";
}

FileArtifactStore::FileArtifactStore(fs::path store_dir, std::string base_url)
    : store_dir_(std::move(store_dir)), base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string FileArtifactStore::Store(const std::string& bytes,
                                     const std::string& mime,
                                     const std::string& session_id,
                                     const std::string& correlation_id) {
    if (bytes.empty()) {
        throw ArtifactStoreError("refusing to store an empty artifact");
    }
    const auto session = SanitizeComponent(session_id);
    const auto dir = store_dir_ / session;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ArtifactStoreError("cannot create " + dir.string() + ": " + ec.message());
    }

    const auto file_name = utils::Sha256Hex(bytes) + "." + ExtensionForMime(mime);
    const auto path = dir / file_name;
    if (!fs::exists(path, ec)) {
        // Concurrent stores of the same bytes each write their own temp file.
        static std::atomic<unsigned long> temp_counter{0};
        const auto temp = dir / (file_name + "." + std::to_string(::getpid()) + "-" +
                                 std::to_string(++temp_counter) + ".tmp");
        {
            std::ofstream output(temp, std::ios::binary | std::ios::trunc);
            if (!output.is_open()) {
                throw ArtifactStoreError("cannot write " + temp.string());
            }
            output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!output) {
                throw ArtifactStoreError("short write to " + temp.string());
            }
        }
        fs::rename(temp, path, ec);
        if (ec) {
            const auto message = ec.message();
            fs::remove(temp, ec);
            // Another store of the same content won the race.
            if (!fs::exists(path, ec)) {
                throw ArtifactStoreError("cannot move artifact into place: " + path.string() + ": " + message);
            }
        }
    }
    utils::LogDebug("storage", correlation_id + ": stored " + std::to_string(bytes.size()) +
                                   " bytes as " + path.string());

    if (base_url_.empty()) {
        return "file://" + fs::absolute(path, ec).string();
    }
    return base_url_ + "/" + session + "/" + file_name;
}

}  // namespace anabox::storage
