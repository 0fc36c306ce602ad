#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace anabox::storage {

class ArtifactStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable home for artifact bytes. Implementations return a URL the UI can
// load, and throw ArtifactStoreError when the bytes cannot be stored.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    virtual std::string Store(const std::string& bytes,
                              const std::string& mime,
                              const std::string& session_id,
                              const std::string& correlation_id) = 0;
};

// Writes <store_dir>/<session>/<sha256>.<ext>. Identical bytes share a file.
class FileArtifactStore : public ArtifactStore {
public:
    // An empty base_url makes Store() return file:// URLs.
    FileArtifactStore(std::filesystem::path store_dir, std::string base_url = "");

    std::string Store(const std::string& bytes,
                      const std::string& mime,
                      const std::string& session_id,
                      const std::string& correlation_id) override;

    const std::filesystem::path& StoreDir() const { return store_dir_; }

private:
    std::filesystem::path store_dir_;
    std::string base_url_;
};

// File extension for an image MIME type, "bin" when unknown.
std::string ExtensionForMime(const std::string& mime);

}  // namespace anabox::storage
