#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <istream>
#include <string>
#include <vector>

// A file arriving from a client. The source drives: it reports the declared
// filename once, then pushes the content in chunks. Either handler returning
// false stops the transfer.
class UploadSource {
public:
    using BeginHandler = std::function<bool(const std::string& filename)>;
    using ChunkHandler = std::function<bool(const char* data, size_t len)>;

    virtual ~UploadSource() = default;

    // Returns false if the transfer was stopped by a handler or failed.
    // Returns true without calling on_begin if there was no file.
    virtual bool read(const BeginHandler& on_begin, const ChunkHandler& on_chunk) = 0;
};

// Reads a std::istream in fixed 8 KiB chunks.
class StreamUploadSource : public UploadSource {
public:
    static constexpr size_t chunk_size = 8192;

    StreamUploadSource(std::istream& in, std::string filename);

    bool read(const BeginHandler& on_begin, const ChunkHandler& on_chunk) override;

private:
    std::istream& in_;
    std::string filename_;
};

// A file in transient storage, owned by one request. Removed on destruction
// unless remove() already ran.
class TempArtifact {
public:
    TempArtifact(std::string path, uint64_t byte_size);
    ~TempArtifact();

    TempArtifact(TempArtifact&& other) noexcept;
    TempArtifact& operator=(TempArtifact&& other) noexcept;
    TempArtifact(const TempArtifact&) = delete;
    TempArtifact& operator=(const TempArtifact&) = delete;

    const std::string& path() const { return path_; }
    uint64_t byte_size() const { return byte_size_; }

    // Deletes the file. Safe to call more than once.
    std::expected<void, std::string> remove();

private:
    std::string path_;
    uint64_t byte_size_ = 0;
    bool owned_ = true;
};

struct UploadLimits {
    uint64_t max_bytes = 0;
    std::vector<std::string> allowed_formats; // lowercase, no dot
    std::string temp_dir;
};

class UploadIngestor {
public:
    explicit UploadIngestor(UploadLimits limits);

    // Checks that a filename is present and carries an allowed extension.
    std::expected<void, TranscribeError> validate_filename(const std::string& filename) const;

    // Streams the source to a new temp file, enforcing the size limit at
    // every chunk. On failure nothing is left on disk.
    std::expected<TempArtifact, TranscribeError> ingest(UploadSource& source) const;

    const UploadLimits& limits() const { return limits_; }

private:
    UploadLimits limits_;
};

// Lowercased extension without the dot ("Song.MP3" -> "mp3"), or "".
std::string file_extension(const std::string& filename);
