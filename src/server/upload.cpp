#include "upload.hpp"

#include "log.hpp"
#include "paths.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <optional>
#include <stdlib.h>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

std::string file_extension(const std::string& filename) {
    auto ext = fs::path(filename).extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// --- StreamUploadSource ---

StreamUploadSource::StreamUploadSource(std::istream& in, std::string filename)
    : in_(in), filename_(std::move(filename)) {}

bool StreamUploadSource::read(const BeginHandler& on_begin, const ChunkHandler& on_chunk) {
    if (!on_begin(filename_)) return false;

    char buf[chunk_size];
    while (in_) {
        in_.read(buf, sizeof(buf));
        auto n = static_cast<size_t>(in_.gcount());
        if (n > 0 && !on_chunk(buf, n)) return false;
    }
    return !in_.bad();
}

// --- TempArtifact ---

TempArtifact::TempArtifact(std::string path, uint64_t byte_size)
    : path_(std::move(path)), byte_size_(byte_size) {}

TempArtifact::~TempArtifact() {
    auto res = remove();
    if (!res) {
        logging::warn("upload: failed to remove {}: {}", path_, res.error());
    }
}

TempArtifact::TempArtifact(TempArtifact&& other) noexcept
    : path_(std::move(other.path_)), byte_size_(other.byte_size_), owned_(other.owned_) {
    other.owned_ = false;
}

TempArtifact& TempArtifact::operator=(TempArtifact&& other) noexcept {
    if (this != &other) {
        auto res = remove();
        if (!res) {
            logging::warn("upload: failed to remove {}: {}", path_, res.error());
        }
        path_ = std::move(other.path_);
        byte_size_ = other.byte_size_;
        owned_ = other.owned_;
        other.owned_ = false;
    }
    return *this;
}

std::expected<void, std::string> TempArtifact::remove() {
    if (!owned_) return {};
    owned_ = false;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) return std::unexpected(ec.message());
    return {};
}

// --- UploadIngestor ---

namespace {

// Open temp file being written. Unlinked on destruction unless released.
struct PartialFile {
    int fd = -1;
    std::string path;

    ~PartialFile() {
        if (fd >= 0) ::close(fd);
        if (!path.empty()) ::unlink(path.c_str());
    }

    bool write_all(const char* data, size_t len) {
        while (len > 0) {
            ssize_t n = ::write(fd, data, len);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }
};

std::string describe_limit(uint64_t max_bytes) {
    constexpr uint64_t mib = 1024 * 1024;
    if (max_bytes % mib == 0) return std::format("{}MB", max_bytes / mib);
    return std::format("{} bytes", max_bytes);
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

UploadIngestor::UploadIngestor(UploadLimits limits)
    : limits_(std::move(limits)) {
    if (limits_.temp_dir.empty()) limits_.temp_dir = platform::temp_dir();
}

std::expected<void, TranscribeError>
UploadIngestor::validate_filename(const std::string& filename) const {
    if (filename.empty()) {
        return std::unexpected(TranscribeError{
            .kind = ErrorKind::UnsupportedFormat,
            .detail = "File must have a filename",
        });
    }

    auto ext = file_extension(filename);
    if (std::ranges::find(limits_.allowed_formats, ext) == limits_.allowed_formats.end()) {
        return std::unexpected(TranscribeError{
            .kind = ErrorKind::UnsupportedFormat,
            .detail = std::format("Unsupported audio format: {}. Allowed formats: {}",
                                  ext.empty() ? "(none)" : ext, join(limits_.allowed_formats, ", ")),
        });
    }
    return {};
}

std::expected<TempArtifact, TranscribeError> UploadIngestor::ingest(UploadSource& source) const {
    PartialFile file;
    std::optional<TranscribeError> failure;
    bool began = false;
    uint64_t written = 0;

    auto storage_error = [](std::string what) {
        return TranscribeError{
            .kind = ErrorKind::StorageError,
            .detail = "Failed to save uploaded file: " + what,
        };
    };

    bool ok = source.read(
        [&](const std::string& filename) {
            began = true;
            if (auto valid = validate_filename(filename); !valid) {
                failure = valid.error();
                return false;
            }

            std::string suffix = "." + file_extension(filename);
            auto tmpl = (fs::path(limits_.temp_dir) / ("audio_XXXXXX" + suffix)).string();
            std::vector<char> buf(tmpl.begin(), tmpl.end());
            buf.push_back('\0');

            int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
            if (fd < 0) {
                failure = storage_error(std::format("create in {}: {}", limits_.temp_dir,
                                                    std::strerror(errno)));
                return false;
            }
            file.fd = fd;
            file.path.assign(buf.data());
            return true;
        },
        [&](const char* data, size_t len) {
            if (file.fd < 0) return false;

            if (written + len > limits_.max_bytes) {
                failure = TranscribeError{
                    .kind = ErrorKind::FileTooLarge,
                    .detail = "File too large. Maximum size: " + describe_limit(limits_.max_bytes),
                };
                return false;
            }
            if (!file.write_all(data, len)) {
                failure = storage_error(std::strerror(errno));
                return false;
            }
            written += len;
            return true;
        });

    if (!began) {
        return std::unexpected(TranscribeError{
            .kind = ErrorKind::MissingFile,
            .detail = "No file uploaded",
        });
    }
    if (failure) return std::unexpected(std::move(*failure));
    if (!ok) return std::unexpected(storage_error("upload stream interrupted"));

    int fd = file.fd;
    file.fd = -1;
    if (::close(fd) != 0) {
        return std::unexpected(storage_error(std::strerror(errno)));
    }

    TempArtifact artifact(std::move(file.path), written);
    file.path.clear();
    return artifact;
}
