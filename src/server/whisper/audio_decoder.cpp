#include "audio_decoder.hpp"

#include "../log.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <samplerate.h>
#include <sndfile.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

namespace audio {

namespace {

// Second temp file produced by an ffmpeg conversion, removed with the scope.
struct ConvertedFile {
    std::string path;
    ~ConvertedFile() {
        if (!path.empty()) ::unlink(path.c_str());
    }
};

} // namespace

std::expected<std::vector<float>, std::string> read_with_sndfile(const std::string& path) {
    SF_INFO info{};
    SNDFILE* sf = sf_open(path.c_str(), SFM_READ, &info);
    if (!sf) {
        return std::unexpected(std::string("cannot open audio: ") + sf_strerror(nullptr));
    }

    const sf_count_t frames = info.frames;
    const int channels = info.channels;
    if (frames <= 0 || channels <= 0) {
        sf_close(sf);
        return std::vector<float>{};
    }

    std::vector<float> interleaved(static_cast<size_t>(frames) * channels);
    sf_count_t read = sf_readf_float(sf, interleaved.data(), frames);
    sf_close(sf);

    if (read <= 0) {
        return std::unexpected(std::string("no audio frames could be read"));
    }

    std::vector<float> mono(static_cast<size_t>(read));
    if (channels == 1) {
        std::copy_n(interleaved.begin(), mono.size(), mono.begin());
    } else {
        for (sf_count_t i = 0; i < read; ++i) {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) {
                sum += interleaved[static_cast<size_t>(i) * channels + c];
            }
            mono[static_cast<size_t>(i)] = sum / channels;
        }
    }

    if (info.samplerate == target_sample_rate) return mono;

    double ratio = static_cast<double>(target_sample_rate) / info.samplerate;
    std::vector<float> resampled(static_cast<size_t>(std::ceil(mono.size() * ratio)) + 1);

    SRC_DATA src{};
    src.data_in = mono.data();
    src.input_frames = static_cast<long>(mono.size());
    src.data_out = resampled.data();
    src.output_frames = static_cast<long>(resampled.size());
    src.src_ratio = ratio;

    int err = src_simple(&src, SRC_SINC_MEDIUM_QUALITY, 1);
    if (err != 0) {
        return std::unexpected(std::string("resampling failed: ") + src_strerror(err));
    }

    resampled.resize(static_cast<size_t>(src.output_frames_gen));
    return resampled;
}

std::expected<void, std::string> convert_with_ffmpeg(const std::string& in, const std::string& out) {
    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execlp("ffmpeg", "ffmpeg", "-nostdin", "-loglevel", "error", "-y",
                 "-i", in.c_str(), "-ar", "16000", "-ac", "1", "-c:a", "pcm_s16le",
                 out.c_str(), nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (!WIFEXITED(status)) {
        return std::unexpected(std::string("ffmpeg terminated abnormally"));
    }
    if (WEXITSTATUS(status) == 127) {
        return std::unexpected(std::string("ffmpeg not found"));
    }
    if (WEXITSTATUS(status) != 0) {
        return std::unexpected("ffmpeg failed with code " + std::to_string(WEXITSTATUS(status)));
    }
    return {};
}

std::expected<std::vector<float>, std::string>
load_pcm_mono_16k(const std::string& path, bool ffmpeg_fallback) {
    auto pcm = read_with_sndfile(path);
    if (pcm || !ffmpeg_fallback) return pcm;

    logging::debug("audio: {} ({}), converting with ffmpeg", pcm.error(), path);

    std::string tmpl = path + ".XXXXXX.wav";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = ::mkstemps(buf.data(), 4);
    if (fd < 0) {
        return std::unexpected(std::string("cannot create conversion file: ") + std::strerror(errno));
    }
    ::close(fd);

    ConvertedFile converted{buf.data()};
    if (auto res = convert_with_ffmpeg(path, converted.path); !res) {
        return std::unexpected(pcm.error() + "; " + res.error());
    }
    return read_with_sndfile(converted.path);
}

} // namespace audio
