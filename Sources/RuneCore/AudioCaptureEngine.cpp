#include "AudioCaptureEngine.hpp"

#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace rune {

namespace {
constexpr const char* kTag = "capture";
constexpr std::size_t kReadReserveFrames = 16384;
} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioCaptureEngine::AudioCaptureEngine(std::unique_ptr<AudioInput> input,
                                       CaptureConfig config)
    : input_(std::move(input)), config_(config) {
    if (!input_) {
        throw RuneError(ErrorCode::invalid_argument, "AudioCaptureEngine needs an input");
    }
    config_.frame_size = std::max<std::size_t>(1, config_.frame_size);
}

AudioCaptureEngine::~AudioCaptureEngine() {
    stop();
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

StreamFormat AudioCaptureEngine::start(const std::optional<std::string>& device_id,
                                       FrameCallback frame_cb,
                                       LevelCallback level_cb,
                                       CaptureErrorCallback error_cb) {
    std::lock_guard<std::mutex> lock(mu_);

    if (running_.load()) {
        throw RuneError(ErrorCode::already_recording, "Audio capture is already running");
    }

    // A previous capture thread that ended on its own (device failure or
    // end of stream) still has to be reaped.
    if (capture_thread_.joinable()) {
        capture_thread_.join();
        std::lock_guard<std::mutex> dev_lock(device_mu_);
        input_->close();
    }

    const std::string device = resolve_device(device_id);
    StreamFormat fmt;
    {
        std::lock_guard<std::mutex> dev_lock(device_mu_);
        fmt = input_->open(device);
    }
    if (fmt.sample_rate <= 0 || fmt.channels <= 0) {
        std::lock_guard<std::mutex> dev_lock(device_mu_);
        input_->close();
        throw RuneError(ErrorCode::device_unavailable, "Audio device reported an invalid format");
    }

    format_   = fmt;
    frame_cb_ = std::move(frame_cb);
    level_cb_ = std::move(level_cb);
    error_cb_ = std::move(error_cb);

    const auto channels = static_cast<std::size_t>(fmt.channels);
    read_buf_.clear();
    read_buf_.reserve(std::max(kReadReserveFrames, input_->max_frames_per_read()) * channels);
    frame_buf_.clear();
    frame_buf_.reserve(config_.frame_size * channels);

    meter_.reset();
    current_level_.store(0.0f);

    running_.store(true);
    capture_thread_ = std::thread(&AudioCaptureEngine::capture_loop, this);

    log::info(kTag, "capture started on '" + (device.empty() ? std::string("default") : device)
                        + "' (" + std::to_string(fmt.sample_rate) + " Hz, "
                        + std::to_string(fmt.channels) + " ch)");
    return fmt;
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------

void AudioCaptureEngine::stop() {
    // Called from a callback on the capture thread: just ask the loop to
    // end; the thread is reaped by the next start() or stop().
    if (capture_thread_.joinable()
        && std::this_thread::get_id() == capture_thread_.get_id()) {
        running_.store(false);
        return;
    }

    std::lock_guard<std::mutex> lock(mu_);

    const bool was_running = running_.exchange(false);
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    } else if (!was_running) {
        return;
    }

    {
        std::lock_guard<std::mutex> dev_lock(device_mu_);
        input_->close();
    }

    frame_cb_ = nullptr;
    level_cb_ = nullptr;
    error_cb_ = nullptr;
    format_   = StreamFormat{};
    current_level_.store(0.0f);

    log::info(kTag, "capture stopped");
}

bool AudioCaptureEngine::is_capturing() const {
    return running_.load();
}

StreamFormat AudioCaptureEngine::format() const {
    std::lock_guard<std::mutex> lock(mu_);
    return format_;
}

// ---------------------------------------------------------------------------
// probe
// ---------------------------------------------------------------------------

void AudioCaptureEngine::probe(const std::optional<std::string>& device_id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_.load()) {
        throw RuneError(ErrorCode::already_recording, "Audio capture is already running");
    }
    const std::string device = resolve_device(device_id);
    std::lock_guard<std::mutex> dev_lock(device_mu_);
    input_->open(device);
    input_->close();
}

// ---------------------------------------------------------------------------
// Devices
// ---------------------------------------------------------------------------

std::vector<AudioDeviceDescriptor> AudioCaptureEngine::list_devices() {
    std::lock_guard<std::mutex> dev_lock(device_mu_);
    return input_->list_devices();
}

std::optional<AudioDeviceDescriptor> AudioCaptureEngine::system_default_device() {
    std::lock_guard<std::mutex> dev_lock(device_mu_);
    return input_->system_default_device();
}

void AudioCaptureEngine::set_default_device(std::optional<std::string> device_id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (device_id && device_id->empty()) device_id.reset();
    default_device_ = std::move(device_id);
}

std::optional<std::string> AudioCaptureEngine::default_device() const {
    std::lock_guard<std::mutex> lock(mu_);
    return default_device_;
}

std::string AudioCaptureEngine::resolve_device(const std::optional<std::string>& device_id) const {
    if (device_id && !device_id->empty()) return *device_id;
    if (default_device_) return *default_device_;
    return {};
}

// ---------------------------------------------------------------------------
// capture_loop  (runs on the capture thread)
// ---------------------------------------------------------------------------

void AudioCaptureEngine::capture_loop() {
    using Clock = std::chrono::steady_clock;

    const auto channels   = static_cast<std::size_t>(format_.channels);
    const std::size_t frame_samples = config_.frame_size * channels;
    auto last_level = Clock::now() - config_.level_interval;

    auto emit_frame = [&](std::size_t frames) {
        AudioFrame frame;
        frame.samples     = frame_buf_.data();
        frame.frame_count = frames;
        frame.channels    = format_.channels;
        frame.sample_rate = format_.sample_rate;
        frame.levels      = meter_.process(frame_buf_.data(), frames, format_.channels);
        current_level_.store(LevelMeter::compute_rms(frame_buf_.data(), frames * channels));

        if (frame_cb_) frame_cb_(frame);

        const auto now = Clock::now();
        if (level_cb_ && now - last_level >= config_.level_interval) {
            level_cb_(frame.levels);
            last_level = now;
        }
    };

    std::string failure;

    while (running_.load()) {
        std::size_t frames = 0;
        try {
            frames = input_->read(read_buf_);
        } catch (const std::exception& e) {
            failure = e.what();
            break;
        }
        if (frames == 0) {
            // Only stop() may end a capture; a stream that runs dry means
            // the device went away.
            if (running_.load()) failure = "Audio input ended unexpectedly";
            break;
        }

        const std::size_t samples = std::min(read_buf_.size(), frames * channels);
        std::size_t offset = 0;
        while (offset < samples) {
            const std::size_t take = std::min(samples - offset, frame_samples - frame_buf_.size());
            frame_buf_.insert(frame_buf_.end(),
                              read_buf_.begin() + static_cast<std::ptrdiff_t>(offset),
                              read_buf_.begin() + static_cast<std::ptrdiff_t>(offset + take));
            offset += take;
            if (frame_buf_.size() == frame_samples) {
                emit_frame(config_.frame_size);
                frame_buf_.clear();
            }
        }
    }

    // Hand over the trailing partial frame so finalize sees every sample.
    if (!frame_buf_.empty()) {
        emit_frame(frame_buf_.size() / channels);
        frame_buf_.clear();
    }

    running_.store(false);

    if (!failure.empty()) {
        log::error(kTag, "capture failed: " + failure);
        if (error_cb_) error_cb_(failure);
    }
}

} // namespace rune
