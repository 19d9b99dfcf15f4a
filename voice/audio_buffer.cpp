#include "voice/audio_buffer.hpp"

namespace Voice {

bool AudioBuffer::append(const float* samples, size_t count) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (sealed_) return false;
    if (!samples || count == 0) return true;

    samples_.insert(samples_.end(), samples, samples + count);
    length_ += count;
    return true;
}

void AudioBuffer::seal() {
    std::lock_guard<std::mutex> lock(mtx_);
    sealed_ = true;
}

bool AudioBuffer::sealed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sealed_;
}

size_t AudioBuffer::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return length_;
}

size_t AudioBuffer::snapshotFrom(size_t from, std::vector<float>& out) const {
    std::lock_guard<std::mutex> lock(mtx_);
    out.clear();
    if (!released_ && from < samples_.size()) {
        out.assign(samples_.begin() + static_cast<std::ptrdiff_t>(from), samples_.end());
    }
    return length_;
}

std::vector<float> AudioBuffer::copyAll() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return samples_;
}

void AudioBuffer::release() {
    std::lock_guard<std::mutex> lock(mtx_);
    sealed_ = true;
    released_ = true;
    std::vector<float>().swap(samples_);
}

bool AudioBuffer::released() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return released_;
}

} // namespace Voice
