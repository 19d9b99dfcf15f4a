#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

namespace Voice {

    // Append-only sample store shared by the capture callback (producer)
    // and the commit loop (consumer). The logical length never decreases,
    // samples below a snapshot length are never modified, and release()
    // frees the storage without shrinking the logical length.
    class AudioBuffer {
    public:
        // Returns false once the buffer is sealed.
        bool append(const float* samples, size_t count);

        // Reject every later append.
        void seal();
        bool sealed() const;

        // Logical length (samples ever appended)
        size_t size() const;

        // Copy [from, size()) into out under the lock and return the
        // snapshot length. from > size() yields an empty copy.
        size_t snapshotFrom(size_t from, std::vector<float>& out) const;

        // Full copy of the retained samples (empty after release()).
        std::vector<float> copyAll() const;

        void release();
        bool released() const;

    private:
        mutable std::mutex mtx_;
        std::vector<float> samples_;
        size_t length_ = 0;
        bool sealed_ = false;
        bool released_ = false;
    };

} // namespace Voice
