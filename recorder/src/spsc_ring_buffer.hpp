/*
Bounded lock-free ring buffer for exactly one producer thread and one consumer
thread. Used to hand frames from the GStreamer streaming thread and key
transitions from the keyboard reader thread to the capture tasks without
blocking the delivering thread.

Back-pressure: push() returns false when the buffer is full and the item is
not stored. The caller decides whether to log or count the drop.
*/

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>

template<typename T>
class SPSCRingBuffer {
    public:
        explicit SPSCRingBuffer(size_t capacity)
            : buffer_(nullptr), capacity_(capacity) {
                if (capacity == 0) {
                    throw std::invalid_argument("SPSCRingBuffer capacity must be positive");
                }
                // One spare slot distinguishes full from empty.
                buffer_ = std::make_unique<T[]>(capacity + 1);
              }

        SPSCRingBuffer(const SPSCRingBuffer&) = delete;
        SPSCRingBuffer& operator=(const SPSCRingBuffer&) = delete;

        // Producer operation - returns false if buffer is full.
        bool push(const T& item) { return emplace_(T(item)); }
        bool push(T&& item) { return emplace_(std::move(item)); }

        // Consumer operation - returns false if buffer is empty.
        bool pop(T& item);

        size_t size() const;

        size_t capacity() const;

        bool is_empty() const;

        bool is_full() const;

    private:
        std::unique_ptr<T[]> buffer_;
        const size_t capacity_;
        alignas(64) std::atomic<size_t> write_index_{0};
        alignas(64) std::atomic<size_t> read_index_{0};

        size_t next_(size_t index) const { return (index + 1) % (capacity_ + 1); }
        bool emplace_(T&& item);
};

template<typename T>
bool SPSCRingBuffer<T>::emplace_(T&& item) {
    const size_t current_write = write_index_.load(std::memory_order_relaxed);
    const size_t next_write = next_(current_write);

    // Check if buffer is full by reading consumer's index
    if (next_write == read_index_.load(std::memory_order_acquire)) {
        return false;
    }

    buffer_[current_write] = std::move(item);

    // make the item available to consumer (release ensures data write completes first)
    write_index_.store(next_write, std::memory_order_release);
    return true;
}

template<typename T>
bool SPSCRingBuffer<T>::pop(T& item) {
    const size_t current_read = read_index_.load(std::memory_order_relaxed);

    // Check if buffer is empty by reading producer's index
    if (write_index_.load(std::memory_order_acquire) == current_read) {
        return false;
    }

    item = std::move(buffer_[current_read]);

    // hand the slot back to the producer
    read_index_.store(next_(current_read), std::memory_order_release);
    return true;
}

template<typename T>
size_t SPSCRingBuffer<T>::size() const {
    const size_t write_idx = write_index_.load(std::memory_order_acquire);
    const size_t read_idx = read_index_.load(std::memory_order_acquire);
    return (write_idx >= read_idx) ? (write_idx - read_idx) : (capacity_ + 1 + write_idx - read_idx);
}

template<typename T>
size_t SPSCRingBuffer<T>::capacity() const {
    return capacity_;
}

template<typename T>
bool SPSCRingBuffer<T>::is_empty() const {
    return (
        read_index_.load(std::memory_order_acquire) ==
        write_index_.load(std::memory_order_acquire)
    );
}

template<typename T>
bool SPSCRingBuffer<T>::is_full() const {
    const size_t current_write = write_index_.load(std::memory_order_acquire);
    return next_(current_write) == read_index_.load(std::memory_order_acquire);
}
