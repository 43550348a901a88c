// File: secure_memory.hpp
// Brief: Locked, wiped storage for the master seed
//
// The seed never leaves the offline machine. While it is held:
// - its pages are locked so they are not swapped to disk
// - it is cleansed before the memory is released
// - it cannot be copied, only moved

#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <openssl/crypto.h>
#include <sys/mman.h>

namespace coldspend {

class SecureBytes {
private:
    uint8_t* data_;
    size_t size_;
    bool locked_ = true;

    void release() {
        if (data_) {
            OPENSSL_cleanse(data_, size_);
            if (locked_) {
                munlock(data_, size_);
            }
            delete[] data_;
            data_ = nullptr;
            size_ = 0;
        }
    }

public:
    SecureBytes(std::span<const uint8_t> input) : data_(new uint8_t[input.size()]), size_(input.size()) {
        std::memcpy(data_, input.data(), size_);

        // Locking is best effort: without RLIMIT_MEMLOCK headroom the data is still wiped on release
        if (mlock(data_, size_) != 0) {
            locked_ = false;
        }
    }

    ~SecureBytes() { release(); }

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept : data_(other.data_), size_(other.size_), locked_(other.locked_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }

    SecureBytes& operator=(SecureBytes&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            locked_ = other.locked_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    std::span<const uint8_t> view() const { return {data_, size_}; }
    size_t size() const { return size_; }
    bool is_locked() const { return locked_; }
    bool empty() const { return size_ == 0 || data_ == nullptr; }
};

} // namespace coldspend
