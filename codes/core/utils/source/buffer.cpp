#include "utils/buffer.hpp"
#include <cstring>
#include <algorithm>
#include <new>

namespace rpc_snoop {
namespace utils {

constexpr size_t Buffer::npos;
constexpr size_t Buffer::DEFAULT_INITIAL_CAPACITY;
constexpr size_t Buffer::MIN_CAPACITY;
constexpr size_t Buffer::MAX_CAPACITY;
constexpr size_t Buffer::GROWTH_THRESHOLD_DOUBLE;
constexpr size_t Buffer::GROWTH_THRESHOLD_15X;
constexpr size_t Buffer::GROWTH_LINEAR_INCREMENT;

Buffer::Buffer(size_t initial_capacity)
    : read_idx_(0), write_idx_(0)
{
    size_t cap = std::max(initial_capacity, MIN_CAPACITY);
    cap = std::min(cap, MAX_CAPACITY);
    data_.resize(cap);
}

Buffer::~Buffer() = default;

Buffer::Buffer(Buffer&& other) noexcept
    : data_(std::move(other.data_))
    , read_idx_(other.read_idx_)
    , write_idx_(other.write_idx_)
{
    other.read_idx_ = 0;
    other.write_idx_ = 0;
}

Buffer& Buffer::operator=(Buffer&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        read_idx_ = other.read_idx_;
        write_idx_ = other.write_idx_;
        other.read_idx_ = 0;
        other.write_idx_ = 0;
    }
    return *this;
}

size_t Buffer::write(const uint8_t* data, size_t len) {
    if (len == 0 || data == nullptr) {
        return 0;
    }
    if (!ensure_writable(len)) {
        return 0;
    }
    std::memcpy(write_ptr(), data, len);
    commit(len);
    return len;
}

size_t Buffer::write(const char* data, size_t len) {
    return write(reinterpret_cast<const uint8_t*>(data), len);
}

uint8_t* Buffer::reserve(size_t len) {
    if (!ensure_writable(len)) {
        return nullptr;
    }
    return write_ptr();
}

void Buffer::commit(size_t len) {
    // 只提交不超过当前可写空间的数据量
    write_idx_ += std::min(len, writable_bytes());
}

size_t Buffer::read_to_string(std::string* out, size_t len) {
    if (out == nullptr) {
        return 0;
    }
    size_t to_read = (len == 0) ? readable_bytes() : std::min(len, readable_bytes());
    out->assign(reinterpret_cast<const char*>(read_ptr()), to_read);
    skip(to_read);
    return to_read;
}

size_t Buffer::find_crlf() const {
    const uint8_t* data = read_ptr();
    size_t readable = readable_bytes();
    for (size_t pos = 0; pos + 1 < readable; ++pos) {
        if (data[pos] == '\r' && data[pos + 1] == '\n') {
            return pos;
        }
    }
    return npos;
}

const uint8_t* Buffer::read_ptr() const {
    return data_.data() + read_idx_;
}

uint8_t* Buffer::write_ptr() {
    return data_.data() + write_idx_;
}

void Buffer::skip(size_t len) {
    read_idx_ += std::min(len, readable_bytes());
    if (read_idx_ == write_idx_) {
        read_idx_ = 0;
        write_idx_ = 0;
    }
}

size_t Buffer::readable_bytes() const {
    return write_idx_ - read_idx_;
}

size_t Buffer::writable_bytes() const {
    return data_.size() - write_idx_;
}

size_t Buffer::capacity() const {
    return data_.size();
}

bool Buffer::ensure_writable(size_t len) {
    if (writable_bytes() >= len) {
        return true;
    }
    // 先尝试压缩
    if (read_idx_ > 0) {
        compact();
        if (writable_bytes() >= len) {
            return true;
        }
    }
    size_t required = write_idx_ + len;
    if (required > MAX_CAPACITY) {
        return false;
    }
    return resize(calculate_growth(required));
}

void Buffer::clear() {
    read_idx_ = 0;
    write_idx_ = 0;
}

void Buffer::compact() {
    if (read_idx_ == 0) {
        return;
    }
    size_t data_len = write_idx_ - read_idx_;
    if (data_len > 0) {
        std::memmove(data_.data(), data_.data() + read_idx_, data_len);
    }
    read_idx_ = 0;
    write_idx_ = data_len;
}

size_t Buffer::calculate_growth(size_t required) const {
    size_t current = data_.size();
    size_t new_capacity = current;

    if (current < GROWTH_THRESHOLD_DOUBLE) {
        // 小于64KB：翻倍
        new_capacity = current * 2;
    } else if (current < GROWTH_THRESHOLD_15X) {
        // 64KB ~ 1MB：1.5倍
        new_capacity = current + (current / 2);
    } else {
        // 大于1MB：线性增长
        new_capacity = current + GROWTH_LINEAR_INCREMENT;
    }

    new_capacity = std::max(new_capacity, required);
    new_capacity = std::min(new_capacity, MAX_CAPACITY);

    return new_capacity;
}

bool Buffer::resize(size_t new_capacity) {
    if (new_capacity > MAX_CAPACITY) {
        return false;
    }
    try {
        data_.resize(new_capacity);
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

} // namespace utils
} // namespace rpc_snoop
