#include <image/byte_stream.hpp>

#include <algorithm>
#include <cstring>

namespace pictor::image {

int64_t MemorySource::read(void* buffer, size_t length) {
    size_t count = std::min(length, data_.size() - offset_);
    if (count > 0) {
        std::memcpy(buffer, data_.data() + offset_, count);
        offset_ += count;
    }
    return static_cast<int64_t>(count);
}

int64_t BoundedSource::read(void* buffer, size_t length) {
    if (exceeded_) return -1;
    int64_t count = inner_.read(buffer, length);
    if (count > 0 && inner_.consumed() > limit_) {
        exceeded_ = true;
        return -1;
    }
    return count;
}

void StringSink::write(const void* data, size_t length) {
    buffer_.append(static_cast<const char*>(data), length);
}

}
