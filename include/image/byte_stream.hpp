#ifndef PICTOR_BYTE_STREAM_HPP
#define PICTOR_BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pictor::image {

/**
 * @brief Pull-style input handed to the codec.
 *
 * read() returns the number of bytes copied, 0 at end of input and -1 on error.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual int64_t read(void* buffer, size_t length) = 0;
    virtual size_t consumed() const = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(const void* data, size_t length) = 0;
    virtual size_t written() const = 0;
};

// Reads from a buffer owned by the caller
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string_view data) : data_(data) {}

    int64_t read(void* buffer, size_t length) override;
    size_t consumed() const override { return offset_; }

private:
    std::string_view data_;
    size_t offset_ = 0;
};

/**
 * @brief Fails reads once more than `limit` bytes have come through.
 */
class BoundedSource : public ByteSource {
public:
    BoundedSource(ByteSource& inner, size_t limit) : inner_(inner), limit_(limit) {}

    int64_t read(void* buffer, size_t length) override;
    size_t consumed() const override { return inner_.consumed(); }
    bool exceeded() const { return exceeded_; }

private:
    ByteSource& inner_;
    size_t limit_;
    bool exceeded_ = false;
};

class StringSink : public ByteSink {
public:
    void write(const void* data, size_t length) override;
    size_t written() const override { return buffer_.size(); }
    std::string release() { return std::move(buffer_); }

private:
    std::string buffer_;
};

}

#endif // PICTOR_BYTE_STREAM_HPP
