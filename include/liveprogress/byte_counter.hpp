#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace liveprogress {

inline constexpr std::int64_t kEndOfStream = -1;

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Number of bytes copied into dst, or kEndOfStream.
    virtual std::int64_t read(char* dst, std::size_t capacity) = 0;

    // Declared length of the stream, <= 0 when unknown.
    [[nodiscard]] virtual std::int64_t contentLength() const = 0;
};

// Per-attempt byte counters. Reads are reported to the attached listener as
// deltas, and the end of the stream as kEndOfStream.
class ByteCounterTag {
public:
    using Listener = std::function<void(std::int64_t delta)>;

    // Records the declared length. Only the first call has an effect.
    void open(std::int64_t content_length);
    void record(std::int64_t count);
    // open() then record(): what every reader does after a read.
    void recordRead(std::int64_t content_length, std::int64_t count);

    [[nodiscard]] bool isOpen() const { return opened_.load(); }
    [[nodiscard]] std::int64_t totalBytes() const { return total_bytes_.load(); }
    [[nodiscard]] std::int64_t bytesRead() const { return bytes_read_.load(); }

    void attach(Listener listener);
    void detach();
    [[nodiscard]] bool isAttached() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<Listener> listener_;
    std::atomic<bool> opened_{false};
    std::atomic<std::int64_t> total_bytes_{0};
    std::atomic<std::int64_t> bytes_read_{0};
};

using ByteCounterTagPtr = std::shared_ptr<ByteCounterTag>;

// Passes reads through unchanged while reporting their sizes to a tag.
// Push transports such as CurlCall have no reader to wrap and call
// ByteCounterTag::recordRead from their write callback instead.
class CountingSource final : public ByteSource {
public:
    CountingSource(std::unique_ptr<ByteSource> inner, ByteCounterTagPtr tag);

    std::int64_t read(char* dst, std::size_t capacity) override;
    [[nodiscard]] std::int64_t contentLength() const override;

    [[nodiscard]] const ByteCounterTagPtr& tag() const { return tag_; }

private:
    std::unique_ptr<ByteSource> inner_;
    ByteCounterTagPtr tag_;
};

} // namespace liveprogress
