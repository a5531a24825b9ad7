#include "liveprogress/byte_counter.hpp"

#include <stdexcept>
#include <utility>

namespace liveprogress {

void ByteCounterTag::open(std::int64_t content_length) {
    bool expected = false;
    if (opened_.compare_exchange_strong(expected, true)) {
        total_bytes_.store(content_length);
    }
}

void ByteCounterTag::record(std::int64_t count) {
    if (count > 0) {
        bytes_read_ += count;
    }

    std::shared_ptr<Listener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        (*listener)(count < 0 ? kEndOfStream : count);
    }
}

void ByteCounterTag::recordRead(std::int64_t content_length, std::int64_t count) {
    open(content_length);
    record(count);
}

void ByteCounterTag::attach(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::make_shared<Listener>(std::move(listener));
}

void ByteCounterTag::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_.reset();
}

bool ByteCounterTag::isAttached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(listener_);
}

CountingSource::CountingSource(std::unique_ptr<ByteSource> inner, ByteCounterTagPtr tag)
    : inner_(std::move(inner)), tag_(std::move(tag)) {
    if (!inner_ || !tag_) {
        throw std::invalid_argument("CountingSource needs a source and a tag");
    }
}

std::int64_t CountingSource::read(char* dst, std::size_t capacity) {
    const std::int64_t count = inner_->read(dst, capacity);
    tag_->recordRead(inner_->contentLength(), count);
    return count;
}

std::int64_t CountingSource::contentLength() const {
    return inner_->contentLength();
}

} // namespace liveprogress
