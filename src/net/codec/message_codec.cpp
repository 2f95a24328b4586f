/// @file message_codec.cpp
/// @brief MessageCodec and FrameAssembler implementation (LZ4 block format).

#include "cgc/net/message_codec.hpp"

#include "cgc/foundation/client_logger.hpp"
#include "cgc/net/connection_config.hpp"

#include <lz4.h>

#include <cstring>
#include <limits>
#include <string>

namespace cgc::net {

using foundation::ClientResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::makeError;

namespace {

void putU32(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v & 0xFF);
    out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    out[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

void putU64(uint8_t* out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

uint32_t getU32(const uint8_t* in) {
    return static_cast<uint32_t>(in[0]) |
           (static_cast<uint32_t>(in[1]) << 8) |
           (static_cast<uint32_t>(in[2]) << 16) |
           (static_cast<uint32_t>(in[3]) << 24);
}

uint64_t getU64(const uint8_t* in) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return v;
}

} // namespace

CodecOptions CodecOptions::fromConfig(const ConnectionConfig& config) {
    CodecOptions options;
    options.compressionThreshold = config.compressionThreshold;
    options.enableCompression = config.enableCompression;
    options.maxFrameSize = config.maxFrameSize;
    return options;
}

MessageCodec::MessageCodec(CodecOptions options) : options_(options) {}

// ---------------------------------------------------------------------------
// Message body
// ---------------------------------------------------------------------------

std::vector<uint8_t> MessageCodec::serialize(const Message& message) {
    std::vector<uint8_t> out(kMessageHeaderSize + message.payload.size());
    out[0] = static_cast<uint8_t>(message.type);
    putU32(out.data() + 1, message.sequenceNumber);
    putU64(out.data() + 5, message.timestampMs);
    if (!message.payload.empty()) {
        std::memcpy(out.data() + kMessageHeaderSize, message.payload.data(),
                    message.payload.size());
    }
    return out;
}

ClientResult<Message> MessageCodec::deserialize(std::span<const uint8_t> bytes) {
    if (bytes.size() < kMessageHeaderSize) {
        return makeError<Message>(ErrorCode::MalformedFrame,
                                  "message shorter than header: " + std::to_string(bytes.size()));
    }
    Message message;
    message.type = static_cast<MessageType>(bytes[0]);
    message.sequenceNumber = getU32(bytes.data() + 1);
    message.timestampMs = getU64(bytes.data() + 5);
    message.payload.assign(bytes.begin() + kMessageHeaderSize, bytes.end());
    return ClientResult<Message>::ok(std::move(message));
}

// ---------------------------------------------------------------------------
// Compression
// ---------------------------------------------------------------------------

bool MessageCodec::isCompressed(std::span<const uint8_t> body) noexcept {
    return body.size() >= 2 && body[0] == kCompressionMagic0 && body[1] == kCompressionMagic1;
}

ClientResult<std::vector<uint8_t>> MessageCodec::encodePayload(
    std::span<const uint8_t> raw) const {
    const bool overThreshold =
        options_.enableCompression && raw.size() > options_.compressionThreshold;
    if (!overThreshold && !isCompressed(raw)) {
        return ClientResult<std::vector<uint8_t>>::ok(
            std::vector<uint8_t>(raw.begin(), raw.end()));
    }

    if (raw.size() > static_cast<std::size_t>(LZ4_MAX_INPUT_SIZE)) {
        return makeError<std::vector<uint8_t>>(ErrorCode::CompressionFailed,
                                               "input too large for LZ4");
    }

    const int srcSize = static_cast<int>(raw.size());
    const int bound = LZ4_compressBound(srcSize);
    std::vector<uint8_t> out(kCompressedHeaderSize + static_cast<std::size_t>(bound));
    out[0] = kCompressionMagic0;
    out[1] = kCompressionMagic1;
    putU32(out.data() + 2, static_cast<uint32_t>(raw.size()));

    const int written = LZ4_compress_default(
        reinterpret_cast<const char*>(raw.data()),
        reinterpret_cast<char*>(out.data() + kCompressedHeaderSize),
        srcSize, bound);
    if (written <= 0) {
        return makeError<std::vector<uint8_t>>(ErrorCode::CompressionFailed,
                                               "LZ4 compression failed");
    }
    out.resize(kCompressedHeaderSize + static_cast<std::size_t>(written));
    return ClientResult<std::vector<uint8_t>>::ok(std::move(out));
}

ClientResult<std::vector<uint8_t>> MessageCodec::decodePayload(
    std::span<const uint8_t> body) const {
    if (!isCompressed(body)) {
        return ClientResult<std::vector<uint8_t>>::ok(
            std::vector<uint8_t>(body.begin(), body.end()));
    }
    if (body.size() < kCompressedHeaderSize) {
        return makeError<std::vector<uint8_t>>(ErrorCode::MalformedFrame,
                                               "truncated compression header");
    }

    const uint32_t rawLength = getU32(body.data() + 2);
    if (rawLength > options_.maxDecompressedSize ||
        rawLength > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::FrameTooLarge,
            "declared decompressed size " + std::to_string(rawLength) + " exceeds limit");
    }

    const auto compressed = body.subspan(kCompressedHeaderSize);
    std::vector<uint8_t> out(rawLength);
    const int produced = LZ4_decompress_safe(
        reinterpret_cast<const char*>(compressed.data()),
        reinterpret_cast<char*>(out.data()),
        static_cast<int>(compressed.size()),
        static_cast<int>(rawLength));
    if (produced < 0 || static_cast<uint32_t>(produced) != rawLength) {
        CGC_LOG_WARN(LogCategory::Codec, "LZ4 block rejected, declared " +
                     std::to_string(rawLength) + " bytes");
        return makeError<std::vector<uint8_t>>(ErrorCode::DecompressionFailed,
                                               "decompressed size mismatch");
    }
    return ClientResult<std::vector<uint8_t>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Frames
// ---------------------------------------------------------------------------

ClientResult<std::vector<uint8_t>> MessageCodec::encode(const Message& message) const {
    auto body = encodePayload(serialize(message));
    if (body.hasError()) {
        return body;
    }
    const auto& bytes = body.value();
    if (bytes.size() > options_.maxFrameSize) {
        return makeError<std::vector<uint8_t>>(
            ErrorCode::FrameTooLarge,
            "frame body of " + std::to_string(bytes.size()) + " bytes exceeds " +
                std::to_string(options_.maxFrameSize));
    }

    std::vector<uint8_t> frame(kFrameHeaderSize + bytes.size());
    putU32(frame.data(), static_cast<uint32_t>(bytes.size()));
    std::memcpy(frame.data() + kFrameHeaderSize, bytes.data(), bytes.size());
    return ClientResult<std::vector<uint8_t>>::ok(std::move(frame));
}

ClientResult<Message> MessageCodec::decodeBody(std::span<const uint8_t> body) const {
    auto raw = decodePayload(body);
    if (raw.hasError()) {
        return ClientResult<Message>::err(raw.error());
    }
    return deserialize(raw.value());
}

ClientResult<Message> MessageCodec::decode(std::span<const uint8_t> frame) const {
    if (frame.size() < kFrameHeaderSize) {
        return makeError<Message>(ErrorCode::MalformedFrame, "frame shorter than length prefix");
    }
    const uint32_t length = getU32(frame.data());
    if (length > options_.maxFrameSize) {
        return makeError<Message>(ErrorCode::FrameTooLarge,
                                  "declared frame length " + std::to_string(length) +
                                      " exceeds " + std::to_string(options_.maxFrameSize));
    }
    if (length == 0 || frame.size() - kFrameHeaderSize != length) {
        return makeError<Message>(ErrorCode::MalformedFrame, "frame length mismatch");
    }
    return decodeBody(frame.subspan(kFrameHeaderSize));
}

// ---------------------------------------------------------------------------
// FrameAssembler
// ---------------------------------------------------------------------------

FrameAssembler::FrameAssembler(std::size_t maxFrameSize) : maxFrameSize_(maxFrameSize) {}

void FrameAssembler::feed(std::span<const uint8_t> bytes) {
    compact();
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

ClientResult<std::optional<std::vector<uint8_t>>> FrameAssembler::next() {
    using R = ClientResult<std::optional<std::vector<uint8_t>>>;
    if (buffered() < kFrameHeaderSize) {
        return R::ok(std::nullopt);
    }

    const uint32_t length = getU32(buffer_.data() + readPos_);
    if (length > maxFrameSize_) {
        return makeError<std::optional<std::vector<uint8_t>>>(
            ErrorCode::FrameTooLarge,
            "declared frame length " + std::to_string(length) + " exceeds " +
                std::to_string(maxFrameSize_));
    }
    if (length == 0) {
        return makeError<std::optional<std::vector<uint8_t>>>(ErrorCode::MalformedFrame,
                                                              "zero-length frame");
    }
    if (buffered() < kFrameHeaderSize + length) {
        return R::ok(std::nullopt);
    }

    auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(readPos_ + kFrameHeaderSize);
    std::vector<uint8_t> body(begin, begin + static_cast<std::ptrdiff_t>(length));
    readPos_ += kFrameHeaderSize + length;
    return R::ok(std::move(body));
}

void FrameAssembler::reset() {
    buffer_.clear();
    readPos_ = 0;
}

void FrameAssembler::compact() {
    if (readPos_ == 0) {
        return;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(readPos_));
    readPos_ = 0;
}

} // namespace cgc::net
