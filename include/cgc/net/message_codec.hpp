#pragma once

/// @file message_codec.hpp
/// @brief Length-prefixed framing, message (de)serialization and optional
///        LZ4 payload compression.
///
/// Wire format (all integers little-endian):
///
///   frame        := [u32 length][body]           length == body size
///   body         := message | compressed
///   compressed   := [0x4C 0x5A][u32 rawLength][LZ4 block of message]
///   message      := [u8 type][u32 sequence][u64 timestampMs][payload]
///
/// A message is compressed when its serialized size exceeds the configured
/// threshold. A serialized message that happens to start with the magic
/// bytes is always compressed so the decoder never misreads it.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "cgc/foundation/client_result.hpp"
#include "cgc/net/message.hpp"

namespace cgc::net {

struct ConnectionConfig;

inline constexpr std::size_t kFrameHeaderSize = 4;
inline constexpr std::size_t kMessageHeaderSize = 1 + 4 + 8;
inline constexpr uint8_t kCompressionMagic0 = 0x4C;
inline constexpr uint8_t kCompressionMagic1 = 0x5A;
inline constexpr std::size_t kCompressedHeaderSize = 2 + 4;

/// Codec limits and compression policy.
struct CodecOptions {
    std::size_t compressionThreshold = 512;
    bool enableCompression = true;
    std::size_t maxFrameSize = 65536;
    std::size_t maxDecompressedSize = 4 * 1024 * 1024;

    static CodecOptions fromConfig(const ConnectionConfig& config);
};

/// Stateless encoder/decoder for single frames. Thread-safe.
class MessageCodec {
public:
    explicit MessageCodec(CodecOptions options = {});

    /// Serialize, maybe compress and frame @p message.
    /// @return FrameTooLarge if the body exceeds maxFrameSize,
    ///         CompressionFailed if LZ4 rejects the input.
    [[nodiscard]] foundation::ClientResult<std::vector<uint8_t>> encode(const Message& message) const;

    /// Decode one frame body (the bytes after the length prefix).
    [[nodiscard]] foundation::ClientResult<Message> decodeBody(std::span<const uint8_t> body) const;

    /// Decode exactly one complete frame including its length prefix.
    [[nodiscard]] foundation::ClientResult<Message> decode(std::span<const uint8_t> frame) const;

    /// Apply the compression policy to raw message bytes.
    [[nodiscard]] foundation::ClientResult<std::vector<uint8_t>> encodePayload(
        std::span<const uint8_t> raw) const;

    /// Undo encodePayload(). Raw bodies are returned unchanged.
    [[nodiscard]] foundation::ClientResult<std::vector<uint8_t>> decodePayload(
        std::span<const uint8_t> body) const;

    /// True if @p body carries the compression magic.
    [[nodiscard]] static bool isCompressed(std::span<const uint8_t> body) noexcept;

    [[nodiscard]] static std::vector<uint8_t> serialize(const Message& message);
    [[nodiscard]] static foundation::ClientResult<Message> deserialize(std::span<const uint8_t> bytes);

    [[nodiscard]] const CodecOptions& options() const noexcept { return options_; }

private:
    CodecOptions options_;
};

/// Reassembles frame bodies from arbitrarily split stream reads.
///
/// Example:
/// @code
///   FrameAssembler assembler(config.maxFrameSize);
///   assembler.feed(chunk);
///   while (true) {
///       auto body = assembler.next();
///       if (!body) { teardown(body.error()); break; }
///       if (!body.value()) break;           // need more bytes
///       handle(codec.decodeBody(*body.value()));
///   }
/// @endcode
class FrameAssembler {
public:
    explicit FrameAssembler(std::size_t maxFrameSize = 65536);

    /// Append received bytes.
    void feed(std::span<const uint8_t> bytes);

    /// Extract the next complete frame body, nullopt if more bytes are needed.
    ///
    /// The length prefix is checked as soon as it is available: a declared
    /// length above maxFrameSize yields FrameTooLarge and a zero length
    /// yields MalformedFrame without waiting for the body. After an error the
    /// stream is unusable and the assembler must be reset().
    [[nodiscard]] foundation::ClientResult<std::optional<std::vector<uint8_t>>> next();

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - readPos_; }

    void reset();

private:
    void compact();

    std::size_t maxFrameSize_;
    std::vector<uint8_t> buffer_;
    std::size_t readPos_ = 0;
};

} // namespace cgc::net
