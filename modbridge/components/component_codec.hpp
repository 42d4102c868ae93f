#pragma once

#include <modbridge/core/byte_buffer.hpp>
#include <modbridge/core/error.hpp>
#include <modbridge/core/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace modbridge::components {

// ============================================================================
// ComponentCodec - byte layout of one component type
//
// The signature is written in Lua string.pack notation ("<fff", "<i4s2", ...).
// Two codecs describe the same layout when their signatures are equal.
// ============================================================================

class ComponentCodec {
public:
    virtual ~ComponentCodec() = default;

    virtual const std::string& signature() const = 0;

    // SchemaMismatch if the payload does not follow the layout.
    virtual Status validate(std::span<const std::uint8_t> bytes) const = 0;
};

// Codec for a host-native struct, built from a writer/reader pair over the
// project byte codec. Readers may throw core::ByteBufferError; it never
// leaves the codec.
template <typename T>
class StructCodec final : public ComponentCodec {
public:
    using Writer = void (*)(core::ByteWriter&, const T&);
    using Reader = void (*)(core::ByteReader&, T&);

    StructCodec(std::string signature, Writer writer, Reader reader)
        : signature_(std::move(signature)), writer_(writer), reader_(reader) {}

    const std::string& signature() const override { return signature_; }

    Status validate(std::span<const std::uint8_t> bytes) const override {
        T scratch{};
        return decode(bytes, scratch);
    }

    Bytes encode(const T& value) const {
        core::ByteWriter w;
        writer_(w, value);
        return w.take();
    }

    // `out` is left untouched on failure.
    Status decode(std::span<const std::uint8_t> bytes, T& out) const {
        try {
            core::ByteReader r(bytes);
            T value{};
            reader_(r, value);
            r.expect_end();
            out = std::move(value);
            return Status::success();
        } catch (const core::ByteBufferError& e) {
            return Status::fail(ErrorCode::SchemaMismatch, signature_ + ": " + e.what());
        }
    }

private:
    std::string signature_;
    Writer writer_;
    Reader reader_;
};

// Opaque payload of a guest-defined component type ("c<N>" when sized, "blob"
// otherwise). Stored verbatim; only the size is checked when one was declared.
class BlobCodec final : public ComponentCodec {
public:
    explicit BlobCodec(std::optional<std::size_t> fixedSize = std::nullopt)
        : fixedSize_(fixedSize),
          signature_(fixedSize ? "c" + std::to_string(*fixedSize) : std::string("blob")) {}

    const std::string& signature() const override { return signature_; }

    Status validate(std::span<const std::uint8_t> bytes) const override {
        if (fixedSize_ && bytes.size() != *fixedSize_) {
            return Status::fail(ErrorCode::SchemaMismatch,
                                "expected " + std::to_string(*fixedSize_) + " bytes, got " +
                                    std::to_string(bytes.size()));
        }
        return Status::success();
    }

    std::optional<std::size_t> fixed_size() const { return fixedSize_; }

private:
    std::optional<std::size_t> fixedSize_;
    std::string signature_;
};

} // namespace modbridge::components
