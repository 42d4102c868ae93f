#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace modbridge::core {

// Thrown by ByteReader when a payload does not match the layout being read.
// Codecs catch it and turn it into a SchemaMismatch status.
class ByteBufferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// ByteWriter - little-endian component payload encoder
//
// The layout matches Lua's string.pack with the "<" modifier, so guests can
// decode a payload with string.unpack("<fff", bytes) and friends.
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    void write_u8(std::uint8_t v) { put(v); }
    void write_u16(std::uint16_t v) { put(v); }
    void write_u32(std::uint32_t v) { put(v); }
    void write_u64(std::uint64_t v) { put(v); }
    void write_i32(std::int32_t v) { put(static_cast<std::uint32_t>(v)); }
    void write_i64(std::int64_t v) { put(static_cast<std::uint64_t>(v)); }
    void write_f32(float v) { put(bits_of<std::uint32_t>(v)); }
    void write_f64(double v) { put(bits_of<std::uint64_t>(v)); }
    void write_bool(bool v) { put(static_cast<std::uint8_t>(v ? 1 : 0)); }

    // u16 length prefix ("s2" in string.pack notation)
    void write_string(std::string_view s) {
        if (s.size() > 0xFFFF) {
            throw ByteBufferError("ByteWriter: string of " + std::to_string(s.size()) + " bytes does not fit s2");
        }
        put(static_cast<std::uint16_t>(s.size()));
        data_.insert(data_.end(), s.begin(), s.end());
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    std::span<const std::uint8_t> data() const { return data_; }
    std::vector<std::uint8_t> take() { return std::move(data_); }
    void clear() { data_.clear(); }

private:
    template <typename U, typename F>
    static U bits_of(F value) {
        static_assert(sizeof(U) == sizeof(F));
        U bits;
        std::memcpy(&bits, &value, sizeof(bits));
        return bits;
    }

    template <typename U>
    void put(U value) {
        static_assert(std::is_unsigned_v<U>);
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            data_.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
        }
    }

    std::vector<std::uint8_t> data_;
};

// ============================================================================
// ByteReader - little-endian component payload decoder
//
// Never reads past the span; every short read throws ByteBufferError.
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    std::uint8_t read_u8() { return get<std::uint8_t>(); }
    std::uint16_t read_u16() { return get<std::uint16_t>(); }
    std::uint32_t read_u32() { return get<std::uint32_t>(); }
    std::uint64_t read_u64() { return get<std::uint64_t>(); }
    std::int32_t read_i32() { return static_cast<std::int32_t>(get<std::uint32_t>()); }
    std::int64_t read_i64() { return static_cast<std::int64_t>(get<std::uint64_t>()); }
    float read_f32() { return from_bits<float>(get<std::uint32_t>()); }
    double read_f64() { return from_bits<double>(get<std::uint64_t>()); }

    bool read_bool() {
        const auto v = get<std::uint8_t>();
        if (v > 1) {
            throw ByteBufferError("ByteReader: invalid bool value " + std::to_string(v));
        }
        return v == 1;
    }

    std::string read_string() {
        auto bytes = read_bytes(get<std::uint16_t>());
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count);
        auto out = data_.subspan(pos_, count);
        pos_ += count;
        return out;
    }

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

    // Payloads must be consumed exactly; trailing bytes mean the layout differs.
    void expect_end() const {
        if (!at_end()) {
            throw ByteBufferError("ByteReader: " + std::to_string(remaining()) + " trailing bytes");
        }
    }

private:
    void require(std::size_t count) const {
        if (count > remaining()) {
            throw ByteBufferError("ByteReader: need " + std::to_string(count) + " bytes, " +
                                  std::to_string(remaining()) + " left");
        }
    }

    template <typename U>
    U get() {
        static_assert(std::is_unsigned_v<U>);
        require(sizeof(U));
        U value = 0;
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            value = static_cast<U>(value | static_cast<U>(static_cast<U>(data_[pos_ + i]) << (8 * i)));
        }
        pos_ += sizeof(U);
        return value;
    }

    template <typename F, typename U>
    static F from_bits(U bits) {
        static_assert(sizeof(U) == sizeof(F));
        F value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_{0};
};

} // namespace modbridge::core
