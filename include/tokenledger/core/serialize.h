// TOKENLEDGER - Serialization Header
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Record encoding for persisted ledger state. Integers are fixed-width
// little-endian, variable-length fields carry a compact length prefix.

#ifndef TOKENLEDGER_CORE_SERIALIZE_H
#define TOKENLEDGER_CORE_SERIALIZE_H

#include "tokenledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tokenledger {

/// Largest length prefix accepted when decoding a record
static constexpr uint64_t MAX_RECORD_FIELD_LENGTH = 1 << 20;

// ============================================================================
// DataStream
// ============================================================================

/// Growable byte buffer with a read cursor
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& bytes) : buffer_(bytes) {}
    DataStream(const uint8_t* bytes, size_t len) : buffer_(bytes, bytes + len) {}

    /// Bytes not yet consumed
    size_t size() const noexcept { return buffer_.size() - cursor_; }
    bool empty() const noexcept { return cursor_ == buffer_.size(); }
    const uint8_t* data() const noexcept { return buffer_.data() + cursor_; }

    void Write(const void* src, size_t len) {
        const auto* bytes = static_cast<const uint8_t*>(src);
        buffer_.insert(buffer_.end(), bytes, bytes + len);
    }

    void Read(void* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream: record truncated");
        }
        std::memcpy(dst, buffer_.data() + cursor_, len);
        cursor_ += len;
    }

    /// Unread bytes as a database value
    std::string ToString() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    template<typename T>
    DataStream& operator<<(const T& value);

    template<typename T>
    DataStream& operator>>(T& value);

private:
    std::vector<uint8_t> buffer_;
    size_t cursor_{0};
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

/// Write an unsigned integer as sizeof(T) little-endian bytes
template<typename Stream, typename T>
void WriteLE(Stream& s, T value) {
    static_assert(std::is_unsigned<T>::value, "WriteLE takes unsigned types");
    uint8_t bytes[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(bytes, sizeof(T));
}

template<typename T, typename Stream>
T ReadLE(Stream& s) {
    static_assert(std::is_unsigned<T>::value, "ReadLE takes unsigned types");
    uint8_t bytes[sizeof(T)];
    s.Read(bytes, sizeof(T));
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<T>(bytes[i]) << (8 * i));
    }
    return value;
}

// ============================================================================
// Compact Length Prefix
// ============================================================================
// One byte below 0xFD, otherwise a marker byte followed by a 2, 4 or 8 byte
// value. Decoding rejects values that a shorter form could have carried.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t length) {
    if (length < 0xFD) {
        WriteLE(s, static_cast<uint8_t>(length));
    } else if (length <= 0xFFFF) {
        WriteLE(s, static_cast<uint8_t>(0xFD));
        WriteLE(s, static_cast<uint16_t>(length));
    } else if (length <= 0xFFFFFFFFULL) {
        WriteLE(s, static_cast<uint8_t>(0xFE));
        WriteLE(s, static_cast<uint32_t>(length));
    } else {
        WriteLE(s, static_cast<uint8_t>(0xFF));
        WriteLE(s, length);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    const uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t length = marker;
    uint64_t smallest = 0;

    switch (marker) {
        case 0xFD:
            length = ReadLE<uint16_t>(s);
            smallest = 0xFD;
            break;
        case 0xFE:
            length = ReadLE<uint32_t>(s);
            smallest = 0x10000;
            break;
        case 0xFF:
            length = ReadLE<uint64_t>(s);
            smallest = 0x100000000ULL;
            break;
        default:
            break;
    }

    if (length < smallest) {
        throw std::ios_base::failure("ReadCompactSize: non-canonical length");
    }
    if (length > MAX_RECORD_FIELD_LENGTH) {
        throw std::ios_base::failure("ReadCompactSize: length too large");
    }
    return length;
}

// ============================================================================
// Scalars
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, uint32_t v) { WriteLE(s, v); }

template<typename Stream>
void Serialize(Stream& s, uint64_t v) { WriteLE(s, v); }

/// Signed values travel as their two's complement bit pattern
template<typename Stream>
void Serialize(Stream& s, int64_t v) { WriteLE(s, static_cast<uint64_t>(v)); }

template<typename Stream>
void Serialize(Stream& s, bool v) { WriteLE(s, static_cast<uint8_t>(v ? 1 : 0)); }

template<typename Stream>
void Unserialize(Stream& s, uint32_t& v) { v = ReadLE<uint32_t>(s); }

template<typename Stream>
void Unserialize(Stream& s, uint64_t& v) { v = ReadLE<uint64_t>(s); }

template<typename Stream>
void Unserialize(Stream& s, int64_t& v) { v = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
void Unserialize(Stream& s, bool& v) { v = ReadLE<uint8_t>(s) != 0; }

// ============================================================================
// Strings and Hashes
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    str.assign(ReadCompactSize(s), '\0');
    s.Read(&str[0], str.size());
}

/// Hashes and addresses are written as their raw storage bytes
template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), hash.size());
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), hash.size());
}

// ============================================================================
// Records and Containers
// ============================================================================

/// Record structs provide SerializeTo(Stream&) const and UnserializeFrom(Stream&)
template<typename Stream, typename T>
auto Serialize(Stream& s, const T& record) -> decltype(record.SerializeTo(s), void()) {
    record.SerializeTo(s);
}

template<typename Stream, typename T>
auto Unserialize(Stream& s, T& record) -> decltype(record.UnserializeFrom(s), void()) {
    record.UnserializeFrom(s);
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& items) {
    WriteCompactSize(s, items.size());
    for (const T& item : items) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& items) {
    const uint64_t count = ReadCompactSize(s);
    items.clear();
    for (uint64_t i = 0; i < count; ++i) {
        items.emplace_back();
        Unserialize(s, items.back());
    }
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::set<T>& items) {
    WriteCompactSize(s, items.size());
    for (const T& item : items) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::set<T>& items) {
    const uint64_t count = ReadCompactSize(s);
    items.clear();
    for (uint64_t i = 0; i < count; ++i) {
        T item;
        Unserialize(s, item);
        items.insert(std::move(item));
    }
}

template<typename T>
DataStream& DataStream::operator<<(const T& value) {
    Serialize(*this, value);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& value) {
    Unserialize(*this, value);
    return *this;
}

} // namespace tokenledger

#endif // TOKENLEDGER_CORE_SERIALIZE_H
