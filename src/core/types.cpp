// TOKENLEDGER - Core Types Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/core/types.h"

namespace tokenledger {

namespace {

const char HEX_DIGITS[] = "0123456789abcdef";

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    std::string hex;
    hex.reserve(SIZE * 2);
    for (auto it = bytes_.rbegin(); it != bytes_.rend(); ++it) {
        hex += HEX_DIGITS[*it >> 4];
        hex += HEX_DIGITS[*it & 0x0F];
    }
    return hex;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    size_t offset = (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) ? 2 : 0;
    if (hex.size() - offset != SIZE * 2) {
        throw std::invalid_argument("expected " + std::to_string(SIZE * 2) + " hex digits");
    }

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        // Digit pair i counts from the most significant (last) byte
        int high = HexValue(hex[offset + 2 * i]);
        int low = HexValue(hex[offset + 2 * i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("invalid hex digit in " + hex);
        }
        result.bytes_[SIZE - 1 - i] = static_cast<Byte>((high << 4) | low);
    }
    return result;
}

template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Reserved Internal Accounts
// ============================================================================

namespace {

Address MakeReservedAddress(Byte tag) {
    std::array<Byte, Address::SIZE> data{};
    data[0] = tag;
    return Address(data);
}

} // namespace

const Address& StakingPoolAddress() {
    static const Address addr = MakeReservedAddress(0x01);
    return addr;
}

const Address& RewardPoolAddress() {
    static const Address addr = MakeReservedAddress(0x02);
    return addr;
}

const Address& VestingEscrowAddress() {
    static const Address addr = MakeReservedAddress(0x03);
    return addr;
}

bool IsInternalAddress(const Address& addr) {
    return addr.IsNull() ||
           addr == StakingPoolAddress() ||
           addr == RewardPoolAddress() ||
           addr == VestingEscrowAddress();
}

} // namespace tokenledger
