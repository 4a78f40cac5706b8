#pragma once

/// @file id.hpp
/// @brief Generational identifiers and string hashing for hoard_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <atomic>
#include <functional>
#include <compare>
#include <ostream>

namespace hoard_core {

// =============================================================================
// FNV-1a Hash
// =============================================================================

namespace detail {

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

/// Compute FNV-1a hash of a byte range
[[nodiscard]] constexpr std::uint64_t fnv1a_hash(const char* str, std::size_t len) noexcept {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(str[i]));
        hash *= FNV_PRIME;
    }
    return hash;
}

[[nodiscard]] constexpr std::uint64_t fnv1a_hash(std::string_view str) noexcept {
    return fnv1a_hash(str.data(), str.size());
}

/// Fold another value into an existing hash
[[nodiscard]] constexpr std::uint64_t hash_combine(std::uint64_t seed, std::uint64_t value) noexcept {
    return (seed ^ value) * FNV_PRIME;
}

} // namespace detail

// =============================================================================
// Id
// =============================================================================

/// Generational index identifier (64-bit)
/// Layout: [Generation(32 bits) | Index(32 bits)]
struct Id {
    std::uint64_t bits = UINT64_MAX;  // Null by default

    constexpr Id() noexcept = default;
    constexpr explicit Id(std::uint64_t raw) noexcept : bits(raw) {}

    /// Construct from index and generation
    [[nodiscard]] static constexpr Id create(std::uint32_t index, std::uint32_t generation) noexcept {
        return Id((static_cast<std::uint64_t>(generation) << 32) | static_cast<std::uint64_t>(index));
    }

    [[nodiscard]] static constexpr Id null() noexcept {
        return Id{UINT64_MAX};
    }

    [[nodiscard]] constexpr bool is_null() const noexcept { return bits == UINT64_MAX; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return bits != UINT64_MAX; }

    /// Slot index component
    [[nodiscard]] constexpr std::uint32_t index() const noexcept {
        return static_cast<std::uint32_t>(bits & 0xFFFFFFFF);
    }

    /// Generation component
    [[nodiscard]] constexpr std::uint32_t generation() const noexcept {
        return static_cast<std::uint32_t>(bits >> 32);
    }

    [[nodiscard]] constexpr std::uint64_t to_bits() const noexcept { return bits; }

    constexpr auto operator<=>(const Id&) const noexcept = default;
    constexpr bool operator==(const Id&) const noexcept = default;

    explicit constexpr operator bool() const noexcept { return is_valid(); }
};

inline std::ostream& operator<<(std::ostream& os, const Id& id) {
    if (id.is_null()) {
        return os << "Id(null)";
    }
    return os << "Id(" << id.index() << "v" << id.generation() << ")";
}

// =============================================================================
// IdGenerator
// =============================================================================

/// Thread-safe monotonic ID generator
class IdGenerator {
public:
    IdGenerator() noexcept : m_next(0) {}

    /// Generate next ID (generation is always 0)
    [[nodiscard]] Id next() noexcept {
        std::uint64_t index = m_next.fetch_add(1, std::memory_order_relaxed);
        return Id::create(static_cast<std::uint32_t>(index), 0);
    }

    /// Number of IDs handed out so far
    [[nodiscard]] std::uint64_t current() const noexcept {
        return m_next.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_next;
};

} // namespace hoard_core

template<>
struct std::hash<hoard_core::Id> {
    std::size_t operator()(const hoard_core::Id& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.bits);
    }
};
