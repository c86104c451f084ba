#pragma once

#include "codec/lzw/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace gifrgb::codec::lzw {

// Code table stored as an arena of (prefix code, appended symbol) pairs.
// A code's sequence is rebuilt by walking the prefix chain back to its root.
// Only a searchable table keeps the (prefix, symbol) index behind find().
class Dictionary {
public:
    explicit Dictionary(const CodeLayout& layout, bool searchable = false);

    void reset();

    std::uint16_t size() const noexcept;
    bool full() const noexcept;

    std::uint16_t add(std::uint16_t prefix, std::uint8_t symbol);
    std::optional<std::uint16_t> find(std::uint16_t prefix, std::uint8_t symbol) const;

    std::uint8_t firstSymbol(std::uint16_t code) const;
    std::size_t length(std::uint16_t code) const;

    // Appends the sequence for `code` to `output`.
    void expand(std::uint16_t code, std::vector<std::uint8_t>& output) const;

private:
    struct Entry {
        std::uint16_t prefix {kNoPrefix};
        std::uint8_t symbol {0};
        std::uint8_t first {0};
        std::uint16_t length {0};
    };

    static constexpr std::uint16_t kNoPrefix = 0xFFFF;

    static std::uint32_t key(std::uint16_t prefix, std::uint8_t symbol) noexcept;
    const Entry& entry(std::uint16_t code) const;

    CodeLayout layout_;
    bool searchable_ {false};
    std::vector<Entry> entries_;
    std::unordered_map<std::uint32_t, std::uint16_t> index_;
};

} // namespace gifrgb::codec::lzw
