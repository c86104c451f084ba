#include "codec/lzw/dictionary.hpp"

#include <stdexcept>

namespace gifrgb::codec::lzw {

Dictionary::Dictionary(const CodeLayout& layout, bool searchable)
    : layout_(layout)
    , searchable_(searchable)
{
    entries_.reserve(kMaxDictionarySize);
    if (searchable_) {
        index_.reserve(kMaxDictionarySize);
    }
    reset();
}

void Dictionary::reset()
{
    entries_.clear();
    index_.clear();

    for (std::uint16_t code = 0; code < layout_.clearCode; ++code) {
        const auto symbol = static_cast<std::uint8_t>(code);
        entries_.push_back(Entry {kNoPrefix, symbol, symbol, 1});
    }

    // Clear and End hold their slots but never expand to anything.
    entries_.push_back(Entry {});
    entries_.push_back(Entry {});
}

std::uint16_t Dictionary::size() const noexcept
{
    return static_cast<std::uint16_t>(entries_.size());
}

bool Dictionary::full() const noexcept
{
    return entries_.size() >= kMaxDictionarySize;
}

std::uint16_t Dictionary::add(std::uint16_t prefix, std::uint8_t symbol)
{
    if (full()) {
        throw std::length_error("LZW dictionary is full");
    }

    const auto& parent = entry(prefix);
    if (parent.length == 0U) {
        throw std::invalid_argument("LZW dictionary prefix refers to a control code");
    }

    const auto code = size();
    entries_.push_back(Entry {prefix, symbol, parent.first, static_cast<std::uint16_t>(parent.length + 1U)});
    if (searchable_) {
        index_.emplace(key(prefix, symbol), code);
    }
    return code;
}

std::optional<std::uint16_t> Dictionary::find(std::uint16_t prefix, std::uint8_t symbol) const
{
    if (!searchable_) {
        throw std::logic_error("LZW dictionary was built without a lookup index");
    }

    const auto iterator = index_.find(key(prefix, symbol));
    if (iterator == index_.end()) {
        return std::nullopt;
    }
    return iterator->second;
}

std::uint8_t Dictionary::firstSymbol(std::uint16_t code) const
{
    return entry(code).first;
}

std::size_t Dictionary::length(std::uint16_t code) const
{
    return entry(code).length;
}

void Dictionary::expand(std::uint16_t code, std::vector<std::uint8_t>& output) const
{
    const auto& head = entry(code);
    if (head.length == 0U) {
        throw std::invalid_argument("LZW control codes have no sequence");
    }

    const auto start = output.size();
    output.resize(start + head.length);

    auto cursor = start + head.length;
    for (auto current = code; current != kNoPrefix;) {
        const auto& node = entries_[current];
        output[--cursor] = node.symbol;
        current = node.prefix;
    }
}

std::uint32_t Dictionary::key(std::uint16_t prefix, std::uint8_t symbol) noexcept
{
    return (static_cast<std::uint32_t>(prefix) << 8U) | symbol;
}

const Dictionary::Entry& Dictionary::entry(std::uint16_t code) const
{
    if (code >= entries_.size()) {
        throw std::out_of_range("LZW code is not in the dictionary");
    }
    return entries_[code];
}

} // namespace gifrgb::codec::lzw
