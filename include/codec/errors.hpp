#pragma once

#include <stdexcept>
#include <string>

namespace gifrgb::codec {

class GifError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed code stream, sub-block framing or container structure.
class InputFormatError : public GifError {
public:
    using GifError::GifError;
};

// Request exceeds what the format can hold (width, colour count).
class CapacityError : public GifError {
public:
    using GifError::GifError;
};

// Decoded data disagrees with the declared geometry.
class ConsistencyError : public GifError {
public:
    using GifError::GifError;
};

} // namespace gifrgb::codec
