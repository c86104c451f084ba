#include "codec/diagnostics.hpp"

#include <ostream>
#include <string>

namespace gifrgb::codec {
namespace {

std::string toBinary(std::uint16_t code, std::uint8_t width)
{
    std::string digits(width, '0');
    for (std::uint8_t bit = 0; bit < width; ++bit) {
        if ((code >> bit) & 0x1U) {
            digits[width - 1U - bit] = '1';
        }
    }
    return digits;
}

} // namespace

StreamDiagnostics::StreamDiagnostics(std::ostream& output, std::ostream& errors, Verbosity verbosity)
    : output_(output)
    , errors_(errors)
    , verbosity_(verbosity)
{
}

void StreamDiagnostics::info(const std::string& message)
{
    if (!verbosity_.verbose) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    output_ << message << "\n";
}

void StreamDiagnostics::warning(const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    errors_ << "Warning: " << message << "\n";
}

void StreamDiagnostics::traceCode(std::uint16_t code, std::uint8_t width)
{
    if (!verbosity_.traceCodes) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    output_ << toBinary(code, width) << "\n";
}

} // namespace gifrgb::codec
