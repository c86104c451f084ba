#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace gifrgb::codec {

class Diagnostics {
public:
    virtual ~Diagnostics() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void traceCode(std::uint16_t code, std::uint8_t width) = 0;
};

class NullDiagnostics final : public Diagnostics {
public:
    void info(const std::string&) override {}
    void warning(const std::string&) override {}
    void traceCode(std::uint16_t, std::uint8_t) override {}
};

struct Verbosity {
    bool verbose {false};
    bool traceCodes {false};
};

// Writes to caller-owned streams. Safe to share between batch workers.
class StreamDiagnostics final : public Diagnostics {
public:
    StreamDiagnostics(std::ostream& output, std::ostream& errors, Verbosity verbosity);

    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void traceCode(std::uint16_t code, std::uint8_t width) override;

private:
    std::ostream& output_;
    std::ostream& errors_;
    Verbosity verbosity_;
    std::mutex mutex_;
};

} // namespace gifrgb::codec
