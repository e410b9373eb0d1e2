#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string


using er = std::runtime_error;

namespace snowid {

// Raised at construction when node/datacenter ids or the bit layout are out of range.
class InvalidConfiguration : public er {
public:
    using er::er;
};

// Raised by IdWorker::next() when the clock reads earlier than the last issued timestamp.
class ClockMovedBackwards : public er {
public:
    using er::er;
};

enum class ErrKind { Runtime, InvalidConfiguration, ClockMovedBackwards };

} // namespace snowid

void error(snowid::ErrKind kind, const std::string& msg, const char* file, int line, ...);
// Helper macros to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(snowid::ErrKind::Runtime, msg, __FILE__, __LINE__, ##__VA_ARGS__)
#define THROW_CONFIG(msg, ...) error(snowid::ErrKind::InvalidConfiguration, msg, __FILE__, __LINE__, ##__VA_ARGS__)
#define THROW_CLOCK(msg, ...) error(snowid::ErrKind::ClockMovedBackwards, msg, __FILE__, __LINE__, ##__VA_ARGS__)
