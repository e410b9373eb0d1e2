#include "lib.hpp"

// Formats a printf-style message, prefixes it with the call site and throws
// the exception type selected by kind.
    void error(snowid::ErrKind kind, const std::string& msg, const char* file, int line, ...) {
        va_list args;
        va_start(args, line);

        // Two passes: the first call with a null buffer only measures the output.
        va_list args_copy;
        va_copy(args_copy, args);
        int required_size = std::vsnprintf(nullptr, 0, msg.c_str(), args_copy);
        va_end(args_copy);

        if (required_size < 0) {
            va_end(args);
            throw std::runtime_error("Error: Failed to determine required buffer size.");
        }

        std::vector<char> buffer(required_size + 1);
        std::vsnprintf(buffer.data(), buffer.size(), msg.c_str(), args);
        va_end(args);

        std::stringstream ss;
        ss << file << ":" << line << ": " << buffer.data();

        switch (kind) {
            case snowid::ErrKind::InvalidConfiguration:
                throw snowid::InvalidConfiguration(ss.str());
            case snowid::ErrKind::ClockMovedBackwards:
                throw snowid::ClockMovedBackwards(ss.str());
            case snowid::ErrKind::Runtime:
                break;
        }
        throw std::runtime_error(ss.str());
    }
