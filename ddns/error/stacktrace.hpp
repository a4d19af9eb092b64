#ifndef DDNS_ERROR_STACKTRACE_HPP
#define DDNS_ERROR_STACKTRACE_HPP

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace ddns::error {

/**
 * @brief Captures the call stack at construction time.
 *
 * Frames are resolved lazily in toString(), so capturing is cheap enough to do
 * for every exception thrown.
 */
class StackTrace {
public:
    /**
     * @brief Default constructor that captures the current stack trace.
     */
    StackTrace();

    /**
     * @brief Get the string representation of the stack trace.
     *
     * @return One line per frame with the demangled function name, the address
     * and the module it belongs to when available.
     */
    [[nodiscard]] auto toString() const -> std::string;

private:
    void capture();

    [[nodiscard]] auto processFrame(void* frame, int frameIndex) const
        -> std::string;

#if defined(__APPLE__) || defined(__linux__)
    std::shared_ptr<char*> symbols_;
    std::vector<void*> frames_;
    int num_frames_ = 0;
#endif
};

}  // namespace ddns::error

#endif  // DDNS_ERROR_STACKTRACE_HPP
