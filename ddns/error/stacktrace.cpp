#include "stacktrace.hpp"

#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>

#if defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace ddns::error {

namespace {

#if defined(__APPLE__) || defined(__linux__)
auto demangle(const char* name) -> std::string {
    int status = 0;
    std::unique_ptr<char, decltype(&free)> demangled(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), &free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return name;
}

auto processString(const std::string& input) -> std::string {
    size_t startIndex = input.find("_Z");
    if (startIndex == std::string::npos) {
        return input;
    }

    size_t endIndex = input.find('+', startIndex);
    if (endIndex == std::string::npos) {
        return input;
    }

    std::string abiName = input.substr(startIndex, endIndex - startIndex);
    std::string result = input;
    result.replace(startIndex, endIndex - startIndex,
                   demangle(abiName.c_str()));
    return result;
}
#endif

auto prettifyStacktrace(const std::string& input) -> std::string {
    static const std::vector<std::pair<std::string, std::string>> REPLACEMENTS =
        {{"std::__1::", "std::"},
         {"std::__cxx11::", "std::"},
         {", std::allocator<[^<>]+>", ""}};

    std::string output = input;
    for (const auto& [from, to] : REPLACEMENTS) {
        output = std::regex_replace(output, std::regex(from), to);
    }
    return output;
}

auto formatAddress(uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    size_t lastSlash = path.find_last_of('/');
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

}  // namespace

StackTrace::StackTrace() { capture(); }

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;

#if defined(__APPLE__) || defined(__linux__)
    for (int i = 0; i < num_frames_; ++i) {
        oss << "\t[" << i << "] " << processFrame(frames_[i], i) << "\n";
    }
#else
    oss << "\tStack trace not available on this platform.\n";
#endif

    return prettifyStacktrace(oss.str());
}

#if defined(__APPLE__) || defined(__linux__)
auto StackTrace::processFrame(void* frame, int frameIndex) const
    -> std::string {
    std::ostringstream oss;
    auto address = reinterpret_cast<uintptr_t>(frame);

    Dl_info dlInfo;
    std::string functionName = "<unknown function>";
    std::string moduleName;
    uintptr_t offset = 0;

    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname != nullptr) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase != nullptr) {
            offset = address - reinterpret_cast<uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname != nullptr) {
            functionName = demangle(dlInfo.dli_sname);
        }
    }

    if (functionName == "<unknown function>" && symbols_ &&
        frameIndex < num_frames_) {
        functionName = processString(symbols_.get()[frameIndex]);
    }

    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }
    return oss.str();
}

void StackTrace::capture() {
    constexpr int MAX_FRAMES = 64;
    void* framePtrs[MAX_FRAMES];

    num_frames_ = backtrace(framePtrs, MAX_FRAMES);
    if (num_frames_ > 1) {
        symbols_.reset(backtrace_symbols(framePtrs + 1, num_frames_ - 1),
                       &free);
        frames_.assign(framePtrs + 1, framePtrs + num_frames_);
        num_frames_--;
    } else {
        symbols_.reset();
        frames_.clear();
        num_frames_ = 0;
    }
}

#else
auto StackTrace::processFrame(void* frame, int /*frameIndex*/) const
    -> std::string {
    return "<frame information unavailable> at " +
           formatAddress(reinterpret_cast<uintptr_t>(frame));
}

void StackTrace::capture() {}
#endif

}  // namespace ddns::error
