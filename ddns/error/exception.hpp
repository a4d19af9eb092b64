/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#ifndef DDNS_ERROR_EXCEPTION_HPP
#define DDNS_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "ddns/error/stacktrace.hpp"
#include "ddns/macro.hpp"

namespace ddns::error {

/**
 * @brief Base exception carrying the throw site and a captured stack trace.
 *
 * Use the THROW_* macros below instead of constructing these directly so that
 * file, line and function are filled in.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an Exception.
     * @param file The file where the exception was thrown.
     * @param line The line where the exception was thrown.
     * @param func The function that threw.
     * @param args Values streamed together to form the message.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file), line_(line), func_(func) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
        thread_id_ = std::this_thread::get_id();
    }

    /**
     * @brief Returns the full report: location, thread, message and stack.
     */
    auto what() const noexcept -> const char* override;

    DDNS_NODISCARD auto getFile() const -> std::string;
    DDNS_NODISCARD auto getLine() const -> int;
    DDNS_NODISCARD auto getFunction() const -> std::string;

    /**
     * @brief Returns only the message, without location or stack trace.
     */
    DDNS_NODISCARD auto getMessage() const -> std::string;
    DDNS_NODISCARD auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
    StackTrace stack_trace_;
};

#define THROW_EXCEPTION(...)                                              \
    throw ddns::error::Exception(DDNS_FILE_NAME, DDNS_FILE_LINE,          \
                                 DDNS_FUNC_NAME, __VA_ARGS__)

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_RUNTIME_ERROR(...)                                          \
    throw ddns::error::RuntimeError(DDNS_FILE_NAME, DDNS_FILE_LINE,       \
                                    DDNS_FUNC_NAME, __VA_ARGS__)

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                                       \
    throw ddns::error::InvalidArgument(DDNS_FILE_NAME, DDNS_FILE_LINE,    \
                                       DDNS_FUNC_NAME, __VA_ARGS__)

class FileNotFound : public Exception {
public:
    using Exception::Exception;
};

#define THROW_FILE_NOT_FOUND(...)                                         \
    throw ddns::error::FileNotFound(DDNS_FILE_NAME, DDNS_FILE_LINE,       \
                                    DDNS_FUNC_NAME, __VA_ARGS__)

// -------------------------------------------------------------------
// Curl
// -------------------------------------------------------------------

class CurlInitializationError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_CURL_INITIALIZATION_ERROR(...)                              \
    throw ddns::error::CurlInitializationError(                           \
        DDNS_FILE_NAME, DDNS_FILE_LINE, DDNS_FUNC_NAME, __VA_ARGS__)

class CurlRuntimeError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_CURL_RUNTIME_ERROR(...)                                     \
    throw ddns::error::CurlRuntimeError(DDNS_FILE_NAME, DDNS_FILE_LINE,   \
                                        DDNS_FUNC_NAME, __VA_ARGS__)

}  // namespace ddns::error

#endif  // DDNS_ERROR_EXCEPTION_HPP
