/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exception base carrying the throw site

**************************************************/

#ifndef ONCAL_ERROR_EXCEPTION_HPP
#define ONCAL_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#ifndef ONCAL_FILE_NAME
#define ONCAL_FILE_NAME __FILE__
#endif
#ifndef ONCAL_FILE_LINE
#define ONCAL_FILE_LINE __LINE__
#endif
#ifndef ONCAL_FUNC_NAME
#ifdef _MSC_VER
#define ONCAL_FUNC_NAME __FUNCSIG__
#else
#define ONCAL_FUNC_NAME __PRETTY_FUNCTION__
#endif
#endif

namespace oncal::error {

/**
 * @brief Base exception recording where it was thrown.
 *
 * The message is assembled from the trailing constructor arguments, so call
 * sites can pass strings and numbers without formatting them first. The
 * detailed report (file, line, function, thread, message) is built lazily by
 * what(); getMessage() returns the bare message.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace oncal::error

#define THROW_EXCEPTION(...)                                          \
    throw oncal::error::Exception(ONCAL_FILE_NAME, ONCAL_FILE_LINE,   \
                                  ONCAL_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                         \
    throw oncal::error::InvalidArgument(ONCAL_FILE_NAME, ONCAL_FILE_LINE,   \
                                        ONCAL_FUNC_NAME, __VA_ARGS__)

#define THROW_RUNTIME_ERROR(...)                                         \
    throw oncal::error::RuntimeError(ONCAL_FILE_NAME, ONCAL_FILE_LINE,   \
                                     ONCAL_FUNC_NAME, __VA_ARGS__)

#endif
