#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised when a configuration string (size bound, aspect ratio,
 * panel layout) does not match its expected syntax
 *
 * Thrown at configuration time, never while validating individual files.
 */
class InvalidFormatError : public std::invalid_argument
{
public:
    InvalidFormatError(const std::string &what_kind, const std::string &input)
        : std::invalid_argument("Invalid " + what_kind + " format: '" + input + "'"),
          kind_(what_kind), input_(input) {}

    const std::string &kind() const { return kind_; }
    const std::string &input() const { return input_; }

private:
    std::string kind_;
    std::string input_;
};

/**
 * @brief The worker context answered a call with an error frame
 */
class WorkerCallError : public std::runtime_error
{
public:
    explicit WorkerCallError(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * @brief The channel was terminated while the call was still outstanding
 */
class AbandonedCallError : public std::runtime_error
{
public:
    explicit AbandonedCallError(const std::string &correlation_id)
        : std::runtime_error("Call " + correlation_id + " cancelled by channel termination"),
          correlation_id_(correlation_id) {}

    const std::string &correlationId() const { return correlation_id_; }

private:
    std::string correlation_id_;
};

/**
 * @brief A call was issued on a channel that has already been terminated
 */
class ChannelTerminatedError : public std::logic_error
{
public:
    explicit ChannelTerminatedError(const std::string &message)
        : std::logic_error(message) {}
};

/**
 * @brief The decode context could not produce a bitmap for a file
 */
class DecodeFailure : public std::runtime_error
{
public:
    DecodeFailure(const std::string &file_name, const std::string &reason)
        : std::runtime_error("Failed to decode " + file_name + ": " + reason),
          file_name_(file_name) {}

    const std::string &fileName() const { return file_name_; }

private:
    std::string file_name_;
};
