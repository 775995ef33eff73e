/**
 * @file key_errors.hpp
 */
#pragma once
#include "stagedag/common/common.hpp"

namespace stagedag
{

/**
 * @brief Error codes for key registration and key resolution.
 */
enum class KeyErrorCode
{
    DuplicateKeyName,       ///< A second key was created with an existing name.
    IllegalKeyName,         ///< The name has no valid identifier form.
    TypeMismatch,           ///< A value of the wrong type was bound to a key.
    AlreadyBound,           ///< A key was bound twice in the same context.
    UnresolvedKeyInvariant  ///< eval() reached a key with no binding (internal defect).
};

/**
 * @brief Exception class for key errors.
 *
 * @details
 * `KeyError` is thrown by the key registry, the evaluation context and the
 * expression evaluator. Each exception carries an error code, the name of the
 * offending key and a descriptive message.
 *
 * Malformed command-line input is not reported through `KeyError`; it is
 * collected as `ParseFailure` values so that every key gets reported.
 */
class KeyError : public std::exception
{
public:
    KeyError(KeyErrorCode code, std::string key_name, std::string message)
        : m_code(code)
        , m_key_name(std::move(key_name))
        , m_message(std::move(message))
    {
    }

    KeyErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Name of the key the error is about.
     */
    const std::string& key_name() const noexcept
    {
        return m_key_name;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    KeyErrorCode m_code;
    std::string m_key_name;
    std::string m_message;
};

} // namespace stagedag
