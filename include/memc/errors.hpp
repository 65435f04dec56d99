#pragma once

#include <chrono>
#include <string>
#include <variant>

namespace memc
{
    namespace errors
    {
        /// The key is empty, too long, or contains whitespace or control characters.
        struct KeyNotValid
        {
            std::string message;  ///< Why the key was rejected.
        };

        /// The ttl cannot be sent as a non-negative 32-bit count of whole seconds.
        struct ExpirationNotValid
        {
            std::chrono::nanoseconds duration;  ///< The rejected duration.
        };

        /// A value could not be converted to bytes.
        struct EncodingFailure
        {
            std::string message;  ///< The error message.
        };

        /// Bytes could not be converted to the requested type.
        struct DecodingFailure
        {
            std::string message;  ///< The error message.
        };

        /// The key is not present in the cache. This is an expected outcome of a retrieval.
        struct CacheMiss
        {
        };

        /// The cache server could not be reached or rejected the command.
        struct TransportFailure
        {
            std::string message;  ///< The error message.
        };
    }  // namespace errors

    using Error = std::variant<errors::KeyNotValid,
                               errors::ExpirationNotValid,
                               errors::EncodingFailure,
                               errors::DecodingFailure,
                               errors::CacheMiss,
                               errors::TransportFailure>;

    /// Returns true if the error is a cache miss rather than a failure.
    inline bool isCacheMiss(Error const& error)
    {
        return std::holds_alternative<errors::CacheMiss>(error);
    }
}  // namespace memc
