#pragma once

/// @file client_result.hpp
/// @brief ClientResult<T> type alias for client-core error handling.

#include "cgc/core/result.hpp"
#include "cgc/foundation/client_error.hpp"

namespace cgc::foundation {

/// Result type specialized with ClientError for client operations.
///
/// Example:
/// @code
///   ClientResult<Endpoint> parse(std::string_view address) {
///       if (address.empty()) {
///           return ClientResult<Endpoint>::err(
///               ClientError(ErrorCode::InvalidConfig, "empty server address"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using ClientResult = cgc::Result<T, ClientError>;

/// Shorthand for building an error result with code and message.
template <typename T>
[[nodiscard]] ClientResult<T> makeError(ErrorCode code, std::string message) {
    return ClientResult<T>::err(ClientError(code, std::move(message)));
}

}  // namespace cgc::foundation
