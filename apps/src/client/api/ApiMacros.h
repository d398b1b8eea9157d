#pragma once

#include <string_view>

namespace RNodeClient {

/**
 * @brief Define the wire name of an API namespace.
 *
 * Usage: DEFINE_API_NAME("Repl.Run") at the top of the API namespace.
 */
#define DEFINE_API_NAME(Literal)                          \
    inline constexpr std::string_view api_name = Literal; \
    static_assert(!api_name.empty(), "API name must not be empty")

/**
 * @brief Add name() method to Command or Okay structs.
 *
 * Usage: API_COMMAND_NAME() inside Command/Okay struct definitions.
 * Returns the api_name from the enclosing namespace.
 */
#define API_COMMAND_NAME()                   \
    static constexpr std::string_view name() \
    {                                        \
        return api_name;                     \
    }

/**
 * @brief Add name() and the OkayType alias to a Command struct.
 *
 * Usage: API_COMMAND() inside the Command struct, after forward declaring Okay.
 */
#define API_COMMAND()      \
    API_COMMAND_NAME()     \
    using OkayType = Okay;

/**
 * @brief Define standard API typedefs at namespace level.
 *
 * Usage: API_STANDARD_TYPES() after Command and Okay struct definitions.
 * Creates OkayType and Response typedefs.
 */
#define API_STANDARD_TYPES() \
    using OkayType = Okay;   \
    using Response = Result<OkayType, ApiError>;

} // namespace RNodeClient
