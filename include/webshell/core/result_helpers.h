#pragma once

#include <webshell/core/types.h>

/**
 * @def WEBSHELL_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 *
 * Example:
 * @code
 * Result<void> load() {
 *     WEBSHELL_TRY(step1());
 *     WEBSHELL_TRY(step2());
 *     return {};
 * }
 * @endcode
 */
#define WEBSHELL_TRY(expr)                                                                         \
    do {                                                                                           \
        auto _webshell_try_result = (expr);                                                        \
        if (!_webshell_try_result.has_value()) {                                                   \
            return _webshell_try_result.error();                                                   \
        }                                                                                          \
    } while (0)
