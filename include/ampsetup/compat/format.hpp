/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro. When the
 * standard library does not ship <format> (libstdc++ before GCC 13), the fmt
 * library is used instead.
 *
 * Usage:
 *   #include <ampsetup/compat/format.hpp>
 *   auto s = ampsetup::compat::format("Creating role {}", name);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define AMPSETUP_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define AMPSETUP_HAS_STD_FORMAT 1
#else
    #define AMPSETUP_HAS_STD_FORMAT 0
#endif

#if AMPSETUP_HAS_STD_FORMAT
    #include <format>
    namespace ampsetup::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace ampsetup::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
