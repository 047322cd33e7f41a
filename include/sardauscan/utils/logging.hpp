#pragma once

#include <cstdio>
#include <fmt/color.h>
#include <fmt/format.h>

#define SDS_INFO(...) fmt::print("[Info] {}\n", fmt::format(__VA_ARGS__))
#define SDS_WARN(...) fmt::print(stderr, "[Warn] {}\n", fmt::format(fmt::fg(fmt::terminal_color::yellow), __VA_ARGS__))
#define SDS_ERROR(...) fmt::print(stderr, "[Error] {}\n", fmt::format(fmt::fg(fmt::terminal_color::red), __VA_ARGS__))

//-------------------------
    // ASSERTS
//-------------------------

// Asserts will raise SIGTRAP if condition fails. If you have a debugger, that will stop it in the appropriate line. Otherwise, the program ends.
#if SDS_ENABLE_ASSERTS
#include <signal.h>
#define SDS_ASSERT_MSG(cnd, ...)                                                                                         \
    {                                                                                                                    \
        if (!(cnd))                                                                                                      \
        {                                                                                                                \
            SDS_ERROR("{0}:     At {1}",                                                                                 \
                      fmt::format(                                                                                       \
                          fmt::bg(fmt::terminal_color::red) | fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold, \
                          fmt::format(__VA_ARGS__)),                                                                     \
                      fmt::format(fmt::emphasis::bold, "{0}:{1}", __FILE__, __LINE__));                                  \
            raise(SIGTRAP);                                                                                              \
        }                                                                                                                \
    }

#define SDS_ASSERT_BLOCK(...) __VA_ARGS__
#else

#define SDS_ASSERT_MSG(cnd, ...)
#define SDS_ASSERT_BLOCK(...)

#endif

#define SDS_ASSERT(cnd) SDS_ASSERT_MSG(cnd, "")
