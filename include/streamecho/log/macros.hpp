#pragma once

#include "logger.hpp"

/// Logging macros with file and line information

#ifdef STREAMECHO_DEBUG
    #define STREAMECHO_LOG_DEBUG(fmt, ...) \
        ::streamecho::log::logger::instance().log( \
            ::streamecho::log::level::debug, \
            __FILE__, __LINE__, \
            fmt __VA_OPT__(,) __VA_ARGS__ \
        )
#else
    #define STREAMECHO_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define STREAMECHO_LOG_INFO(fmt, ...) \
    ::streamecho::log::logger::instance().log( \
        ::streamecho::log::level::info, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define STREAMECHO_LOG_WARNING(fmt, ...) \
    ::streamecho::log::logger::instance().log( \
        ::streamecho::log::level::warning, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define STREAMECHO_LOG_ERROR(fmt, ...) \
    ::streamecho::log::logger::instance().log( \
        ::streamecho::log::level::error, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )
