/**
 * @file log.hpp
 * @brief formflow logging facade - spdlog backend behind the logger:: call-site API
 *
 * Usage Example:
 *   #include <formflow/core/log.hpp>
 *
 *   // Initialize (optional, no need to call if using default config)
 *   logger::init("myapp", logger::level::debug);
 *
 *   // Basic logging (automatically captures file name and line number at call site)
 *   logger::info("Hello {}", "world");
 *   logger::debug("value = {}", 42);
 *   logger::warn("Warning message");
 *   logger::error("Error: {}", err.message());
 *
 *   // With file output
 *   logger::init_with_file("myapp", "logs/app.log");
 */
#pragma once

#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace logger {

    // ============================================================================
    // Log Level
    // ============================================================================
    enum class level {
        trace    = 0,
        debug    = 1,
        info     = 2,
        warn     = 3,
        error    = 4,
        critical = 5,
        off      = 6
    };

    // ============================================================================
    // Internal Implementation
    // ============================================================================
    namespace detail {
        inline constexpr const char* default_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v";

        inline auto to_spdlog(level lv) noexcept -> spdlog::level::level_enum {
            switch (lv) {
                case level::trace:    return spdlog::level::trace;
                case level::debug:    return spdlog::level::debug;
                case level::info:     return spdlog::level::info;
                case level::warn:     return spdlog::level::warn;
                case level::error:    return spdlog::level::err;
                case level::critical: return spdlog::level::critical;
                default:              return spdlog::level::off;
            }
        }

        inline std::mutex& log_mutex() {
            static std::mutex mtx;
            return mtx;
        }

        inline auto make_console_logger(const std::string& name, level lv)
            -> std::shared_ptr<spdlog::logger>
        {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            auto lg = std::make_shared<spdlog::logger>(name, std::move(sink));
            lg->set_pattern(default_pattern);
            lg->set_level(to_spdlog(lv));
            return lg;
        }

        /// Not registered with spdlog's global registry, so repeated init() never collides
        inline std::shared_ptr<spdlog::logger>& instance() {
            static std::shared_ptr<spdlog::logger> lg = make_console_logger("formflow", level::info);
            return lg;
        }

        inline auto current() -> std::shared_ptr<spdlog::logger> {
            std::lock_guard<std::mutex> lock(log_mutex());
            return instance();
        }

        inline auto to_source_loc(const std::source_location& loc) noexcept -> spdlog::source_loc {
            return {loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
        }

        template<typename... Args>
        inline void write_log(level lv, const std::source_location& loc,
                              fmt::format_string<Args...> fmt, Args&&... args) {
            auto lg = current();
            lg->log(to_source_loc(loc), to_spdlog(lv), fmt, std::forward<Args>(args)...);
        }

        inline void write_log(level lv, std::string_view message, const std::source_location& loc) {
            auto lg = current();
            lg->log(to_source_loc(loc), to_spdlog(lv), "{}", message);
        }

        /// Embed source_location in format string parameters so a
        /// "variadic pack + trailing default source_location" can coexist
        template<typename... Args>
        struct fmt_loc {
            fmt::format_string<Args...> fmt;
            std::source_location loc;

            template<typename S>
            consteval fmt_loc(const S& s,
                const std::source_location& l = std::source_location::current())
                : fmt(s), loc(l) {}
        };
    }

    // ============================================================================
    // Initialization Functions
    // ============================================================================

    /**
     * @brief Initialize logging system (console output only)
     * @param name Logger name
     * @param lv Log level
     */
    inline void init(const std::string& name = "formflow", level lv = level::info) {
        auto lg = detail::make_console_logger(name, lv);
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        detail::instance() = std::move(lg);
    }

    /**
     * @brief Initialize logging system (console + file)
     * @param name Logger name
     * @param filepath Log file path
     * @param lv Log level
     */
    inline void init_with_file(const std::string& name,
                               const std::string& filepath,
                               level lv = level::info) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath);
        auto lg = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{std::move(console), std::move(file)});
        lg->set_pattern(detail::default_pattern);
        lg->set_level(detail::to_spdlog(lv));
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        detail::instance() = std::move(lg);
    }

    // ============================================================================
    // Configuration Functions
    // ============================================================================

    inline void set_level(level lv) {
        detail::current()->set_level(detail::to_spdlog(lv));
    }

    inline void flush() {
        detail::current()->flush();
    }

    /// Drops file sinks; later calls log to the console only
    inline void shutdown() {
        auto lg = detail::make_console_logger("formflow", level::info);
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        detail::instance()->flush();
        detail::instance() = std::move(lg);
    }

    // ============================================================================
    // Log Output Functions (fmt format strings + std::source_location)
    // Uses struct + template constructor trick to allow source_location default parameter to coexist with variadic templates
    // ============================================================================

    struct trace {
        template<typename... Args>
        trace(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log<Args...>(level::trace, fl.loc, fl.fmt, std::forward<Args>(args)...);
        }
        trace(std::string_view msg,
              const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::trace, msg, loc);
        }
    };

    struct debug {
        template<typename... Args>
        debug(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log<Args...>(level::debug, fl.loc, fl.fmt, std::forward<Args>(args)...);
        }
        debug(std::string_view msg,
              const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::debug, msg, loc);
        }
    };

    struct info {
        template<typename... Args>
        info(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log<Args...>(level::info, fl.loc, fl.fmt, std::forward<Args>(args)...);
        }
        info(std::string_view msg,
             const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::info, msg, loc);
        }
    };

    struct warn {
        template<typename... Args>
        warn(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log<Args...>(level::warn, fl.loc, fl.fmt, std::forward<Args>(args)...);
        }
        warn(std::string_view msg,
             const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::warn, msg, loc);
        }
    };

    struct error {
        template<typename... Args>
        error(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log<Args...>(level::error, fl.loc, fl.fmt, std::forward<Args>(args)...);
        }
        error(std::string_view msg,
              const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::error, msg, loc);
        }
    };

    struct critical {
        template<typename... Args>
        critical(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log<Args...>(level::critical, fl.loc, fl.fmt, std::forward<Args>(args)...);
        }
        critical(std::string_view msg,
                 const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::critical, msg, loc);
        }
    };

} // namespace logger
