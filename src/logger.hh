#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 * 
 * Project BEATWATCH
 */

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

/*
 * This Logger class uses spdlog library, a simple header-only logging library for C++.
 */

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

namespace beatwatch {

    const char* const LOG_LEVEL_ENV = "BEATWATCH_LOG_LEVEL";

    /// @brief Console level of a component, taken from BEATWATCH_LOG_LEVEL.
    ///  The variable holds comma separated entries, either a bare level for every
    ///  component or <name>=<level> for one, e.g. "warn,BEATWATCH/UDP=debug".
    ///  A named entry wins over a bare one. Unknown levels are skipped.
    /// @param arg_lgr_name
    /// @param arg_default Level when nothing applies.
    /// @return
    inline spdlog::level::level_enum resolveLogLevel(const std::string& arg_lgr_name, spdlog::level::level_enum arg_default) {

        const char* env_value = std::getenv(LOG_LEVEL_ENV);
        if (env_value == nullptr)
            return arg_default;

        spdlog::level::level_enum any_level = arg_default;
        bool named = false;
        spdlog::level::level_enum named_level = arg_default;

        std::stringstream entries(env_value);
        std::string entry;

        while (std::getline(entries, entry, ',')) {
            size_t eq = entry.find('=');

            std::string name = (eq == std::string::npos) ? "" : entry.substr(0, eq);
            std::string level_str = (eq == std::string::npos) ? entry : entry.substr(eq + 1);

            spdlog::level::level_enum level = spdlog::level::from_str(level_str);
            if ((level == spdlog::level::off) && (level_str != "off"))
                continue;

            if (name.empty())
                any_level = level;
            else if (name == arg_lgr_name) {
                named = true;
                named_level = level;
            }
        }

        return named ? named_level : any_level;
    }

    /// @brief Console and file logger, one per component.
    class Logger {
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt>    console_lgr;    // Prints out to the console.
        std::shared_ptr<spdlog::sinks::basic_file_sink_mt>      file_lgr;       // Prints out to the file.

        std::unique_ptr<spdlog::logger>                         bw_lgr;

    public:
        Logger(std::string arg_lgr_name, std::string arg_filen = "beatwatch.log") {
            const std::string formatted_log = "[%H:%M:%S.%e] [%n:%^%l%$] %v";

            // Generate both file and console logger.
            console_lgr = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            file_lgr    = std::make_shared<spdlog::sinks::basic_file_sink_mt>(arg_filen, true);

            // File and Console logger uses the same format.
            console_lgr->set_pattern(formatted_log);
            file_lgr->set_pattern(formatted_log);

            file_lgr->set_level(spdlog::level::debug);      // File keeps the debug trail.

            bw_lgr = std::unique_ptr<spdlog::logger>(new spdlog::logger(arg_lgr_name, {console_lgr, file_lgr}));
            bw_lgr->set_level(spdlog::level::debug);

            setConsoleLevel(resolveLogLevel(arg_lgr_name, spdlog::level::info));
        }

        // The logger itself is lowered along, so trace reaches the console.
        void setConsoleLevel(spdlog::level::level_enum arg_level) {
            console_lgr->set_level(arg_level);
            if (arg_level < bw_lgr->level())
                bw_lgr->set_level(arg_level);
        }

        spdlog::level::level_enum getConsoleLevel() const { return console_lgr->level(); }

        spdlog::logger* getLogger() { return bw_lgr.get(); }
    };

    class LoggerFileOnly {
        std::shared_ptr<spdlog::sinks::basic_file_sink_mt>      file_lgr;       // Prints out to the file.

        std::unique_ptr<spdlog::logger>                         bw_lgr;

    public:
        LoggerFileOnly(std::string arg_lgr_name, std::string arg_filen = "beatwatch.log") {

            // Not registered to the spdlog registry, so the same name may be
            // instantiated more than once (e.g. per runner).
            file_lgr = std::make_shared<spdlog::sinks::basic_file_sink_mt>(arg_filen, true);
            file_lgr->set_pattern("[%H:%M:%S.%e] [%n:%l] %v");

            bw_lgr = std::unique_ptr<spdlog::logger>(new spdlog::logger(arg_lgr_name, file_lgr));
            bw_lgr->set_level(resolveLogLevel(arg_lgr_name, spdlog::level::info));
        }

        void setLevel(spdlog::level::level_enum arg_level) { bw_lgr->set_level(arg_level); }
        spdlog::level::level_enum getLevel() const { return bw_lgr->level(); }

        spdlog::logger* getLogger() { return bw_lgr.get(); }
    };

}

// Access loggers using the macros defined below.
#define BEATWATCH_LOGGER_INFO(INSTANCE, ...)        do {(INSTANCE).getLogger()->info(__VA_ARGS__); } while(0)
#define BEATWATCH_LOGGER_DEBUG(INSTANCE, ...)       do {(INSTANCE).getLogger()->debug(__VA_ARGS__); } while(0)
#define BEATWATCH_LOGGER_WARN(INSTANCE, ...)        do {(INSTANCE).getLogger()->warn(__VA_ARGS__); } while(0)
#define BEATWATCH_LOGGER_ERROR(INSTANCE, ...)       do {(INSTANCE).getLogger()->error(__VA_ARGS__); } while(0)
