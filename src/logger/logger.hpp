#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string_view>
#include <system_error>

enum class LogType
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Critical = 4,
};

class Logger
{
   public:
    static std::string GetNowString()
    {
        const auto now = std::chrono::system_clock::now();
        return fmt::format("{:%y%m%d-%H:%M:%S}", now);
    }

    // applies to every logger, messages below it are dropped
    static inline std::atomic<LogType> min_level = LogType::Debug;

    const std::string log_folder = "./logs";

    explicit Logger(std::string_view field_str) : field(field_str)
    {
        std::string folder_name = fmt::format("{}/{}", log_folder, field_str);
        std::string file_name = folder_name + "/" + GetNowString();

        std::error_code ec;
        std::filesystem::create_directories(folder_name, ec);
        if (ec)
        {
            fmt::print(stderr, "Failed to create log folder {}: {}\n",
                       folder_name, ec.message());
            return;
        }

        log_stream.open(file_name, std::ios::app);
    }

    mutable std::ofstream log_stream;
    mutable std::mutex log_mutex;

    template <LogType type, typename... T>
    inline void Log(fmt::format_string<T...> message, T&&... args) const
    {
        if (type < min_level.load(std::memory_order_relaxed)) return;

        using enum fmt::color;
        std::scoped_lock lock(log_mutex);
        fmt::text_style color;
        const char* prefix = nullptr;

        switch (type)
        {
            case LogType::Debug:
                color = fg(green);
                prefix = "DEBUG";
                break;
            case LogType::Info:
                color = fg(dodger_blue);
                prefix = "INFO";
                break;
            case LogType::Warn:
                color = fg(yellow);
                prefix = "WARN";
                break;
            case LogType::Error:
                color = fg(red);
                prefix = "ERROR";
                break;
            case LogType::Critical:
                color = fg(red) | fmt::emphasis::bold;
                prefix = "CRITICAL";
                break;
        }

        const std::string line =
            fmt::format(message, std::forward<T>(args)...);

        if (log_stream.is_open())
        {
            fmt::print(log_stream, "{} {} [{}] {}\n", GetNowString(), prefix,
                       field, line);
            log_stream.flush();
        }

#ifdef DEBUG
        fmt::print(color, "{} {} [{}] ", GetNowString(), prefix, field);
        fmt::print("{}\n", line);
#else
        if constexpr (type >= LogType::Warn)
        {
            fmt::print(stderr, color, "{} [{}] ", prefix, field);
            fmt::print(stderr, "{}\n", line);
        }
#endif
    }

   private:
    const std::string field;
};

#endif
