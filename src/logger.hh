#pragma once

#include "chunkstore.types.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace chunkstore {
class Logger
{
  public:
    static void set_log_level(ChunkStoreLogLevel level);
    static ChunkStoreLogLevel get_log_level();

    template<typename... Args>
    static std::string log(ChunkStoreLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        std::string prefix;
        auto stream = &std::cout;

        switch (level) {
            case ChunkStoreLogLevel_Debug:
                prefix = "[DEBUG] ";
                break;
            case ChunkStoreLogLevel_Info:
                prefix = "[INFO] ";
                break;
            case ChunkStoreLogLevel_Warning:
                prefix = "[WARNING] ";
                stream = &std::cerr;
                break;
            default:
                prefix = "[ERROR] ";
                stream = &std::cerr;
                break;
        }

        fs::path filepath(file);
        std::string filename = filepath.filename().string();

        std::ostringstream ss;
        ss << get_timestamp_() << " " << prefix << filename << ":" << line
           << " " << func << ": ";

        format_arg_(ss, std::forward<Args>(args)...);

        std::string message = ss.str();

        // the message is still returned when suppressed, so EXPECT can throw it
        if (level >= current_level_) {
            std::scoped_lock lock(log_mutex_);
            *stream << message << std::endl;
        }

        return message;
    }

  private:
    static ChunkStoreLogLevel current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream&) {} // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static std::string get_timestamp_();
};
} // namespace chunkstore

#define LOG_DEBUG(...)                                                         \
    chunkstore::Logger::log(                                                   \
      ChunkStoreLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    chunkstore::Logger::log(                                                   \
      ChunkStoreLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    chunkstore::Logger::log(                                                   \
      ChunkStoreLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    chunkstore::Logger::log(                                                   \
      ChunkStoreLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
