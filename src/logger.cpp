#include "logger.hh"
#include "chunkstore.hh"

#include <chrono>
#include <ctime>
#include <iomanip>

ChunkStoreLogLevel chunkstore::Logger::current_level_ = ChunkStoreLogLevel_Info;
std::mutex chunkstore::Logger::log_mutex_{};

void
chunkstore::Logger::set_log_level(ChunkStoreLogLevel level)
{
    current_level_ = level;
}

ChunkStoreLogLevel
chunkstore::Logger::get_log_level()
{
    return current_level_;
}

std::string
chunkstore::Logger::get_timestamp_()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
              1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count();

    return ss.str();
}

void
chunkstore::set_log_level(ChunkStoreLogLevel level)
{
    Logger::set_log_level(level);
}

ChunkStoreLogLevel
chunkstore::get_log_level()
{
    return Logger::get_log_level();
}
