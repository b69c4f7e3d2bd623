#ifndef PSHARE_LOGGER_HPP
#define PSHARE_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace pshare {

    enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

    // Parses "DEBUG", "INFO", "WARN" or "ERROR". Throws std::runtime_error otherwise.
    LogLevel parseLogLevel(const std::string& name);

    class Logger {
    public:
        // Empty path logs to stderr.
        explicit Logger(const std::string& path, LogLevel minLevel = LogLevel::INFO);
        ~Logger();

        void debug(const std::string& msg);
        void info(const std::string& msg);
        void warn(const std::string& msg);
        void error(const std::string& msg);


        // Catalog events
        void onFileRegistered(int fileId, const std::string& name, long long size);
        void onFileNotFound(const std::string& what);

        // Tracker events
        void onHeartbeatRejected();
        void onNoSources(int fileId);

        // Transfer events
        void onSeedRefused(int fileId, const std::string& seed);
        void onSeedRejected(int fileId, const std::string& seed, const std::string& why);
        void onTaskFailed(int fileId, const std::string& seed, const std::string& why);
        void onDownloadedPart(int fileId, int partIndex, const std::string& seed, size_t ownedParts, size_t totalParts);
        void onDownloadComplete(int fileId, const std::string& path);
        void onDownloadPartial(int fileId, size_t ownedParts, size_t totalParts);

        // Serving events
        void onProtocolFault(const std::string& remote, const std::string& why);

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        std::ofstream out_;
        bool toStderr_ = false;
        LogLevel minLevel_;
        std::mutex mtx_;
        static std::string nowTs();
        void write(LogLevel level, const std::string& msg);
    };

} // namespace pshare

#endif // PSHARE_LOGGER_HPP
