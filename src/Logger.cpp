#include "pshare/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace pshare {

    static const char* levelName(LogLevel level){
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
        }
        return "INFO";
    }

    LogLevel parseLogLevel(const std::string& name){
        if (name=="DEBUG") return LogLevel::DEBUG;
        if (name=="INFO") return LogLevel::INFO;
        if (name=="WARN") return LogLevel::WARN;
        if (name=="ERROR") return LogLevel::ERROR;
        throw std::runtime_error("Unknown log level: " + name);
    }

    Logger::Logger(const std::string& path, LogLevel minLevel)
    : toStderr_(path.empty()), minLevel_(minLevel) {
        if (!toStderr_) {
            out_.open(path, std::ios::app);
            if (!out_) throw std::runtime_error("Failed to open log file: " + path);
        }
    }

    Logger::~Logger(){ if (out_.is_open()) out_.flush(); }

    std::string Logger::nowTs(){
        using namespace std::chrono;
        auto t = system_clock::to_time_t(system_clock::now());
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    void Logger::write(LogLevel level, const std::string& msg){
        std::lock_guard<std::mutex> lk(mtx_);
        if (level < minLevel_) return;
        std::ostream& os = toStderr_ ? std::cerr : static_cast<std::ostream&>(out_);
        os << "[" << nowTs() << "] [" << levelName(level) << "] " << msg << "\n";
        os.flush();
    }

    void Logger::debug(const std::string& msg){ write(LogLevel::DEBUG, msg); }
    void Logger::info(const std::string& msg){ write(LogLevel::INFO, msg); }
    void Logger::warn(const std::string& msg){ write(LogLevel::WARN, msg); }
    void Logger::error(const std::string& msg){ write(LogLevel::ERROR, msg); }

    void Logger::onFileRegistered(int fileId, const std::string& name, long long size){
        info("Registered file " + name + " (" + std::to_string(size) +
             " bytes) with id " + std::to_string(fileId) + ".");
    }

    void Logger::onFileNotFound(const std::string& what){
        warn("File " + what + " not found.");
    }

    void Logger::onHeartbeatRejected(){
        warn("Tracker did not accept the update.");
    }

    void Logger::onNoSources(int fileId){
        warn("No seeds found for file " + std::to_string(fileId) + ".");
    }

    void Logger::onSeedRefused(int fileId, const std::string& seed){
        warn("Seed " + seed + " refused the connection for file " + std::to_string(fileId) + ".");
    }

    void Logger::onSeedRejected(int fileId, const std::string& seed, const std::string& why){
        warn("Could not schedule download of file " + std::to_string(fileId) +
             " from " + seed + ": " + why);
    }

    void Logger::onTaskFailed(int fileId, const std::string& seed, const std::string& why){
        error("Download of file " + std::to_string(fileId) + " from " + seed + " failed: " + why);
    }

    void Logger::onDownloadedPart(int fileId, int partIndex, const std::string& seed,
                                  size_t ownedParts, size_t totalParts){
        // File [id] has downloaded the part [index] from [seed]. Now it has [n] of [total] parts.
        info("File " + std::to_string(fileId) +
             " has downloaded the part " + std::to_string(partIndex) +
             " from " + seed +
             ". Now it has " + std::to_string(ownedParts) +
             " of " + std::to_string(totalParts) + " parts.");
    }

    void Logger::onDownloadComplete(int fileId, const std::string& path){
        info("Successfully loaded file " + std::to_string(fileId) + " into " + path + ".");
    }

    void Logger::onDownloadPartial(int fileId, size_t ownedParts, size_t totalParts){
        warn("File " + std::to_string(fileId) + " is incomplete after download: " +
             std::to_string(ownedParts) + " of " + std::to_string(totalParts) + " parts.");
    }

    void Logger::onProtocolFault(const std::string& remote, const std::string& why){
        warn("Closing connection from " + remote + ": " + why);
    }

} // namespace pshare
