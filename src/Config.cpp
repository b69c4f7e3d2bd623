#include "pshare/Config.hpp"

#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace pshare {

    static std::string trim(const std::string& s){
        auto a = s.find_first_not_of(" \t\r\n");
        auto b = s.find_last_not_of(" \t\r\n");
        if (a==std::string::npos) return "";
        return s.substr(a, b-a+1);
    }

    // Calls fn(key, value) for every "Key Value" line. The value is the rest of the line.
    static void forEachEntry(const std::string& path,
                             const std::function<void(const std::string&, const std::string&)>& fn) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("Failed to open config file: " + path);
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0]=='#') continue;
            std::istringstream iss(line);
            std::string key, val;
            iss >> key;
            std::getline(iss, val);
            fn(key, trim(val));
        }
    }

    static uint16_t toPort(const std::string& key, const std::string& val){
        int p = std::stoi(val);
        if (p < 0 || p > 65535) throw std::runtime_error(key + " out of range: " + val);
        return static_cast<uint16_t>(p);
    }

    NodeConfig NodeConfig::fromFile(const std::string& path) {
        NodeConfig c;
        forEachEntry(path, [&c](const std::string& key, const std::string& val){
            if (key=="TrackerHost") c.trackerHost = val;
            else if (key=="TrackerPort") c.trackerPort = toPort(key, val);
            else if (key=="ListenPort") c.listenPort = toPort(key, val);
            else if (key=="HomeDir") c.homeDir = val;
            else if (key=="PartSize") c.partSizeBytes = std::stoll(val);
            else if (key=="HeartbeatIntervalSec") c.heartbeatIntervalSec = std::stoi(val);
            else if (key=="WorkerThreads") c.workerThreads = std::stoi(val);
            else if (key=="MaxQueuedTasks") c.maxQueuedTasks = std::stoi(val);
            else if (key=="IoTimeoutSec") c.ioTimeoutSec = std::stoi(val);
            else if (key=="LogFile") c.logFile = val;
            else if (key=="LogLevel") c.logLevel = parseLogLevel(val);
        });
        c.validate();
        return c;
    }

    void NodeConfig::validate() const {
        if (partSizeBytes <= 0) throw std::runtime_error("PartSize must be positive");
        if (heartbeatIntervalSec <= 0) throw std::runtime_error("HeartbeatIntervalSec must be positive");
        if (workerThreads <= 0) throw std::runtime_error("WorkerThreads must be positive");
        if (maxQueuedTasks <= 0) throw std::runtime_error("MaxQueuedTasks must be positive");
        if (ioTimeoutSec < 0) throw std::runtime_error("IoTimeoutSec must not be negative");
        if (trackerHost.empty()) throw std::runtime_error("TrackerHost must be set");
    }

    TrackerConfig TrackerConfig::fromFile(const std::string& path) {
        TrackerConfig c;
        forEachEntry(path, [&c](const std::string& key, const std::string& val){
            if (key=="Port") c.port = toPort(key, val);
            else if (key=="WorkerThreads") c.workerThreads = std::stoi(val);
            else if (key=="MaxQueuedTasks") c.maxQueuedTasks = std::stoi(val);
            else if (key=="SeedTtlSec") c.seedTtlSec = std::stoi(val);
            else if (key=="IoTimeoutSec") c.ioTimeoutSec = std::stoi(val);
            else if (key=="LogFile") c.logFile = val;
            else if (key=="LogLevel") c.logLevel = parseLogLevel(val);
        });
        c.validate();
        return c;
    }

    void TrackerConfig::validate() const {
        if (workerThreads <= 0) throw std::runtime_error("WorkerThreads must be positive");
        if (maxQueuedTasks <= 0) throw std::runtime_error("MaxQueuedTasks must be positive");
        if (seedTtlSec <= 0) throw std::runtime_error("SeedTtlSec must be positive");
        if (ioTimeoutSec < 0) throw std::runtime_error("IoTimeoutSec must not be negative");
    }

} // namespace pshare
