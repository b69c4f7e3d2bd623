#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "pshare/Config.hpp"
#include "pshare/Logger.hpp"
#include "pshare/Node.hpp"

using namespace pshare;

static std::atomic<bool> gShouldTerminate{false};

static void onSignal(int){ gShouldTerminate.store(true); }

static int usage(){
    std::cerr << "Usage: peerProcess <config> [run | list | upload <name> | get <id>]\n";
    return 1;
}

int main(int argc, char** argv){
    try {
        if (argc < 2) return usage();
        std::string command = argc >= 3 ? argv[2] : "run";
        if ((command=="upload" || command=="get") && argc < 4) return usage();

        NodeConfig cfg = NodeConfig::fromFile(argv[1]);
        Logger logger(cfg.logFile, cfg.logLevel);
        logger.info("peerProcess starting, tracker " + cfg.trackerHost + ":" + std::to_string(cfg.trackerPort));

        Node node(cfg, logger);
        node.start();

        int status = 0;
        if (command=="run") {
            std::signal(SIGINT, onSignal);
            std::signal(SIGTERM, onSignal);
            while (!gShouldTerminate.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            logger.info("Shutting down peer on port " + std::to_string(node.port()));
        } else if (command=="list") {
            for (const auto& info : node.listFiles()) {
                std::cout << info.id << "\t" << info.size << "\t" << info.name << "\n";
            }
        } else if (command=="upload") {
            auto id = node.addFile(argv[3]);
            if (id) std::cout << *id << "\n";
            else status = 1;
        } else if (command=="get") {
            status = node.getFile(std::stoi(argv[3])) ? 0 : 1;
        } else {
            node.stop();
            return usage();
        }

        node.stop();
        return status;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << "\n";
        return 2;
    }
}
