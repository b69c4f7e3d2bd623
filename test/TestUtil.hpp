#ifndef PSHARE_TEST_UTIL_HPP
#define PSHARE_TEST_UTIL_HPP

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <utility>

#include <sys/socket.h>

#include "pshare/Net.hpp"

// Like assert, but also active in release builds.
#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::cerr << __FILE__ << ":" << __LINE__ << ": CHECK failed: " #cond "\n"; \
            std::exit(1); \
        } \
    } while (0)

// Passes if expr throws an exception of type ex.
#define CHECK_THROWS(expr, ex) \
    do { \
        bool thrown_ = false; \
        try { (void)(expr); } catch (const ex&) { thrown_ = true; } \
        if (!thrown_) { \
            std::cerr << __FILE__ << ":" << __LINE__ << ": expected " #ex " from " #expr "\n"; \
            std::exit(1); \
        } \
    } while (0)

namespace testutil {

    namespace fs = std::filesystem;

    // Fresh directory under the system temp dir, removed on destruction.
    struct TempDir {
        fs::path path;

        explicit TempDir(const std::string& tag) {
            static std::atomic<int> counter{0};
            auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path = fs::temp_directory_path() /
                   ("pshare_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
            fs::create_directories(path);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;
    };

    inline std::string randomBytes(size_t n, unsigned seed) {
        std::mt19937 rng(seed);
        std::string s(n, '\0');
        for (auto& c : s) c = static_cast<char>(rng() & 0xFF);
        return s;
    }

    inline void writeFile(const fs::path& path, const std::string& data) {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    inline std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Two connected in-process connections.
    inline std::pair<pshare::Connection, pshare::Connection> connectionPair() {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) throw pshare::NetError("socketpair failed");
        return {pshare::Connection(fds[0], pshare::Endpoint{"local", 1}),
                pshare::Connection(fds[1], pshare::Endpoint{"local", 2})};
    }

    // Waits until pred() holds or the timeout passes.
    template<class P>
    bool eventually(P pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

} // namespace testutil

#endif // PSHARE_TEST_UTIL_HPP
