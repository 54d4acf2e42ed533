#pragma once

#include <iostream>
#include <mutex>

namespace droidpack {

class Context {
public:
    explicit Context(bool verbose = true) : verbose_(verbose) {}

    template <typename... Args>
    void log(const Args &...args) const {
        if (!verbose_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex());
        (std::cout << ... << args) << '\n';
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        std::lock_guard<std::mutex> lock(mutex());
        std::cerr << "[warn] ";
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void error(const Args &...args) const {
        std::lock_guard<std::mutex> lock(mutex());
        std::cerr << "[error] ";
        (std::cerr << ... << args) << '\n';
    }

    bool verbose() const { return verbose_; }

private:
    // Placement workers log from several threads.
    static std::mutex &mutex() {
        static std::mutex instance;
        return instance;
    }

    bool verbose_;
};

} // namespace droidpack
