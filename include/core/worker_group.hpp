#pragma once

#include <thread>
#include <utility>
#include <vector>

namespace droidpack {

// Threads started through spawn() are joined when the group goes out of
// scope, so an exception between two spawns never destroys a joinable thread.
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { joinAll(); }

    WorkerGroup(const WorkerGroup &) = delete;
    WorkerGroup &operator=(const WorkerGroup &) = delete;

    template <typename Fn>
    void spawn(Fn &&fn) {
        workers_.emplace_back(std::forward<Fn>(fn));
    }

    void joinAll() {
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
};

} // namespace droidpack
