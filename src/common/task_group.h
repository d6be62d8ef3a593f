/*******************************************************************************
    Project: Network Speed Test (UDP/TCP Throughput Measurement)
    Authors: Talif Pathan, Mohamed Samir Shafat Khan
    Course: CS6650 Scalable Distributed Systems SEC 04 Fall 2025 [BOS-1-TR]
    Date: November 27, 2025

    File: task_group.h

    Description:
        A group of concurrently running tasks that all produce the same
        result type. Each spawn() starts one thread (std::launch::async)
        and keeps its future; join_all() waits for every task and returns
        the results in spawn order.

        The client uses TaskGroup<TransferResult> to run N TCP and M UDP
        transfers in parallel and collect their measurements as values.

    Usage:
        TaskGroup<TransferResult> group;
        for (int i = 1; i <= tcp_count; ++i) {
            group.spawn([=]() { return run_tcp_transfer(..., i); });
        }
        std::vector<TransferResult> results = group.join_all();

    Exceptions:
        An exception escaping a task is captured by its future and rethrown
        from join_all() after all other tasks have finished. Transfer tasks
        catch their own errors, so in practice join_all() does not throw.

    Lifetime:
        The destructor waits for tasks that were never joined (std::future
        from std::async blocks in its destructor), so a group going out of
        scope never leaves a thread behind.

*******************************************************************************/

#ifndef TASK_GROUP_H
#define TASK_GROUP_H

#include <future>
#include <utility>
#include <vector>
#include <exception>

namespace netspeed {

template <typename Result>
class TaskGroup {
private:
    std::vector<std::future<Result>> futures_;

public:
    TaskGroup() = default;

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    template <typename Task>
    void spawn(Task&& task) {
        futures_.push_back(std::async(std::launch::async, std::forward<Task>(task)));
    }

    size_t size() const { return futures_.size(); }

    // Waits for every task. The group is empty afterwards and can be reused.
    std::vector<Result> join_all() {
        std::vector<Result> results;
        results.reserve(futures_.size());

        // Wait for everything first so one failing task never leaves its
        // siblings running when the exception propagates.
        for (auto& future : futures_) {
            future.wait();
        }

        std::exception_ptr first_error;
        for (auto& future : futures_) {
            try {
                results.push_back(future.get());
            } catch (...) {
                if (!first_error) first_error = std::current_exception();
            }
        }
        futures_.clear();

        if (first_error) {
            std::rethrow_exception(first_error);
        }
        return results;
    }
};

} // namespace netspeed

#endif // TASK_GROUP_H
