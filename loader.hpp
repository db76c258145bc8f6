#ifndef LOADER_H
#define LOADER_H

#include "forest_builder.hpp"
#include "listing.hpp"
#include "listing_node.hpp"
#include "progress.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

struct LoadResult {
    LoadStatus status {LoadStatus::NoRootFound};
    Forest forest {};
    std::size_t line_count {};
    std::size_t item_count {};
};

// Phase 1 (parse) and phase 2 (build), synchronously.
LoadResult load_listing(const std::vector<std::string>& lines, BuildStrategy strategy,
                        ProgressReporter* progress = nullptr,
                        const CancelCheck& cancelled = {});

// Runs load_listing on a worker thread. Progress events and the finished
// forest reach the primary thread only through the dispatcher. A newer
// load() supersedes older ones: their results and progress are dropped,
// never delivered, even when already queued.
class ListingLoader
{
public:
    using Task = std::function<void()>;
    // Queues a task on the primary thread.
    using Dispatcher = std::function<void(Task)>;
    using CompletionHandler = std::function<void(LoadResult)>;

    // progress runs on the primary thread, like on_done.
    explicit ListingLoader(Dispatcher dispatch, ProgressObserver progress = {});
    ~ListingLoader();

    ListingLoader(const ListingLoader&) = delete;
    ListingLoader& operator=(const ListingLoader&) = delete;

    // Returns the generation tag of the new load. on_done runs through the
    // dispatcher, and only if no newer load started in the meantime. Never
    // waits for the superseded worker.
    std::uint64_t load(std::vector<std::string> lines, BuildStrategy strategy,
                       CompletionHandler on_done);

    // Invalidates the in-flight load, if any.
    void cancel();

    // Blocks until every worker, superseded ones included, has finished.
    void wait();

    std::uint64_t generation() const { return m_generation->load(); }
    bool is_current(std::uint64_t generation) const { return m_generation->load() == generation; }

private:
    struct Worker {
        std::thread thread {};
        std::shared_ptr<std::atomic<bool>> finished {};
    };

    // Moves the current worker aside and joins the retired ones that are done.
    void retire_worker();

    Dispatcher m_dispatch {};
    std::shared_ptr<const ProgressObserver> m_progress {};
    // Shared with queued tasks, which may run after the loader is gone.
    std::shared_ptr<std::atomic<std::uint64_t>> m_generation {};
    Worker m_worker {};
    // Superseded workers still winding down.
    std::vector<Worker> m_retired {};
};

#endif
