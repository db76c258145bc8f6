#include "loader.hpp"

#include <exception>
#include <iostream>
#include <utility>

LoadResult load_listing(const std::vector<std::string>& lines, BuildStrategy strategy,
                        ProgressReporter* progress, const CancelCheck& cancelled)
{
    LoadResult result {};

    ParsedListing parsed = parse_listing(lines, progress, cancelled);
    result.status = parsed.status;
    result.line_count = parsed.line_count;
    result.item_count = parsed.items.size();
    if (parsed.status != LoadStatus::Ok) {
        return result;
    }

    if (cancelled && cancelled()) {
        result.status = LoadStatus::Cancelled;
        return result;
    }

    result.forest = build_forest(parsed.items, strategy, progress, cancelled);
    if (cancelled && cancelled()) {
        result.status = LoadStatus::Cancelled;
        result.forest = Forest {};
    }
    return result;
}

ListingLoader::ListingLoader(Dispatcher dispatch, ProgressObserver progress)
    : m_dispatch {std::move(dispatch)},
      m_progress {std::make_shared<const ProgressObserver>(std::move(progress))},
      m_generation {std::make_shared<std::atomic<std::uint64_t>>(0)}
{
}

ListingLoader::~ListingLoader() {
    cancel();
    wait();
}

void ListingLoader::cancel() {
    ++*m_generation;
}

void ListingLoader::wait() {
    if (m_worker.thread.joinable()) {
        m_worker.thread.join();
    }
    for (auto& worker : m_retired) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    m_retired.clear();
}

void ListingLoader::retire_worker() {
    if (m_worker.thread.joinable()) {
        m_retired.push_back(std::move(m_worker));
        m_worker = Worker {};
    }

    auto it = m_retired.begin();
    while (it != m_retired.end()) {
        if (it->finished->load()) {
            it->thread.join();
            it = m_retired.erase(it);
        }
        else {
            ++it;
        }
    }
}

std::uint64_t ListingLoader::load(std::vector<std::string> lines, BuildStrategy strategy,
                                  CompletionHandler on_done)
{
    const std::uint64_t generation = ++*m_generation;
    // The previous worker polls the generation and stops early on its own.
    retire_worker();

    auto current = m_generation;
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([current, generation, strategy, finished,
                        lines = std::move(lines),
                        on_done = std::move(on_done),
                        dispatch = m_dispatch,
                        observer = m_progress]() mutable {
        auto stale = [current, generation]() { return current->load() != generation; };

        ProgressReporter progress {[&](const ProgressEvent& event) {
            if (!*observer || !dispatch || stale()) {
                return;
            }
            dispatch([current, generation, observer, event]() {
                // Queued before a newer load started: it belongs to the old one.
                if (current->load() == generation) {
                    (*observer)(event);
                }
            });
        }};

        LoadResult result {};
        try {
            result = load_listing(lines, strategy, &progress, stale);
        }
        catch (const std::exception& e) {
            std::cerr << "Listing load failed: " << e.what() << "\n";
            result = LoadResult {};
            result.status = LoadStatus::Failed;
        }

        if (!stale() && dispatch) {
            auto shared = std::make_shared<LoadResult>(std::move(result));
            dispatch([current, generation, shared, on_done = std::move(on_done)]() {
                // A newer load may have started while this task was queued.
                if (current->load() != generation) {
                    return;
                }
                if (on_done) {
                    on_done(std::move(*shared));
                }
            });
        }

        // Free the input here so a finished worker joins without delay.
        result = LoadResult {};
        std::vector<std::string>().swap(lines);
        finished->store(true);
    });

    m_worker = Worker {std::move(thread), std::move(finished)};
    return generation;
}
