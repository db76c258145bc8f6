#ifndef PROGRESS_H
#define PROGRESS_H

#include <cstddef>
#include <functional>
#include <string>

enum class Phase {
    Parsing,
    Building,
    Populating
};

struct ProgressEvent {
    Phase phase {Phase::Parsing};
    std::size_t done {};
    std::size_t total {};
};

using ProgressObserver = std::function<void(const ProgressEvent&)>;

// Long phases poll this every cancel_poll_interval units of work.
using CancelCheck = std::function<bool()>;
constexpr std::size_t cancel_poll_interval { 1000 };

// Throttles progress for a fast producer. Within a phase the emitted counts
// never decrease and done == total is emitted exactly once. Delivery is
// best effort: no observer is fine, and a throwing observer is logged and
// ignored.
class ProgressReporter
{
public:
    static constexpr std::size_t update_steps { 100 };

    explicit ProgressReporter(ProgressObserver observer = {});

    void report(Phase phase, std::size_t done, std::size_t total);
    void finish(Phase phase, std::size_t total) { report(phase, total, total); }

    std::size_t emitted_count() const { return m_emitted_count; }

private:
    void start_phase(Phase phase, std::size_t total);
    void emit(std::size_t done);

    ProgressObserver m_observer {};
    bool m_started {false};
    Phase m_phase {Phase::Parsing};
    std::size_t m_total {};
    std::size_t m_step {1};
    std::size_t m_last_done {};
    bool m_emitted_any {false};
    bool m_finished {false};
    std::size_t m_emitted_count {};
};

const char* phase_name(Phase phase);

// "Phase 1/3: Reading and Parsing lines... 10/100"
std::string describe(const ProgressEvent& event);

#endif
