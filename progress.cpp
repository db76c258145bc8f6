#include "progress.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

ProgressReporter::ProgressReporter(ProgressObserver observer)
    : m_observer {std::move(observer)}
{
}

void ProgressReporter::start_phase(Phase phase, std::size_t total) {
    m_started = true;
    m_phase = phase;
    m_total = total;
    m_step = std::max<std::size_t>(1, total / update_steps);
    m_last_done = 0;
    m_emitted_any = false;
    m_finished = false;
}

void ProgressReporter::report(Phase phase, std::size_t done, std::size_t total) {
    if (!m_started || phase != m_phase || total != m_total) {
        start_phase(phase, total);
    }
    if (m_finished) {
        return;
    }

    done = std::min(done, m_total);
    if (m_emitted_any && done < m_last_done) {
        return;
    }

    const bool first = !m_emitted_any;
    const bool last = done == m_total;
    if (first || last || done - m_last_done >= m_step) {
        emit(done);
    }
}

void ProgressReporter::emit(std::size_t done) {
    m_emitted_any = true;
    m_last_done = done;
    if (done == m_total) {
        m_finished = true;
    }
    ++m_emitted_count;

    if (!m_observer) {
        return;
    }
    try {
        m_observer(ProgressEvent {m_phase, done, m_total});
    }
    catch (const std::exception& e) {
        std::cerr << "Progress observer failed: " << e.what() << "\n";
    }
}

const char* phase_name(Phase phase) {
    switch (phase) {
    case Phase::Parsing:
        return "Parsing";
    case Phase::Building:
        return "Building";
    case Phase::Populating:
        return "Populating";
    }
    return "Unknown";
}

std::string describe(const ProgressEvent& event) {
    std::string label {};
    switch (event.phase) {
    case Phase::Parsing:
        label = "Phase 1/3: Reading and Parsing lines...";
        break;
    case Phase::Building:
        label = "Phase 2/3: Building Tree Structure...";
        break;
    case Phase::Populating:
        label = "Phase 3/3: Initializing Root Nodes...";
        break;
    }

    if (event.total > 0 && event.done == event.total && event.phase == Phase::Building) {
        return label + " Done";
    }
    return label + " " + std::to_string(event.done) + "/" + std::to_string(event.total);
}
