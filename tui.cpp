#include "tui.hpp"
#include "listing_file.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace {

const char* usage_hint = "usage: tree /F > tree_output.txt";

std::vector<TreeMaterializer::NodeId> visible_rows(const std::shared_ptr<AppState>& state) {
    std::vector<TreeMaterializer::NodeId> visible {};
    state->materializer.visible_nodes(visible);
    return visible;
}

void clamp_selection(const std::shared_ptr<AppState>& state, int row_count) {
    if (state->selected_index >= row_count) {
        state->selected_index = row_count - 1;
    }
    if (state->selected_index < 0) {
        state->selected_index = 0;
    }
}

}

void start_load(std::shared_ptr<AppState> state) {
    std::vector<std::string> lines {};
    std::string encoding {};

    state->status = "Loading " + state->listing_path.string() + "...";
    ReadStatus read = read_listing_file(state->listing_path, lines, encoding);
    if (read != ReadStatus::Ok) {
        state->status = describe(read);
        return;
    }

    // Drop the old tree now; a stale worker can no longer bring it back.
    state->materializer.clear();
    state->selected_index = 0;
    state->loading = true;
    state->progress = 0.0f;

    const std::size_t line_count = lines.size();
    std::weak_ptr<AppState> weak = state;
    state->loader->load(std::move(lines), state->strategy, [weak](LoadResult result) {
        if (auto locked = weak.lock()) {
            apply_load_result(locked, std::move(result));
        }
    });
    state->status = "Read " + std::to_string(line_count) + " lines (" + encoding + ")";
}

void apply_progress(std::shared_ptr<AppState> state, const ProgressEvent& event) {
    state->phase_label = describe(event);
    state->progress = event.total == 0 ? 1.0f
                                       : static_cast<float>(event.done) / static_cast<float>(event.total);
}

void apply_load_result(std::shared_ptr<AppState> state, LoadResult result) {
    state->loading = false;
    if (result.status != LoadStatus::Ok) {
        state->phase_label = "Done";
        state->status = describe(result.status);
        return;
    }

    auto forest = std::make_shared<const Forest>(std::move(result.forest));

    std::weak_ptr<AppState> weak = state;
    ProgressReporter populate {[weak](const ProgressEvent& event) {
        if (auto locked = weak.lock()) {
            apply_progress(locked, event);
        }
    }};
    state->materializer.reset(forest, &populate);

    // The top path line starts out open, as `tree` prints it.
    if (state->materializer.roots().size() == 1) {
        state->materializer.set_open(state->materializer.roots().front(), true);
    }

    state->selected_index = 0;
    state->progress = 1.0f;
    state->phase_label = "Done";
    state->status = "Loaded " + std::to_string(result.line_count) + " lines ("
        + strategy_name(state->strategy) + ", lazy, threaded).";
}

bool toggle_selected(std::shared_ptr<AppState> state) {
    std::vector<TreeMaterializer::NodeId> visible = visible_rows(state);
    if (visible.empty()) {
        return false;
    }
    clamp_selection(state, static_cast<int>(visible.size()));

    const TreeMaterializer::NodeId id = visible[state->selected_index];
    if (!state->materializer.expandable(id)) {
        return false;
    }
    return state->materializer.set_open(id, !state->materializer.is_open(id));
}

bool close_or_select_parent(std::shared_ptr<AppState> state) {
    std::vector<TreeMaterializer::NodeId> visible = visible_rows(state);
    if (visible.empty()) {
        return false;
    }
    clamp_selection(state, static_cast<int>(visible.size()));

    const TreeMaterializer::NodeId id = visible[state->selected_index];
    if (state->materializer.is_open(id)) {
        return state->materializer.set_open(id, false);
    }

    TreeMaterializer::NodeId parent {};
    if (!state->materializer.parent_of(id, parent)) {
        return false;
    }
    auto it = std::find(visible.begin(), visible.end(), parent);
    if (it != visible.end()) {
        state->selected_index = static_cast<int>(it - visible.begin());
    }
    return true;
}

ftxui::Element render_tree(std::shared_ptr<AppState> state) {
    std::vector<TreeMaterializer::NodeId> visible = visible_rows(state);

    ftxui::Elements lines;
    for (int i = 0; i < static_cast<int>(visible.size()); ++i) {
        const TreeMaterializer::NodeId id = visible[i];
        const ListingNode* node = state->materializer.node(id);

        std::string label;
        label.append(node->depth * 2, ' ');

        if (state->materializer.expandable(id)) {
            label += state->materializer.is_open(id) ? "▾ " : "▸ ";
        } else {
            label += "  ";
        }

        label += icon_for(state->config, *node);
        label += " ";
        label += node->name;

        ftxui::Element e = ftxui::text(label);
        if (i == state->selected_index) {
            e = e | ftxui::inverted | ftxui::focus;  // highlight selected row
        }
        lines.push_back(e);
    }

    if (lines.empty()) {
        lines.push_back(ftxui::text(state->loading ? "Loading..." : "") | ftxui::dim);
    }

    return ftxui::vbox(std::move(lines)) | ftxui::vscroll_indicator | ftxui::yframe
        | ftxui::flex | ftxui::border;
}

ftxui::Element render_header(std::shared_ptr<AppState> state) {
    return ftxui::vbox({
        ftxui::gauge(state->progress) | ftxui::color(ftxui::Color::Blue),
        ftxui::text(state->phase_label) | ftxui::dim,
        ftxui::text(usage_hint) | ftxui::color(ftxui::Color::Cyan),
        ftxui::text("File: " + state->listing_path.string()),
    });
}

ftxui::Element render_status_bar(std::shared_ptr<AppState> state) {
    return ftxui::hbox({
        ftxui::text(state->status) | ftxui::flex,
        ftxui::text(" Enter:open  h:close  r:reload  q:quit ") | ftxui::dim,
    });
}

bool handle_event(ftxui::Event e, ftxui::ScreenInteractive& screen, std::shared_ptr<AppState> state) {

    if (e == ftxui::Event::Character('q')) {
        screen.Exit();
        return true;
    }

    if (e == ftxui::Event::Character('r')) {
        start_load(state);
        return true;
    }

    std::vector<TreeMaterializer::NodeId> visible = visible_rows(state);
    int n = static_cast<int>(visible.size());

    if (n == 0) {
        return false;
    }
    clamp_selection(state, n);

    if (e == ftxui::Event::ArrowDown || e == ftxui::Event::Character('j')) {
        if (state->selected_index + 1 < n) {
            state->selected_index++;
        }
        return true;
    }

    if (e == ftxui::Event::ArrowUp || e == ftxui::Event::Character('k')) {
        if (state->selected_index > 0) {
            state->selected_index--;
        }
        return true;
    }

    const TreeMaterializer::NodeId id = visible[state->selected_index];

    if (e == ftxui::Event::Return) {
        toggle_selected(state);
        return true;
    }

    if (e == ftxui::Event::ArrowRight || e == ftxui::Event::Character('l')) {
        if (state->materializer.expandable(id)) {
            state->materializer.set_open(id, true);
        }
        return true;
    }

    if (e == ftxui::Event::ArrowLeft || e == ftxui::Event::Character('h')) {
        close_or_select_parent(state);
        return true;
    }

    return false;
}

void run_tui(const std::filesystem::path& listing_path, const ViewerConfig& config, BuildStrategy strategy) {
    auto state = std::make_shared<AppState>();
    state->listing_path = listing_path;
    state->config = config;
    state->strategy = strategy;

    auto screen = ftxui::ScreenInteractive::Fullscreen();

    std::weak_ptr<AppState> weak = state;
    auto dispatch = [&screen](ListingLoader::Task task) {
        screen.Post(std::move(task));
        screen.PostEvent(ftxui::Event::Custom);
    };
    // Already on the UI thread: the loader posts it through dispatch.
    auto on_progress = [weak](const ProgressEvent& event) {
        if (auto locked = weak.lock()) {
            apply_progress(locked, event);
        }
    };
    state->loader = std::make_unique<ListingLoader>(dispatch, on_progress);

    ftxui::Component renderer = ftxui::Renderer([state] {
        return ftxui::vbox({
            render_header(state),
            render_tree(state),
            render_status_bar(state),
        });
    });

    ftxui::Component app = ftxui::CatchEvent(renderer, [&screen, state](ftxui::Event e) {
            return handle_event(e, screen, state);
    });

    start_load(state);
    screen.Loop(app);

    // Join the worker while the screen it posts to still exists.
    state->loader.reset();
}
