#ifndef TUI_H
#define TUI_H

#include "config.hpp"
#include "forest_builder.hpp"
#include "loader.hpp"
#include "materializer.hpp"

#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <filesystem>
#include <memory>
#include <string>

struct AppState {
    std::filesystem::path listing_path {};
    ViewerConfig config {};
    BuildStrategy strategy {BuildStrategy::Recursive};

    TreeMaterializer materializer {};
    std::unique_ptr<ListingLoader> loader {};
    int selected_index {};

    bool loading {false};
    float progress {};
    std::string phase_label {"Ready"};
    std::string status {"Ready"};
};

void start_load(std::shared_ptr<AppState> state);

void apply_load_result(std::shared_ptr<AppState> state, LoadResult result);

void apply_progress(std::shared_ptr<AppState> state, const ProgressEvent& event);

bool toggle_selected(std::shared_ptr<AppState> state);

bool close_or_select_parent(std::shared_ptr<AppState> state);

ftxui::Element render_tree(std::shared_ptr<AppState> state);

ftxui::Element render_header(std::shared_ptr<AppState> state);

ftxui::Element render_status_bar(std::shared_ptr<AppState> state);

bool handle_event(ftxui::Event e, ftxui::ScreenInteractive& screen, std::shared_ptr<AppState> state);

void run_tui(const std::filesystem::path& listing_path, const ViewerConfig& config, BuildStrategy strategy);

#endif
