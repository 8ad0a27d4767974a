#include <FL/Fl.H>
#include <FL/Fl_Double_Window.H>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/ListConfig.h"
#include "ui/Theme.h"
#include "ui/VirtualListView.h"
#include "utils/Logger.h"

const int INITIAL_WINDOW_WIDTH = 480;
const int INITIAL_WINDOW_HEIGHT = 720;
const int DEMO_ROW_COUNT = 100000;
const int SECTION_EVERY = 25;

namespace {

ListConfig defaultConfig() {
    ListConfig config;
    config.estimatedSize = 32.0;
    config.overscan = 3;
    config.stickyIndices = {0};
    config.itemSize = VirtualScroll::PerIndexSize{[](int index) -> std::optional<double> {
        if (index == 0) {
            return 48.0;
        }
        if (index % SECTION_EVERY == 0) {
            return 40.0;
        }
        return 28.0 + (index % 3) * 10.0;
    }};
    return config;
}

ListConfig loadConfig(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw VirtualScroll::ConfigurationError("Cannot open configuration file " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error &e) {
        throw VirtualScroll::ConfigurationError("Cannot parse " + path + ": " + e.what());
    }
    return ListConfig::fromJson(j);
}

std::vector<std::string> makeRows() {
    std::vector<std::string> rows;
    rows.reserve(DEMO_ROW_COUNT);
    rows.push_back("Virtual list: " + std::to_string(DEMO_ROW_COUNT) + " rows");
    for (int i = 1; i < DEMO_ROW_COUNT; ++i) {
        if (i % SECTION_EVERY == 0) {
            rows.push_back("Section " + std::to_string(i / SECTION_EVERY));
        } else {
            rows.push_back("Row " + std::to_string(i));
        }
    }
    return rows;
}

} // namespace

int main(int argc, char **argv) {
    const char *level = std::getenv("VIRTUALLIST_DEBUG");
    Logger::setLevel(level && std::string(level) == "1" ? Logger::Level::DEBUG : Logger::Level::INFO);
    Logger::info("Virtual list demo started");

    init_theme();

    ListConfig config;
    try {
        config = argc > 1 ? loadConfig(argv[1]) : defaultConfig();
    } catch (const std::exception &e) {
        Logger::error(std::string("Invalid configuration: ") + e.what());
        return 1;
    }

    auto *window = new Fl_Double_Window(INITIAL_WINDOW_WIDTH, INITIAL_WINDOW_HEIGHT, "Virtual List");
    auto *view = new VirtualListView(0, 0, window->w(), window->h(), config, makeRows());
    window->resizable(view);
    window->end();
    window->show();

    if (config.scrollToIndex) {
        Logger::info("Starting at index " + std::to_string(*config.scrollToIndex));
    }

    return Fl::run();
}
