#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "ui/ItemSize.h"
#include "ui/VirtualScroll.h"

/**
 * @brief Everything a virtual list is configured with
 *
 * Plain value type; the orchestrator diffs two snapshots to decide what to
 * invalidate.
 */
struct ListConfig {
    static constexpr double kDefaultEstimatedSize = 50.0;
    static constexpr int kDefaultOverscan = 1;

    /**
     * @brief Parse a configuration object
     *
     * itemSize may be a number (fixed), an array of numbers (per-index table)
     * or absent/null (uniform estimate taken from estimatedSize). width and
     * height accept numbers or strings such as "320px".
     * @throws VirtualScroll::ConfigurationError on malformed or invalid input
     */
    static ListConfig fromJson(const nlohmann::json &j);

    /**
     * @throws VirtualScroll::ConfigurationError describing the first invalid field
     */
    void validate() const;

    VirtualScroll::SizeGetters sizeGetters() const;

    /// Viewport extent along the scroll axis.
    double containerSize() const;
    /// Viewport extent across the scroll axis.
    double crossAxisSize() const;

    int itemCount = 0;
    VirtualScroll::ItemSize itemSize = VirtualScroll::EstimatedSize{kDefaultEstimatedSize};
    std::optional<double> estimatedSize;
    int overscan = kDefaultOverscan;
    VirtualScroll::Align align = VirtualScroll::Align::Auto;
    VirtualScroll::ScrollDirection scrollDirection = VirtualScroll::ScrollDirection::Vertical;
    std::vector<int> stickyIndices;
    std::optional<int> scrollToIndex;
    double width = 0.0;
    double height = 0.0;
};

/// True when itemSize and estimatedSize describe the same sizes.
bool sizeConfigEquals(const ListConfig &a, const ListConfig &b);

VirtualScroll::Align alignFromString(const std::string &value);
VirtualScroll::ScrollDirection scrollDirectionFromString(const std::string &value);
