#pragma once

#include "../interfaces/i_sample_source.hpp"
#include "frame.hpp"
#include "gradient.hpp"
#include "widgets/block.hpp"
#include <string>
#include <vector>

namespace panedash {

// Regions of one frame's dashboard partition
struct DashboardRegions {
    Rect header;
    Rect top;
    Rect mid;
    Rect bottom;  // reserved, nothing is drawn there

    Rect cpu;
    Rect gpu;
    Rect disk;
    Rect memory;
};

// Composes the dashboard: a header line and four titled panels, three of
// them filled with freshly sampled bar graphs. Holds no per-frame state.
class Dashboard {
public:
    // Non-owning: `samples` must be non-null and outlive the dashboard
    explicit Dashboard(ISampleSource* samples);

    void render(Frame& frame);

    [[nodiscard]] static DashboardRegions compute_regions(const Rect& canvas);

    // 2 * inner_width samples, one pair per terminal column
    [[nodiscard]] static std::vector<double> sample_series(ISampleSource& samples,
                                                           uint16_t inner_width);

    // Top-bordered panel with the name centered on the border
    [[nodiscard]] static Block panel_block(const std::string& name);

    // Layout constants
    static constexpr uint16_t kMargin = 4;
    static constexpr uint16_t kBandSpacing = 1;
    static constexpr uint16_t kPanelSpacing = 2;
    static constexpr uint16_t kHeaderHeight = 1;
    static constexpr uint16_t kSamplesPerColumn = 2;
    static constexpr const char* kHeaderText = "Blocks without borders";

private:
    void render_header(Frame& frame, const Rect& area);
    void render_graph(Frame& frame, const Rect& area, const std::string& name,
                      const Gradient& gradient);
    void render_disk(Frame& frame, const Rect& area);
    void render_memory(Frame& frame, const Rect& area);

    ISampleSource* samples_ = nullptr;
};

} // namespace panedash
