#include "minitest.hpp"
#include "random_sample_source.hpp"
#include "test_support.hpp"
#include "tui/tui_dashboard.hpp"

using namespace panedash;
using panedash::testing::FixedSampleSource;
using panedash::testing::RecordingTerminal;

namespace {

std::vector<Rect> panels(const DashboardRegions& r) {
    return {r.cpu, r.gpu, r.disk, r.memory};
}

} // namespace

TEST(dashboard_regions_for_120x40) {
    auto r = Dashboard::compute_regions(Rect{0, 0, 120, 40});

    ASSERT_EQ(r.header, (Rect{4, 4, 112, 1}));
    ASSERT_EQ(r.top, (Rect{4, 6, 112, 7}));
    ASSERT_EQ(r.mid, (Rect{4, 14, 112, 14}));
    ASSERT_EQ(r.bottom, (Rect{4, 29, 112, 7}));

    ASSERT_EQ(r.cpu, (Rect{4, 6, 55, 7}));
    ASSERT_EQ(r.gpu, (Rect{61, 6, 55, 7}));
    ASSERT_EQ(r.disk, (Rect{4, 14, 37, 14}));
    ASSERT_EQ(r.memory, (Rect{43, 14, 73, 14}));
}

TEST(dashboard_header_is_one_row) {
    for (uint16_t h = 12; h < 200; h += 7) {
        for (uint16_t w = 9; w < 300; w += 29) {
            auto r = Dashboard::compute_regions(Rect{0, 0, w, h});
            ASSERT_EQ(r.header.height, 1);
            ASSERT_EQ(r.header.y, Dashboard::kMargin);
        }
    }
}

TEST(dashboard_panels_disjoint_and_inside_canvas) {
    for (uint16_t h = 13; h < 90; ++h) {
        for (uint16_t w = 32; w < 260; w += 3) {
            Rect canvas{0, 0, w, h};
            auto r = Dashboard::compute_regions(canvas);
            auto ps = panels(r);
            for (size_t i = 0; i < ps.size(); ++i) {
                ASSERT_TRUE(canvas.contains(ps[i]));
                ASSERT_FALSE(ps[i].intersects(r.header));
                for (size_t j = i + 1; j < ps.size(); ++j) {
                    ASSERT_FALSE(ps[i].intersects(ps[j]));
                }
            }
        }
    }
}

TEST(dashboard_tiny_canvas_stays_inside) {
    for (uint16_t h = 0; h < 14; ++h) {
        for (uint16_t w = 0; w < 40; ++w) {
            Rect canvas{0, 0, w, h};
            auto r = Dashboard::compute_regions(canvas);
            for (const auto& p : panels(r)) {
                ASSERT_TRUE(canvas.contains(p));
            }
            ASSERT_TRUE(canvas.contains(r.header));
        }
    }
}

TEST(dashboard_panels_leave_margin_blank) {
    Rect canvas{0, 0, 100, 50};
    auto r = Dashboard::compute_regions(canvas);
    Rect inside = canvas.inner(Margin(Dashboard::kMargin));
    for (const auto& p : panels(r)) {
        ASSERT_TRUE(inside.contains(p));
    }
    // Spacing between the top panels
    ASSERT_EQ(r.gpu.x - r.cpu.right(), Dashboard::kPanelSpacing);
    ASSERT_EQ(r.memory.x - r.disk.right(), Dashboard::kPanelSpacing);
    ASSERT_EQ(r.top.y - r.header.bottom(), Dashboard::kBandSpacing);
}

TEST(dashboard_memory_at_least_as_wide_as_disk) {
    for (uint16_t w = 8; w < 400; ++w) {
        auto r = Dashboard::compute_regions(Rect{0, 0, w, 40});
        if (r.mid.width < 6) continue;
        ASSERT_TRUE(r.memory.width >= r.disk.width);
    }
}

TEST(dashboard_sample_series_length_and_range) {
    RandomSampleSource samples(12345);
    for (uint16_t w : {0, 1, 7, 55, 73, 500}) {
        auto series = Dashboard::sample_series(samples, w);
        ASSERT_EQ(series.size(), size_t{w} * 2);
        for (double v : series) {
            ASSERT_TRUE(v >= 0.0);
            ASSERT_TRUE(v < 1.0);
        }
    }
}

TEST(dashboard_series_is_fresh_each_frame) {
    RandomSampleSource samples(7);
    auto a = Dashboard::sample_series(samples, 20);
    auto b = Dashboard::sample_series(samples, 20);
    ASSERT_NE(a, b);
}

TEST(dashboard_render_header_and_background) {
    FixedSampleSource samples({0.5});
    Dashboard dashboard(&samples);
    RecordingTerminal terminal(120, 40);
    terminal.draw([&](Frame& f) { dashboard.render(f); });
    const Buffer& buf = terminal.last_frame();

    ASSERT_EQ(buf.cell(0, 0).style.bg, std::optional<Color>(slate::c800));
    ASSERT_EQ(buf.cell(119, 39).style.bg, std::optional<Color>(slate::c800));

    std::string header = buf.row_text(4).substr(4, 22);
    ASSERT_EQ(header, "Blocks without borders");
    ASSERT_EQ(buf.cell(4, 4).style.fg, std::optional<Color>(slate::c900));
    ASSERT_EQ(buf.cell(4, 4).style.bg, std::optional<Color>(slate::c100));
    // Margin stays background
    ASSERT_EQ(buf.cell(3, 4).symbol, " ");
    ASSERT_EQ(buf.cell(3, 4).style.bg, std::optional<Color>(slate::c800));
}

TEST(dashboard_render_panel_titles) {
    FixedSampleSource samples({0.5});
    Dashboard dashboard(&samples);
    RecordingTerminal terminal(120, 40);
    terminal.draw([&](Frame& f) { dashboard.render(f); });
    const Buffer& buf = terminal.last_frame();

    // CPU spans columns 4..58: "CPU" starts at 4 + (55 - 3) / 2
    ASSERT_EQ(buf.cell(30, 6).symbol, "C");
    ASSERT_EQ(buf.cell(31, 6).symbol, "P");
    ASSERT_EQ(buf.cell(32, 6).symbol, "U");
    ASSERT_EQ(buf.cell(30, 6).style.bg, std::optional<Color>(slate::c300));
    ASSERT_EQ(buf.cell(4, 6).symbol, "█");
    ASSERT_EQ(buf.cell(4, 6).style.fg, std::optional<Color>(slate::c300));

    // Disk spans 4..40, Memory 43..115
    ASSERT_EQ(buf.cell(20, 14).symbol, "D");
    ASSERT_EQ(buf.cell(23, 14).symbol, "k");
    ASSERT_EQ(buf.cell(76, 14).symbol, "M");
    ASSERT_EQ(buf.cell(81, 14).symbol, "y");

    // Gap between CPU and GPU is background
    ASSERT_EQ(buf.cell(59, 6).symbol, " ");
    ASSERT_EQ(buf.cell(59, 6).style.bg, std::optional<Color>(slate::c800));
}

TEST(dashboard_render_samples_per_frame) {
    FixedSampleSource samples({1.0});
    Dashboard dashboard(&samples);
    RecordingTerminal terminal(120, 40);
    terminal.draw([&](Frame& f) { dashboard.render(f); });

    // CPU and GPU: 55 columns each, Memory: 73 columns, two samples per column
    ASSERT_EQ(samples.calls(), size_t{(55 + 55 + 73) * 2});

    terminal.draw([&](Frame& f) { dashboard.render(f); });
    ASSERT_EQ(samples.calls(), size_t{(55 + 55 + 73) * 2 * 2});
}

TEST(dashboard_render_graph_fills_interior) {
    FixedSampleSource samples({1.0});
    Dashboard dashboard(&samples);
    RecordingTerminal terminal(120, 40);
    terminal.draw([&](Frame& f) { dashboard.render(f); });
    const Buffer& buf = terminal.last_frame();

    // Every CPU interior cell is a full braille cell in panel colours
    for (uint16_t y = 7; y < 13; ++y) {
        for (uint16_t x = 4; x < 59; ++x) {
            ASSERT_EQ(buf.cell(x, y).symbol, "⣿");
            ASSERT_EQ(buf.cell(x, y).style.bg, std::optional<Color>(slate::c900));
        }
    }
    ASSERT_EQ(buf.cell(4, 7).style.fg, std::optional<Color>(gradients::plasma().at(1.0)));
    ASSERT_EQ(buf.cell(43, 15).style.fg, std::optional<Color>(gradients::blues().at(1.0)));

    // Disk interior stays empty
    for (uint16_t y = 15; y < 28; ++y) {
        for (uint16_t x = 4; x < 41; ++x) {
            ASSERT_EQ(buf.cell(x, y).symbol, " ");
            ASSERT_EQ(buf.cell(x, y).style.bg, std::optional<Color>(slate::c900));
        }
    }

    // Bottom band is left alone
    ASSERT_EQ(buf.row_text(30).find_first_not_of(' '), std::string::npos);
}

TEST(dashboard_render_small_canvas_does_not_throw) {
    FixedSampleSource samples({0.3, 0.9});
    Dashboard dashboard(&samples);
    for (uint16_t w = 0; w < 30; w += 3) {
        for (uint16_t h = 0; h < 20; h += 2) {
            RecordingTerminal terminal(w, h);
            terminal.draw([&](Frame& f) { dashboard.render(f); });
            ASSERT_EQ(terminal.frames(), 1);
        }
    }
}

TEST(dashboard_requires_sample_source) {
    ASSERT_THROWS(Dashboard dashboard(nullptr), std::invalid_argument);
}
