#include "tui_dashboard.hpp"
#include "../layout/layout.hpp"
#include "widgets/bar_graph.hpp"
#include <stdexcept>

namespace panedash {

Dashboard::Dashboard(ISampleSource* samples)
    : samples_(samples)
{
    if (samples_ == nullptr) {
        throw std::invalid_argument("Dashboard requires a sample source");
    }
}

DashboardRegions Dashboard::compute_regions(const Rect& canvas) {
    DashboardRegions regions;

    auto [header, top, mid, bottom] = Layout::vertical({
        Constraint::length(kHeaderHeight),
        Constraint::fill(1),
        Constraint::fill(2),
        Constraint::fill(1),
    })
        .spacing(kBandSpacing)
        .margin(kMargin)
        .areas<4>(canvas);

    regions.header = header;
    regions.top = top;
    regions.mid = mid;
    regions.bottom = bottom;

    auto [cpu, gpu] = Layout::horizontal({Constraint::fill(1), Constraint::fill(1)})
        .spacing(kPanelSpacing)
        .areas<2>(top);
    regions.cpu = cpu;
    regions.gpu = gpu;

    auto [disk, memory] = Layout::horizontal({Constraint::fill(1), Constraint::fill(2)})
        .spacing(kPanelSpacing)
        .areas<2>(mid);
    regions.disk = disk;
    regions.memory = memory;

    return regions;
}

std::vector<double> Dashboard::sample_series(ISampleSource& samples, uint16_t inner_width) {
    std::vector<double> data;
    data.reserve(size_t{inner_width} * kSamplesPerColumn);
    for (size_t i = 0; i < size_t{inner_width} * kSamplesPerColumn; ++i) {
        data.push_back(samples.next());
    }
    return data;
}

Block Dashboard::panel_block(const std::string& name) {
    Block block;
    block.borders(BORDERS_TOP)
        .border_set(border::kFull)
        .title(Line(name).centered().fg(slate::c900).bg(slate::c300))
        .border_style(fg(slate::c300))
        .bg(slate::c900);
    return block;
}

void Dashboard::render(Frame& frame) {
    frame.buffer().set_style(frame.area(), bg(slate::c800));

    const auto regions = compute_regions(frame.area());

    render_header(frame, regions.header);

    render_graph(frame, regions.cpu, "CPU", gradients::plasma());
    render_graph(frame, regions.gpu, "GPU", gradients::plasma());

    render_disk(frame, regions.disk);
    render_memory(frame, regions.memory);
}

void Dashboard::render_header(Frame& frame, const Rect& area) {
    Line title(kHeaderText);
    title.fg(slate::c900).bg(slate::c100);
    frame.render_widget(title, area);
}

void Dashboard::render_graph(Frame& frame, const Rect& area, const std::string& name,
                             const Gradient& gradient) {
    Block block = panel_block(name);
    frame.render_widget(block, area);

    Rect inner = block.inner(area);
    BarGraph graph(sample_series(*samples_, inner.width));
    graph.with_gradient(gradient);
    frame.render_widget(graph, inner);
}

void Dashboard::render_disk(Frame& frame, const Rect& area) {
    frame.render_widget(panel_block("Disk"), area);
}

void Dashboard::render_memory(Frame& frame, const Rect& area) {
    render_graph(frame, area, "Memory", gradients::blues());
}

} // namespace panedash
