#include "layout.hpp"
#include <algorithm>
#include <utility>

namespace panedash {

namespace {

struct FlexSegment {
    size_t index;
    uint64_t weight;
    bool capped;
    uint64_t cap;
};

// Largest-remainder apportionment of `total` cells between segments.
// Ties on the fractional part go to the larger weight, then the later segment.
void apportion(const std::vector<FlexSegment>& segments, uint64_t total,
               std::vector<uint16_t>& sizes) {
    uint64_t weight_sum = 0;
    for (const auto& s : segments) weight_sum += s.weight;
    if (weight_sum == 0 || total == 0) return;

    struct Share {
        size_t index;
        uint64_t weight;
        uint64_t remainder;
    };
    std::vector<Share> shares;
    shares.reserve(segments.size());

    uint64_t granted = 0;
    for (const auto& s : segments) {
        uint64_t num = total * s.weight;
        uint64_t whole = num / weight_sum;
        sizes[s.index] = static_cast<uint16_t>(sizes[s.index] + whole);
        granted += whole;
        shares.push_back({s.index, s.weight, num % weight_sum});
    }

    std::sort(shares.begin(), shares.end(), [](const Share& a, const Share& b) {
        if (a.remainder != b.remainder) return a.remainder > b.remainder;
        if (a.weight != b.weight) return a.weight > b.weight;
        return a.index > b.index;
    });

    uint64_t leftover = total - granted;
    for (size_t i = 0; i < shares.size() && leftover > 0; ++i) {
        if (shares[i].weight == 0) continue;
        sizes[shares[i].index]++;
        leftover--;
    }
}

} // namespace

Layout::Layout(Direction direction, std::vector<Constraint> constraints)
    : direction_(direction)
    , constraints_(std::move(constraints))
{
}

Layout Layout::vertical(std::initializer_list<Constraint> constraints) {
    return Layout(Direction::Vertical, std::vector<Constraint>(constraints));
}

Layout Layout::horizontal(std::initializer_list<Constraint> constraints) {
    return Layout(Direction::Horizontal, std::vector<Constraint>(constraints));
}

Layout& Layout::margin(uint16_t uniform) {
    margin_ = Margin(uniform);
    return *this;
}

Layout& Layout::margin(Margin m) {
    margin_ = m;
    return *this;
}

Layout& Layout::spacing(uint16_t cells) {
    spacing_ = cells;
    return *this;
}

std::vector<uint16_t> Layout::solve(const std::vector<Constraint>& constraints,
                                    uint16_t available) {
    std::vector<uint16_t> sizes(constraints.size(), 0);
    uint64_t remaining = available;

    // Fixed parts first, in order
    for (size_t i = 0; i < constraints.size(); ++i) {
        const auto& c = constraints[i];
        uint64_t want = 0;
        switch (c.kind) {
            case Constraint::Kind::Length:
            case Constraint::Kind::Min:
                want = c.value;
                break;
            case Constraint::Kind::Percentage:
                want = uint64_t{available} * std::min<uint16_t>(c.value, 100) / 100;
                break;
            case Constraint::Kind::Max:
            case Constraint::Kind::Fill:
                break;
        }
        uint64_t take = std::min(want, remaining);
        sizes[i] = static_cast<uint16_t>(take);
        remaining -= take;
    }

    std::vector<FlexSegment> flex;
    for (size_t i = 0; i < constraints.size(); ++i) {
        const auto& c = constraints[i];
        switch (c.kind) {
            case Constraint::Kind::Min:
                flex.push_back({i, 1, false, 0});
                break;
            case Constraint::Kind::Max:
                flex.push_back({i, 1, true, c.value});
                break;
            case Constraint::Kind::Fill:
                flex.push_back({i, c.value, false, 0});
                break;
            default:
                break;
        }
    }

    // Cap Max segments whose exact share exceeds their limit, then re-share
    bool capped_any = true;
    while (capped_any && remaining > 0) {
        capped_any = false;
        uint64_t weight_sum = 0;
        for (const auto& s : flex) weight_sum += s.weight;
        if (weight_sum == 0) break;

        for (auto it = flex.begin(); it != flex.end(); ++it) {
            if (it->capped && remaining * it->weight > it->cap * weight_sum) {
                sizes[it->index] = static_cast<uint16_t>(it->cap);
                remaining -= it->cap;
                flex.erase(it);
                capped_any = true;
                break;
            }
        }
    }

    apportion(flex, remaining, sizes);
    return sizes;
}

std::vector<Rect> Layout::split(const Rect& area) const {
    std::vector<Rect> rects;
    rects.reserve(constraints_.size());
    if (constraints_.empty()) return rects;

    const Rect inner = area.inner(margin_);
    const bool vertical = direction_ == Direction::Vertical;
    const uint32_t axis_start = vertical ? inner.y : inner.x;
    const uint32_t axis_len = vertical ? inner.height : inner.width;
    const uint32_t axis_end = axis_start + axis_len;

    const uint32_t total_spacing = uint32_t{spacing_} * (constraints_.size() - 1);
    const auto available = static_cast<uint16_t>(axis_len > total_spacing ? axis_len - total_spacing : 0);
    const auto sizes = solve(constraints_, available);

    uint32_t pos = axis_start;
    for (size_t i = 0; i < sizes.size(); ++i) {
        uint32_t start = std::min(pos, axis_end);
        uint32_t end = std::min(start + sizes[i], axis_end);
        auto len = static_cast<uint16_t>(end - start);

        if (vertical) {
            rects.push_back(Rect{inner.x, static_cast<uint16_t>(start), inner.width, len});
        } else {
            rects.push_back(Rect{static_cast<uint16_t>(start), inner.y, len, inner.height});
        }
        pos = start + sizes[i] + spacing_;
    }
    return rects;
}

} // namespace panedash
