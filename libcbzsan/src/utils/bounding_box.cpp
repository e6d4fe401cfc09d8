#include "../../include/bounding_box.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <regex>

namespace cbzsan {

namespace {

std::optional<std::uint32_t> parse_axis(const std::ssub_match& group, bool& ok) {
    if (!group.matched) return std::nullopt;
    const std::string digits = group.str();
    std::uint32_t value = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || end != digits.data() + digits.size() || value == 0) {
        ok = false;
        return std::nullopt;
    }
    return value;
}

// picks floor or ceil of `value`, whichever scores lower; ties keep floor
template <typename Score>
std::uint32_t round_aspect(const double value, Score score) {
    const double lo = std::floor(value);
    const double hi = std::ceil(value);
    const double best = score(hi) < score(lo) ? hi : lo;
    return static_cast<std::uint32_t>(std::max(best, 1.0));
}

} // namespace

bool BoundingBox::fits(const std::uint32_t width, const std::uint32_t height) const noexcept {
    const bool width_ok = !max_width || width <= *max_width;
    const bool height_ok = !max_height || height <= *max_height;
    return width_ok && height_ok;
}

std::string BoundingBox::to_string() const {
    std::string out;
    if (max_width) out += std::to_string(*max_width);
    out += 'x';
    if (max_height) out += std::to_string(*max_height);
    return out;
}

std::optional<BoundingBox> parse_bounding_box(const std::string_view text) {
    static const std::regex grammar(R"((\d+)?x(\d+)?)");

    const std::string s(text);
    std::smatch match;
    if (!std::regex_match(s, match, grammar)) {
        return std::nullopt;
    }

    bool ok = true;
    BoundingBox box;
    box.max_width = parse_axis(match[1], ok);
    box.max_height = parse_axis(match[2], ok);
    if (!ok) {
        return std::nullopt;
    }
    return box;
}

std::optional<ImageSize> compute_target_size(const std::uint32_t width,
                                              const std::uint32_t height,
                                              const BoundingBox& box) {
    if (width == 0 || height == 0 || box.fits(width, height)) {
        return std::nullopt;
    }

    // clamp the box to the image so an unconstrained or larger axis never upscales
    const std::uint32_t box_w = box.max_width ? std::min(*box.max_width, width) : width;
    const std::uint32_t box_h = box.max_height ? std::min(*box.max_height, height) : height;

    const double aspect = static_cast<double>(width) / static_cast<double>(height);
    const double bw = box_w;
    const double bh = box_h;

    ImageSize target{box_w, box_h};
    if (bw / bh >= aspect) {
        // height is the limiting axis
        target.width = round_aspect(bh * aspect, [&](const double n) {
            return std::abs(aspect - n / bh);
        });
    } else {
        // width is the limiting axis
        target.height = round_aspect(bw / aspect, [&](const double n) {
            return n == 0.0 ? 0.0 : std::abs(aspect - bw / n);
        });
    }
    return target;
}

} // namespace cbzsan
