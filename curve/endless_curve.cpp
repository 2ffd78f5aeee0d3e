#include "endless_curve.hpp"
#include <geometry/parallel_transport.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace serpent {

void EndlessCurveConfig::validate() const {
    if (samples_per_segment < 1) {
        throw std::invalid_argument("EndlessCurveConfig: samples_per_segment must be >= 1, got " +
                                    std::to_string(samples_per_segment));
    }
    if (arc_length_divisions < 1) {
        throw std::invalid_argument("EndlessCurveConfig: arc_length_divisions must be >= 1, got " +
                                    std::to_string(arc_length_divisions));
    }
    if (max_segments_per_fill < 1) {
        throw std::invalid_argument("EndlessCurveConfig: max_segments_per_fill must be >= 1, got " +
                                    std::to_string(max_segments_per_fill));
    }
}

EndlessCurve::EndlessCurve(SegmentSource source, const EndlessCurveConfig& config)
    : source_(std::move(source)), config_(config) {
    if (!source_) {
        throw std::invalid_argument("EndlessCurve: segment source is empty");
    }
    config_.validate();
}

float EndlessCurve::total_length() const {
    return cumulative_lengths_.empty() ? 0.0f : cumulative_lengths_.back();
}

// ============================================
// Segment stream
// ============================================

void EndlessCurve::append_segment(const CubicBezier& segment) {
    CachedSegment cached{segment, segment.arc_length_table(config_.arc_length_divisions)};

    cumulative_lengths_.push_back(total_length() + cached.arc.total());
    compute_frames(cached);
    segments_.push_back(std::move(cached));

    recalculate_u_values();

    auto log = serpent::logging::get_logger();
    log->trace("EndlessCurve: appended segment {} (length={:.3f}, total={:.3f})",
               segments_.size() - 1, segments_.back().arc.total(), total_length());
}

void EndlessCurve::fill_length(double distance) {
    const float local = static_cast<float>(distance - distance_offset_);
    int appended = 0;

    while (local >= total_length()) {
        if (appended >= config_.max_segments_per_fill) {
            auto log = serpent::logging::get_logger();
            log->warn("EndlessCurve: stopped filling after {} segments "
                      "(cached length {:.3f} < requested {:.3f})",
                      appended, total_length(), local);
            break;
        }
        append_segment(source_(target_));
        ++appended;
    }
}

void EndlessCurve::remove_segments_before(double position) {
    const float p = static_cast<float>(position - distance_offset_);

    size_t remove = 0;
    float removed_length = 0.0f;
    for (float end : cumulative_lengths_) {
        if (p < end) {
            break;
        }
        removed_length = end;
        ++remove;
    }

    if (remove == 0) {
        return;
    }

    distance_offset_ += removed_length;

    const auto count = static_cast<std::ptrdiff_t>(remove);
    segments_.erase(segments_.begin(), segments_.begin() + count);

    const auto frames = count * static_cast<std::ptrdiff_t>(config_.samples_per_segment + 1);
    normals_.erase(normals_.begin(), normals_.begin() + frames);
    u_values_.erase(u_values_.begin(), u_values_.begin() + frames);

    // Cumulative lengths restart at the new first segment
    cumulative_lengths_.clear();
    float running = 0.0f;
    for (const auto& seg : segments_) {
        running += seg.arc.total();
        cumulative_lengths_.push_back(running);
    }

    recalculate_u_values();

    auto log = serpent::logging::get_logger();
    log->trace("EndlessCurve: evicted {} segments, distance_offset={:.3f}, remaining={}",
               remove, distance_offset_, segments_.size());
}

void EndlessCurve::configure_start_end(double position, float length) {
    fill_length(position + length);
    remove_segments_before(position);

    const float local = static_cast<float>(position - distance_offset_);
    float total = total_length();

    if (total > 0.0f) {
        u_start_ = std::clamp(local / total, 0.0f, 1.0f);
        u_length_ = length / total;
    } else {
        u_start_ = 0.0f;
        u_length_ = 0.0f;
    }
}

// ============================================
// Frame cache
// ============================================

void EndlessCurve::compute_frames(const CachedSegment& segment) {
    Vec3 prev_normal = last_normal_;
    Vec3 prev_tangent;

    if (last_tangent_) {
        prev_tangent = *last_tangent_;
    } else {
        // Very first segment: seed with any normal perpendicular to the start
        prev_tangent = segment.curve.start_tangent();
        prev_normal = arbitrary_perpendicular(prev_tangent);
    }

    const int n = config_.samples_per_segment;
    for (int i = 0; i <= n; ++i) {
        float local_u = static_cast<float>(i) / static_cast<float>(n);
        float t = segment.arc.parameter_at_fraction(local_u);

        // t is exactly 0 or 1 at the ends, which selects the analytic handle tangents
        Vec3 tangent = segment.curve.tangent(t);
        Vec3 normal = parallel_transport(prev_normal, prev_tangent, tangent);

        normals_.push_back(normal);
        u_values_.push_back(0.0f);  // set by recalculate_u_values

        prev_normal = normal;
        prev_tangent = tangent;
    }

    last_normal_ = prev_normal;
    last_tangent_ = prev_tangent;
}

void EndlessCurve::recalculate_u_values() {
    const float total = total_length();
    const int n = config_.samples_per_segment;

    size_t frame = 0;
    for (size_t s = 0; s < segments_.size(); ++s) {
        float start = s > 0 ? cumulative_lengths_[s - 1] : 0.0f;
        float length = cumulative_lengths_[s] - start;

        for (int i = 0; i <= n && frame < u_values_.size(); ++i, ++frame) {
            float local_u = static_cast<float>(i) / static_cast<float>(n);
            u_values_[frame] = total > 0.0f ? (start + length * local_u) / total : 0.0f;
        }
    }
}

// ============================================
// Queries
// ============================================

std::pair<size_t, float> EndlessCurve::locate(float u) const {
    u = std::clamp(u, 0.0f, 1.0f);
    float distance = u * total_length();

    auto it = std::lower_bound(cumulative_lengths_.begin(), cumulative_lengths_.end(), distance);
    size_t index = static_cast<size_t>(it - cumulative_lengths_.begin());
    if (index >= segments_.size()) {
        index = segments_.size() - 1;
    }

    float start = index > 0 ? cumulative_lengths_[index - 1] : 0.0f;
    float length = cumulative_lengths_[index] - start;
    float local = length > 0.0f ? (distance - start) / length : 0.0f;

    return {index, segments_[index].arc.parameter_at_fraction(local)};
}

Vec3 EndlessCurve::position_at(float u) const {
    if (segments_.empty()) {
        return vec3::zero();
    }
    auto [index, t] = locate(u);
    return segments_[index].curve.evaluate(t);
}

Vec3 EndlessCurve::tangent_at(float u) const {
    if (segments_.empty()) {
        return vec3::unit_x();
    }
    auto [index, t] = locate(u);
    return segments_[index].curve.tangent(t);
}

Vec3 EndlessCurve::normal_at(float u) const {
    if (normals_.empty()) {
        return arbitrary_perpendicular(tangent_at(u));
    }
    if (normals_.size() == 1) {
        return normals_.front();
    }

    size_t low = 0;
    size_t high = u_values_.size() - 1;

    // No extrapolation past the cached range
    if (u <= u_values_[low]) {
        return normals_[low];
    }
    if (u >= u_values_[high]) {
        return normals_[high];
    }

    while (low + 1 < high) {
        size_t mid = (low + high) / 2;
        if (u_values_[mid] <= u) {
            low = mid;
        } else {
            high = mid;
        }
    }

    float u_low = u_values_[low];
    float u_high = u_values_[high];
    float t = u_high > u_low ? (u - u_low) / (u_high - u_low) : 0.0f;

    Vec3 normal = lerp(normals_[low], normals_[high], t);
    if (normal.length_squared() < 1e-12f) {
        return normals_[low];
    }
    return normal.normalized();
}

CurveBasis EndlessCurve::basis_at(float u) const {
    return CurveBasis{position_at(u), normal_at(u), tangent_at(u)};
}

Vec3 EndlessCurve::position_at_local(float u) const {
    return position_at(std::min(u_start_ + u_length_ * u, 1.0f));
}

CurveBasis EndlessCurve::basis_at_local(float u) const {
    return basis_at(std::min(u_start_ + u_length_ * u, 1.0f));
}

}  // namespace serpent
