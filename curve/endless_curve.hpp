#ifndef SERPENT_CURVE_ENDLESS_CURVE_HPP
#define SERPENT_CURVE_ENDLESS_CURVE_HPP

#include <geometry/cubic_bezier.hpp>
#include <math/vec3.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace serpent {

// Produces the next segment of the curve; receives the current target (if any).
// Each segment must start where the previous one ended.
using SegmentSource = std::function<CubicBezier(const std::optional<Vec3>&)>;

struct EndlessCurveConfig {
    // Frame samples per segment are samples_per_segment + 1 (both ends included)
    int samples_per_segment = 10;

    // Chord divisions used for each segment's arc-length table
    int arc_length_divisions = 200;

    // Upper bound on segments appended by a single fill
    int max_segments_per_fill = 1000;

    // Throws std::invalid_argument
    void validate() const;
};

// Orientation of the curve at one point
struct CurveBasis {
    Vec3 position;
    Vec3 normal;
    Vec3 tangent;
};

// A sliding window over an endless chain of cubic Bezier segments.
//
// Segments are requested from the source as the window advances and evicted
// once they are entirely behind it. Every segment carries a block of
// parallel-transported normals, so the orientation along the curve is
// continuous across segment boundaries and never flips.
//
// Parameters named u are global arc-length fractions over the cached
// segments; the *_local queries map [0, 1] onto the configured window.
class EndlessCurve {
public:
    explicit EndlessCurve(SegmentSource source,
                          const EndlessCurveConfig& config = EndlessCurveConfig{});

    // Steering target handed to the source for segments generated from now on
    void set_target(const Vec3& target) { target_ = target; }
    void clear_target() { target_.reset(); }
    const std::optional<Vec3>& target() const { return target_; }

    // Make [position, position + length] (world distance) the active window:
    // fill ahead, evict behind, then recompute the local window.
    // World distances grow without bound and are kept in double precision;
    // everything relative to distance_offset() is float.
    void configure_start_end(double position, float length);

    // Generate segments until the cached curve reaches past distance
    void fill_length(double distance);

    // Evict whole segments that end at or before position
    void remove_segments_before(double position);

    // Append a segment and compute its frame block
    void append_segment(const CubicBezier& segment);

    // Global queries, u in [0, 1] (clamped)
    Vec3 position_at(float u) const;
    Vec3 tangent_at(float u) const;
    Vec3 normal_at(float u) const;
    CurveBasis basis_at(float u) const;

    // Window-local queries, u in [0, 1]
    Vec3 position_at_local(float u) const;
    CurveBasis basis_at_local(float u) const;

    float total_length() const;
    size_t segment_count() const { return segments_.size(); }
    const CubicBezier& segment(size_t index) const { return segments_[index].curve; }
    float segment_length(size_t index) const { return segments_[index].arc.total(); }

    // Frame cache, index-aligned
    const std::vector<Vec3>& frame_normals() const { return normals_; }
    const std::vector<float>& frame_u_values() const { return u_values_; }

    double distance_offset() const { return distance_offset_; }
    float u_start() const { return u_start_; }
    float u_length() const { return u_length_; }

    const EndlessCurveConfig& config() const { return config_; }

private:
    struct CachedSegment {
        CubicBezier curve;
        ArcLengthTable arc;
    };

    // Segment index and Bezier parameter for a global u
    std::pair<size_t, float> locate(float u) const;

    void compute_frames(const CachedSegment& segment);
    void recalculate_u_values();

    SegmentSource source_;
    EndlessCurveConfig config_;
    std::optional<Vec3> target_;

    std::vector<CachedSegment> segments_;
    std::vector<float> cumulative_lengths_;   // end distance of each segment

    std::vector<Vec3> normals_;
    std::vector<float> u_values_;

    // Exit frame of the most recently appended segment
    std::optional<Vec3> last_tangent_;
    Vec3 last_normal_ = vec3::unit_y();

    double distance_offset_ = 0.0;
    float u_start_ = 0.0f;
    float u_length_ = 1.0f;
};

}  // namespace serpent

#endif // SERPENT_CURVE_ENDLESS_CURVE_HPP
