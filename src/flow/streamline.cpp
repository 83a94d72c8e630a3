#include "flow/streamline.hpp"

namespace flow {

std::vector<StreamlinePoint> trace(const glm::vec3& seed, int steps, float stepSize, const FieldParams& field) {
    std::vector<StreamlinePoint> points;
    if (steps < 0) return points;

    points.reserve(static_cast<size_t>(steps) + 1);
    points.push_back(makePoint(seed, field));
    for (int k = 0; k < steps; ++k) {
        points.push_back(advance(points.back(), stepSize, field));
    }
    return points;
}

std::vector<Segment> integrate(const glm::vec3& seed, int steps, float stepSize,
                               const FieldParams& field, const SegmentStyle& style) {
    std::vector<Segment> segments;
    if (steps <= 0) return segments;

    segments.resize(static_cast<size_t>(steps));
    integrateStrand(seed, steps, stepSize, field, style, segments.data());
    return segments;
}

}  // namespace flow
