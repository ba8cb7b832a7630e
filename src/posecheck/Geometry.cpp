#include "posecheck/Geometry.hpp"

namespace posecheck {

double calculateIou(const BoundingBox& a, const BoundingBox& b) {
    const Eigen::Vector2d lower = a.minCorner().cwiseMax(b.minCorner());
    const Eigen::Vector2d upper = a.maxCorner().cwiseMin(b.maxCorner());
    const Eigen::Vector2d extent = (upper - lower).cwiseMax(0.0);

    const double intersection = extent.x() * extent.y();
    const double union_area = a.area() + b.area() - intersection;
    if (union_area <= 0.0) {
        return 0.0;
    }
    return intersection / union_area;
}

std::vector<OverlapPair> findOverlaps(const std::vector<BoundingBox>& boxes, double threshold) {
    std::vector<OverlapPair> overlaps;
    for (std::size_t i = 0; i < boxes.size(); ++i) {
        for (std::size_t j = i + 1; j < boxes.size(); ++j) {
            const double iou = calculateIou(boxes[i], boxes[j]);
            if (iou > threshold) {
                overlaps.push_back(OverlapPair{i, j, iou});
            }
        }
    }
    return overlaps;
}

} // namespace posecheck
