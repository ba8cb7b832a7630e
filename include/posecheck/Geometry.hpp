#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Core>

namespace posecheck {

// Normalized YOLO box: centre and size as fractions of the image extent.
struct BoundingBox {
    Eigen::Vector2d center = Eigen::Vector2d::Zero();
    Eigen::Vector2d size = Eigen::Vector2d::Zero();

    BoundingBox() = default;
    BoundingBox(double cx, double cy, double w, double h) : center(cx, cy), size(w, h) {}

    Eigen::Vector2d minCorner() const { return center - size / 2.0; }
    Eigen::Vector2d maxCorner() const { return center + size / 2.0; }
    double area() const { return size.x() * size.y(); }
};

// Rows are the corners in TL, TR, BR, BL order; columns are x, y, visibility.
using Keypoints = Eigen::Matrix<double, 4, 3, Eigen::RowMajor>;

constexpr int kKeypointCount = 4;
constexpr int kKeypointValues = 3;

// Intersection over union of two axis-aligned boxes. Disjoint or touching
// boxes give exactly 0; a zero union gives 0.
double calculateIou(const BoundingBox& a, const BoundingBox& b);

struct OverlapPair {
    std::size_t first = 0;  // 0-based index into the input
    std::size_t second = 0;
    double iou = 0.0;
};

// Every unordered pair (i < j) whose IoU is strictly above `threshold`,
// in (i, j) lexicographic order.
std::vector<OverlapPair> findOverlaps(const std::vector<BoundingBox>& boxes, double threshold);

} // namespace posecheck
