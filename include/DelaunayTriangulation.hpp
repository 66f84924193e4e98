#ifndef DELAUNAY_TRIANGULATION_HPP
#define DELAUNAY_TRIANGULATION_HPP

#include "GeoProfile.hpp"
#include <vector>

namespace GeoProfile {

struct Point2 {
    double x;
    double z;
};

/// Triangle as counter-clockwise indices into DelaunayTriangulation::points()
struct Triangle {
    int a;
    int b;
    int c;
};

/**
 * @brief Delaunay triangulation of a 2-D point set (CGAL, exact predicates)
 *
 * Works on raw coordinates. Exact duplicates are collapsed, keeping the first
 * occurrence. The triangles tile the convex hull of the points. Construction
 * throws DegenerateInputError when fewer than three distinct points remain or
 * when all of them are collinear.
 */
class DelaunayTriangulation {
public:
    explicit DelaunayTriangulation(const std::vector<Point2>& input);

    /// Distinct vertices, in first-occurrence order
    const std::vector<Point2>& points() const { return points_; }

    /// Index in the constructor input of each distinct vertex
    const std::vector<int>& sourceIndex() const { return source_index_; }

    const std::vector<Triangle>& triangles() const { return triangles_; }

    /// Twice the signed area of (a, b, c); positive when counter-clockwise
    static double orient(const Point2& a, const Point2& b, const Point2& c);

private:
    std::vector<Point2> points_;
    std::vector<int> source_index_;
    std::vector<Triangle> triangles_;

    void collapseDuplicates(const std::vector<Point2>& input);
    void checkDegenerate() const;
    void build();
};

} // namespace GeoProfile

#endif // DELAUNAY_TRIANGULATION_HPP
