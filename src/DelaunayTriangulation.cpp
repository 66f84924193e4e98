#include "DelaunayTriangulation.hpp"
#include "ProfileErrors.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Delaunay_triangulation_2.h>
#include <CGAL/Triangulation_data_structure_2.h>
#include <CGAL/Triangulation_vertex_base_with_info_2.h>

#include <cmath>
#include <map>
#include <sstream>
#include <utility>

namespace GeoProfile {

namespace {

// Each CGAL vertex carries its index into points_
typedef CGAL::Exact_predicates_inexact_constructions_kernel Kernel;
typedef CGAL::Triangulation_vertex_base_with_info_2<int, Kernel> VertexBase;
typedef CGAL::Triangulation_data_structure_2<VertexBase> DataStructure;
typedef CGAL::Delaunay_triangulation_2<Kernel, DataStructure> Delaunay;

} // namespace

double DelaunayTriangulation::orient(const Point2& a, const Point2& b, const Point2& c) {
    return (b.x - a.x) * (c.z - a.z) - (b.z - a.z) * (c.x - a.x);
}

DelaunayTriangulation::DelaunayTriangulation(const std::vector<Point2>& input) {
    collapseDuplicates(input);
    checkDegenerate();
    build();
}

void DelaunayTriangulation::collapseDuplicates(const std::vector<Point2>& input) {
    std::map<std::pair<double, double>, int> seen;

    for (size_t i = 0; i < input.size(); ++i) {
        const Point2& p = input[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.z)) {
            continue;
        }
        auto key = std::make_pair(p.x, p.z);
        if (seen.count(key)) continue;
        seen[key] = static_cast<int>(points_.size());
        points_.push_back(p);
        source_index_.push_back(static_cast<int>(i));
    }
}

void DelaunayTriangulation::checkDegenerate() const {
    if (points_.size() < 3) {
        std::ostringstream msg;
        msg << "Cannot triangulate " << points_.size()
            << " distinct point(s); at least 3 are required";
        throw DegenerateInputError(msg.str());
    }
}

void DelaunayTriangulation::build() {
    std::vector<std::pair<Kernel::Point_2, int>> sites;
    sites.reserve(points_.size());
    for (size_t i = 0; i < points_.size(); ++i) {
        sites.emplace_back(Kernel::Point_2(points_[i].x, points_[i].z), static_cast<int>(i));
    }

    Delaunay dt;
    dt.insert(sites.begin(), sites.end());

    // Exact orientation: anything short of a 2-D triangulation is collinear
    if (dt.dimension() < 2) {
        throw DegenerateInputError("All sample points are collinear; no triangle can be formed");
    }

    // Finite faces tile the convex hull exactly and are counter-clockwise
    triangles_.clear();
    triangles_.reserve(dt.number_of_faces());
    for (auto f = dt.finite_faces_begin(); f != dt.finite_faces_end(); ++f) {
        triangles_.push_back({f->vertex(0)->info(), f->vertex(1)->info(), f->vertex(2)->info()});
    }

    if (triangles_.empty()) {
        throw DegenerateInputError("Triangulation produced no triangles");
    }
}

} // namespace GeoProfile
