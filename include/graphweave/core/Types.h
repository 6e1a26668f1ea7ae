#pragma once

#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace graphweave {

/// Node and edge identifiers come straight from the upstream data pipeline
using NodeId = std::string;
using EdgeId = std::string;
using MetaNodeId = std::string;

using IdSet = std::unordered_set<std::string>;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    Point& operator+=(const Point& o) { x += o.x; y += o.y; return *this; }
    Point& operator-=(const Point& o) { x -= o.x; y -= o.y; return *this; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    Point normalized() const {
        float len = length();
        return len > 0.0f ? *this / len : Point{0.0f, 0.0f};
    }

    /// Rotated 90 degrees counter-clockwise
    constexpr Point perpendicular() const { return {-y, x}; }

    constexpr float dot(const Point& o) const { return x * o.x + y * o.y; }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Simulated body: location plus the displacement applied on the last tick
struct Position {
    float x = 0.0f;
    float y = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;

    constexpr Position() = default;
    constexpr Position(float x_, float y_) : x(x_), y(y_) {}
    constexpr Position(float x_, float y_, float vx_, float vy_) : x(x_), y(y_), vx(vx_), vy(vy_) {}
    constexpr explicit Position(const Point& p) : x(p.x), y(p.y) {}

    constexpr Point point() const { return {x, y}; }
    constexpr Point velocity() const { return {vx, vy}; }

    void moveTo(const Point& p) { x = p.x; y = p.y; }
    void moveBy(const Point& d) { x += d.x; y += d.y; }
    void stop() { vx = 0.0f; vy = 0.0f; }

    bool operator==(const Position& o) const = default;
};

using PositionMap = std::unordered_map<NodeId, Position>;
using PointMap = std::unordered_map<NodeId, Point>;

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr float area() const { return width * height; }
    constexpr Point center() const { return {width / 2, height / 2}; }

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

}  // namespace graphweave
