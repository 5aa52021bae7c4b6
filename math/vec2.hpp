#ifndef NETDECLUTTER_MATH_VEC2_HPP
#define NETDECLUTTER_MATH_VEC2_HPP

#include <cmath>
#include <cstddef>

namespace netdeclutter {

// Point or displacement in unit-square world coordinates.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    // Compound assignment
    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr Vec2& operator*=(double scalar) {
        x *= scalar; y *= scalar;
        return *this;
    }

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }

    constexpr double& operator[](size_t i) {
        return i == 0 ? x : y;
    }

    constexpr double operator[](size_t i) const {
        return i == 0 ? x : y;
    }

    static constexpr Vec2 zero() { return {0.0, 0.0}; }
};

// Scalar * Vec2
constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

namespace vec2 {
    // Center of the unit square
    constexpr Vec2 center() { return {0.5, 0.5}; }
}

}  // namespace netdeclutter

#endif // NETDECLUTTER_MATH_VEC2_HPP
