#pragma once

#include <cmath>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace Biomorph {

template <typename T>
struct Vector2 {
    T x = 0;
    T y = 0;

    Vector2 operator+(const Vector2& other) const { return Vector2{ x + other.x, y + other.y }; }
    Vector2 operator-(const Vector2& other) const { return Vector2{ x - other.x, y - other.y }; }
    Vector2 operator-() const { return Vector2{ -x, -y }; }
    Vector2 operator*(T scalar) const { return Vector2{ x * scalar, y * scalar }; }
    Vector2 operator/(T scalar) const { return Vector2{ x / scalar, y / scalar }; }

    Vector2& operator+=(const Vector2& other)
    {
        x += other.x;
        y += other.y;
        return *this;
    }

    Vector2& operator-=(const Vector2& other)
    {
        x -= other.x;
        y -= other.y;
        return *this;
    }

    Vector2& operator*=(T scalar)
    {
        x *= scalar;
        y *= scalar;
        return *this;
    }

    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vector2& other) const { return !(*this == other); }

    T dot(const Vector2& other) const { return x * other.x + y * other.y; }

    // Z component of the 3D cross product.
    T cross(const Vector2& other) const { return x * other.y - y * other.x; }

    T magnitudeSquared() const { return x * x + y * y; }
    T magnitude() const { return std::sqrt(x * x + y * y); }
    T mag() const { return magnitude(); }

    Vector2 normalize() const
    {
        const T m = magnitude();
        if (m == 0) {
            return Vector2{ 0, 0 };
        }
        return Vector2{ x / m, y / m };
    }

    Vector2 rotate(double angle) const
    {
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        return Vector2{ static_cast<T>(x * c - y * s), static_cast<T>(x * s + y * c) };
    }

    // Counter-clockwise perpendicular.
    Vector2 perp() const { return Vector2{ -y, x }; }
};

template <typename T>
Vector2<T> operator*(T scalar, const Vector2<T>& v)
{
    return v * scalar;
}

using Vector2d = Vector2<double>;
using Vector2f = Vector2<float>;
using Vector2i = Vector2<int>;

// Vectors serialize as [x, y].
template <typename T>
void to_json(nlohmann::json& j, const Vector2<T>& v)
{
    j = nlohmann::json::array({ v.x, v.y });
}

template <typename T>
void from_json(const nlohmann::json& j, Vector2<T>& v)
{
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("Vector2 expects a two-element array");
    }
    v.x = j.at(0).get<T>();
    v.y = j.at(1).get<T>();
}

} // namespace Biomorph

template <typename T>
struct fmt::formatter<Biomorph::Vector2<T>> : fmt::formatter<double> {
    auto format(const Biomorph::Vector2<T>& v, fmt::format_context& ctx) const
    {
        return fmt::format_to(ctx.out(), "({:.1f}, {:.1f})", double(v.x), double(v.y));
    }
};
