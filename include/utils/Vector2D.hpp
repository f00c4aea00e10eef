/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>

// Plain 2D vector for positions, facings and spawn directions
class Vector2D {
public:
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    // Zero-length vectors normalize to +X so facings stay valid
    Vector2D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 0.0001f) return Vector2D(1.0f, 0.0f);
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector2D(m_x * invLen, m_y * invLen);
    }

    float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    Vector2D& operator+=(const Vector2D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        return *this;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D& operator-=(const Vector2D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        return *this;
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }

    bool operator!=(const Vector2D& v2) const { return !(*this == v2); }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    // Moves 'from' toward 'to' by at most maxStep, never overshooting
    static Vector2D moveTowards(const Vector2D& from, const Vector2D& to,
                                float maxStep) {
        Vector2D delta = to - from;
        float dist = delta.length();
        if (dist <= maxStep || dist < 0.0001f) {
            return to;
        }
        return from + delta * (maxStep / dist);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
