#include "Math.hpp"

#include <cmath>

namespace Math {
    const Vec3 X_AXIS(1, 0, 0);
    const Vec3 Y_AXIS(0, 1, 0);
    const Vec3 Z_AXIS(0, 0, 1);

    double Vec3::length() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    double Vec3::distance(const Vec3& other) const {
        return (*this - other).length();
    }

    Quat Quat::normalized() const {
        double n = std::sqrt(w * w + x * x + y * y + z * z);
        if (n == 0.0) return Quat();
        return Quat(w / n, x / n, y / n, z / n);
    }

    Vec3 Quat::rotate(const Vec3& v) const {
        // v' = q v q*, expanded: v + 2w(u x v) + 2(u x (u x v))
        Vec3 u(x, y, z);
        Vec3 t = u.cross(v) * 2.0;
        return v + t * w + u.cross(t);
    }

    void Quat::toMatrix(double out[16]) const {
        double xx = x * x, yy = y * y, zz = z * z;
        double xy = x * y, xz = x * z, yz = y * z;
        double wx = w * x, wy = w * y, wz = w * z;

        out[0] = 1 - 2 * (yy + zz);
        out[1] = 2 * (xy + wz);
        out[2] = 2 * (xz - wy);
        out[3] = 0;

        out[4] = 2 * (xy - wz);
        out[5] = 1 - 2 * (xx + zz);
        out[6] = 2 * (yz + wx);
        out[7] = 0;

        out[8] = 2 * (xz + wy);
        out[9] = 2 * (yz - wx);
        out[10] = 1 - 2 * (xx + yy);
        out[11] = 0;

        out[12] = 0;
        out[13] = 0;
        out[14] = 0;
        out[15] = 1;
    }

    double degToRad(double deg) {
        return deg * PI / 180.0;
    }

    Quat quatFromAxisAngle(const Vec3& axis, double angleDeg) {
        double len = axis.length();
        if (len == 0.0) return Quat();
        double half = degToRad(angleDeg) / 2.0;
        double s = std::sin(half) / len;
        return Quat(std::cos(half), axis.x * s, axis.y * s, axis.z * s);
    }

    bool sameRotation(const Quat& a, const Quat& b, double eps) {
        double d = a.w * b.w + a.x * b.x + a.y * b.y + a.z * b.z;
        return std::fabs(std::fabs(d) - 1.0) < eps;
    }

    Vec3 lerp(const Vec3& from, const Vec3& to, double t) {
        return from + (to - from) * t;
    }

    double halfRound(double v) {
        return std::round(v * 2.0) / 2.0;
    }

    double twoPtRound(double v) {
        return std::round(v * 100.0) / 100.0;
    }

    bool isInt(double v) {
        return std::fmod(v, 1.0) == 0.0;
    }
}
