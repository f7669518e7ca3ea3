#ifndef BLOCKROLL_MATH_HPP
#define BLOCKROLL_MATH_HPP

// ============================================================================
// MATH MODULE (Vector & Quaternion)
// ============================================================================

namespace Math {
    const double PI = 3.14159265358979323846;

    struct Vec3 {
        double x, y, z;
        Vec3(double _x = 0, double _y = 0, double _z = 0) : x(_x), y(_y), z(_z) {}

        Vec3 operator+(const Vec3& other) const {
            return Vec3(x + other.x, y + other.y, z + other.z);
        }

        Vec3 operator-(const Vec3& other) const {
            return Vec3(x - other.x, y - other.y, z - other.z);
        }

        Vec3 operator*(double s) const {
            return Vec3(x * s, y * s, z * s);
        }

        double dot(const Vec3& other) const {
            return x * other.x + y * other.y + z * other.z;
        }

        Vec3 cross(const Vec3& other) const {
            return Vec3(y * other.z - z * other.y,
                        z * other.x - x * other.z,
                        x * other.y - y * other.x);
        }

        double length() const;
        double distance(const Vec3& other) const;
    };

    // Unit quaternion, w + (x, y, z)
    struct Quat {
        double w, x, y, z;
        Quat(double _w = 1, double _x = 0, double _y = 0, double _z = 0)
            : w(_w), x(_x), y(_y), z(_z) {}

        // Hamilton product: applying the result equals applying `other` then `*this`
        Quat operator*(const Quat& other) const {
            return Quat(w * other.w - x * other.x - y * other.y - z * other.z,
                        w * other.x + x * other.w + y * other.z - z * other.y,
                        w * other.y - x * other.z + y * other.w + z * other.x,
                        w * other.z + x * other.y - y * other.x + z * other.w);
        }

        Quat conjugate() const { return Quat(w, -x, -y, -z); }
        Quat normalized() const;
        Vec3 rotate(const Vec3& v) const;

        // Column-major 4x4 rotation, ready for glMultMatrixd
        void toMatrix(double out[16]) const;
    };

    extern const Vec3 X_AXIS;
    extern const Vec3 Y_AXIS;
    extern const Vec3 Z_AXIS;

    double degToRad(double deg);
    Quat quatFromAxisAngle(const Vec3& axis, double angleDeg);

    // q and -q describe the same rotation
    bool sameRotation(const Quat& a, const Quat& b, double eps);

    Vec3 lerp(const Vec3& from, const Vec3& to, double t);

    // Rounding used to classify drifting positions
    double halfRound(double v);      // nearest 0.5
    double twoPtRound(double v);     // nearest 0.01
    bool isInt(double v);            // v % 1 == 0, sign-safe
}

#endif
