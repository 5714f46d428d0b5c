/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file Angle.hpp
 * @brief Angle class declaration
 */

#pragma once

#include <cstdint>
#include <string>

constexpr double SEC_PER_DEG = 3600.0;
constexpr double SEC_PER_MIN = 60.0;
constexpr double MIN_PER_DEG = 60.0;

/**
 * @brief Angle class
 * 
 * @details Fixed-point geographic angle stored as degrees, minutes and seconds with a single
 * sign for the whole angle. Minutes and seconds are never negative. Arithmetic goes through
 * the total arc-second value and always yields a new Angle.
 */
class Angle
{
    public:
        // Largest magnitude, in arc-seconds, that still fits the 16-bit degree field
        static constexpr double MAX_TOTAL_SECONDS = 65535.0 * SEC_PER_DEG;

        Angle();
        Angle(uint16_t deg, uint8_t min, double sec, bool negative = false);

        static Angle fromTotalSeconds(double totalSeconds);
        static Angle fromDegrees(double degrees);

        uint16_t deg() const { return deg_; }
        uint8_t min() const { return min_; }
        double sec() const { return sec_; }
        bool isNegative() const { return negative_; }
        bool isZero() const { return deg_ == 0 && min_ == 0 && sec_ == 0.0; }

        double totalSeconds() const;
        double toDegrees() const;

        // Same angle with the sign cleared when every field is zero
        Angle normalized() const;

        std::string toString() const;

        Angle operator-() const;

    private:
        uint16_t deg_;
        uint8_t min_;
        double sec_;
        bool negative_;
};

bool operator==(const Angle& lhs, const Angle& rhs);
bool operator!=(const Angle& lhs, const Angle& rhs);
bool operator<(const Angle& lhs, const Angle& rhs);
bool operator>(const Angle& lhs, const Angle& rhs);
bool operator<=(const Angle& lhs, const Angle& rhs);
bool operator>=(const Angle& lhs, const Angle& rhs);

Angle operator+(const Angle& lhs, const Angle& rhs);
Angle operator-(const Angle& lhs, const Angle& rhs);
Angle operator*(const Angle& lhs, double factor);
Angle operator*(double factor, const Angle& rhs);
Angle operator/(const Angle& lhs, double divisor);
