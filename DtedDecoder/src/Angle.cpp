/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file Angle.cpp
 * @brief Angle class implementation
 */

#include "Angle.hpp"
#include "DtedError.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

/**
 * @brief Default constructor, zero angle
 */
Angle::Angle()
    : deg_(0)
    , min_(0)
    , sec_(0.0)
    , negative_(false)
{
}

/**
 * @brief Constructor from raw fields
 * @param deg Degrees magnitude
 * @param min Minutes, 0-59
 * @param sec Seconds, 0 <= sec < 60
 * @param negative Sign of the whole angle
 */
Angle::Angle(uint16_t deg, uint8_t min, double sec, bool negative)
    : deg_(deg)
    , min_(min)
    , sec_(sec)
    , negative_(negative)
{
    if (min >= 60)
    {
        throw DtedError(DtedErrorKind::ValueDomain,
                        "minutes must be less than 60, got " + std::to_string(min));
    }
    if (std::isnan(sec) || sec >= 60.0)
    {
        throw DtedError(DtedErrorKind::ValueDomain,
                        "seconds must be less than 60, got " + std::to_string(sec));
    }
    if (sec < 0.0)
    {
        throw DtedError(DtedErrorKind::ValueDomain,
                        "seconds must be non-negative, use the sign flag for negative angles");
    }
}

/**
 * @brief Build an angle from a signed arc-second total
 * @param totalSeconds Signed arc-seconds
 * @return Normalized angle
 */
Angle Angle::fromTotalSeconds(double totalSeconds)
{
    if (std::isnan(totalSeconds))
    {
        throw DtedError(DtedErrorKind::ValueDomain, "cannot build an angle from NaN seconds");
    }

    double secAbs = std::fabs(totalSeconds);
    if (secAbs > MAX_TOTAL_SECONDS)
    {
        throw DtedError(DtedErrorKind::ValueDomain,
                        std::to_string(totalSeconds) + "s is too large to be an angle");
    }

    uint32_t secInt = static_cast<uint32_t>(secAbs);
    uint32_t deg = secInt / 3600;
    uint32_t min = (secInt % 3600) / 60;
    double sec = secAbs - static_cast<double>(deg * 3600 + min * 60);

    Angle angle;
    angle.deg_ = static_cast<uint16_t>(deg);
    angle.min_ = static_cast<uint8_t>(min);
    angle.sec_ = sec;
    angle.negative_ = totalSeconds < 0.0;
    return angle;
}

/**
 * @brief Build an angle from signed decimal degrees
 * @param degrees Signed decimal degrees
 * @return Normalized angle
 */
Angle Angle::fromDegrees(double degrees)
{
    return fromTotalSeconds(degrees * SEC_PER_DEG);
}

/**
 * @brief Get signed total arc-seconds
 */
double Angle::totalSeconds() const
{
    double secAbs = static_cast<double>(static_cast<uint32_t>(deg_) * 3600 +
                                        static_cast<uint32_t>(min_) * 60) + sec_;
    return negative_ ? -secAbs : secAbs;
}

/**
 * @brief Get signed decimal degrees
 */
double Angle::toDegrees() const
{
    double abs = static_cast<double>(deg_) + min_ / MIN_PER_DEG + sec_ / SEC_PER_DEG;
    return negative_ ? -abs : abs;
}

/**
 * @brief Clear the sign of a zero angle so +0 and -0 compare equal
 */
Angle Angle::normalized() const
{
    Angle angle = *this;
    if (angle.isZero())
    {
        angle.negative_ = false;
    }
    return angle;
}

/**
 * @brief Format as [-]DDD MM SS.ss
 */
std::string Angle::toString() const
{
    std::ostringstream oss;
    oss << (negative_ ? "-" : "")
        << std::setfill('0') << std::setw(3) << deg_ << " "
        << std::setw(2) << static_cast<int>(min_) << " "
        << std::fixed << std::setprecision(2) << std::setw(5) << sec_;
    return oss.str();
}

/**
 * @brief Negation
 */
Angle Angle::operator-() const
{
    Angle angle = *this;
    angle.negative_ = !negative_;
    return angle.normalized();
}

bool operator==(const Angle& lhs, const Angle& rhs)
{
    Angle a = lhs.normalized();
    Angle b = rhs.normalized();
    return a.deg() == b.deg() &&
           a.min() == b.min() &&
           a.sec() == b.sec() &&
           a.isNegative() == b.isNegative();
}

bool operator!=(const Angle& lhs, const Angle& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const Angle& lhs, const Angle& rhs)
{
    return lhs.totalSeconds() < rhs.totalSeconds();
}

bool operator>(const Angle& lhs, const Angle& rhs)
{
    return rhs < lhs;
}

bool operator<=(const Angle& lhs, const Angle& rhs)
{
    return !(rhs < lhs);
}

bool operator>=(const Angle& lhs, const Angle& rhs)
{
    return !(lhs < rhs);
}

Angle operator+(const Angle& lhs, const Angle& rhs)
{
    return Angle::fromTotalSeconds(lhs.totalSeconds() + rhs.totalSeconds());
}

Angle operator-(const Angle& lhs, const Angle& rhs)
{
    return Angle::fromTotalSeconds(lhs.totalSeconds() - rhs.totalSeconds());
}

Angle operator*(const Angle& lhs, double factor)
{
    return Angle::fromTotalSeconds(lhs.totalSeconds() * factor);
}

Angle operator*(double factor, const Angle& rhs)
{
    return rhs * factor;
}

// Division by zero yields an infinite total and is rejected as too large
Angle operator/(const Angle& lhs, double divisor)
{
    return Angle::fromTotalSeconds(lhs.totalSeconds() / divisor);
}
