/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file AxisElement.hpp
 * @brief AxisElement template and checked numeric conversion
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <type_traits>

#include "Angle.hpp"
#include "DtedError.hpp"

/**
 * @brief Checked conversion between arithmetic types
 * 
 * @details Floating point sources are truncated toward zero before the range check.
 * NaN, infinities and values outside the destination range throw DtedError(Conversion).
 * @param value Value to convert
 * @return Converted value
 */
template <typename To, typename From>
To numericCast(From value)
{
    static_assert(std::is_arithmetic<To>::value && std::is_arithmetic<From>::value,
                  "numericCast requires arithmetic types");

    if constexpr (std::is_floating_point<To>::value)
    {
        if constexpr (std::is_floating_point<From>::value)
        {
            if (std::isfinite(value) &&
                std::fabs(static_cast<long double>(value)) >
                    static_cast<long double>(std::numeric_limits<To>::max()))
            {
                throw DtedError(DtedErrorKind::Conversion,
                                std::to_string(value) + " does not fit the floating point target");
            }
        }
        return static_cast<To>(value);
    }
    else if constexpr (std::is_floating_point<From>::value)
    {
        if (!std::isfinite(value))
        {
            throw DtedError(DtedErrorKind::Conversion, "cannot convert a non-finite value to an integer");
        }
        long double truncated = std::trunc(static_cast<long double>(value));
        if (truncated < static_cast<long double>(std::numeric_limits<To>::lowest()) ||
            truncated > static_cast<long double>(std::numeric_limits<To>::max()))
        {
            throw DtedError(DtedErrorKind::Conversion,
                            std::to_string(value) + " is out of range for the integer target");
        }
        return static_cast<To>(truncated);
    }
    else
    {
        if constexpr (std::is_signed<From>::value)
        {
            if (value < 0)
            {
                if (!std::is_signed<To>::value ||
                    static_cast<std::intmax_t>(value) <
                        static_cast<std::intmax_t>(std::numeric_limits<To>::lowest()))
                {
                    throw DtedError(DtedErrorKind::Conversion,
                                    std::to_string(value) + " is out of range for the integer target");
                }
                return static_cast<To>(value);
            }
        }
        if (static_cast<std::uintmax_t>(value) >
            static_cast<std::uintmax_t>(std::numeric_limits<To>::max()))
        {
            throw DtedError(DtedErrorKind::Conversion,
                            std::to_string(value) + " is out of range for the integer target");
        }
        return static_cast<To>(value);
    }
}

/**
 * @brief AxisElement struct
 * @details One value per geographic axis. Every operation acts on latitude and longitude
 * independently.
 */
template <typename T>
struct AxisElement
{
    T lat;
    T lon;

    AxisElement() : lat(), lon() {}
    AxisElement(const T& lat_, const T& lon_) : lat(lat_), lon(lon_) {}

    /**
     * @brief Convert both axes to another arithmetic type
     * @return Converted pair, throws DtedError(Conversion) when a value does not fit
     */
    template <typename U>
    AxisElement<U> cast() const
    {
        return AxisElement<U>(numericCast<U>(lat), numericCast<U>(lon));
    }
};

template <typename T>
bool operator==(const AxisElement<T>& lhs, const AxisElement<T>& rhs)
{
    return lhs.lat == rhs.lat && lhs.lon == rhs.lon;
}

template <typename T>
bool operator!=(const AxisElement<T>& lhs, const AxisElement<T>& rhs)
{
    return !(lhs == rhs);
}

namespace detail
{
    // Integer results are computed in long double and narrowed back to T with a range check,
    // floating results are range checked, Angle results pass through
    template <typename T, typename A, typename B, typename Op>
    T combine(const A& a, const B& b, Op op)
    {
        if constexpr (std::is_integral<T>::value)
        {
            if constexpr (std::is_same<Op, std::divides<>>::value)
            {
                if (b == 0)
                {
                    throw DtedError(DtedErrorKind::Conversion, "integer division by zero");
                }
            }
            return numericCast<T>(op(static_cast<long double>(a), static_cast<long double>(b)));
        }
        else if constexpr (std::is_arithmetic<T>::value)
        {
            return numericCast<T>(op(a, b));
        }
        else
        {
            return op(a, b);
        }
    }

    template <typename T>
    using EnableArithmetic = std::enable_if_t<std::is_arithmetic<T>::value, AxisElement<T>>;

    template <typename T, typename U>
    using EnableMixed = std::enable_if_t<!std::is_same<T, U>::value &&
                                         std::is_arithmetic<T>::value &&
                                         std::is_arithmetic<U>::value, AxisElement<T>>;

    template <typename T, typename S>
    using EnableScalar = std::enable_if_t<std::is_arithmetic<T>::value &&
                                          std::is_arithmetic<S>::value, AxisElement<T>>;

    template <typename U>
    using EnableAngleByAxis = std::enable_if_t<std::is_arithmetic<U>::value, AxisElement<Angle>>;

    template <typename T, typename U, typename Op>
    AxisElement<T> mixed(const AxisElement<T>& lhs, const AxisElement<U>& rhs, Op op)
    {
        return AxisElement<T>(
            numericCast<T>(op(static_cast<double>(lhs.lat), static_cast<double>(rhs.lat))),
            numericCast<T>(op(static_cast<double>(lhs.lon), static_cast<double>(rhs.lon))));
    }

    template <typename T, typename S, typename Op>
    AxisElement<T> broadcast(const AxisElement<T>& lhs, const S& rhs, Op op)
    {
        return AxisElement<T>(combine<T>(lhs.lat, rhs, op), combine<T>(lhs.lon, rhs, op));
    }

    template <typename T, typename Op>
    AxisElement<T> pairwise(const AxisElement<T>& lhs, const AxisElement<T>& rhs, Op op)
    {
        return AxisElement<T>(combine<T>(lhs.lat, rhs.lat, op), combine<T>(lhs.lon, rhs.lon, op));
    }
}

// Same type, per axis. Angle pairs only add and subtract
template <typename T>
AxisElement<T> operator+(const AxisElement<T>& lhs, const AxisElement<T>& rhs)
{
    return detail::pairwise(lhs, rhs, std::plus<>());
}

template <typename T>
AxisElement<T> operator-(const AxisElement<T>& lhs, const AxisElement<T>& rhs)
{
    return detail::pairwise(lhs, rhs, std::minus<>());
}

template <typename T>
detail::EnableArithmetic<T> operator*(const AxisElement<T>& lhs, const AxisElement<T>& rhs)
{
    return detail::pairwise(lhs, rhs, std::multiplies<>());
}

template <typename T>
detail::EnableArithmetic<T> operator/(const AxisElement<T>& lhs, const AxisElement<T>& rhs)
{
    return detail::pairwise(lhs, rhs, std::divides<>());
}

// Mixed numeric types, computed in double and narrowed to the left operand's type
template <typename T, typename U>
detail::EnableMixed<T, U> operator+(const AxisElement<T>& lhs, const AxisElement<U>& rhs)
{
    return detail::mixed(lhs, rhs, std::plus<>());
}

template <typename T, typename U>
detail::EnableMixed<T, U> operator-(const AxisElement<T>& lhs, const AxisElement<U>& rhs)
{
    return detail::mixed(lhs, rhs, std::minus<>());
}

template <typename T, typename U>
detail::EnableMixed<T, U> operator*(const AxisElement<T>& lhs, const AxisElement<U>& rhs)
{
    return detail::mixed(lhs, rhs, std::multiplies<>());
}

template <typename T, typename U>
detail::EnableMixed<T, U> operator/(const AxisElement<T>& lhs, const AxisElement<U>& rhs)
{
    return detail::mixed(lhs, rhs, std::divides<>());
}

// Scalar broadcast to both axes
template <typename T, typename S>
detail::EnableScalar<T, S> operator+(const AxisElement<T>& lhs, S rhs)
{
    return detail::broadcast(lhs, rhs, std::plus<>());
}

template <typename T, typename S>
detail::EnableScalar<T, S> operator-(const AxisElement<T>& lhs, S rhs)
{
    return detail::broadcast(lhs, rhs, std::minus<>());
}

template <typename T, typename S>
detail::EnableScalar<T, S> operator*(const AxisElement<T>& lhs, S rhs)
{
    return detail::broadcast(lhs, rhs, std::multiplies<>());
}

template <typename T, typename S>
detail::EnableScalar<T, S> operator/(const AxisElement<T>& lhs, S rhs)
{
    return detail::broadcast(lhs, rhs, std::divides<>());
}

// Angle pair scaled by one factor
inline AxisElement<Angle> operator*(const AxisElement<Angle>& lhs, double factor)
{
    return AxisElement<Angle>(lhs.lat * factor, lhs.lon * factor);
}

inline AxisElement<Angle> operator/(const AxisElement<Angle>& lhs, double divisor)
{
    return AxisElement<Angle>(lhs.lat / divisor, lhs.lon / divisor);
}

// Angle pair scaled by a numeric pair
template <typename U>
detail::EnableAngleByAxis<U> operator*(const AxisElement<Angle>& lhs, const AxisElement<U>& rhs)
{
    return AxisElement<Angle>(lhs.lat * static_cast<double>(rhs.lat),
                              lhs.lon * static_cast<double>(rhs.lon));
}

template <typename U>
detail::EnableAngleByAxis<U> operator/(const AxisElement<Angle>& lhs, const AxisElement<U>& rhs)
{
    return AxisElement<Angle>(lhs.lat / static_cast<double>(rhs.lat),
                              lhs.lon / static_cast<double>(rhs.lon));
}

/**
 * @brief Convert an angle pair to signed decimal degrees
 */
inline AxisElement<double> toDegrees(const AxisElement<Angle>& angles)
{
    return AxisElement<double>(angles.lat.toDegrees(), angles.lon.toDegrees());
}
