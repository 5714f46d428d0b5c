/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file FieldDecoder.cpp
 * @brief Primitive DTED field decoder implementation
 */

#include "FieldDecoder.hpp"
#include "DtedError.hpp"

#include <cstring>
#include <stdexcept>

constexpr uint16_t U16_SIGN_BIT = 0x8000;
constexpr uint16_t U16_DATA_MASK = 0x7FFF;

// Widest ASCII field that always fits a uint32_t accumulator
constexpr std::size_t MAX_DIGIT_WIDTH = 9;

/**
 * @brief Get the literal bytes of a sentinel
 * @param sentinel Sentinel id
 * @return Byte sequence
 */
std::string_view sentinelBytes(Sentinel sentinel)
{
    switch (sentinel)
    {
        case Sentinel::UHL:  return std::string_view("UHL1", 4);
        case Sentinel::DSI:  return std::string_view("DSIU", 4);
        case Sentinel::ACC:  return std::string_view("ACC", 3);
        case Sentinel::DATA: return std::string_view("\xAA", 1);
        case Sentinel::NA:   return std::string_view("NA", 2);
    }
    return std::string_view();
}

/**
 * @brief Constructor over a raw buffer
 * @param data Start of buffer, must outlive the cursor
 * @param size Buffer length in bytes
 */
ByteCursor::ByteCursor(const uint8_t* data, std::size_t size)
    : data_(data)
    , size_(size)
    , offset_(0)
{
}

/**
 * @brief Constructor over a byte vector
 * @param bytes Buffer, must outlive the cursor
 */
ByteCursor::ByteCursor(const std::vector<uint8_t>& bytes)
    : ByteCursor(bytes.data(), bytes.size())
{
}

/**
 * @brief Consume count bytes
 * @param count Number of bytes
 * @return Pointer to the first consumed byte
 */
const uint8_t* ByteCursor::take(std::size_t count)
{
    if (count > remaining())
    {
        throw DtedError(DtedErrorKind::IncompleteInput,
                        "needed " + std::to_string(count) + " bytes, " +
                        std::to_string(remaining()) + " available", offset_);
    }
    const uint8_t* start = data_ + offset_;
    offset_ += count;
    return start;
}

/**
 * @brief Check whether the next bytes equal a sentinel without consuming them
 */
bool startsWith(const ByteCursor& cursor, Sentinel sentinel)
{
    std::string_view tag = sentinelBytes(sentinel);
    return cursor.remaining() >= tag.size() &&
           std::memcmp(cursor.position(), tag.data(), tag.size()) == 0;
}

/**
 * @brief Consume and verify a sentinel
 * @param cursor Byte cursor
 * @param sentinel Expected sentinel
 */
void matchTag(ByteCursor& cursor, Sentinel sentinel)
{
    std::string_view tag = sentinelBytes(sentinel);
    if (cursor.remaining() < tag.size())
    {
        throw DtedError(DtedErrorKind::IncompleteInput,
                        "input ends before the " + std::to_string(tag.size()) + "-byte tag",
                        cursor.offset());
    }
    if (!startsWith(cursor, sentinel))
    {
        throw DtedError(DtedErrorKind::StructuralMismatch,
                        "expected tag \"" + std::string(tag) + "\"", cursor.offset());
    }
    cursor.skip(tag.size());
}

/**
 * @brief Decode a fixed-width ASCII unsigned decimal field
 * @param cursor Byte cursor
 * @param width Number of digit bytes, 0 returns defaultValue without consuming
 * @param defaultValue Value for a zero-width field
 * @return Decoded value
 */
uint32_t decodeUnsigned(ByteCursor& cursor, std::size_t width, uint32_t defaultValue)
{
    if (width == 0)
    {
        return defaultValue;
    }
    if (width > MAX_DIGIT_WIDTH)
    {
        throw std::invalid_argument("decodeUnsigned: width " + std::to_string(width) +
                                    " exceeds " + std::to_string(MAX_DIGIT_WIDTH));
    }

    std::size_t start = cursor.offset();
    const uint8_t* bytes = cursor.take(width);

    uint32_t value = 0;
    for (std::size_t i = 0; i < width; ++i)
    {
        if (bytes[i] < '0' || bytes[i] > '9')
        {
            throw DtedError(DtedErrorKind::ValueDomain,
                            "non-digit byte " + std::to_string(bytes[i]) + " in numeric field",
                            start + i);
        }
        value = value * 10 + static_cast<uint32_t>(bytes[i] - '0');
    }
    return value;
}

/**
 * @brief Decode an unsigned field that may hold the "NA" not-available marker
 * @param cursor Byte cursor
 * @param width Field width including the marker filler
 * @return Empty when the field starts with "NA", the decoded value otherwise
 */
std::optional<uint16_t> decodeOptionalUnsigned(ByteCursor& cursor, std::size_t width)
{
    if (width >= sentinelBytes(Sentinel::NA).size() && startsWith(cursor, Sentinel::NA))
    {
        cursor.skip(width);
        return std::nullopt;
    }
    return decodeUnsignedAs<uint16_t>(cursor, width);
}

/**
 * @brief Decode a one-byte hemisphere letter
 * @param cursor Byte cursor
 * @param axis Restricts the letters to N/S or E/W
 * @return +1 for N/E or a blank slot, -1 for S/W
 */
int decodeHemisphere(ByteCursor& cursor, Hemisphere axis)
{
    std::size_t start = cursor.offset();
    uint8_t letter = *cursor.take(1);

    bool latitudeLetter = (letter == 'N' || letter == 'S');
    bool longitudeLetter = (letter == 'E' || letter == 'W');
    if ((axis == Hemisphere::Latitude && longitudeLetter) ||
        (axis == Hemisphere::Longitude && latitudeLetter))
    {
        throw DtedError(DtedErrorKind::StructuralMismatch,
                        std::string("hemisphere '") + static_cast<char>(letter) + "' does not match the " +
                        (axis == Hemisphere::Latitude ? "latitude" : "longitude") + " axis", start);
    }

    switch (letter)
    {
        case 'N':
        case 'E':
        case ' ':
        case '\0':
            return 1;
        case 'S':
        case 'W':
            return -1;
        default:
            throw DtedError(DtedErrorKind::StructuralMismatch,
                            "invalid hemisphere byte " + std::to_string(letter), start);
    }
}

/**
 * @brief Decode a DDDMMSSH angle field
 * @param cursor Byte cursor
 * @param degWidth Degree digits
 * @param minWidth Minute digits, 0 for none
 * @param secWidth Second digits, 0 for none
 * @param axis Hemisphere letters accepted
 * @return Signed angle
 */
Angle decodeAngle(ByteCursor& cursor, std::size_t degWidth, std::size_t minWidth, std::size_t secWidth,
                  Hemisphere axis)
{
    std::size_t start = cursor.offset();
    uint16_t deg = decodeUnsignedAs<uint16_t>(cursor, degWidth);
    uint8_t min = decodeUnsignedAs<uint8_t>(cursor, minWidth);
    uint8_t sec = decodeUnsignedAs<uint8_t>(cursor, secWidth);
    int sign = decodeHemisphere(cursor, axis);

    try
    {
        return Angle(deg, min, static_cast<double>(sec), sign < 0);
    }
    catch (const DtedError& e)
    {
        // Re-raise with the field position attached
        throw DtedError(e.kind(), "angle field: " + std::string(e.what()), start);
    }
}

/**
 * @brief Decode a fixed-width text field with trailing blanks removed
 */
std::string decodeText(ByteCursor& cursor, std::size_t width)
{
    const uint8_t* bytes = cursor.take(width);
    std::string text(reinterpret_cast<const char*>(bytes), width);
    std::size_t end = text.find_last_not_of(" \0", std::string::npos, 2);
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

/**
 * @brief Decode a big-endian 16-bit unsigned word
 */
uint16_t decodeU16(ByteCursor& cursor)
{
    const uint8_t* bytes = cursor.take(2);
    return static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
}

/**
 * @brief Decode a big-endian 32-bit unsigned word
 */
uint32_t decodeU32(ByteCursor& cursor)
{
    const uint8_t* bytes = cursor.take(4);
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
           static_cast<uint32_t>(bytes[3]);
}

/**
 * @brief Interpret a 16-bit word as signed magnitude
 * 
 * @details Bit 15 is the sign, bits 0-14 the magnitude. Not two's complement:
 * 0x8003 is -3 and 0x8000 is zero.
 * @param word Raw word
 * @return Signed value
 */
int16_t signedMagnitudeToInt(uint16_t word)
{
    int16_t magnitude = static_cast<int16_t>(word & U16_DATA_MASK);
    return (word & U16_SIGN_BIT) ? static_cast<int16_t>(-magnitude) : magnitude;
}

/**
 * @brief Decode a big-endian signed-magnitude 16-bit value
 */
int16_t decodeSignedMagnitude(ByteCursor& cursor)
{
    return signedMagnitudeToInt(decodeU16(cursor));
}
