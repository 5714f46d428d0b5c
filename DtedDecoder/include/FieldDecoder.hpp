/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file FieldDecoder.hpp
 * @brief Byte cursor and primitive DTED field decoders
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Angle.hpp"
#include "AxisElement.hpp"

/**
 * @brief Literal byte sequences that open DTED sections and fields
 */
enum class Sentinel
{
    UHL,    // "UHL1"
    DSI,    // "DSIU"
    ACC,    // "ACC"
    DATA,   // 0xAA
    NA      // "NA"
};

std::string_view sentinelBytes(Sentinel sentinel);

// Axis a hemisphere letter belongs to: N/S for latitude, E/W for longitude
enum class Hemisphere
{
    Any,
    Latitude,
    Longitude
};

/**
 * @brief ByteCursor class
 * 
 * @details Read position over a caller-owned byte buffer. Every read either consumes the
 * requested bytes or throws DtedError(IncompleteInput) without moving.
 */
class ByteCursor
{
    public:
        ByteCursor(const uint8_t* data, std::size_t size);
        explicit ByteCursor(const std::vector<uint8_t>& bytes);

        std::size_t offset() const { return offset_; }
        std::size_t size() const { return size_; }
        std::size_t remaining() const { return size_ - offset_; }
        bool atEnd() const { return offset_ == size_; }
        const uint8_t* position() const { return data_ + offset_; }

        const uint8_t* take(std::size_t count);
        void skip(std::size_t count) { take(count); }

    private:
        const uint8_t* data_;
        std::size_t size_;
        std::size_t offset_;
};

// Tags
void matchTag(ByteCursor& cursor, Sentinel sentinel);
bool startsWith(const ByteCursor& cursor, Sentinel sentinel);

// ASCII numeric fields
uint32_t decodeUnsigned(ByteCursor& cursor, std::size_t width, uint32_t defaultValue = 0);
std::optional<uint16_t> decodeOptionalUnsigned(ByteCursor& cursor, std::size_t width = 4);
int decodeHemisphere(ByteCursor& cursor, Hemisphere axis = Hemisphere::Any);
Angle decodeAngle(ByteCursor& cursor, std::size_t degWidth, std::size_t minWidth, std::size_t secWidth,
                  Hemisphere axis = Hemisphere::Any);
std::string decodeText(ByteCursor& cursor, std::size_t width);

/**
 * @brief Decode a fixed-width ASCII unsigned field into a narrower type
 * @return Decoded value, throws DtedError(Conversion) if it does not fit U
 */
template <typename U>
U decodeUnsignedAs(ByteCursor& cursor, std::size_t width, U defaultValue = U())
{
    return numericCast<U>(decodeUnsigned(cursor, width, defaultValue));
}

// Binary fields, big-endian
uint16_t decodeU16(ByteCursor& cursor);
uint32_t decodeU32(ByteCursor& cursor);
int16_t signedMagnitudeToInt(uint16_t word);
int16_t decodeSignedMagnitude(ByteCursor& cursor);
