/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedHeader.cpp
 * @brief DTED User Header Label decoder
 */

#include "DtedHeader.hpp"
#include "DtedError.hpp"

/**
 * @brief Decode the 80-byte User Header Label at the cursor
 * 
 * @details Layout: "UHL1", longitude DDDMMSSH, latitude DDDMMSSH, longitude and latitude
 * intervals (4 digits each), accuracy (4, may be "NA"), security code (3), unique
 * reference (12), longitude and latitude counts (4 digits each), multiple accuracy
 * flag (1), reserved (24).
 * @param cursor Byte cursor positioned at the label
 * @return Decoded header
 */
DtedHeader decodeDtedHeader(ByteCursor& cursor)
{
    if (cursor.remaining() < DTED_UHL_LENGTH)
    {
        throw DtedError(DtedErrorKind::IncompleteInput,
                        "user header label needs " + std::to_string(DTED_UHL_LENGTH) + " bytes, " +
                        std::to_string(cursor.remaining()) + " available", cursor.offset());
    }

    DtedHeader header;

    matchTag(cursor, Sentinel::UHL);

    header.origin.lon = decodeAngle(cursor, 3, 2, 2, Hemisphere::Longitude);
    header.origin.lat = decodeAngle(cursor, 3, 2, 2, Hemisphere::Latitude);

    header.interval.lon = decodeUnsignedAs<uint16_t>(cursor, 4);
    header.interval.lat = decodeUnsignedAs<uint16_t>(cursor, 4);

    header.accuracy = decodeOptionalUnsigned(cursor, 4);

    // 15 bytes: security code and unique reference
    header.securityCode = decodeText(cursor, 3);
    header.uniqueReference = decodeText(cursor, 12);

    header.count.lon = decodeUnsignedAs<uint16_t>(cursor, 4);
    header.count.lat = decodeUnsignedAs<uint16_t>(cursor, 4);

    // 25 bytes: multiple accuracy flag then reserved
    header.multipleAccuracy = (*cursor.take(1) == '1');
    cursor.skip(24);

    return header;
}

/**
 * @brief Decode a header from the start of a buffer
 * @param bytes Buffer holding at least the 80-byte label
 * @return Decoded header
 */
DtedHeader decodeDtedHeader(const std::vector<uint8_t>& bytes)
{
    ByteCursor cursor(bytes);
    return decodeDtedHeader(cursor);
}
