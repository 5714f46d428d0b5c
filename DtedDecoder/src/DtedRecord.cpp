/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedRecord.cpp
 * @brief DTED elevation record decoder
 */

#include "DtedRecord.hpp"
#include "DtedError.hpp"
#include "Logger.hpp"

#include <stdexcept>

/**
 * @brief Parse a checksum policy name (ignore, warn, reject)
 * @param name Policy name
 * @return Policy
 */
ChecksumPolicy parseChecksumPolicy(const std::string& name)
{
    if (name == "ignore") return ChecksumPolicy::Ignore;
    if (name == "warn") return ChecksumPolicy::Warn;
    if (name == "reject") return ChecksumPolicy::Reject;
    throw std::invalid_argument("unknown checksum policy: " + name);
}

/**
 * @brief Get the name of a checksum policy
 */
const char* toString(ChecksumPolicy policy)
{
    switch (policy)
    {
        case ChecksumPolicy::Ignore: return "ignore";
        case ChecksumPolicy::Warn:   return "warn";
        case ChecksumPolicy::Reject: return "reject";
    }
    return "ignore";
}

/**
 * @brief Sum of the unsigned bytes of a record, excluding its checksum field
 * @param record First byte of the record (the 0xAA sentinel)
 * @param length Number of bytes to sum
 * @return Checksum
 */
uint32_t computeRecordChecksum(const uint8_t* record, std::size_t length)
{
    uint32_t sum = 0;
    for (std::size_t i = 0; i < length; ++i)
    {
        sum += record[i];
    }
    return sum;
}

/**
 * @brief Decode one longitude line
 * 
 * @details The line length is not stored in the record and has to come from the header's
 * latitude count. The byte after the sentinel is the high part of the block index.
 * @param cursor Byte cursor positioned at the 0xAA sentinel
 * @param lineLen Number of elevation posts in the line
 * @param policy Checksum handling
 * @return Decoded record
 */
DtedRecord decodeDtedRecord(ByteCursor& cursor, std::size_t lineLen, ChecksumPolicy policy)
{
    std::size_t start = cursor.offset();
    const uint8_t* recordStart = cursor.position();

    DtedRecord record;

    matchTag(cursor, Sentinel::DATA);
    uint8_t blockHigh = *cursor.take(1);
    uint16_t blockLow = decodeU16(cursor);
    record.blockIndex = static_cast<uint32_t>(blockHigh) * 0x10000 + blockLow;

    record.lonCount = decodeU16(cursor);
    record.latCount = decodeU16(cursor);

    if (cursor.remaining() < 2 * lineLen + 4)
    {
        throw DtedError(DtedErrorKind::IncompleteInput,
                        "record with " + std::to_string(lineLen) + " posts is truncated",
                        cursor.offset());
    }

    record.elevations.reserve(lineLen);
    for (std::size_t i = 0; i < lineLen; ++i)
    {
        record.elevations.push_back(decodeSignedMagnitude(cursor));
    }

    record.checksum = decodeU32(cursor);

    if (policy != ChecksumPolicy::Ignore)
    {
        uint32_t computed = computeRecordChecksum(recordStart, dtedRecordLength(lineLen) - 4);
        if (computed != record.checksum)
        {
            std::string message = "record " + std::to_string(record.blockIndex) +
                                  " checksum " + std::to_string(record.checksum) +
                                  " does not match computed " + std::to_string(computed);
            if (policy == ChecksumPolicy::Reject)
            {
                throw DtedError(DtedErrorKind::Checksum, message, start);
            }
            logger.warn(message);
        }
    }

    return record;
}
