/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedRecord.hpp
 * @brief DTED elevation record declaration
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "FieldDecoder.hpp"

// Sentinel, block count, two count echoes and checksum
constexpr std::size_t DTED_RECORD_OVERHEAD = 12;

// Elevation value DTED uses for void posts
constexpr int16_t DTED_VOID_VALUE = -32767;

/**
 * @brief What to do when a record's stored checksum disagrees with its bytes
 */
enum class ChecksumPolicy
{
    Ignore,
    Warn,
    Reject
};

ChecksumPolicy parseChecksumPolicy(const std::string& name);
const char* toString(ChecksumPolicy policy);

/**
 * @brief DtedRecord struct
 * @details One longitude line. Elevations run south to north, in meters.
 */
struct DtedRecord
{
    uint32_t blockIndex = 0;
    uint16_t lonCount = 0;
    uint16_t latCount = 0;
    std::vector<int16_t> elevations;
    uint32_t checksum = 0;
};

/**
 * @brief Byte length of a record holding lineLen elevations
 */
inline std::size_t dtedRecordLength(std::size_t lineLen)
{
    return DTED_RECORD_OVERHEAD + 2 * lineLen;
}

uint32_t computeRecordChecksum(const uint8_t* record, std::size_t length);

DtedRecord decodeDtedRecord(ByteCursor& cursor, std::size_t lineLen,
                            ChecksumPolicy policy = ChecksumPolicy::Ignore);
