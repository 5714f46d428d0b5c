/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedFile.cpp
 * @brief Whole-file DTED decoder
 */

#include "DtedFile.hpp"
#include "DtedError.hpp"
#include "Logger.hpp"

/**
 * @brief Skip an opaque metadata block, optionally checking its leading sentinel
 */
static void skipSection(ByteCursor& cursor, std::size_t length, Sentinel sentinel, bool verify)
{
    if (cursor.remaining() < length)
    {
        throw DtedError(DtedErrorKind::IncompleteInput,
                        "metadata block needs " + std::to_string(length) + " bytes, " +
                        std::to_string(cursor.remaining()) + " available", cursor.offset());
    }
    if (verify)
    {
        matchTag(cursor, sentinel);
        cursor.skip(length - sentinelBytes(sentinel).size());
    }
    else
    {
        cursor.skip(length);
    }
}

/**
 * @brief Decode a complete DTED file held in memory
 * 
 * @details Header at offset 0, the DSI and ACC blocks skipped, then count.lon records of
 * count.lat posts each, back to back. The buffer must end exactly after the last record.
 * @param data Buffer start
 * @param size Buffer length
 * @param options Decoder strictness
 * @return Decoded file
 */
DtedFile decodeDtedFile(const uint8_t* data, std::size_t size, const DecodeOptions& options)
{
    ByteCursor cursor(data, size);
    DtedFile file;

    file.header = decodeDtedHeader(cursor);

    skipSection(cursor, DTED_DSI_LENGTH, Sentinel::DSI, options.verifySectionSentinels);
    skipSection(cursor, DTED_ACC_LENGTH, Sentinel::ACC, options.verifySectionSentinels);

    std::size_t lineLen = file.header.count.lat;
    std::size_t lineCount = file.header.count.lon;

    file.records.reserve(lineCount);
    for (std::size_t i = 0; i < lineCount; ++i)
    {
        file.records.push_back(decodeDtedRecord(cursor, lineLen, options.checksumPolicy));
        if (logger.enabled(LogLevel::Debug))
        {
            logger.debug("[decodeDtedFile] Decoded record " + std::to_string(i) + " (block " +
                         std::to_string(file.records.back().blockIndex) + ")");
        }
    }

    if (!cursor.atEnd())
    {
        throw DtedError(DtedErrorKind::StructuralMismatch,
                        std::to_string(cursor.remaining()) + " trailing bytes after the last record",
                        cursor.offset());
    }

    logger.info("[decodeDtedFile] Decoded " + std::to_string(lineCount) + " x " +
                std::to_string(lineLen) + " elevation posts");
    return file;
}

/**
 * @brief Decode a complete DTED file held in a byte vector
 */
DtedFile decodeDtedFile(const std::vector<uint8_t>& bytes, const DecodeOptions& options)
{
    return decodeDtedFile(bytes.data(), bytes.size(), options);
}
