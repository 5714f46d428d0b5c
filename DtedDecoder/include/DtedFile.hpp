/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedFile.hpp
 * @brief Whole-file DTED decoder declaration
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "DtedHeader.hpp"
#include "DtedRecord.hpp"

/**
 * @brief Decoder strictness knobs
 */
struct DecodeOptions
{
    ChecksumPolicy checksumPolicy = ChecksumPolicy::Ignore;
    bool verifySectionSentinels = false;    // require "DSIU" and "ACC" at the opaque blocks
};

/**
 * @brief DtedFile struct
 * @details Header plus one record per longitude line, west to east.
 */
struct DtedFile
{
    DtedHeader header;
    std::vector<DtedRecord> records;
};

DtedFile decodeDtedFile(const uint8_t* data, std::size_t size, const DecodeOptions& options = DecodeOptions());
DtedFile decodeDtedFile(const std::vector<uint8_t>& bytes, const DecodeOptions& options = DecodeOptions());
