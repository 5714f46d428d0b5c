/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedHeader.hpp
 * @brief DTED User Header Label declaration
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Angle.hpp"
#include "AxisElement.hpp"
#include "FieldDecoder.hpp"

// Fixed section sizes of a DTED file
constexpr std::size_t DTED_UHL_LENGTH = 80;
constexpr std::size_t DTED_DSI_LENGTH = 648;
constexpr std::size_t DTED_ACC_LENGTH = 2700;
constexpr std::size_t DTED_DATA_OFFSET = DTED_UHL_LENGTH + DTED_DSI_LENGTH + DTED_ACC_LENGTH;

/**
 * @brief DtedHeader struct
 * @details Decoded User Header Label. Intervals are in tenths of an arc-second, counts are
 * (latitude points per line, longitude lines).
 */
struct DtedHeader
{
    AxisElement<Angle> origin;
    AxisElement<uint16_t> interval;
    std::optional<uint16_t> accuracy;   // absolute vertical accuracy in meters
    AxisElement<uint16_t> count;

    std::string securityCode;
    std::string uniqueReference;
    bool multipleAccuracy = false;
};

DtedHeader decodeDtedHeader(ByteCursor& cursor);
DtedHeader decodeDtedHeader(const std::vector<uint8_t>& bytes);
