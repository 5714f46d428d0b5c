/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedReader.hpp
 * @brief Load DTED files through GDAL's virtual file layer
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "DtedFile.hpp"

std::vector<uint8_t> readFileBytes(const std::string& path,
                                   std::size_t maxBytes = std::numeric_limits<std::size_t>::max());

DtedFile readDtedFile(const std::string& path, const DecodeOptions& options = DecodeOptions());
DtedHeader readDtedHeader(const std::string& path);
