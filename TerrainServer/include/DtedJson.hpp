/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedJson.hpp
 * @brief JSON views of decoded DTED metadata
 */

#pragma once

#include <nlohmann/json.hpp>

#include "DtedHeader.hpp"
#include "ElevationGrid.hpp"

nlohmann::json angleToJson(const Angle& angle);
nlohmann::json headerToJson(const DtedHeader& header);
nlohmann::json gridToJson(const ElevationGrid& grid);
