/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedJson.cpp
 * @brief JSON views of decoded DTED metadata
 */

#include "DtedJson.hpp"

using json = nlohmann::json;

json angleToJson(const Angle& angle)
{
    return {
        {"deg", angle.deg()},
        {"min", angle.min()},
        {"sec", angle.sec()},
        {"negative", angle.isNegative()},
        {"degrees", angle.toDegrees()}
    };
}

/**
 * @brief Describe a User Header Label
 * @param header Decoded header
 * @return JSON object, accuracy is null when not available
 */
json headerToJson(const DtedHeader& header)
{
    json j;
    j["origin"] = {
        {"lat", angleToJson(header.origin.lat)},
        {"lon", angleToJson(header.origin.lon)}
    };
    j["interval_tenths_arcsec"] = {
        {"lat", header.interval.lat},
        {"lon", header.interval.lon}
    };
    j["count"] = {
        {"lat", header.count.lat},
        {"lon", header.count.lon}
    };
    j["accuracy_m"] = header.accuracy ? json(*header.accuracy) : json(nullptr);
    j["security_code"] = header.securityCode;
    j["unique_reference"] = header.uniqueReference;
    j["multiple_accuracy"] = header.multipleAccuracy;
    return j;
}

/**
 * @brief Describe a grid: its header plus derived decimal-degree geometry
 */
json gridToJson(const ElevationGrid& grid)
{
    json j = headerToJson(grid.header());
    j["interval_deg"] = {
        {"lat", grid.interval().lat},
        {"lon", grid.interval().lon}
    };
    j["bounds"] = {
        {"min_lat", grid.min().lat},
        {"max_lat", grid.max().lat},
        {"min_lon", grid.min().lon},
        {"max_lon", grid.max().lon}
    };
    j["void_as_missing"] = grid.voidAsMissing();
    return j;
}
