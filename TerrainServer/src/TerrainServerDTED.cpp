/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file TerrainServerDTED.cpp
 * @brief TerrainServerDTED class implementation
 */

#include "TerrainServerDTED.hpp"
#include "DtedError.hpp"
#include "Logger.hpp"

#include <utility>

/**
 * @brief Load the grid, logging failures before they propagate
 */
ElevationGrid TerrainServerDTED::loadGrid(const std::string& path, const DecodeOptions& options,
                                          bool void_as_missing)
{
    try
    {
        return ElevationGrid::load(path, options, void_as_missing);
    }
    catch (const DtedError& e)
    {
        logger.error("[TerrainServerDTED] Failed to load DTED file " + path + ": " + e.what());
        throw;
    }
}

/**
 * @brief Constructor for TerrainServerDTED class
 * @param dted_path Path to the DTED file
 * @param options Decoder strictness
 * @param void_as_missing Treat void posts as missing data
 */
TerrainServerDTED::TerrainServerDTED(const std::string& dted_path, const DecodeOptions& options,
                                     bool void_as_missing)
    : dted_path_(dted_path)
    , grid_(loadGrid(dted_path, options, void_as_missing))
{
    bbox_ = grid_.boundingBox();

    const DtedHeader& header = grid_.header();
    logger.info("[TerrainServerDTED] Grid " + std::to_string(header.count.lon) + " x " +
                std::to_string(header.count.lat) + ", spacing " +
                std::to_string(grid_.intervalSeconds().lon) + "\" x " +
                std::to_string(grid_.intervalSeconds().lat) + "\", accuracy " +
                (header.accuracy ? std::to_string(*header.accuracy) + " m" : std::string("n/a")));
}

/**
 * @brief Constructor from an already decoded grid
 * @param grid Elevation grid, moved in
 */
TerrainServerDTED::TerrainServerDTED(ElevationGrid grid)
    : grid_(std::move(grid))
{
    bbox_ = grid_.boundingBox();
}

/**
 * @brief Get elevation at given latitude and longitude
 * @param lat Latitude in degrees
 * @param lon Longitude in degrees
 * @return Elevation in meters, empty outside coverage
 */
std::optional<double> TerrainServerDTED::getElevation(double lat, double lon) const
{
    if (!isPointInBounds(lat, lon))
    {
        logger.debug("[TerrainServerDTED] Point (" + std::to_string(lat) + ", " + std::to_string(lon) +
                     ") is outside coverage");
        return std::nullopt;
    }

    std::optional<double> elevation = grid_.getElevation(lat, lon);
    if (elevation && logger.enabled(LogLevel::Debug))
    {
        logger.debug("[TerrainServerDTED] Elevation at (" + std::to_string(lat) + ", " +
                     std::to_string(lon) + "): " + std::to_string(*elevation) + " m");
    }
    return elevation;
}

/**
 * @brief Get a grid of elevation values for a given latitude and longitude range
 * @param latStart Starting latitude in degrees
 * @param lonStart Starting longitude in degrees
 * @param latEnd Ending latitude in degrees
 * @param lonEnd Ending longitude in degrees
 * @param numLatSamples Number of latitude samples
 * @param numLonSamples Number of longitude samples
 */
std::vector<TerrainPoint> TerrainServerDTED::getElevationGrid(double latStart,
    double lonStart, double latEnd, double lonEnd, int numLatSamples, int numLonSamples) const
{
    logger.info("[TerrainServerDTED::getElevationGrid] Getting elevation grid from (" + std::to_string(latStart) + ", " +
                std::to_string(lonStart) + ") to (" + std::to_string(latEnd) + ", " +
                std::to_string(lonEnd) + ") with " + std::to_string(numLatSamples) +
                "x" + std::to_string(numLonSamples) + " samples.");

    std::vector<TerrainPoint> points = grid_.getElevationGrid(latStart, lonStart, latEnd, lonEnd,
                                                              numLatSamples, numLonSamples);

    logger.info("[TerrainServerDTED::getElevationGrid] Generated " + std::to_string(points.size()) + " elevation points");
    return points;
}
