/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file ElevationGrid.cpp
 * @brief ElevationGrid class implementation
 */

#include "ElevationGrid.hpp"
#include "DtedError.hpp"
#include "DtedReader.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

// DTED intervals are stored in tenths of an arc-second
constexpr double TENTHS_PER_DEG = 36000.0;
constexpr double TENTHS_PER_SEC = 10.0;

/**
 * @brief Constructor for ElevationGrid class
 * @param file Decoded DTED file, moved in
 * @param voidAsMissing Treat void posts (-32767) as missing data during interpolation
 */
ElevationGrid::ElevationGrid(DtedFile file, bool voidAsMissing)
    : header_(std::move(file.header))
    , records_(std::move(file.records))
    , voidAsMissing_(voidAsMissing)
{
    if (header_.count.lat < 2 || header_.count.lon < 2)
    {
        throw DtedError(DtedErrorKind::ValueDomain,
                        "grid needs at least 2 posts per axis, got " +
                        std::to_string(header_.count.lat) + " x " + std::to_string(header_.count.lon));
    }
    if (header_.interval.lat == 0 || header_.interval.lon == 0)
    {
        throw DtedError(DtedErrorKind::ValueDomain, "grid interval must be non-zero");
    }
    if (records_.size() != header_.count.lon)
    {
        throw DtedError(DtedErrorKind::StructuralMismatch,
                        "header declares " + std::to_string(header_.count.lon) + " lines, got " +
                        std::to_string(records_.size()));
    }
    for (const auto& record : records_)
    {
        if (record.elevations.size() != header_.count.lat)
        {
            throw DtedError(DtedErrorKind::StructuralMismatch,
                            "record " + std::to_string(record.blockIndex) + " holds " +
                            std::to_string(record.elevations.size()) + " posts, header declares " +
                            std::to_string(header_.count.lat));
        }
    }

    AxisElement<double> intervalTenths = header_.interval.cast<double>();
    interval_ = intervalTenths / TENTHS_PER_DEG;
    intervalSecs_ = intervalTenths / TENTHS_PER_SEC;
    origin_ = toDegrees(header_.origin);
    max_ = origin_ + interval_ * (header_.count - 1);
}

/**
 * @brief Load a DTED file and build its grid
 * @param path File path (any GDAL virtual path)
 * @param options Decoder strictness
 * @param voidAsMissing Void post handling
 * @return Grid
 */
ElevationGrid ElevationGrid::load(const std::string& path, const DecodeOptions& options, bool voidAsMissing)
{
    ElevationGrid grid(readDtedFile(path, options), voidAsMissing);
    BoundingBox bbox = grid.boundingBox();
    logger.info("[ElevationGrid::load] Loaded " + path + ". Bounds: (" +
                std::to_string(bbox.min_lat) + ", " + std::to_string(bbox.min_lon) + ") to (" +
                std::to_string(bbox.max_lat) + ", " + std::to_string(bbox.max_lon) + ")");
    return grid;
}

/**
 * @brief Decode an in-memory DTED file and build its grid
 */
ElevationGrid ElevationGrid::fromBytes(const std::vector<uint8_t>& bytes, const DecodeOptions& options,
                                       bool voidAsMissing)
{
    return ElevationGrid(decodeDtedFile(bytes, options), voidAsMissing);
}

/**
 * @brief Get the grid extent in decimal degrees
 */
BoundingBox ElevationGrid::boundingBox() const
{
    BoundingBox bbox;
    bbox.min_lat = origin_.lat;
    bbox.max_lat = max_.lat;
    bbox.min_lon = origin_.lon;
    bbox.max_lon = max_.lon;
    return bbox;
}

/**
 * @brief Get a raw post value
 * @param lonIndex Longitude line index
 * @param latIndex Latitude post index within the line
 * @return Elevation in meters
 */
int16_t ElevationGrid::post(std::size_t lonIndex, std::size_t latIndex) const
{
    return records_.at(lonIndex).elevations.at(latIndex);
}

/**
 * @brief Checks if a point lies inside the grid, edges included
 */
bool ElevationGrid::contains(double lat, double lon) const
{
    if (std::isnan(lat) || std::isnan(lon))
    {
        return false;
    }
    return lat >= origin_.lat && lat <= max_.lat &&
           lon >= origin_.lon && lon <= max_.lon;
}

/**
 * @brief Continuous grid coordinate along one axis
 * 
 * @details A value equal to the axis maximum maps exactly onto the last index so that the
 * edge post is returned without rounding error.
 */
double ElevationGrid::gridPosition(double value, double min, double max, double interval, uint16_t count) const
{
    if (value == max)
    {
        return static_cast<double>(count - 1);
    }
    return std::min((value - min) / interval, static_cast<double>(count - 1));
}

/**
 * @brief Get elevation at given latitude and longitude
 * @param lat Latitude in degrees
 * @param lon Longitude in degrees
 * @return Bilinearly interpolated elevation in meters, empty outside coverage
 */
std::optional<double> ElevationGrid::getElevation(double lat, double lon) const
{
    if (!contains(lat, lon))
    {
        return std::nullopt;
    }

    double latPos = gridPosition(lat, origin_.lat, max_.lat, interval_.lat, header_.count.lat);
    double lonPos = gridPosition(lon, origin_.lon, max_.lon, interval_.lon, header_.count.lon);

    std::size_t latIdx = static_cast<std::size_t>(latPos);
    std::size_t lonIdx = static_cast<std::size_t>(lonPos);
    double latFrac = latPos - static_cast<double>(latIdx);
    double lonFrac = lonPos - static_cast<double>(lonIdx);

    // Keep the 2x2 neighbourhood inside the grid on the last line/post
    if (latIdx == static_cast<std::size_t>(header_.count.lat) - 1)
    {
        latIdx -= 1;
        latFrac += 1.0;
    }
    if (lonIdx == static_cast<std::size_t>(header_.count.lon) - 1)
    {
        lonIdx -= 1;
        lonFrac += 1.0;
    }

    const std::vector<int16_t>& west = records_[lonIdx].elevations;
    const std::vector<int16_t>& east = records_[lonIdx + 1].elevations;

    const int16_t corners[4] = { west[latIdx], west[latIdx + 1], east[latIdx], east[latIdx + 1] };
    const double weights[4] = {
        (1.0 - lonFrac) * (1.0 - latFrac),
        (1.0 - lonFrac) * latFrac,
        lonFrac * (1.0 - latFrac),
        lonFrac * latFrac
    };

    double elevation = 0.0;
    for (int i = 0; i < 4; ++i)
    {
        if (voidAsMissing_ && weights[i] != 0.0 && corners[i] == DTED_VOID_VALUE)
        {
            return std::nullopt;
        }
        elevation += static_cast<double>(corners[i]) * weights[i];
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
 * @return Sampled points, points without an elevation are left out
 */
std::vector<TerrainPoint> ElevationGrid::getElevationGrid(double latStart, double lonStart,
                                                          double latEnd, double lonEnd,
                                                          int numLatSamples, int numLonSamples) const
{
    if (numLatSamples < 2 || numLonSamples < 2)
    {
        throw std::invalid_argument("getElevationGrid needs at least 2 samples per axis");
    }

    std::vector<TerrainPoint> points;
    points.reserve(static_cast<std::size_t>(numLatSamples) * static_cast<std::size_t>(numLonSamples));

    double lat_step = (latEnd - latStart) / (numLatSamples - 1);
    double lon_step = (lonEnd - lonStart) / (numLonSamples - 1);

    std::size_t missing = 0;
    for (int i = 0; i < numLatSamples; ++i)
    {
        for (int j = 0; j < numLonSamples; ++j)
        {
            double lat = (i == numLatSamples - 1) ? latEnd : latStart + i * lat_step;
            double lon = (j == numLonSamples - 1) ? lonEnd : lonStart + j * lon_step;

            std::optional<double> elevation = getElevation(lat, lon);
            if (!elevation)
            {
                ++missing;
                continue;
            }

            TerrainPoint pt;
            pt.lat = lat;
            pt.lon = lon;
            pt.alt = *elevation;
            points.push_back(pt);
        }
    }

    if (missing > 0)
    {
        logger.warn("[ElevationGrid::getElevationGrid] " + std::to_string(missing) +
                    " samples had no elevation and were skipped");
    }
    return points;
}
