/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file TerrainPoint.hpp
 * @brief TerrainPoint and BoundingBox definitions
 */

#pragma once

/**
 * @brief TerrainPoint struct
 * @details This struct represents a point on the terrain with latitude, longitude, and altitude information.
 */
struct TerrainPoint 
{
    double lat;
    double lon;
    double alt;
};

/**
 * @brief BoundingBox struct
 * @details This struct represents a bounding box defined by minimum and maximum latitude and longitude.
 */
struct BoundingBox 
{
    double min_lat;
    double max_lat;
    double min_lon;
    double max_lon;
};
