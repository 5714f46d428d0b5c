/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file ITerrainServer.hpp
 * @brief ITerrainServer class declaration
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "TerrainPoint.hpp"

/**
 * @brief ITerrainServer interface
 * 
 * @details This interface defines the methods for a terrain data server.
 */
class ITerrainServer
{
    public:
        virtual ~ITerrainServer() = default;

        // Pure virtual methods - must be implemented by derived classes
        virtual std::optional<double> getElevation(double lat, double lon) const = 0;
        virtual std::vector<TerrainPoint> getElevationGrid(double latStart, 
            double lonStart, double latEnd, double lonEnd, 
            int numLatSamples, int numLonSamples) const = 0;

        // Common virtual methods with default implementations
        virtual void startServer(int port);
        virtual BoundingBox getBoundingBox() const { return bbox_; }
        virtual bool exportToCSV(const std::vector<TerrainPoint>& points, const std::string& filename) const;

        std::string formatElevationResponse(const std::string& request) const;

    protected:
        // Common member variables available to all derived classes
        BoundingBox bbox_ = {0, 0, 0, 0};

        // Common helper methods
        virtual void handleClient(int clientSocket);
        bool isPointInBounds(double lat, double lon) const;
};
