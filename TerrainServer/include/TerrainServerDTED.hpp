/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file TerrainServerDTED.hpp
 * @brief TerrainServerDTED class declaration
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ITerrainServer.hpp"
#include "ElevationGrid.hpp"

/**
 * @brief TerrainServerDTED class
 * @details This class represents a terrain data server that answers from one decoded DTED file.
 */
class TerrainServerDTED : public ITerrainServer
{
    public:
        // Constructor accepts path to DTED file, throws DtedError if it cannot be decoded
        explicit TerrainServerDTED(const std::string& dted_path,
                                   const DecodeOptions& options = DecodeOptions(),
                                   bool void_as_missing = false);
        explicit TerrainServerDTED(ElevationGrid grid);

        // ITerrainServer interface implementation
        std::optional<double> getElevation(double lat, double lon) const override;
        std::vector<TerrainPoint> getElevationGrid(double latStart,
            double lonStart, double latEnd, double lonEnd,
            int numLatSamples, int numLonSamples) const override;

        const ElevationGrid& grid() const { return grid_; }
        const std::string& path() const { return dted_path_; }

    private:
        std::string dted_path_;
        ElevationGrid grid_;

        static ElevationGrid loadGrid(const std::string& path, const DecodeOptions& options,
                                      bool void_as_missing);
};
