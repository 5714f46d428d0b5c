/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file ElevationGrid.hpp
 * @brief ElevationGrid class declaration
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "AxisElement.hpp"
#include "DtedFile.hpp"
#include "TerrainPoint.hpp"

/**
 * @brief ElevationGrid class
 * 
 * @details Decoded DTED posts with their decimal-degree geometry. Immutable after
 * construction, so concurrent queries need no locking.
 */
class ElevationGrid
{
    public:
        explicit ElevationGrid(DtedFile file, bool voidAsMissing = false);

        static ElevationGrid load(const std::string& path,
                                  const DecodeOptions& options = DecodeOptions(),
                                  bool voidAsMissing = false);
        static ElevationGrid fromBytes(const std::vector<uint8_t>& bytes,
                                       const DecodeOptions& options = DecodeOptions(),
                                       bool voidAsMissing = false);

        std::optional<double> getElevation(double lat, double lon) const;
        std::vector<TerrainPoint> getElevationGrid(double latStart, double lonStart,
                                                   double latEnd, double lonEnd,
                                                   int numLatSamples, int numLonSamples) const;

        const DtedHeader& header() const { return header_; }
        const AxisElement<double>& origin() const { return origin_; }
        const AxisElement<double>& interval() const { return interval_; }
        const AxisElement<double>& intervalSeconds() const { return intervalSecs_; }
        const AxisElement<uint16_t>& count() const { return header_.count; }
        const std::optional<uint16_t>& accuracy() const { return header_.accuracy; }
        const AxisElement<double>& min() const { return origin_; }
        const AxisElement<double>& max() const { return max_; }
        BoundingBox boundingBox() const;
        bool voidAsMissing() const { return voidAsMissing_; }

        int16_t post(std::size_t lonIndex, std::size_t latIndex) const;
        bool contains(double lat, double lon) const;

    private:
        DtedHeader header_;
        std::vector<DtedRecord> records_;
        AxisElement<double> origin_;
        AxisElement<double> interval_;
        AxisElement<double> intervalSecs_;
        AxisElement<double> max_;
        bool voidAsMissing_;

        double gridPosition(double value, double min, double max, double interval, uint16_t count) const;
};
