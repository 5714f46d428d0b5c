/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedReader.cpp
 * @brief DTED file loading through GDAL VSI
 */

#include "DtedReader.hpp"
#include "DtedError.hpp"
#include "Logger.hpp"

#include <gdal/cpl_error.h>
#include <gdal/cpl_vsi.h>

#include <algorithm>
#include <memory>

namespace
{
    constexpr std::size_t READ_CHUNK = 64 * 1024;

    struct VsiCloser
    {
        void operator()(VSILFILE* fp) const
        {
            if (fp != nullptr)
            {
                VSIFCloseL(fp);
            }
        }
    };

    std::string lastGdalError()
    {
        const char* msg = CPLGetLastErrorMsg();
        return (msg != nullptr && msg[0] != '\0') ? std::string(msg) : std::string("unknown error");
    }
}

/**
 * @brief Read up to maxBytes from a file
 * @param path Local path or any GDAL virtual path (/vsizip/, /vsicurl/, ...)
 * @param maxBytes Stop after this many bytes
 * @return File contents
 */
std::vector<uint8_t> readFileBytes(const std::string& path, std::size_t maxBytes)
{
    CPLErrorReset();
    std::unique_ptr<VSILFILE, VsiCloser> fp(VSIFOpenL(path.c_str(), "rb"));
    if (!fp)
    {
        throw DtedError(DtedErrorKind::Io, "cannot open " + path + ": " + lastGdalError());
    }

    std::vector<uint8_t> bytes;
    while (bytes.size() < maxBytes)
    {
        std::size_t want = std::min(READ_CHUNK, maxBytes - bytes.size());
        std::size_t oldSize = bytes.size();
        bytes.resize(oldSize + want);

        std::size_t got = VSIFReadL(bytes.data() + oldSize, 1, want, fp.get());
        bytes.resize(oldSize + got);

        if (got < want)
        {
            if (!VSIFEofL(fp.get()))
            {
                throw DtedError(DtedErrorKind::Io, "read failed on " + path + ": " + lastGdalError());
            }
            break;
        }
    }

    return bytes;
}

/**
 * @brief Load and decode a complete DTED file
 * @param path File path
 * @param options Decoder strictness
 * @return Decoded file
 */
DtedFile readDtedFile(const std::string& path, const DecodeOptions& options)
{
    logger.info("[readDtedFile] Loading DTED file: " + path);
    std::vector<uint8_t> bytes = readFileBytes(path);
    return decodeDtedFile(bytes, options);
}

/**
 * @brief Load only the User Header Label of a DTED file
 * @param path File path
 * @return Decoded header
 */
DtedHeader readDtedHeader(const std::string& path)
{
    std::vector<uint8_t> bytes = readFileBytes(path, DTED_UHL_LENGTH);
    return decodeDtedHeader(bytes);
}
