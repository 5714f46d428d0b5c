/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedError.hpp
 * @brief DtedError exception declaration
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief Category of a DTED decode failure
 */
enum class DtedErrorKind
{
    Io,                 // underlying open/read failed
    IncompleteInput,    // fewer bytes than the fixed layout requires
    StructuralMismatch, // sentinel/tag mismatch or trailing bytes
    ValueDomain,        // field decoded but violates its value range
    Conversion,         // numeric conversion between axis value types failed
    Checksum            // record checksum mismatch under the reject policy
};

/**
 * @brief DtedError class
 * 
 * @details Thrown by every decode and load operation. Carries the failure category and,
 * when decoding from a byte buffer, the offset at which decoding stopped.
 */
class DtedError : public std::runtime_error
{
    public:
        static constexpr std::size_t npos = static_cast<std::size_t>(-1);

        DtedError(DtedErrorKind kind, const std::string& message, std::size_t offset = npos);

        DtedErrorKind kind() const { return kind_; }
        std::size_t offset() const { return offset_; }
        bool hasOffset() const { return offset_ != npos; }

    private:
        DtedErrorKind kind_;
        std::size_t offset_;
};

const char* toString(DtedErrorKind kind);
