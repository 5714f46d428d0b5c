/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file DtedError.cpp
 * @brief DtedError implementation
 */

#include "DtedError.hpp"

/**
 * @brief Build the what() text from kind, message and offset
 */
static std::string describe(DtedErrorKind kind, const std::string& message, std::size_t offset)
{
    std::string text = std::string(toString(kind)) + ": " + message;
    if (offset != DtedError::npos)
    {
        text += " (at byte " + std::to_string(offset) + ")";
    }
    return text;
}

/**
 * @brief Constructor for DtedError
 * @param kind Failure category
 * @param message Human readable description
 * @param offset Byte offset of the failure, or npos
 */
DtedError::DtedError(DtedErrorKind kind, const std::string& message, std::size_t offset)
    : std::runtime_error(describe(kind, message, offset))
    , kind_(kind)
    , offset_(offset)
{
}

/**
 * @brief Get printable name of an error kind
 * @param kind Error kind
 * @return Name string
 */
const char* toString(DtedErrorKind kind)
{
    switch (kind)
    {
        case DtedErrorKind::Io:                 return "I/O error";
        case DtedErrorKind::IncompleteInput:    return "incomplete input";
        case DtedErrorKind::StructuralMismatch: return "structural mismatch";
        case DtedErrorKind::ValueDomain:        return "value out of domain";
        case DtedErrorKind::Conversion:         return "numeric conversion failed";
        case DtedErrorKind::Checksum:           return "checksum mismatch";
    }
    return "unknown error";
}
