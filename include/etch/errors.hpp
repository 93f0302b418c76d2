#pragma once

/**
 * @file errors.hpp
 * @brief Exception types for caller programming errors.
 *
 * Invalid arguments are reported with std::invalid_argument. The types
 * below flag values that no valid caller can produce; the library never
 * catches them.
 */

#include <stdexcept>
#include <string>

namespace etch {

/// @brief A path iterator produced a segment kind the path builder does not know.
class UnsupportedSegmentError : public std::logic_error {
public:
    explicit UnsupportedSegmentError(int segmentType)
        : std::logic_error("Unrecognised segment type " + std::to_string(segmentType)),
          segmentType_(segmentType) {}

    int segmentType() const { return segmentType_; }

private:
    int segmentType_;
};

/// @brief A composite rule value outside the Porter-Duff set.
class UnsupportedCompositeRuleError : public std::logic_error {
public:
    explicit UnsupportedCompositeRuleError(int rule)
        : std::logic_error("Unrecognised composite rule " + std::to_string(rule)),
          rule_(rule) {}

    int rule() const { return rule_; }

private:
    int rule_;
};

}
