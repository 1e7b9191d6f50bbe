#pragma once

#include <string>
#include <vector>

#include "dimforge/levelgen/LevelTypes.hpp"

namespace dimforge::levelgen
{
enum class IssueSeverity
{
    Warning,
    Error
};

struct ValidationIssue
{
    IssueSeverity severity = IssueSeverity::Error;
    std::string message;
};

const char* IssueSeverityToText(IssueSeverity severity);

/**
 * Structural checks on a finished level: connectivity, edge count bounds,
 * referential integrity of edges/objectives/portals/layers, symmetric
 * adjacency, sampling distance and fingerprint consistency. Under-sampling and
 * a missing nexus are warnings; everything else is an error.
 */
[[nodiscard]] std::vector<ValidationIssue> ValidateLevel(const GeneratedLevel& level);

[[nodiscard]] bool HasErrors(const std::vector<ValidationIssue>& issues);
} // namespace dimforge::levelgen
