#pragma once

#include "config.hpp"

#include <string>
#include <vector>

// Dotted-numeric comparison with pre-release handling ("1.0.0-beta" < "1.0.0" < "1.10.0").
// Returns true if v1 sorts strictly before v2.
bool version_compare(const std::string& v1_str, const std::string& v2_str);

bool version_less(const std::string& v1, const std::string& v2, VersionOrder order);

// Sorts newest first under the given ordering.
void sort_versions_descending(std::vector<std::string>& versions, VersionOrder order);
