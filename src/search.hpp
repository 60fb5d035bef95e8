#pragma once
/*
 * Search
 *
 * Purpose: literal substring search over rendered lines (KMP, no regex).
 * Rule: occurrences are non-overlapping; after a hit the scan restarts past it.
 */
#include <string>
#include <vector>
#include "types.hpp"

void find_all_literal(const std::string& s, const std::string& pat, std::vector<int>& out);

// Ordered by line, then by start offset.
std::vector<SearchMatch> collect_matches(const std::vector<std::string>& lines, const std::string& query);
