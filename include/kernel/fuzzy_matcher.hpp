// Case-insensitive subsequence matching and ranking of profile names
#pragma once

#include <string>
#include <vector>

#include "pps_types.hpp"

namespace pps {

struct FuzzyMatch {
    bool matched = false;
    int score = 0;
};

// `candidate` matches when every character of `query` appears in it in order
// (ASCII case-insensitive). Score: one point per matched character, +2 for
// each matched character that sits in a contiguous run of matches, +3 when
// the match starts at the first character. Among all alignments the highest
// score is reported. An empty query matches everything with score 0.
PPS_API FuzzyMatch fuzzy_match(const std::string& query, const std::string& candidate);

struct RankedRecord {
    Record record;
    size_t index = 0;  // position in the unfiltered sequence
    int score = 0;
};

// Score desc, then case-insensitive name asc, then original position.
PPS_API bool ranks_before(const RankedRecord& a, const RankedRecord& b);

// Matching records only, ordered by ranks_before.
PPS_API std::vector<RankedRecord> rank_records(const std::vector<Record>& records,
                                               const std::string& query);

} // namespace pps
