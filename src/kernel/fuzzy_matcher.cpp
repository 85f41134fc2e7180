#include "kernel/fuzzy_matcher.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>

namespace pps {

namespace {

constexpr int kRunBonus = 2;
constexpr int kStartBonus = 3;
constexpr int kNoMatch = std::numeric_limits<int>::min() / 2;

char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string folded(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), fold);
    return out;
}

} // namespace

FuzzyMatch fuzzy_match(const std::string& query, const std::string& candidate) {
    const size_t m = query.size();
    const size_t n = candidate.size();
    if (m == 0) return {true, 0};
    if (m > n) return {};

    // best[j][linked]: highest bonus total with the current query character
    // placed at candidate[j]; linked is set when it directly follows the
    // previous query character, i.e. it is already counted as part of a run.
    std::vector<std::array<int, 2>> best(n, {kNoMatch, kNoMatch});
    std::vector<std::array<int, 2>> next(n);

    const char q0 = fold(query[0]);
    for (size_t j = 0; j < n; ++j) {
        if (fold(candidate[j]) == q0) best[j][0] = (j == 0) ? kStartBonus : 0;
    }

    for (size_t i = 1; i < m; ++i) {
        const char qc = fold(query[i]);
        int gap_best = kNoMatch;  // max over best[0 .. j-2]
        for (size_t j = 0; j < n; ++j) {
            if (j >= 2) gap_best = std::max({gap_best, best[j - 2][0], best[j - 2][1]});
            next[j] = {kNoMatch, kNoMatch};
            if (fold(candidate[j]) != qc) continue;
            if (gap_best > kNoMatch) next[j][0] = gap_best;
            if (j >= 1) {
                int joined = kNoMatch;
                // The predecessor joins a run now unless it already belongs to one.
                if (best[j - 1][0] > kNoMatch) joined = best[j - 1][0] + 2 * kRunBonus;
                if (best[j - 1][1] > kNoMatch) joined = std::max(joined, best[j - 1][1] + kRunBonus);
                next[j][1] = joined;
            }
        }
        best.swap(next);
    }

    int top = kNoMatch;
    for (const auto& cell : best) top = std::max({top, cell[0], cell[1]});
    if (top == kNoMatch) return {};
    return {true, static_cast<int>(m) + top};
}

bool ranks_before(const RankedRecord& a, const RankedRecord& b) {
    if (a.score != b.score) return a.score > b.score;
    const std::string fa = folded(a.record.name);
    const std::string fb = folded(b.record.name);
    if (fa != fb) return fa < fb;
    return a.index < b.index;
}

std::vector<RankedRecord> rank_records(const std::vector<Record>& records, const std::string& query) {
    std::vector<RankedRecord> ranked;
    ranked.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        FuzzyMatch match = fuzzy_match(query, records[i].name);
        if (match.matched) ranked.push_back({records[i], i, match.score});
    }
    std::sort(ranked.begin(), ranked.end(), ranks_before);
    return ranked;
}

} // namespace pps
