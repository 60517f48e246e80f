#include "aggregator.hh"

#include "unit_tests.hh"

#include <algorithm>

namespace Tabgrid
{

static ByteCount common_prefix_length(StringView lhs, StringView rhs)
{
    auto [lhs_it, rhs_it] = std::mismatch(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    return (int)(lhs_it - lhs.begin());
}

Optional<Candidate> aggregate(StringView source_line, CharCount cursor_pos,
                              ConstArrayView<Candidate> candidates)
{
    if (candidates.empty())
        return {};

    // text after the cursor that every candidate keeps is left out of the
    // comparison and restored afterwards
    StringView tail = source_line.substr(cursor_pos);
    if (not std::all_of(candidates.begin(), candidates.end(),
                        [&](const Candidate& c) { return c.new_line.ends_with(tail); }))
        tail = {};

    const StringView source = source_line.substr(0_byte, source_line.length() - tail.length());
    auto head = [&](const Candidate& c) {
        return c.new_line.substr(0_byte, c.new_line.length() - tail.length());
    };

    const StringView first = head(candidates.front());
    ByteCount common = first.length();
    for (auto& candidate : candidates)
        common = std::min(common, common_prefix_length(first, head(candidate)));

    // only what the candidates add past the typed text can be inserted
    if (not first.starts_with(source))
        return {};

    while (common > 0 and common < first.length() and not utf8::is_character_start(first[common]))
        --common;

    if (common <= source.length())
        return {};

    return Candidate{first.substr(0_byte, common) + tail, {}};
}

UnitTest test_aggregate{[]()
{
    auto aggregated = [](StringView line, CharCount pos, CandidateList candidates) -> String {
        auto res = aggregate(line, pos, candidates);
        return res ? res->new_line : "<none>";
    };

    tg_assert(aggregated("gi", 2, {{"git", "t"}, {"git-shell", "t-shell"}}) == "git");
    tg_assert(aggregated("go", 2, {{"good", "od"}, {"going", "ing"}}) == "<none>");
    tg_assert(aggregated("g", 1, {{"go", ""}, {"git", ""}, {"git-shell", ""}, {"grep", ""}}) == "<none>");
    tg_assert(aggregated("gi", 2, {{"Git", ""}, {"Git-shell", ""}}) == "<none>");
    tg_assert(aggregated("run g", 5, {{"run git", ""}, {"run git-shell", ""}}) == "run git");
    tg_assert(aggregated("abc", 3, {}) == "<none>");

    // with the cursor inside the line the common tail is restored
    tg_assert(aggregated("gi x", 2, {{"git x", ""}, {"git-shell x", ""}}) == "git x");
    tg_assert(aggregated("g x", 1, {{"go x", ""}, {"grep x", ""}}) == "<none>");

    // extension stops on a character boundary
    tg_assert(aggregated("b", 1, {{"bé", ""}, {"bè", ""}}) == "<none>");
    tg_assert(aggregated("b", 1, {{"béa", ""}, {"béb", ""}}) == "bé");

    auto res = aggregate("gi", 2, CandidateList{{"git", "t"}, {"git-shell", "t-shell"}});
    tg_assert(res and res->display.empty());
}};

}
