#include "SequenceAligner.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace fuzzscore
{

namespace
{

struct Region
{
    size_t alo;
    size_t ahi;
    size_t blo;
    size_t bhi;
};

bool blockLess(const MatchingBlock& lhs, const MatchingBlock& rhs)
{
    return std::tie(lhs.pos_a, lhs.pos_b, lhs.length) < std::tie(rhs.pos_a, rhs.pos_b, rhs.length);
}

} // namespace

SequenceAligner::SequenceAligner(std::u32string_view a, std::u32string_view b, AlignerOptions options)
    : a_(a), b_(b), options_(options), run_length_(b.size() + 1, 0)
{
    for (size_t j = 0; j < b_.size(); ++j)
    {
        b2j_[b_[j]].push_back(j);
    }

    const size_t n = b_.size();
    if (options_.autojunk && n >= AlignerOptions::kAutojunkMinLength)
    {
        const size_t threshold = n / 100 + 1;
        for (const auto& entry : b2j_)
        {
            if (entry.second.size() > threshold)
                popular_.insert(entry.first);
        }
        for (char32_t symbol : popular_)
        {
            b2j_.erase(symbol);
        }
    }
}

MatchingBlock SequenceAligner::findLongestMatch(size_t alo, size_t ahi, size_t blo, size_t bhi)
{
    size_t best_i = alo;
    size_t best_j = blo;
    size_t best_size = 0;

    // Writes to run_length_ are deferred to the end of each row so the reads in
    // the inner loop still see the previous row.
    std::vector<std::pair<size_t, size_t>> previous_row;
    std::vector<std::pair<size_t, size_t>> current_row;

    for (size_t i = alo; i < ahi; ++i)
    {
        current_row.clear();

        auto positions = b2j_.find(a_[i]);
        if (positions != b2j_.end())
        {
            for (size_t j : positions->second)
            {
                if (j < blo)
                    continue;
                if (j >= bhi)
                    break;

                const size_t length = run_length_[j] + 1;
                current_row.emplace_back(j + 1, length);

                if (length > best_size)
                {
                    best_i = i + 1 - length;
                    best_j = j + 1 - length;
                    best_size = length;
                }
            }
        }

        for (const auto& entry : previous_row)
            run_length_[entry.first] = 0;
        for (const auto& entry : current_row)
            run_length_[entry.first] = entry.second;
        std::swap(previous_row, current_row);
    }

    for (const auto& entry : previous_row)
        run_length_[entry.first] = 0;

    // Grow across symbols the index skipped (popular ones). Without autojunk the
    // run is already maximal and these loops do nothing.
    while (best_i > alo && best_j > blo && a_[best_i - 1] == b_[best_j - 1])
    {
        --best_i;
        --best_j;
        ++best_size;
    }
    while (best_i + best_size < ahi && best_j + best_size < bhi && a_[best_i + best_size] == b_[best_j + best_size])
    {
        ++best_size;
    }

    return MatchingBlock{best_i, best_j, best_size};
}

const std::vector<MatchingBlock>& SequenceAligner::matchingBlocks()
{
    if (blocks_ready_)
        return blocks_;

    std::vector<MatchingBlock> found;
    std::vector<Region> pending;
    pending.push_back(Region{0, a_.size(), 0, b_.size()});

    while (!pending.empty())
    {
        const Region region = pending.back();
        pending.pop_back();

        const MatchingBlock match = findLongestMatch(region.alo, region.ahi, region.blo, region.bhi);
        if (match.length == 0)
            continue;

        found.push_back(match);

        if (region.alo < match.pos_a && region.blo < match.pos_b)
        {
            pending.push_back(Region{region.alo, match.pos_a, region.blo, match.pos_b});
        }
        if (match.pos_a + match.length < region.ahi && match.pos_b + match.length < region.bhi)
        {
            pending.push_back(
                Region{match.pos_a + match.length, region.ahi, match.pos_b + match.length, region.bhi});
        }
    }

    std::sort(found.begin(), found.end(), blockLess);

    // Collapse runs that touch end to end into one block.
    blocks_.clear();
    MatchingBlock current;
    for (const auto& block : found)
    {
        if (current.pos_a + current.length == block.pos_a && current.pos_b + current.length == block.pos_b)
        {
            current.length += block.length;
        }
        else
        {
            if (current.length > 0)
                blocks_.push_back(current);
            current = block;
        }
    }
    if (current.length > 0)
        blocks_.push_back(current);

    blocks_.push_back(MatchingBlock{a_.size(), b_.size(), 0});
    blocks_ready_ = true;
    return blocks_;
}

double SequenceAligner::ratio()
{
    const size_t total = a_.size() + b_.size();
    if (total == 0)
        return 1.0;

    size_t matches = 0;
    for (const auto& block : matchingBlocks())
    {
        matches += block.length;
    }
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

bool SequenceAligner::isPopular(char32_t symbol) const
{
    return popular_.count(symbol) > 0;
}

} // namespace fuzzscore
