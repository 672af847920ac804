#pragma once
#include <string>
#include <vector>


namespace btsalvage::output {

    struct IndexRange
    {
        int first{0};
        int last{0};
    };

    // Sorts and de-duplicates, then merges consecutive runs.
    std::vector<IndexRange> collapseRanges(std::vector<int> indices);

    // {1,2,3,7,8,10} -> "1-3,7-8,10"; empty input gives "".
    std::string formatSelection(std::vector<int> indices);

} // namespace btsalvage::output
