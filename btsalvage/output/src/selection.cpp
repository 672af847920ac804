#include <algorithm>
#include "../include/selection.hpp"


namespace btsalvage::output {

    std::vector<IndexRange> collapseRanges(std::vector<int> indices) {
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

        std::vector<IndexRange> out;
        for (int i : indices) {
            if (!out.empty() && out.back().last + 1 == i) {
                out.back().last = i;
            } else {
                out.push_back(IndexRange{i, i});
            }
        }
        return out;
    }

    std::string formatSelection(std::vector<int> indices) {
        std::string s;
        for (const auto& r : collapseRanges(std::move(indices))) {
            if (!s.empty()) s += ',';
            s += std::to_string(r.first);
            if (r.last != r.first) {
                s += '-';
                s += std::to_string(r.last);
            }
        }
        return s;
    }

} // namespace btsalvage::output
