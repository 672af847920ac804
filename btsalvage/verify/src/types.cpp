#include <iomanip>
#include <sstream>
#include "../include/types.hpp"


namespace btsalvage::verify {

    const char* toString(PieceState s) {
        switch (s) {
            case PieceState::unknown: return "unknown";
            case PieceState::valid:   return "valid";
            case PieceState::invalid: return "invalid";
        }
        return "unknown";
    }

    const char* toString(FileOutcome o) {
        switch (o) {
            case FileOutcome::skipped:         return "skipped";
            case FileOutcome::trustedComplete: return "trusted-complete";
            case FileOutcome::complete:        return "complete";
            case FileOutcome::incomplete:      return "incomplete";
        }
        return "skipped";
    }

    std::string toHex(const PieceHash& h) {
        std::ostringstream oss;
        for (auto b : h) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        }
        return oss.str();
    }

} // namespace btsalvage::verify
