#include "categorize/Models.hpp"

namespace categorize {

const char* to_string(SignalSource s) {
    switch (s) {
        case SignalSource::Keyword: return "keyword";
        case SignalSource::Phrase: return "phrase";
        case SignalSource::Pattern: return "pattern";
        case SignalSource::Fuzzy: return "fuzzy";
        default: return "unknown";
    }
}

}  // namespace categorize
