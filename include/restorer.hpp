#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mapping_store.hpp"

namespace confshield {

enum class UnresolvedReason {
    NOT_CANONICAL,  // grammar matched but decode() rejected it
    NOT_IN_STORE    // decodes, but this store never issued it
};

// A placeholder-shaped token left in place by a restore pass. Returned, never thrown.
struct UnresolvedPlaceholderWarning {
    std::string token;
    size_t offset;
    size_t line;  // 1-based
    UnresolvedReason reason;
};

struct RestoreResult {
    std::string text;
    std::vector<UnresolvedPlaceholderWarning> unresolved;
    size_t restored_count = 0;
};

const char* unresolved_reason_name(UnresolvedReason reason);

// Substitutes original values for placeholder tokens. Never fails on a single
// token: anything it cannot resolve is kept verbatim and reported.
class Restorer {
public:
    explicit Restorer(const MappingStore& store);

    /**
     * @param filename Used only for log context.
     * @throws DetectionError if the text exceeds the scan size limit.
     */
    RestoreResult restore(const std::string& text, const std::string& filename = "") const;

private:
    const MappingStore& store_;
};

}
