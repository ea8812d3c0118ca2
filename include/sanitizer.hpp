#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mapping_store.hpp"
#include "pattern_catalog.hpp"

namespace confshield {

struct SanitizeReport {
    std::string text;
    std::vector<SecretMatch> matches;
    size_t new_records = 0;
    size_t reused = 0;
};

// Replaces detected secrets with placeholders, registering new values in the
// store. Text that is already sanitized passes through unchanged.
class Sanitizer {
public:
    /**
     * @param persist_each_file Flush the store after every file that added
     *        or touched a record, instead of leaving it to the caller.
     */
    Sanitizer(const PatternCatalog& catalog, MappingStore& store, bool persist_each_file = false);

    /**
     * Sanitizes one file's text. Every match is collected before the store is
     * touched, so a DetectionError leaves the store unchanged.
     * @throws DetectionError if a rule fails on this text or it is too large.
     */
    std::string sanitize(const std::string& text, const std::string& filename);

    SanitizeReport sanitize_with_report(const std::string& text, const std::string& filename);

private:
    const PatternCatalog& catalog_;
    MappingStore& store_;
    bool persist_each_file_;
};

}
