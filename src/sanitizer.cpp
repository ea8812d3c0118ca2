#include "sanitizer.hpp"
#include "errors.hpp"
#include "input_validator.hpp"

namespace confshield {

Sanitizer::Sanitizer(const PatternCatalog& catalog, MappingStore& store, bool persist_each_file)
    : catalog_(catalog), store_(store), persist_each_file_(persist_each_file) {}

std::string Sanitizer::sanitize(const std::string& text, const std::string& filename) {
    return sanitize_with_report(text, filename).text;
}

SanitizeReport Sanitizer::sanitize_with_report(const std::string& text, const std::string& filename) {
    if (!InputValidator::is_within_size_limit(text.size(), InputValidator::MAX_TEXT_SIZE)) {
        throw DetectionError("input too large to scan: " + filename + " (" +
                             std::to_string(text.size()) + " bytes)");
    }

    SanitizeReport report;
    report.matches = catalog_.detect(text);

    // Placeholders in match order; the store is only touched after detection succeeded.
    std::vector<std::string> replacements;
    replacements.reserve(report.matches.size());
    for (const auto& match : report.matches) {
        if (const SecretRecord* existing = store_.lookup_by_value(match.value)) {
            store_.note_seen(existing->placeholder, filename);
            replacements.push_back(existing->placeholder);
            ++report.reused;
        } else {
            const SecretRecord& created = store_.create(match.kind, match.value, filename);
            replacements.push_back(created.placeholder);
            ++report.new_records;
        }
    }

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (size_t i = 0; i < report.matches.size(); ++i) {
        const auto& match = report.matches[i];
        out.append(text, cursor, match.offset - cursor);
        out += replacements[i];
        cursor = match.end();
    }
    out.append(text, cursor, std::string::npos);
    report.text = std::move(out);

    if (persist_each_file_ && store_.dirty()) {
        store_.persist();
    }
    return report;
}

}
