#include "restorer.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "placeholder_codec.hpp"
#include "security_logger.hpp"

#include <algorithm>

namespace confshield {

const char* unresolved_reason_name(UnresolvedReason reason) {
    switch (reason) {
        case UnresolvedReason::NOT_CANONICAL: return "not a canonical placeholder";
        case UnresolvedReason::NOT_IN_STORE: return "unknown to this store";
        default: return "unknown";
    }
}

Restorer::Restorer(const MappingStore& store) : store_(store) {}

RestoreResult Restorer::restore(const std::string& text, const std::string& filename) const {
    const std::string location = filename.empty() ? "input" : filename;
    if (!InputValidator::is_within_size_limit(text.size(), InputValidator::MAX_TEXT_SIZE)) {
        throw DetectionError("input too large to restore: " + location + " (" +
                             std::to_string(text.size()) + " bytes)");
    }

    RestoreResult result;
    result.text.reserve(text.size());

    size_t cursor = 0;
    size_t line = 1;
    for (const auto& span : PlaceholderCodec::find_tokens(text)) {
        line += static_cast<size_t>(std::count(text.begin() + static_cast<std::ptrdiff_t>(cursor),
                                               text.begin() + static_cast<std::ptrdiff_t>(span.offset), '\n'));
        result.text.append(text, cursor, span.offset - cursor);
        cursor = span.offset + span.length;

        std::string token = text.substr(span.offset, span.length);
        const SecretRecord* record = nullptr;
        UnresolvedReason reason = UnresolvedReason::NOT_CANONICAL;
        if (PlaceholderCodec::decode(token)) {
            record = store_.lookup_by_placeholder(token);
            reason = UnresolvedReason::NOT_IN_STORE;
        }

        if (record) {
            result.text += record->original_value;
            ++result.restored_count;
            continue;
        }

        result.text += token;
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::PLACEHOLDER_UNRESOLVED,
                            location + ":" + std::to_string(line),
                            token + " " + unresolved_reason_name(reason));
        result.unresolved.push_back({std::move(token), span.offset, line, reason});
    }
    result.text.append(text, cursor, std::string::npos);

    if (result.restored_count > 0) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::PLACEHOLDER_RESTORED,
                            location, std::to_string(result.restored_count) + " placeholders restored");
    }
    return result;
}

}
