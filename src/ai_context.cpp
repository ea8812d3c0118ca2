#include "ai_context.hpp"
#include "store_file.hpp"

#include <boost/json.hpp>

namespace json = boost::json;

namespace confshield {

namespace {

const char kInstruction[] =
    "These placeholders stand for sensitive values that were removed. "
    "Preserve every <<SECRET_...>> token exactly as written; do not replace it with real or dummy data "
    "and do not change its format. The values are restored automatically on import.";

}

std::string build_ai_context(const MappingStore& store) {
    StoreStatistics stats = store.statistics();

    json::object by_kind;
    for (const auto& entry : stats.by_kind) {
        by_kind[kind_prefix(entry.first)] = static_cast<int64_t>(entry.second);
    }

    json::object info;
    info["total_secrets"] = static_cast<int64_t>(stats.total);
    info["placeholder_format"] = "<<SECRET_<KIND>_<NNNN>>>";
    info["by_kind"] = std::move(by_kind);
    info["instruction"] = kInstruction;

    json::array placeholders;
    for (const auto& rec : store.records()) {
        json::object p;
        p["placeholder"] = rec.placeholder;
        p["kind"] = kind_prefix(rec.kind);
        p["first_seen_in"] = rec.first_seen_in;
        placeholders.emplace_back(std::move(p));
    }

    json::object root;
    root["secrets_info"] = std::move(info);
    root["placeholders"] = std::move(placeholders);
    return json::serialize(root);
}

void write_ai_context(const MappingStore& store, const std::filesystem::path& path) {
    std::string doc = build_ai_context(store);
    doc += '\n';
    write_file_atomic(path, std::vector<unsigned char>(doc.begin(), doc.end()));
}

}
