#pragma once

#include <filesystem>
#include <string>

#include "mapping_store.hpp"

namespace confshield {

// Describes every placeholder in the store for an AI assistant: totals, one
// entry per placeholder with its kind and first-seen file, and an instruction
// to keep placeholders verbatim. Never contains an original value.
std::string build_ai_context(const MappingStore& store);

// Writes build_ai_context(store) to path (mode 0600, replaced atomically).
void write_ai_context(const MappingStore& store, const std::filesystem::path& path);

}
