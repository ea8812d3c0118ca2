#include <iostream>
#include <fstream>
#include <iterator>
#include <memory>
#include <chrono>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include <filesystem>
#include <cstdlib>

#include "ai_context.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "key_material.hpp"
#include "mapping_store.hpp"
#include "pattern_catalog.hpp"
#include "restorer.hpp"
#include "sanitizer.hpp"
#include "security_logger.hpp"
#include "store_file.hpp"

namespace fs = std::filesystem;

namespace {

using namespace confshield;

constexpr int kUsageError = 2;
constexpr int kUnresolvedPlaceholders = 1;

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <command> [args] [options]\n"
              << "Commands:\n"
              << "  keygen                       Create a new store key file\n"
              << "  sanitize <out_dir> <files>   Replace secrets with placeholders\n"
              << "  restore <out_dir> <files>    Put original values back\n"
              << "  stats                        Show record counts per kind\n"
              << "  ai-context <out_file>        Export placeholder list for an AI assistant\n"
              << "  reset                        Drop all records (indexes are never reused)\n"
              << "Options:\n"
              << "  --config <file>  JSON config file\n"
              << "  --store <path>   Mapping store file\n"
              << "  --key <path>     Key file\n"
              << "  --quiet, -q      Only log warnings and errors\n"
              << "  --help, -h       Show this help\n";
}

std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return content;
}

void write_text(const fs::path& path, const std::string& text) {
    write_file_atomic(path, std::vector<unsigned char>(text.begin(), text.end()));
}

std::unique_ptr<MappingStore> open_store(const EngineConfig& config) {
    StoreOptions options;
    options.store_path = config.store_path;
    options.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms);
    auto store = std::make_unique<MappingStore>(std::move(options), KeyMaterial::from_file(config.key_path));
    store->open();
    return store;
}

int run_sanitize(const EngineConfig& config, const fs::path& out_dir, const std::vector<std::string>& files) {
    PatternCatalog catalog = PatternCatalog::with_defaults(config.custom_rules, config.extra_skip_values);
    auto store = open_store(config);
    Sanitizer sanitizer(catalog, *store, config.persist_each_file);

    int failed = 0;
    for (const auto& file : files) {
        fs::path in_path(file);
        auto text = read_text(in_path);
        if (!text) {
            std::cerr << "[!] " << file << ": cannot read\n";
            ++failed;
            continue;
        }
        try {
            SanitizeReport report = sanitizer.sanitize_with_report(*text, in_path.filename().string());
            write_text(out_dir / in_path.filename(), report.text);
            std::cout << "[*] " << file << ": " << report.matches.size() << " secrets ("
                      << report.new_records << " new, " << report.reused << " reused)\n";
        } catch (const DetectionError& e) {
            std::cerr << "[!] " << file << ": " << e.what() << "\n";
            ++failed;
        } catch (const std::system_error& e) {
            std::cerr << "[!] " << file << ": " << e.what() << "\n";
            ++failed;
        }
    }

    if (store->dirty()) store->persist();
    store->close();

    return failed > 0 ? exit_code_for(ErrorKind::DETECTION) : 0;
}

int run_restore(const EngineConfig& config, const fs::path& out_dir, const std::vector<std::string>& files) {
    auto store = open_store(config);
    Restorer restorer(*store);

    size_t unresolved = 0;
    int failed = 0;
    for (const auto& file : files) {
        fs::path in_path(file);
        auto text = read_text(in_path);
        if (!text) {
            std::cerr << "[!] " << file << ": cannot read\n";
            ++failed;
            continue;
        }
        try {
            RestoreResult result = restorer.restore(*text, in_path.filename().string());
            write_text(out_dir / in_path.filename(), result.text);
            std::cout << "[*] " << file << ": " << result.restored_count << " restored\n";
            for (const auto& w : result.unresolved) {
                std::cerr << "[!] " << file << ":" << w.line << ": " << w.token
                          << " left in place (" << unresolved_reason_name(w.reason) << ")\n";
            }
            unresolved += result.unresolved.size();
        } catch (const DetectionError& e) {
            std::cerr << "[!] " << file << ": " << e.what() << "\n";
            ++failed;
        } catch (const std::system_error& e) {
            std::cerr << "[!] " << file << ": " << e.what() << "\n";
            ++failed;
        }
    }
    store->close();

    if (failed > 0) return exit_code_for(ErrorKind::DETECTION);
    return unresolved > 0 ? kUnresolvedPlaceholders : 0;
}

int run_stats(const EngineConfig& config) {
    auto store = open_store(config);
    StoreStatistics stats = store->statistics();
    std::cout << "store:   " << store->path().string() << "\n"
              << "secrets: " << stats.total << "\n";
    for (const auto& entry : stats.by_kind) {
        std::cout << "  " << kind_prefix(entry.first) << ": " << entry.second << "\n";
    }
    store->close();
    return 0;
}

int run_ai_context(const EngineConfig& config, const fs::path& out_file) {
    auto store = open_store(config);
    write_ai_context(*store, out_file);
    std::cout << "[*] AI context written to " << out_file.string() << "\n";
    store->close();
    return 0;
}

int run_reset(const EngineConfig& config) {
    auto store = open_store(config);
    size_t dropped = store->size();
    store->reset();
    store->persist();
    store->close();
    std::cout << "[*] dropped " << dropped << " records\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    using confshield::SecurityLogger;
    try {
        confshield::EngineConfig config;

        // --- CLI Argument Parsing ---
        std::vector<std::string> positional;
        std::optional<std::string> config_file, store_override, key_override;
        bool quiet = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&](const char* name) -> std::optional<std::string> {
                if (i + 1 >= argc) {
                    std::cerr << name << " needs a value\n";
                    return std::nullopt;
                }
                return std::string(argv[++i]);
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--quiet" || arg == "-q") {
                quiet = true;
            } else if (arg == "--config") {
                if (!(config_file = value("--config"))) return kUsageError;
            } else if (arg == "--store") {
                if (!(store_override = value("--store"))) return kUsageError;
            } else if (arg == "--key") {
                if (!(key_override = value("--key"))) return kUsageError;
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "unknown option " << arg << "\n";
                return kUsageError;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            print_usage(argv[0]);
            return kUsageError;
        }

        // --- Layered Configuration: file, environment, flags ---
        if (config_file) config.load_file(*config_file);
        config.apply_env();
        if (store_override) config.store_path = *store_override;
        if (key_override) config.key_path = *key_override;

        SecurityLogger::set_min_level(quiet ? SecurityLogger::Level::WARNING
                                            : SecurityLogger::parse_level(config.log_level));

        const std::string command = positional[0];
        std::vector<std::string> args(positional.begin() + 1, positional.end());

        if (command == "keygen" && args.empty()) {
            confshield::KeyMaterial::generate_key_file(config.key_path);
            std::cout << "[*] key written to " << config.key_path.string()
                      << " (keep it out of version control)\n";
            return 0;
        }
        if ((command == "sanitize" || command == "restore") && args.size() >= 2) {
            fs::path out_dir(args[0]);
            std::vector<std::string> files(args.begin() + 1, args.end());
            return command == "sanitize" ? run_sanitize(config, out_dir, files)
                                         : run_restore(config, out_dir, files);
        }
        if (command == "stats" && args.empty()) return run_stats(config);
        if (command == "ai-context" && args.size() == 1) return run_ai_context(config, args[0]);
        if (command == "reset" && args.empty()) return run_reset(config);

        print_usage(argv[0]);
        return kUsageError;
    } catch (const confshield::EngineError& e) {
        std::cerr << "[!] " << confshield::error_kind_name(e.kind()) << ": " << e.what() << "\n";
        return confshield::exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return kUsageError;
    }
}
