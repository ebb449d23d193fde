// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AppConfig.cpp
 * @brief Command-line parsing and config file layering
 */

#include "AppConfig.h"

#include <cerrno>
#include <cstdlib>

#include <ArduinoJson.h>

#include "codec/ConfigCodec.h"
#include "utils/FileUtils.h"

#define CL_LOG_TAG "Config"
#include "utils/Log.h"

namespace coverlight {
namespace config {

namespace {

struct CommandEntry {
    const char* name;
    Command command;
};

const CommandEntry COMMANDS[] = {
    {"demo",    Command::DEMO},
    {"extract", Command::EXTRACT},
    {"pattern", Command::PATTERN},
    {"poll",    Command::POLL},
    {"help",    Command::HELP}
};

bool parseUnsigned(const char* text, uint64_t maxValue, uint64_t& out) {
    if (text == nullptr || text[0] == '\0' || text[0] == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v > maxValue) {
        return false;
    }
    out = v;
    return true;
}

void setError(ConfigLoadResult& result, const char* fmt, const char* detail) {
    result.success = false;
    snprintf(result.errorMsg, MAX_ERROR_MSG, fmt, detail);
}

// Flags taking a value, used to find --config before the main pass
bool flagTakesValue(const char* flag) {
    static const char* const VALUE_FLAGS[] = {
        "--config", "--cache-dir", "--timeout", "--log-level", "--log-domain",
        "--length", "--mode", "--input", "--interval", "--max-loops", "--snapshot"
    };
    for (size_t i = 0; i < sizeof(VALUE_FLAGS) / sizeof(VALUE_FLAGS[0]); ++i) {
        if (strcmp(flag, VALUE_FLAGS[i]) == 0) {
            return true;
        }
    }
    return false;
}

bool parseDomainLevel(const char* text, DomainLevelOverride& out) {
    const char* eq = strchr(text, '=');
    if (eq == nullptr) {
        return false;
    }
    std::string name(text, static_cast<size_t>(eq - text));
    uint64_t level = 0;
    if (!DebugConfig::parseDomain(name.c_str(), out.domain) ||
        !parseUnsigned(eq + 1, static_cast<uint64_t>(DebugLevel::TRACE), level)) {
        return false;
    }
    out.level = static_cast<uint8_t>(level);
    return true;
}

} // namespace

const char* commandName(Command command) {
    for (size_t i = 0; i < sizeof(COMMANDS) / sizeof(COMMANDS[0]); ++i) {
        if (COMMANDS[i].command == command) {
            return COMMANDS[i].name;
        }
    }
    return "none";
}

std::string AppConfig::resolvedSnapshotPath() const {
    if (!snapshotPath.empty()) {
        return snapshotPath;
    }
    std::string path = cacheDir;
    if (!path.empty() && path.back() != '/') {
        path += '/';
    }
    path += PollDefaults::SNAPSHOT_FILE;
    return path;
}

ConfigLoadResult loadConfigFile(const char* path, AppConfig& cfg) {
    ConfigLoadResult result;

    std::vector<uint8_t> bytes;
    if (!utils::readFile(path, bytes)) {
        setError(result, "Cannot read config file '%s'", path);
        return result;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, reinterpret_cast<const char*>(bytes.data()), bytes.size());
    if (err) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Config '%s' is not valid JSON: %s", path, err.c_str());
        return result;
    }
    if (!doc.is<JsonObject>()) {
        setError(result, "Config '%s' must be a JSON object", path);
        return result;
    }

    codec::ConfigDecodeResult decoded = codec::ConfigCodec::decode(doc.as<JsonObjectConst>(), cfg);
    if (!decoded.success) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "%s", decoded.errorMsg);
        return result;
    }

    cfg = decoded.config;
    result.success = true;
    CL_SYS_LOGI("Loaded config from %s", path);
    return result;
}

ConfigLoadResult parseCommandLine(int argc, char** argv, CliOptions& out) {
    ConfigLoadResult result;
    out = CliOptions();

    // Layer 2 first: --config wherever it appears
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                setError(result, "%s needs a value", argv[i]);
                return result;
            }
            out.configPath = argv[i + 1];
            break;
        }
        if (flagTakesValue(argv[i])) {
            ++i;
        }
    }
    if (!out.configPath.empty()) {
        ConfigLoadResult loaded = loadConfigFile(out.configPath.c_str(), out.config);
        if (!loaded.success) {
            return loaded;
        }
    }

    AppConfig& cfg = out.config;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;
        uint64_t n = 0;

        if (arg[0] != '-' || arg[1] == '\0') {
            if (out.command == Command::NONE) {
                bool known = false;
                for (size_t c = 0; c < sizeof(COMMANDS) / sizeof(COMMANDS[0]); ++c) {
                    if (strcmp(arg, COMMANDS[c].name) == 0) {
                        out.command = COMMANDS[c].command;
                        known = true;
                        break;
                    }
                }
                if (!known) {
                    setError(result, "Unknown command '%s'", arg);
                    return result;
                }
            } else if ((out.command == Command::EXTRACT || out.command == Command::PATTERN) &&
                       out.identifier.empty()) {
                out.identifier = arg;
            } else {
                setError(result, "Unexpected argument '%s'", arg);
                return result;
            }
            continue;
        }

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            out.command = Command::HELP;
            continue;
        }
        if (strcmp(arg, "--swatches") == 0) {
            cfg.swatches = true;
            continue;
        }
        if (!flagTakesValue(arg)) {
            setError(result, "Unknown flag '%s'", arg);
            return result;
        }
        if (value == nullptr) {
            setError(result, "%s needs a value", arg);
            return result;
        }
        ++i;

        if (strcmp(arg, "--config") == 0) {
            // Already applied
        } else if (strcmp(arg, "--cache-dir") == 0) {
            if (value[0] == '\0') {
                setError(result, "%s must not be empty", arg);
                return result;
            }
            cfg.cacheDir = value;
        } else if (strcmp(arg, "--timeout") == 0) {
            if (!parseUnsigned(value, 600000, n) || n == 0) {
                setError(result, "Invalid --timeout '%s' (1-600000 ms)", value);
                return result;
            }
            cfg.fetchTimeoutMs = static_cast<uint32_t>(n);
        } else if (strcmp(arg, "--log-level") == 0) {
            if (!parseUnsigned(value, static_cast<uint64_t>(DebugLevel::TRACE), n)) {
                setError(result, "Invalid --log-level '%s' (0-5)", value);
                return result;
            }
            cfg.logLevel = static_cast<uint8_t>(n);
        } else if (strcmp(arg, "--log-domain") == 0) {
            DomainLevelOverride ov;
            if (!parseDomainLevel(value, ov)) {
                setError(result, "Invalid --log-domain '%s' (name=0-5)", value);
                return result;
            }
            cfg.domainLevels.push_back(ov);
        } else if (strcmp(arg, "--length") == 0) {
            if (!parseUnsigned(value, PatternDefaults::MAX_LENGTH, n)) {
                setError(result, "Invalid --length '%s' (0-4096)", value);
                return result;
            }
            cfg.patternLength = static_cast<size_t>(n);
        } else if (strcmp(arg, "--mode") == 0) {
            // Validated by the generator so an unknown mode surfaces as InvalidInput
            cfg.patternMode = value;
        } else if (strcmp(arg, "--input") == 0) {
            cfg.inputPath = value;
        } else if (strcmp(arg, "--interval") == 0) {
            if (!parseUnsigned(value, 86400, n)) {
                setError(result, "Invalid --interval '%s' (0-86400 s)", value);
                return result;
            }
            cfg.intervalSec = static_cast<uint32_t>(n);
        } else if (strcmp(arg, "--max-loops") == 0) {
            if (!parseUnsigned(value, UINT32_MAX, n)) {
                setError(result, "Invalid --max-loops '%s'", value);
                return result;
            }
            cfg.maxLoops = static_cast<uint32_t>(n);
        } else if (strcmp(arg, "--snapshot") == 0) {
            cfg.snapshotPath = value;
        }
    }

    if (out.command == Command::NONE) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing command");
        return result;
    }
    if ((out.command == Command::EXTRACT || out.command == Command::PATTERN) && out.identifier.empty()) {
        setError(result, "'%s' needs an identifier", commandName(out.command));
        return result;
    }

    result.success = true;
    return result;
}

void applyLogging(const AppConfig& cfg) {
    DebugConfig& dbg = getDebugConfig();
    dbg.globalLevel = cfg.logLevel;
    for (size_t i = 0; i < cfg.domainLevels.size(); ++i) {
        dbg.setDomainLevel(cfg.domainLevels[i].domain, static_cast<int8_t>(cfg.domainLevels[i].level));
    }
}

void printUsage(FILE* stream) {
    fprintf(stream,
            "Usage: coverlight [options] <command> [args]\n"
            "\n"
            "Commands:\n"
            "  demo                          Extract a sample palette and send a pattern to the console\n"
            "  extract <identifier>          Print the 4-colour palette\n"
            "  pattern <identifier>          Print a pattern (--length 0-%u, --mode repeat|mirror|rotate)\n"
            "  poll                          Poll identifiers (--input FILE, --interval S,\n"
            "                                --max-loops N, --snapshot PATH)\n"
            "\n"
            "Options:\n"
            "  --config FILE                 JSON config file (flags override it)\n"
            "  --cache-dir DIR               Temp artwork and snapshot directory (default %s)\n"
            "  --timeout MS                  Fetch timeout (default %u)\n"
            "  --log-level 0-5               Global log level (default 2)\n"
            "  --log-domain NAME=0-5         Per-domain level: extract, pattern, network, system\n"
            "  --swatches                    Print ANSI colour swatches\n",
            static_cast<unsigned>(PatternDefaults::MAX_LENGTH),
            ExtractDefaults::CACHE_DIR,
            static_cast<unsigned>(NetworkDefaults::FETCH_TIMEOUT_MS));
}

} // namespace config
} // namespace coverlight
