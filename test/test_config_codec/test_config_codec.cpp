/**
 * @file test_config_codec.cpp
 * @brief Unit tests for ConfigCodec and command-line layering
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <ArduinoJson.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include "../../src/codec/ConfigCodec.h"
#include "../../src/config/AppConfig.h"

#define CL_LOG_TAG "ConfigTest"
#include "../../src/utils/Log.h"

using namespace coverlight;
using namespace coverlight::codec;
using namespace coverlight::config;

static std::string s_configPath;

// argv builder; strings must outlive the parse call
class Args {
public:
    explicit Args(std::initializer_list<const char*> items) {
        m_storage.push_back("coverlight");
        for (const char* item : items) {
            m_storage.push_back(item);
        }
        for (size_t i = 0; i < m_storage.size(); ++i) {
            m_argv.push_back(&m_storage[i][0]);
        }
    }
    int argc() const { return static_cast<int>(m_argv.size()); }
    char** argv() { return m_argv.data(); }

private:
    std::vector<std::string> m_storage;
    std::vector<char*> m_argv;
};

static ConfigDecodeResult decodeText(const char* json, const AppConfig& base = AppConfig()) {
    JsonDocument doc;
    TEST_ASSERT_FALSE(deserializeJson(doc, json));
    return ConfigCodec::decode(doc.as<JsonObjectConst>(), base);
}

static std::string readAll(FILE* f) {
    rewind(f);
    std::string text;
    int ch;
    while ((ch = fgetc(f)) != EOF) {
        text += static_cast<char>(ch);
    }
    return text;
}

static void writeConfig(const char* json) {
    FILE* f = fopen(s_configPath.c_str(), "wb");
    TEST_ASSERT_NOT_NULL(f);
    fputs(json, f);
    fclose(f);
}

void setUp(void) {
    char tmpl[] = "/tmp/coverlight-config-XXXXXX.json";
    int fd = mkstemps(tmpl, 5);
    TEST_ASSERT_TRUE(fd >= 0);
    close(fd);
    s_configPath = tmpl;
}

void tearDown(void) {
    unlink(s_configPath.c_str());
}

// ============================================================================
// ConfigCodec
// ============================================================================

void test_defaults() {
    AppConfig cfg;
    TEST_ASSERT_EQUAL_STRING("cache", cfg.cacheDir.c_str());
    TEST_ASSERT_EQUAL_UINT16(200, cfg.maxDimension);
    TEST_ASSERT_EQUAL_UINT8(8, cfg.quantizedColours);
    TEST_ASSERT_EQUAL_UINT8(245, cfg.nearWhiteThreshold);
    TEST_ASSERT_EQUAL_UINT32(15000, cfg.fetchTimeoutMs);
    TEST_ASSERT_EQUAL_UINT(16, cfg.patternLength);
    TEST_ASSERT_EQUAL_STRING("repeat", cfg.patternMode.c_str());
    TEST_ASSERT_EQUAL_UINT32(60, cfg.intervalSec);
    TEST_ASSERT_EQUAL_UINT32(0, cfg.maxLoops);
    TEST_ASSERT_FALSE(cfg.swatches);
    TEST_ASSERT_EQUAL_STRING("cache/current_palette.json", cfg.resolvedSnapshotPath().c_str());
}

void test_decode_overlays_present_keys_only() {
    AppConfig base;
    base.intervalSec = 5;
    ConfigDecodeResult r = decodeText(
        "{\"cache_dir\":\"/var/cache/coverlight\",\"pattern_length\":32,"
        "\"pattern_mode\":\"mirror\",\"swatches\":true,\"log_level\":4}", base);
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_STRING("/var/cache/coverlight", r.config.cacheDir.c_str());
    TEST_ASSERT_EQUAL_UINT(32, r.config.patternLength);
    TEST_ASSERT_EQUAL_STRING("mirror", r.config.patternMode.c_str());
    TEST_ASSERT_TRUE(r.config.swatches);
    TEST_ASSERT_EQUAL_UINT8(4, r.config.logLevel);
    TEST_ASSERT_EQUAL_UINT32(5, r.config.intervalSec);
    TEST_ASSERT_EQUAL_UINT32(15000, r.config.fetchTimeoutMs);
    TEST_ASSERT_EQUAL_STRING("/var/cache/coverlight/current_palette.json",
                             r.config.resolvedSnapshotPath().c_str());
}

void test_decode_rejects_unknown_key() {
    ConfigDecodeResult r = decodeText("{\"interval_sec\":10,\"intervall\":3}");
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_NOT_NULL(strstr(r.errorMsg, "intervall"));
}

void test_decode_range_and_type_errors() {
    const char* bad[] = {
        "{\"interval_sec\":86401}",
        "{\"interval_sec\":-1}",
        "{\"pattern_length\":5000}",
        "{\"fetch_timeout_ms\":0}",
        "{\"max_dimension\":0}",
        "{\"quantized_colours\":9}",
        "{\"quantized_colours\":0}",
        "{\"near_white_threshold\":256}",
        "{\"log_level\":6}",
        "{\"interval_sec\":\"60\"}",
        "{\"swatches\":1}",
        "{\"cache_dir\":\"\"}",
        "{\"cache_dir\":42}",
        "{\"pattern_mode\":\"zigzag\"}"
    };
    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
        ConfigDecodeResult r = decodeText(bad[i]);
        TEST_ASSERT_FALSE_MESSAGE(r.success, bad[i]);
        TEST_ASSERT_TRUE(strlen(r.errorMsg) > 0);
    }
}

void test_decode_boundaries_accepted() {
    ConfigDecodeResult r = decodeText(
        "{\"interval_sec\":0,\"max_loops\":4294967295,"
        "\"fetch_timeout_ms\":600000,\"near_white_threshold\":0,\"snapshot_path\":\"\","
        "\"quantized_colours\":8,\"pattern_length\":4096}");
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_UINT32(0, r.config.intervalSec);
    TEST_ASSERT_EQUAL_UINT32(4294967295u, r.config.maxLoops);
    TEST_ASSERT_EQUAL_UINT(4096, r.config.patternLength);
    TEST_ASSERT_EQUAL_UINT32(600000, r.config.fetchTimeoutMs);
    TEST_ASSERT_EQUAL_UINT8(8, r.config.quantizedColours);
}

void test_encoded_config_decodes_to_same_values() {
    AppConfig cfg;
    cfg.cacheDir = "/tmp/cl";
    cfg.patternMode = "rotate";
    cfg.patternLength = 7;
    cfg.maxLoops = 3;
    cfg.swatches = true;

    JsonDocument doc;
    JsonObject obj = doc.to<JsonObject>();
    ConfigCodec::encode(cfg, obj);

    ConfigDecodeResult r = ConfigCodec::decode(doc.as<JsonObjectConst>(), AppConfig());
    TEST_ASSERT_TRUE(r.success);
    TEST_ASSERT_EQUAL_STRING("/tmp/cl", r.config.cacheDir.c_str());
    TEST_ASSERT_EQUAL_STRING("rotate", r.config.patternMode.c_str());
    TEST_ASSERT_EQUAL_UINT(7, r.config.patternLength);
    TEST_ASSERT_EQUAL_UINT32(3, r.config.maxLoops);
    TEST_ASSERT_TRUE(r.config.swatches);
}

// ============================================================================
// Command line
// ============================================================================

void test_parse_commands() {
    CliOptions opts;
    Args extract({"extract", "spotify:album:x"});
    TEST_ASSERT_TRUE(parseCommandLine(extract.argc(), extract.argv(), opts).success);
    TEST_ASSERT_EQUAL(static_cast<int>(Command::EXTRACT), static_cast<int>(opts.command));
    TEST_ASSERT_EQUAL_STRING("spotify:album:x", opts.identifier.c_str());

    Args pattern({"pattern", "track-A", "--length", "5", "--mode", "mirror"});
    TEST_ASSERT_TRUE(parseCommandLine(pattern.argc(), pattern.argv(), opts).success);
    TEST_ASSERT_EQUAL(static_cast<int>(Command::PATTERN), static_cast<int>(opts.command));
    TEST_ASSERT_EQUAL_UINT(5, opts.config.patternLength);
    TEST_ASSERT_EQUAL_STRING("mirror", opts.config.patternMode.c_str());

    Args poll({"--interval", "0", "poll", "--max-loops", "4", "--snapshot", "/tmp/snap.json"});
    TEST_ASSERT_TRUE(parseCommandLine(poll.argc(), poll.argv(), opts).success);
    TEST_ASSERT_EQUAL(static_cast<int>(Command::POLL), static_cast<int>(opts.command));
    TEST_ASSERT_EQUAL_UINT32(0, opts.config.intervalSec);
    TEST_ASSERT_EQUAL_UINT32(4, opts.config.maxLoops);
    TEST_ASSERT_EQUAL_STRING("/tmp/snap.json", opts.config.resolvedSnapshotPath().c_str());

    Args help({"-h"});
    TEST_ASSERT_TRUE(parseCommandLine(help.argc(), help.argv(), opts).success);
    TEST_ASSERT_EQUAL(static_cast<int>(Command::HELP), static_cast<int>(opts.command));
}

void test_parse_usage_errors() {
    CliOptions opts;
    Args none({});
    TEST_ASSERT_FALSE(parseCommandLine(none.argc(), none.argv(), opts).success);

    Args unknownCommand({"explode"});
    TEST_ASSERT_FALSE(parseCommandLine(unknownCommand.argc(), unknownCommand.argv(), opts).success);

    Args missingId({"extract"});
    ConfigLoadResult r = parseCommandLine(missingId.argc(), missingId.argv(), opts);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_NOT_NULL(strstr(r.errorMsg, "extract"));

    Args unknownFlag({"demo", "--colour"});
    TEST_ASSERT_FALSE(parseCommandLine(unknownFlag.argc(), unknownFlag.argv(), opts).success);

    Args missingValue({"demo", "--timeout"});
    TEST_ASSERT_FALSE(parseCommandLine(missingValue.argc(), missingValue.argv(), opts).success);

    Args longPattern({"pattern", "track-A", "--length", "4097"});
    r = parseCommandLine(longPattern.argc(), longPattern.argv(), opts);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_NOT_NULL(strstr(r.errorMsg, "0-4096"));

    Args badNumber({"demo", "--timeout", "12ms"});
    TEST_ASSERT_FALSE(parseCommandLine(badNumber.argc(), badNumber.argv(), opts).success);

    Args zeroTimeout({"demo", "--timeout", "0"});
    TEST_ASSERT_FALSE(parseCommandLine(zeroTimeout.argc(), zeroTimeout.argv(), opts).success);

    Args extraArg({"demo", "surplus"});
    TEST_ASSERT_FALSE(parseCommandLine(extraArg.argc(), extraArg.argv(), opts).success);
}

void test_log_domain_flag() {
    CliOptions opts;
    Args ok({"--log-domain", "network=5", "--log-domain", "extract=0", "demo"});
    TEST_ASSERT_TRUE(parseCommandLine(ok.argc(), ok.argv(), opts).success);
    TEST_ASSERT_EQUAL_UINT(2, opts.config.domainLevels.size());
    TEST_ASSERT_EQUAL(static_cast<int>(DebugDomain::NETWORK), static_cast<int>(opts.config.domainLevels[0].domain));
    TEST_ASSERT_EQUAL_UINT8(5, opts.config.domainLevels[0].level);
    TEST_ASSERT_EQUAL_UINT8(0, opts.config.domainLevels[1].level);

    Args badName({"--log-domain", "audio=3", "demo"});
    TEST_ASSERT_FALSE(parseCommandLine(badName.argc(), badName.argv(), opts).success);

    Args badLevel({"--log-domain", "network=9", "demo"});
    TEST_ASSERT_FALSE(parseCommandLine(badLevel.argc(), badLevel.argv(), opts).success);
}

void test_flags_override_config_file() {
    writeConfig("{\"interval_sec\":30,\"max_loops\":9,\"cache_dir\":\"/tmp/from-file\"}");

    CliOptions opts;
    // Flag placed before --config still wins
    Args args({"--interval", "2", "--config", s_configPath.c_str(), "poll"});
    ConfigLoadResult r = parseCommandLine(args.argc(), args.argv(), opts);
    TEST_ASSERT_TRUE_MESSAGE(r.success, r.errorMsg);
    TEST_ASSERT_EQUAL_UINT32(2, opts.config.intervalSec);
    TEST_ASSERT_EQUAL_UINT32(9, opts.config.maxLoops);
    TEST_ASSERT_EQUAL_STRING("/tmp/from-file", opts.config.cacheDir.c_str());
    TEST_ASSERT_EQUAL_STRING(s_configPath.c_str(), opts.configPath.c_str());
}

void test_invalid_config_file_is_reported() {
    CliOptions opts;

    writeConfig("{\"interval_sec\": 10,");
    Args broken({"--config", s_configPath.c_str(), "demo"});
    ConfigLoadResult r = parseCommandLine(broken.argc(), broken.argv(), opts);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_NOT_NULL(strstr(r.errorMsg, "JSON"));

    writeConfig("[1, 2]");
    TEST_ASSERT_FALSE(parseCommandLine(broken.argc(), broken.argv(), opts).success);

    writeConfig("{\"mystery\": true}");
    r = parseCommandLine(broken.argc(), broken.argv(), opts);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_NOT_NULL(strstr(r.errorMsg, "mystery"));

    Args missing({"--config", "/nonexistent/coverlight.json", "demo"});
    TEST_ASSERT_FALSE(parseCommandLine(missing.argc(), missing.argv(), opts).success);
}

void test_load_config_file_leaves_cfg_on_failure() {
    writeConfig("{\"interval_sec\":99999}");
    AppConfig cfg;
    cfg.intervalSec = 12;
    ConfigLoadResult r = loadConfigFile(s_configPath.c_str(), cfg);
    TEST_ASSERT_FALSE(r.success);
    TEST_ASSERT_EQUAL_UINT32(12, cfg.intervalSec);
}

void test_usage_states_length_limit() {
    FILE* f = tmpfile();
    TEST_ASSERT_NOT_NULL(f);
    printUsage(f);
    std::string text = readAll(f);
    fclose(f);
    TEST_ASSERT_NOT_NULL(strstr(text.c_str(), "--length 0-4096"));
}

void test_domain_logging_follows_levels() {
    getDebugConfig().globalLevel = static_cast<uint8_t>(DebugLevel::ERROR);
    getDebugConfig().setDomainLevel(DebugDomain::PATTERN, static_cast<int8_t>(DebugLevel::VERBOSE));

    FILE* captured = tmpfile();
    TEST_ASSERT_NOT_NULL(captured);
    fflush(stderr);
    int saved = dup(fileno(stderr));
    dup2(fileno(captured), fileno(stderr));

    CL_PATTERN_LOGD("pattern detail %d", 7);
    CL_PATTERN_LOGT("pattern trace");
    CL_NET_LOGW("network warning");
    CL_NET_LOGE("network error %s", "x");

    fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);

    std::string text = readAll(captured);
    fclose(captured);
    resetDebugConfig();

    TEST_ASSERT_NOT_NULL(strstr(text.c_str(), "[ConfigTest] pattern detail 7"));
    TEST_ASSERT_NOT_NULL(strstr(text.c_str(), "[VERBOSE]"));
    TEST_ASSERT_NULL(strstr(text.c_str(), "pattern trace"));
    TEST_ASSERT_NULL(strstr(text.c_str(), "network warning"));
    TEST_ASSERT_NOT_NULL(strstr(text.c_str(), "[ERROR]"));
    TEST_ASSERT_NOT_NULL(strstr(text.c_str(), "[ConfigTest] network error x"));
}

void test_apply_logging() {
    AppConfig cfg;
    cfg.logLevel = 1;
    DomainLevelOverride ov;
    ov.domain = DebugDomain::PATTERN;
    ov.level = 5;
    cfg.domainLevels.push_back(ov);

    applyLogging(cfg);
    TEST_ASSERT_EQUAL_UINT8(1, getDebugConfig().globalLevel);
    TEST_ASSERT_EQUAL_UINT8(5, getDebugConfig().effectiveLevel(DebugDomain::PATTERN));
    TEST_ASSERT_EQUAL_UINT8(1, getDebugConfig().effectiveLevel(DebugDomain::NETWORK));
    resetDebugConfig();
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_defaults);
    RUN_TEST(test_decode_overlays_present_keys_only);
    RUN_TEST(test_decode_rejects_unknown_key);
    RUN_TEST(test_decode_range_and_type_errors);
    RUN_TEST(test_decode_boundaries_accepted);
    RUN_TEST(test_encoded_config_decodes_to_same_values);
    RUN_TEST(test_parse_commands);
    RUN_TEST(test_parse_usage_errors);
    RUN_TEST(test_log_domain_flag);
    RUN_TEST(test_flags_override_config_file);
    RUN_TEST(test_invalid_config_file_is_reported);
    RUN_TEST(test_load_config_file_leaves_cfg_on_failure);
    RUN_TEST(test_usage_states_length_limit);
    RUN_TEST(test_domain_logging_follows_levels);
    RUN_TEST(test_apply_logging);
    return UNITY_END();
}

#endif
