// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file main.cpp
 * @brief coverlight command-line entry point
 *
 * Exit codes: 0 success, 1 runtime failure, 2 usage error.
 */

#include <cstdio>
#include <cstdlib>

#include "app/ArtworkSource.h"
#include "app/PollLoop.h"
#include "config/AppConfig.h"
#include "config/DebugConfig.h"
#include "core/CoverTypes.h"
#include "core/persistence/SnapshotWriter.h"
#include "net/CurlFetcher.h"
#include "output/ConsoleOutputDriver.h"
#include "palette/PaletteExtractor.h"
#include "pattern/PatternGenerator.h"
#include "rotation/RotationTracker.h"

#define CL_LOG_TAG "Main"
#include "utils/Log.h"

using namespace coverlight;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME = 1;
constexpr int EXIT_USAGE = 2;

// Offline sample so `demo` runs without network access
constexpr const char* DEMO_IDENTIFIER = "spotify:album:4aawyAB9vmqN3uQ7FjRGTy";

palette::ExtractOptions extractOptionsFrom(const config::AppConfig& cfg) {
    palette::ExtractOptions opts;
    opts.cacheDir = cfg.cacheDir;
    opts.maxDimension = cfg.maxDimension;
    opts.quantizedColours = cfg.quantizedColours;
    opts.nearWhiteThreshold = cfg.nearWhiteThreshold;
    return opts;
}

net::CurlFetcherConfig fetcherConfigFrom(const config::AppConfig& cfg) {
    net::CurlFetcherConfig fc;
    fc.timeoutMs = cfg.fetchTimeoutMs;
    if (fc.connectTimeoutMs > fc.timeoutMs) {
        fc.connectTimeoutMs = fc.timeoutMs;
    }
    return fc;
}

void reportFailure(ErrorKind kind, const char* msg) {
    fprintf(stderr, "error: %s: %s\n", errorKindName(kind), msg);
}

int runExtract(const palette::PaletteExtractor& extractor, const char* identifier) {
    palette::ExtractResult result = extractor.extract(identifier);
    if (!result.success) {
        reportFailure(result.error, result.errorMsg);
        return EXIT_RUNTIME;
    }
    char line[PALETTE_SIZE * 8 + 1];
    joinColours(result.palette.data(), result.palette.size(), line, sizeof(line));
    printf("%s\n", line);
    return EXIT_OK;
}

int runPattern(const palette::PaletteExtractor& extractor, const char* identifier,
               const config::AppConfig& cfg) {
    palette::ExtractResult extracted = extractor.extract(identifier);
    if (!extracted.success) {
        reportFailure(extracted.error, extracted.errorMsg);
        return EXIT_RUNTIME;
    }
    pattern::PatternResult generated =
        pattern::PatternGenerator::generate(extracted.palette, cfg.patternLength, cfg.patternMode.c_str());
    if (!generated.success) {
        reportFailure(generated.error, generated.errorMsg);
        return EXIT_RUNTIME;
    }
    for (size_t i = 0; i < generated.pattern.size(); ++i) {
        printf("%s%s", i > 0 ? "," : "", generated.pattern[i].c_str());
    }
    printf("\n");
    return EXIT_OK;
}

int runDemo(const palette::PaletteExtractor& extractor, const config::AppConfig& cfg) {
    palette::ExtractResult extracted = extractor.extract(DEMO_IDENTIFIER);
    if (!extracted.success) {
        reportFailure(extracted.error, extracted.errorMsg);
        return EXIT_RUNTIME;
    }
    pattern::PatternResult generated =
        pattern::PatternGenerator::generate(extracted.palette, config::PatternDefaults::LENGTH,
                                            pattern::PatternMode::REPEAT);
    if (!generated.success) {
        reportFailure(generated.error, generated.errorMsg);
        return EXIT_RUNTIME;
    }

    output::ConsoleOutputDriver driver(stdout, cfg.swatches);
    if (!driver.connect()) {
        return EXIT_RUNTIME;
    }
    bool sent = driver.send(generated.pattern);
    driver.close();
    return sent ? EXIT_OK : EXIT_RUNTIME;
}

int runPoll(const palette::PaletteExtractor& extractor, const config::AppConfig& cfg) {
    app::LineArtworkSource source(stdin);
    if (!cfg.inputPath.empty() && !source.open(cfg.inputPath.c_str())) {
        fprintf(stderr, "error: cannot open input '%s'\n", cfg.inputPath.c_str());
        return EXIT_RUNTIME;
    }

    rotation::RotationTracker tracker(extractor);
    persistence::SnapshotWriter snapshots(cfg.resolvedSnapshotPath());

    app::PollLoopConfig loopCfg;
    loopCfg.intervalSec = cfg.intervalSec;
    loopCfg.maxLoops = cfg.maxLoops;
    loopCfg.patternLength = cfg.patternLength;
    loopCfg.patternMode = cfg.patternMode;

    app::PollLoop::installSignalHandlers();
    app::PollLoop loop(source, tracker, &snapshots, stdout, loopCfg);
    const app::PollLoopStats& stats = loop.run();

    CL_SYS_LOGI("Poll finished: %u cycles, %u emitted, %u idle, %u failed",
                static_cast<unsigned>(stats.cycles), static_cast<unsigned>(stats.emitted),
                static_cast<unsigned>(stats.idle), static_cast<unsigned>(stats.failures));
    return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
    config::CliOptions cli;
    config::ConfigLoadResult parsed = config::parseCommandLine(argc, argv, cli);
    if (!parsed.success) {
        fprintf(stderr, "error: %s\n\n", parsed.errorMsg);
        config::printUsage(stderr);
        return EXIT_USAGE;
    }
    if (cli.command == config::Command::HELP) {
        config::printUsage(stdout);
        return EXIT_OK;
    }

    config::applyLogging(cli.config);
    if (config::getDebugConfig().globalLevel >= static_cast<uint8_t>(config::DebugLevel::TRACE)) {
        config::printDebugConfig();
    }
    CL_SYS_LOGD("Command: %s", config::commandName(cli.command));

    net::CurlFetcher fetcher(fetcherConfigFrom(cli.config));
    palette::PaletteExtractor extractor(fetcher, extractOptionsFrom(cli.config));

    switch (cli.command) {
        case config::Command::DEMO:
            return runDemo(extractor, cli.config);
        case config::Command::EXTRACT:
            return runExtract(extractor, cli.identifier.c_str());
        case config::Command::PATTERN:
            return runPattern(extractor, cli.identifier.c_str(), cli.config);
        case config::Command::POLL:
            return runPoll(extractor, cli.config);
        default:
            config::printUsage(stderr);
            return EXIT_USAGE;
    }
}
