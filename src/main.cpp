// =============================================================================
// rcp-packager - RCP Package Tool
// =============================================================================
// Main entry point for the rcp command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: export, verify, info
// - Global options: verbose, quiet, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "rcp/common/error.h"
#include "rcp/common/logger.h"
#include "rcp/common/types.h"

// Command implementations
#include "commands/export_command.h"
#include "commands/info_command.h"
#include "commands/verify_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "rcp: package reconstructed pen-stroke and inertial channels as RCP packages\n"
    "A package holds zstd-compressed channel files, a JSON manifest and index,\n"
    "and a sha256sum-compatible checksums.txt.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliExportOptions {
    std::string extractionDir;
    std::string simulationDir;
    std::string format = std::string(rcp::kDefaultFormatVersion);
    std::string output = "./artifacts/export";
    int level = rcp::kDefaultCompressionLevel;
};

struct CliVerifyOptions {
    std::string input;
    bool verbose = false;
};

struct CliInfoOptions {
    std::string input;
    bool json = false;
};

struct CliOptions {
    GlobalOptions global;
    CliExportOptions exportOpts;
    CliVerifyOptions verifyOpts;
    CliInfoOptions infoOpts;
};

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupExportCommand(CLI::App& app, CliExportOptions& opts) {
    auto* exportCmd = app.add_subcommand("export", "Compress and package the pipeline outputs");

    exportCmd->add_option("--extraction-dir", opts.extractionDir,
                          "Folder with extraction.json and kinematics.json")
        ->required()
        ->check(CLI::ExistingDirectory);

    exportCmd->add_option("--simulation-dir", opts.simulationDir,
                          "Folder with simulation.json")
        ->required()
        ->check(CLI::ExistingDirectory);

    exportCmd->add_option("--fmt", opts.format, "Export format label")
        ->capture_default_str();

    exportCmd->add_option("-o,--out", opts.output, "Destination package folder")
        ->capture_default_str();

    exportCmd->add_option("-l,--level", opts.level, "zstd compression level (1-19)")
        ->check(CLI::Range(rcp::kMinCompressionLevel, rcp::kMaxCompressionLevel))
        ->capture_default_str();
}

void setupVerifyCommand(CLI::App& app, CliVerifyOptions& opts) {
    auto* verify = app.add_subcommand("verify", "Verify package checksums and structure");

    verify->add_option("-i,--input", opts.input, "Package directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    verify->add_flag("--verbose", opts.verbose, "Show every checked artifact");
}

void setupInfoCommand(CLI::App& app, CliInfoOptions& opts) {
    auto* info = app.add_subcommand("info", "Display package information");

    info->add_option("-i,--input", opts.input, "Package directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    info->add_flag("--json", opts.json, "Output as JSON");
}

// =============================================================================
// Command Dispatch
// =============================================================================

int runExport(const CliExportOptions& opts) {
    auto cmd = rcp::commands::createExportCommand(opts.extractionDir, opts.simulationDir,
                                                  opts.output, opts.format, opts.level);
    return cmd->execute();
}

int runVerify(const CliVerifyOptions& opts) {
    auto cmd = rcp::commands::createVerifyCommand(opts.input, opts.verbose);
    return cmd->execute();
}

int runInfo(const CliInfoOptions& opts) {
    auto cmd = rcp::commands::createInfoCommand(opts.input, opts.json);
    return cmd->execute();
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    CliOptions options;

    // Global options
    app.add_flag("-v,--verbose", options.global.verbosity,
                 "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", options.global.quiet, "Suppress non-error output");

    app.add_option("--log-file", options.global.logFile, "Also append log records to a file");

    setupExportCommand(app, options.exportOpts);
    setupVerifyCommand(app, options.verifyOpts);
    setupInfoCommand(app, options.infoOpts);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        rcp::log::Config logConfig;
        logConfig.level = rcp::log::levelFromVerbosity(options.global.verbosity,
                                                        options.global.quiet);
        logConfig.logFile = options.global.logFile;
        rcp::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("export")) {
            exitCode = runExport(options.exportOpts);
        } else if (app.got_subcommand("verify")) {
            exitCode = runVerify(options.verifyOpts);
        } else if (app.got_subcommand("info")) {
            exitCode = runInfo(options.infoOpts);
        }
    } catch (const rcp::RCPException& ex) {
        RCP_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        RCP_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    rcp::log::shutdown();
    return exitCode;
}
