#include <string>
#include <vector>
#include <iostream>
#include "batch.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "id_registry.hpp"
#include "log.hpp"
#include "report.hpp"
#include <argparse.hpp>

using namespace iopatch;

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("iopatch", "1.0.0", argparse::default_arguments::all);

    program.add_argument("paths")
        .help(".utoc files, or directories to scan recursively for them")
        .nargs(argparse::nargs_pattern::at_least_one);

    program.add_argument("-f", "--force")
        .help("Assign a fresh container id to every container, colliding or not")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--log-file")
        .help("Append a detailed log to this file (empty to disable)")
        .default_value(std::string("iopatch.log"));

    program.add_argument("-v", "--verbose")
        .help("Print debug output to the console")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    LogOptions logOptions;
    logOptions.filePath = program.get<std::string>("--log-file");
    logOptions.verbose = program.get<bool>("--verbose");
    if (!log_init(logOptions)) {
        std::cerr << "Warning: could not open log file " << logOptions.filePath << "\n";
    }

    BatchOptions batchOptions;
    batchOptions.forceReassign = program.get<bool>("--force");

    std::vector<FilePair> pairs;
    try {
        pairs = collectPairs(program.get<std::vector<std::string>>("paths"));
    } catch (const IoError& e) {
        log_message(LogLevel::Error, "%s", e.what());
        log_shutdown();
        return 1;
    }

    log_message(LogLevel::Info, "Found %zu .utoc file(s)", pairs.size());
    if (pairs.empty()) {
        log_message(LogLevel::Warn, "Nothing to do");
        log_shutdown();
        return 0;
    }

    // One registry per run: ids are unique within this batch only
    IdRegistry registry;
    BatchCoordinator coordinator(registry, batchOptions);

    int status = 0;
    try {
        coordinator.run(pairs);
    } catch (const AllocationExhausted& e) {
        log_message(LogLevel::Error, "Fatal: %s. Batch aborted.", e.what());
        status = 2;
    }

    const BatchReport& report = coordinator.report();
    renderReport(report, std::cout);

    for (const auto& r : report.reassignments) {
        log_message(LogLevel::Debug, "%s: %s -> %s", r.name.c_str(),
                    formatId(r.oldId).c_str(), formatId(r.newId).c_str());
    }
    for (const auto& [id, refs] : report.packageIds.shared()) {
        log_message(LogLevel::Debug, "Shared package id %s: %s",
                    formatId(id).c_str(), describeContainers(refs).c_str());
    }

    if (status == 0 && (report.failedCount() > 0 || report.criticalCount() > 0)) {
        status = 1;
    }

    log_message(LogLevel::Info, "Done: %zu container(s), %zu reassigned, %zu failed",
                report.processedCount(), report.reassignments.size(), report.failedCount());
    log_shutdown();
    return status;
}
