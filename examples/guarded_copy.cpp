/**
 * Guarded file copy using triage
 *
 * This example demonstrates:
 * - Registering classification rules for a scope
 * - Failing fast with ensure() and check() deep in a call chain
 * - Recovering once at the top with a dispatcher and a callback
 *
 * Usage: guarded_copy <src> <dst>
 * Set TRIAGE_CASEFILE to choose where the case file is written.
 */

#include <triage/triage.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {

// Errors reported to the user.
const auto kBadUsage   = triage::make_error("usage: guarded_copy <src> <dst>", "example");
const auto kNoInput    = triage::make_error("input file cannot be read", "example");
const auto kNoOutput   = triage::make_error("output file cannot be written", "example");
const auto kIoInternal = triage::make_error("internal I/O failure", "example");

auto open_errno(const char* what) -> std::optional<triage::error_id> {
    if (errno == 0) return triage::make_error(std::string(what) + ": unknown", "os");
    return triage::make_error(std::string(what) + ": " + std::strerror(errno), "os");
}

auto read_all(const std::string& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    if (!in) triage::check(open_errno("open-read"));
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    triage::ensure(!in.bad(), kIoInternal);
    return data;
}

void write_all(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) triage::check(open_errno("open-write"));
    out << data;
    out.flush();
    triage::ensure(out.good(), kIoInternal);
}

void copy_file(int argc, char** argv) {
    if (argc != 3) triage::check(kBadUsage);
    const auto data = read_all(argv[1]);
    write_all(argv[2], data);
    std::cout << "copied " << data.size() << " bytes\n";
}

} // namespace

int main(int argc, char** argv) {
    auto rules = triage::rules_here();
    rules->register_exact(kBadUsage);
    rules->register_prefix("open-read:", kNoInput);
    rules->register_prefix("open-write:", kNoOutput);
    rules->set_fallback(kIoInternal);

    auto opts = triage::options_from_env();
    if (!opts) {
        std::cerr << "[triage][config] " << opts.error().message << std::endl;
        return 2;
    }

    auto recovery = triage::dispatcher::here(*opts);
    int status = 0;
    recovery.set_callback([&](bool detected, const triage::error_id& e) {
        std::cerr << (detected ? "error: " : "bug: ") << e.message() << std::endl;
        status = detected ? 1 : 2;
    });

    try {
        if (auto v = recovery.guard([&] { copy_file(argc, argv); })) {
            std::cerr << "case file: " << v->casefile.string() << std::endl;
        }
    } catch (const triage::sink_fault& e) {
        std::cerr << e.what() << std::endl;
        return 3;
    }
    return status;
}
