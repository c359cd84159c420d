#include <iostream>
#include <cassert>
#include <fstream>
#include "test_support.hpp"
#include "../libbinder/include/atomic_file.hpp"

using namespace binder;
using test::TempTree;
using test::read_text;

static void write(const std::filesystem::path& p, const std::string& s) {
    std::ofstream(p, std::ios::binary) << s;
}

int main() {
    TempTree tree("atomic");
    const auto target = tree.path() / "out.pdf";
    const auto scratch = scratch_path_for(target, ".tmp");

    std::cout << "[Test] Producer success replaces the target..." << std::endl;
    write(target, "old");
    atomic_replace(target, [](const std::filesystem::path& tmp) { write(tmp, "new content"); });
    assert(read_text(target) == "new content");
    assert(!std::filesystem::exists(scratch));

    std::cout << "[Test] Producer failure leaves the target untouched..." << std::endl;
    bool threw = false;
    try {
        atomic_replace(target, [](const std::filesystem::path& tmp) {
            write(tmp, "half writ");
            throw std::runtime_error("disk full");
        });
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "disk full";
    }
    assert(threw);
    assert(read_text(target) == "new content");
    assert(!std::filesystem::exists(scratch));

    std::cout << "[Test] Failure after the scratch write never promotes it..." << std::endl;
    // the fault hits between the scratch write and the rename
    const auto fresh = tree.path() / "fresh.pdf";
    threw = false;
    try {
        atomic_replace(fresh, [](const std::filesystem::path& tmp) {
            write(tmp, "complete but unconfirmed");
            throw Error(ErrorKind::Processing, "injected fault");
        });
    } catch (const Error& e) {
        threw = e.kind() == ErrorKind::Processing;
    }
    assert(threw);
    assert(!std::filesystem::exists(fresh));
    assert(!std::filesystem::exists(scratch_path_for(fresh, ".tmp")));

    std::cout << "[Test] Producer writing nothing is an error..." << std::endl;
    threw = false;
    try {
        atomic_replace(target, [](const std::filesystem::path&) {});
    } catch (const Error& e) {
        threw = e.kind() == ErrorKind::Processing;
    }
    assert(threw);
    assert(read_text(target) == "new content");

    std::cout << "[Test] Stale scratch files are discarded first..." << std::endl;
    write(scratch, "stale");
    atomic_replace(target, [](const std::filesystem::path& tmp) {
        std::ofstream(tmp, std::ios::binary | std::ios::app) << "fresh";
    });
    assert(read_text(target) == "fresh");

    std::cout << "[Test] Missing target directory is a path error..." << std::endl;
    threw = false;
    try {
        atomic_replace(tree.path() / "missing" / "x.pdf", [](const std::filesystem::path& tmp) { write(tmp, "x"); });
    } catch (const Error& e) {
        threw = e.kind() == ErrorKind::Path;
    }
    assert(threw);

    std::cout << "[Test] atomic_copy publishes a copy..." << std::endl;
    const auto src = tree.file("src.bin", "payload");
    const auto dst = tree.path() / "dst.bin";
    atomic_copy(src, dst);
    assert(read_text(dst) == "payload");
    assert(read_text(src) == "payload");

    std::cout << "[PASS] Atomic file operations behave as expected." << std::endl;
    return 0;
}
