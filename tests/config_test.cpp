#include <iostream>
#include <cassert>
#include "test_support.hpp"

using namespace binder;

static bool fails_with_configuration(const std::string& json) {
    try {
        (void)Config::from_json(json);
    } catch (const Error& e) {
        return e.kind() == ErrorKind::Configuration;
    }
    return false;
}

int main() {
    std::cout << "[Test] Defaults..." << std::endl;
    const Config d;
    assert(d.retry.max_attempts == 3);
    assert(d.retry.base_backoff == std::chrono::milliseconds(2000));
    assert(d.confidence_threshold == 0.7);
    assert(d.max_scan_depth == 10);
    assert(d.separator_for_subsections);
    assert(d.fail_on_empty_section);
    assert(!d.page_number_start.has_value());
    assert(d.compressor_command.empty());
    assert(d.legacy_command.empty());
    d.validate();

    std::cout << "[Test] Overrides from JSON, unknown keys ignored..." << std::endl;
    const Config c = Config::from_json(R"({
        "retry": {"max_attempts": 5, "base_backoff_ms": 250, "office_timeout_s": 30},
        "structure": {"cover_keywords": ["front"], "category_keywords": ["Math", "Science"],
                      "confidence_threshold": 0.5},
        "collector": {"fail_on_empty_section": false},
        "layout": {"toc_title": "Contents", "page_number_start": 3},
        "compressor": {"command": "gs -o {output} {input}"},
        "temp_root": "/tmp/binder-config-test",
        "something_else": {"ignored": true}
    })");
    assert(c.retry.max_attempts == 5);
    assert(c.retry.base_backoff == std::chrono::milliseconds(250));
    assert(c.retry.office_timeout == std::chrono::seconds(30));
    assert(c.retry.legacy_timeout == std::chrono::seconds(120));
    assert(c.cover_keywords.size() == 1 && c.cover_keywords[0] == "front");
    assert(c.category_keywords.size() == 2);
    assert(c.confidence_threshold == 0.5);
    assert(!c.fail_on_empty_section);
    assert(c.toc_title == "Contents");
    assert(c.page_number_start == 3);
    assert(c.compressor_command == "gs -o {output} {input}");
    assert(c.temp_root == "/tmp/binder-config-test");

    std::cout << "[Test] null page_number_start keeps the default..." << std::endl;
    assert(!Config::from_json(R"({"layout": {"page_number_start": null}})").page_number_start);

    std::cout << "[Test] Invalid documents fail fast..." << std::endl;
    assert(fails_with_configuration("not json"));
    assert(fails_with_configuration("[1, 2]"));
    assert(fails_with_configuration(R"({"retry": 3})"));
    assert(fails_with_configuration(R"({"retry": {"max_attempts": "three"}})"));
    assert(fails_with_configuration(R"({"retry": {"max_attempts": 0}})"));
    assert(fails_with_configuration(R"({"structure": {"confidence_threshold": 1.5}})"));
    assert(fails_with_configuration(R"({"converters": {"office_command": "soffice --headless"}})"));
    assert(fails_with_configuration(R"({"converters": {"legacy_command": "jtdconv {input}"}})"));
    assert(fails_with_configuration(R"({"compressor": {"command": "gs {input}"}})"));
    assert(fails_with_configuration(R"({"layout": {"page_number_start": 0}})"));

    std::cout << "[Test] load() reports unreadable files..." << std::endl;
    test::TempTree tree("config");
    bool threw = false;
    try {
        (void)Config::load(tree.path() / "missing.json");
    } catch (const Error& e) {
        threw = e.kind() == ErrorKind::Configuration;
    }
    assert(threw);
    const auto file = tree.file("binder.json", R"({"layout": {"toc_font_size": 14}})");
    assert(Config::load(file).toc_font_size == 14);

    std::cout << "[Test] Nested causes are kept..." << std::endl;
    const auto bad = tree.file("bad.json", R"({"retry": {"max_attempts": "x"}})");
    try {
        (void)Config::load(bad);
        assert(false);
    } catch (const Error&) {
        const auto chain = describe_chain(std::current_exception());
        assert(chain.size() >= 2);
    }

    std::cout << "[PASS] Configuration loading behaves as expected." << std::endl;
    return 0;
}
