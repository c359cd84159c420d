#include <iostream>
#include <cassert>
#include "test_support.hpp"
#include "../libbinder/include/structure_detector.hpp"

using namespace binder;

int main() {
    test::TempTree tree("detector");
    const StructureDetector detector{Config{}};

    std::cout << "[Test] Categories with subjects detect as three-level..." << std::endl;
    for (const char* cat : {"Language", "Science", "Arts"}) {
        for (const char* subject : {"Term 1", "Term 2"}) {
            tree.file(std::string("edu/") + cat + "/" + subject + "/plan.docx");
        }
    }
    const auto edu = detector.detect(tree.path() / "edu");
    assert(edu.variant == StructureVariant::ThreeLevel);
    assert(edu.confidence >= 0.7);
    assert(edu.evidence.main_dir_count == 3);
    assert(edu.evidence.total_files == 6);
    assert(edu.evidence.max_depth == 3);
    assert(edu.evidence.education_score > edu.evidence.event_score);
    assert(edu.level_for_depth(1) == 1);
    assert(edu.level_for_depth(2) == 2);
    assert(edu.level_for_depth(3) == 0);

    std::cout << "[Test] Mostly loose files detect as two-level..." << std::endl;
    for (int i = 0; i < 6; ++i) tree.file("event/item" + std::to_string(i) + ".pdf");
    tree.file("event/Venue/map.png");
    const auto ev = detector.detect(tree.path() / "event");
    assert(ev.variant == StructureVariant::TwoLevel);
    assert(ev.evidence.root_file_count == 6);
    assert(ev.evidence.root_file_ratio > 0.8);
    assert(ev.level_for_depth(1) == 1);
    assert(ev.level_for_depth(2) == 0);

    std::cout << "[Test] Ambiguous trees stay unknown and report why..." << std::endl;
    tree.file("mixed/Cover.docx");
    tree.file("mixed/Section A/doc1.docx");
    tree.file("mixed/Section A/img1.png");
    tree.file("mixed/Section B/doc2.docx");
    tree.file("mixed/.git/config");
    tree.file("mixed/~tmp/scratch.docx");
    const auto mixed = detector.detect(tree.path() / "mixed");
    assert(mixed.variant == StructureVariant::Unknown);
    assert(mixed.confidence < 0.7);
    assert(mixed.evidence.main_dir_count == 2);
    assert(mixed.evidence.root_file_count == 0);
    assert(mixed.evidence.total_files == 3);
    assert(!mixed.issues.empty());
    assert(mixed.level_for_depth(1) == 1);
    assert(mixed.level_for_depth(4) == 1);
    assert(mixed.level_for_depth(11) == 0);

    std::cout << "[Test] Category keywords favour the three-level shape..." << std::endl;
    Config keyed;
    keyed.category_keywords = {"section"};
    keyed.confidence_threshold = 0.3;
    const auto with_keywords = StructureDetector(keyed).detect(tree.path() / "mixed");
    assert(with_keywords.evidence.education_score == mixed.evidence.education_score + 4.0);
    assert(with_keywords.variant == StructureVariant::ThreeLevel);

    std::cout << "[Test] Empty trees..." << std::endl;
    tree.dir("empty/Nothing");
    const auto empty = detector.detect(tree.path() / "empty");
    assert(empty.variant == StructureVariant::Unknown);
    assert(empty.confidence == 0.0);
    assert(empty.evidence.total_files == 0);

    std::cout << "[Test] Missing root is a path error..." << std::endl;
    bool threw = false;
    try {
        (void)detector.detect(tree.path() / "missing");
    } catch (const Error& e) {
        threw = e.kind() == ErrorKind::Path;
    }
    assert(threw);

    std::cout << "[Test] Caller hints override detection..." << std::endl;
    const auto forced = detector.resolve(tree.path() / "mixed", PlanHint::ThreeLevel);
    assert(forced.variant == StructureVariant::ThreeLevel);
    assert(forced.confidence == 1.0);
    assert(detector.resolve(tree.path() / "edu", PlanHint::TwoLevel).variant == StructureVariant::TwoLevel);
    assert(detector.resolve(tree.path() / "edu", PlanHint::Auto).variant == StructureVariant::ThreeLevel);

    FolderStructure shallow;
    shallow.variant = StructureVariant::ThreeLevel;
    shallow.max_depth = 1;
    assert(shallow.level_for_depth(1) == 1);
    assert(shallow.level_for_depth(2) == 0);
    assert(std::string(to_string(StructureVariant::TwoLevel)) == "two-level");

    std::cout << "[PASS] Structure detection behaves as expected." << std::endl;
    return 0;
}
