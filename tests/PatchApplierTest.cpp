// =================================================================
// tests/PatchApplierTest.cpp
// =================================================================
// Unit tests for PatchApplier component.

#include "Rewind/DiffCodec.hpp"
#include "Rewind/PatchApplier.hpp"
#include "TestHelpers.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

class PatchApplierTest {
private:
    Rewind::DiffCodec codec;
    Rewind::PatchApplier applier;
    
    void checkRoundTrip(const std::string& original, const std::string& updated, const std::string& label) {
        std::string diff = codec.buildDiff(original, updated, "file.txt");
        
        auto forward = applier.apply(diff, original, false);
        assert(forward.success && "Forward apply should succeed");
        assert(forward.content == updated && "Forward apply should produce the updated content");
        
        auto backward = applier.apply(diff, updated, true);
        assert(backward.success && "Reverse apply should succeed");
        assert(backward.content == original && "Reverse apply should restore the original content");
        
        std::cout << "  round trip ok: " << label << std::endl;
    }
    
public:
    void testRoundTrips() {
        std::cout << "Testing reverse application round trips..." << std::endl;
        
        checkRoundTrip("a\nb\n", "a\nc\n", "single edit");
        checkRoundTrip("", "hello\nworld\n", "creation");
        checkRoundTrip("hello\nworld\n", "", "deletion");
        checkRoundTrip("no newline", "no newline\nmore", "missing final newline");
        checkRoundTrip("x\n", "x", "newline removed");
        checkRoundTrip("first\r\nsecond\r\n", "first\r\nchanged\r\n", "CRLF line endings");
        checkRoundTrip("\n\n\n", "\n\nfilled\n\n", "blank lines");
        
        std::string long_original;
        std::string long_updated;
        for (int i = 1; i <= 60; ++i) {
            long_original += "line " + std::to_string(i) + "\n";
            if (i == 5) {
                long_updated += "inserted before five\n";
            }
            if (i != 30) {
                long_updated += "line " + std::to_string(i) + "\n";
            }
            if (i == 55) {
                long_updated += "line 55 again\n";
            }
        }
        checkRoundTrip(long_original, long_updated, "several hunks");
        
        std::cout << "✓ Round trip test passed" << std::endl;
    }
    
    void testStaleDiffFails() {
        std::cout << "Testing stale diff detection..." << std::endl;
        
        std::string diff = codec.buildDiff("a\nb\nc\n", "a\nB\nc\n", "file.txt");
        
        auto result = applier.apply(diff, "something\nelse\nentirely\n", true);
        assert(!result.success && "Stale diff should not apply");
        assert(result.error.find("Hunk #1") != std::string::npos && "Error should name the hunk");
        assert(result.error.find("@@ -1,3 +1,3 @@") != std::string::npos && "Error should show the hunk header");
        
        std::cout << "✓ Stale diff test passed" << std::endl;
    }
    
    void testEmptyAndHeaderOnlyDiffs() {
        std::cout << "Testing empty and header-only diffs..." << std::endl;
        
        auto empty = applier.apply("", "content\n", true);
        assert(!empty.success && "Empty diff should fail");
        assert(empty.error == "Empty diff content" && "Should explain empty diff");
        
        std::string unchanged = codec.buildDiff("same\n", "same\n", "file.txt");
        auto identity = applier.apply(unchanged, "same\n", true);
        assert(identity.success && identity.content == "same\n" && "Header-only diff should be the identity");
        
        auto garbage = applier.apply("this is not a diff", "x\n", false);
        assert(!garbage.success && garbage.error.find("Invalid diff") == 0 && "Garbage should be rejected");
        
        std::cout << "✓ Empty diff test passed" << std::endl;
    }
    
    void testOffsetTolerance() {
        std::cout << "Testing hunks displaced by extra lines..." << std::endl;
        
        std::string original;
        for (int i = 1; i <= 12; ++i) {
            original += "row " + std::to_string(i) + "\n";
        }
        std::string updated = original;
        updated.replace(updated.find("row 8\n"), 6, "row eight\n");
        std::string diff = codec.buildDiff(original, updated, "rows.txt");
        
        // Two unrelated lines were added at the top after the diff was taken
        auto result = applier.apply(diff, "header 1\nheader 2\n" + updated, true);
        assert(result.success && "Displaced hunk should still be found");
        assert(result.content == "header 1\nheader 2\n" + original && "Only the hunk should be reverted");
        
        std::cout << "✓ Offset tolerance test passed" << std::endl;
    }
    
    void testCreationReversalRequiresEmptyTarget() {
        std::cout << "Testing reversal of a deletion onto existing content..." << std::endl;
        
        std::string diff = codec.buildDiff("kept\n", "", "gone.txt");
        
        auto restored = applier.apply(diff, "", true);
        assert(restored.success && restored.content == "kept\n" && "Deletion should be reversible");
        
        auto clash = applier.apply(diff, "someone recreated this file\n", true);
        assert(!clash.success && "Recreating over existing content should fail");
        
        std::cout << "✓ Creation reversal test passed" << std::endl;
    }
    
    void testZeroContextDiffs() {
        std::cout << "Testing diffs without context lines..." << std::endl;
        
        // As produced by diff -U0: an insertion before line 1 plus a change
        std::string diff =
            "--- a/list.txt\n"
            "+++ b/list.txt\n"
            "@@ -0,0 +1 @@\n"
            "+top\n"
            "@@ -2 +3 @@\n"
            "-b\n"
            "+B\n";
        
        auto forward = applier.apply(diff, "a\nb\nc\n", false);
        assert(forward.success && "Insertion before line 1 should apply to non-empty content");
        assert(forward.content == "top\na\nB\nc\n" && "Both hunks should be applied");
        
        auto backward = applier.apply(diff, "top\na\nB\nc\n", true);
        assert(backward.success && "Zero-context diff should reverse");
        assert(backward.content == "a\nb\nc\n" && "Reverse should restore the original");
        
        // A lone -0,0 hunk still means the file was created
        std::string creation = "--- a/new.txt\n+++ b/new.txt\n@@ -0,0 +1 @@\n+fresh\n";
        auto onto_empty = applier.apply(creation, "", false);
        assert(onto_empty.success && onto_empty.content == "fresh\n" && "Creation should apply to empty content");
        auto onto_existing = applier.apply(creation, "already here\n", false);
        assert(!onto_existing.success && "Creation should not apply over existing content");
        
        std::cout << "✓ Zero-context diff test passed" << std::endl;
    }
    
    void testSimulate() {
        std::cout << "Testing side-effect-free simulation..." << std::endl;
        
        std::string diff = codec.buildDiff("v1\n", "v2\n", "file.txt");
        
        auto first = applier.simulate(diff, "v2\n", true);
        auto second = applier.simulate(diff, "v2\n", true);
        assert(first.has_value() && *first == "v1\n" && "Simulation should predict the original");
        assert(second.has_value() && *first == *second && "Simulation should be repeatable");
        
        auto stale = applier.simulate(diff, "v3\n", true);
        assert(!stale.has_value() && "Failed simulation should return nothing");
        
        auto broken = applier.simulate("@@ -1,9 +1,9 @@\n x\n", "x\n", true);
        assert(!broken.has_value() && "Malformed diff should return nothing");
        
        std::cout << "✓ Simulate test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running PatchApplier unit tests..." << std::endl;
        
        testRoundTrips();
        testStaleDiffFails();
        testEmptyAndHeaderOnlyDiffs();
        testOffsetTolerance();
        testCreationReversalRequiresEmptyTarget();
        testZeroContextDiffs();
        testSimulate();
        
        std::cout << "All PatchApplier tests passed!" << std::endl;
    }
};

int main() {
    try {
        RewindTest::TempDirectory scratch("rewind_applier");
        RewindTest::quietLogging(scratch);
        
        PatchApplierTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All PatchApplier component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
