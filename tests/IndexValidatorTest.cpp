// =================================================================
// tests/IndexValidatorTest.cpp
// =================================================================
// Unit tests for IndexValidator and timestamp helpers.

#include "Rewind/IndexValidator.hpp"
#include "Rewind/Timestamp.hpp"
#include "TestHelpers.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <cassert>
#include <string>

class IndexValidatorTest {
private:
    Rewind::IndexValidator validator;
    
    static Rewind::PatchMetadata makeRecord(int number) {
        Rewind::PatchMetadata metadata;
        metadata.patch_number = number;
        metadata.timestamp = "2024-05-01T12:00:00.000Z";
        metadata.operation_type = "edit";
        metadata.file_path = "/project/main.cpp";
        metadata.patch_file = "patch_001.diff";
        return metadata;
    }
    
public:
    void testMetadata() {
        std::cout << "Testing metadata validation..." << std::endl;
        
        assert(validator.validateMetadata(makeRecord(1)).valid && "Complete record should be valid");
        
        Rewind::PatchMetadata record = makeRecord(-1);
        record.operation_type.clear();
        auto result = validator.validateMetadata(record);
        assert(!result.valid && "Bad record should be invalid");
        assert(result.errors.size() == 2 && "Each violation should be reported");
        
        record = makeRecord(1);
        record.patch_file = "..";
        assert(!validator.validateMetadata(record).valid && "Parent directory name should be rejected");
        record.patch_file = "sub\\patch_001.diff";
        assert(!validator.validateMetadata(record).valid && "Backslash paths should be rejected");
        
        record = makeRecord(1);
        record.timestamp = "yesterday";
        assert(validator.validateMetadata(record).valid && "Unparseable timestamp should be tolerated");
        record.timestamp.clear();
        assert(!validator.validateMetadata(record).valid && "Missing timestamp should be rejected");
        
        std::cout << "✓ Metadata validation test passed" << std::endl;
    }
    
    void testIndex() {
        std::cout << "Testing index validation..." << std::endl;
        
        Rewind::PatchIndexData index;
        assert(validator.validateIndex(index).valid && "Empty index should be valid");
        
        index.patches.push_back(makeRecord(1));
        index.patches.push_back(makeRecord(2));
        index.next_patch_number = 3;
        assert(validator.validateIndex(index).valid && "Consistent index should be valid");
        
        index.next_patch_number = 2;
        assert(!validator.validateIndex(index).valid && "Counter must exceed every live number");
        
        index.next_patch_number = 5;
        index.patches.push_back(makeRecord(2));
        auto result = validator.validateIndex(index);
        assert(!result.valid && "Duplicate numbers should be invalid");
        assert(result.errors.front().find("duplicate") != std::string::npos && "Should name the problem");
        
        index = Rewind::PatchIndexData{};
        index.next_patch_number = 0;
        assert(!validator.validateIndex(index).valid && "Non-positive counter should be invalid");
        
        std::cout << "✓ Index validation test passed" << std::endl;
    }
    
    void testIndexJson() {
        std::cout << "Testing JSON index validation..." << std::endl;
        
        nlohmann::json good = {
            {"next_patch_number", 2},
            {"patches", nlohmann::json::array({
                {{"patch_number", 1}, {"timestamp", "2024-05-01T12:00:00Z"}, {"operation_type", "write"},
                 {"file_path", "/a"}, {"patch_file", "patch_001.diff"}}
            })}
        };
        assert(validator.validateIndexJson(good).valid && "Well-formed JSON should be valid");
        
        assert(!validator.validateIndexJson(nlohmann::json::array()).valid && "Array root should be invalid");
        
        nlohmann::json missing = good;
        missing.erase("patches");
        assert(!validator.validateIndexJson(missing).valid && "Missing patches should be invalid");
        
        nlohmann::json wrong_type = good;
        wrong_type["patches"][0]["patch_number"] = "1";
        assert(!validator.validateIndexJson(wrong_type).valid && "String patch number should be invalid");
        
        nlohmann::json missing_field = good;
        missing_field["patches"][0].erase("file_path");
        assert(!validator.validateIndexJson(missing_field).valid && "Missing field should be invalid");
        
        std::cout << "✓ JSON validation test passed" << std::endl;
    }
    
    void testUndoResult() {
        std::cout << "Testing undo result validation..." << std::endl;
        
        Rewind::UndoResult ok;
        ok.success = true;
        ok.reverted_files = {"/a"};
        assert(validator.validateUndoResult(ok).valid && "Successful result should be valid");
        
        Rewind::UndoResult empty;
        assert(validator.validateUndoResult(empty).valid && "Empty failure should be valid");
        
        Rewind::UndoResult lying = ok;
        lying.failed_operations = {"Patch 3 (/b): mismatch"};
        assert(!validator.validateUndoResult(lying).valid && "Success with failures should be invalid");
        
        Rewind::UndoResult modest;
        modest.reverted_files = {"/a"};
        assert(!validator.validateUndoResult(modest).valid && "Unset success without failures should be invalid");
        
        Rewind::UndoResult blank = ok;
        blank.reverted_files = {""};
        assert(!validator.validateUndoResult(blank).valid && "Empty reverted path should be invalid");
        
        std::cout << "✓ Undo result validation test passed" << std::endl;
    }
    
    void testTimestamps() {
        std::cout << "Testing timestamp helpers..." << std::endl;
        
        auto epoch = Rewind::parseTimestamp("1970-01-01T00:00:00Z");
        assert(epoch.has_value() && *epoch == 0 && "Epoch should parse to zero");
        
        auto with_millis = Rewind::parseTimestamp("1970-01-01T00:00:01.250Z");
        assert(with_millis.has_value() && *with_millis == 1250 && "Fraction should be honored");
        
        auto offset = Rewind::parseTimestamp("1970-01-01T02:00:00+02:00");
        assert(offset.has_value() && *offset == 0 && "Offset should be applied");
        
        auto naive = Rewind::parseTimestamp("1970-01-01T00:01:00");
        assert(naive.has_value() && *naive == 60000 && "Missing zone should mean UTC");
        
        assert(!Rewind::parseTimestamp("").has_value() && "Empty text should not parse");
        assert(!Rewind::parseTimestamp("2024-13-01T00:00:00Z").has_value() && "Bad month should not parse");
        assert(!Rewind::parseTimestamp("2024-02-30T00:00:00Z").has_value() && "Impossible date should not parse");
        assert(!Rewind::parseTimestamp("2024-05-01T12:00:00Zjunk").has_value() && "Trailing text should not parse");
        
        auto now = std::chrono::system_clock::now();
        std::string formatted = Rewind::formatTimestamp(now);
        assert(formatted.size() == 24 && formatted.back() == 'Z' && "Should format with milliseconds");
        auto parsed = Rewind::parseTimestamp(formatted);
        assert(parsed.has_value() && *parsed == Rewind::toEpochMillis(now) && "Format should parse back");
        
        std::cout << "✓ Timestamp test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running IndexValidator unit tests..." << std::endl;
        
        testMetadata();
        testIndex();
        testIndexJson();
        testUndoResult();
        testTimestamps();
        
        std::cout << "All IndexValidator tests passed!" << std::endl;
    }
};

int main() {
    try {
        RewindTest::TempDirectory scratch("rewind_validator");
        RewindTest::quietLogging(scratch);
        
        IndexValidatorTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All IndexValidator component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
