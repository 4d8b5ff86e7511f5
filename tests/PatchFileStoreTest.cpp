// =================================================================
// tests/PatchFileStoreTest.cpp
// =================================================================
// Unit tests for PatchFileStore component.

#include "Rewind/PatchFileStore.hpp"
#include "TestHelpers.hpp"
#include <iostream>
#include <cassert>
#include <string>

class PatchFileStoreTest {
private:
    RewindTest::TempDirectory& scratch;
    
public:
    explicit PatchFileStoreTest(RewindTest::TempDirectory& dir) : scratch(dir) {}
    
    void testFilenames() {
        std::cout << "Testing patch file names..." << std::endl;
        
        Rewind::PatchFileStore store;
        assert(store.filenameFor(1) == "patch_001.diff" && "Should pad to three digits");
        assert(store.filenameFor(42) == "patch_042.diff" && "Should pad two digit numbers");
        assert(store.filenameFor(1234) == "patch_1234.diff" && "Should not truncate wide numbers");
        
        Rewind::PatchFileStore wide(std::nullopt, 5);
        assert(wide.filenameFor(7) == "patch_00007.diff" && "Should honor configured padding");
        
        assert(Rewind::PatchFileStore::isPatchFileName("patch_9999.diff") && "Should accept patch names");
        assert(!Rewind::PatchFileStore::isPatchFileName("patch_index.json") && "Should reject the index file");
        assert(!Rewind::PatchFileStore::isPatchFileName("patch_001.diff.tmp.1_0") && "Should reject temporary files");
        
        std::cout << "✓ Filenames test passed" << std::endl;
    }
    
    void testNoSession() {
        std::cout << "Testing store without an active session..." << std::endl;
        
        Rewind::PatchFileStore store;
        assert(!store.directory().has_value() && "Should have no directory");
        assert(!store.ensureDirectory() && "Should not create anything");
        assert(!store.write(1, "content").has_value() && "Write should be a no-op");
        assert(!store.read("patch_001.diff").has_value() && "Read should return nothing");
        assert(!store.exists("patch_001.diff") && "Nothing should exist");
        assert(!store.remove("patch_001.diff") && "Delete should return false");
        assert(store.totalSize() == 0 && "Size should be zero");
        assert(store.sizeOf("patch_001.diff") == 0 && "File size should be zero");
        assert(store.listPatchFiles().empty() && "Listing should be empty");
        assert(!store.pathFor("patch_001.diff").has_value() && "Path should be unavailable");
        
        std::cout << "✓ No session test passed" << std::endl;
    }
    
    void testWriteReadDelete() {
        std::cout << "Testing write, read and delete..." << std::endl;
        
        std::string directory = scratch.file("session_a/patches");
        Rewind::PatchFileStore store(directory);
        assert(!RewindTest::exists(directory) && "Directory should not be created eagerly");
        
        auto name = store.write(3, "patch three\n");
        assert(name.has_value() && *name == "patch_003.diff" && "Should return the file name");
        assert(RewindTest::exists(directory) && "Directory should be created on first write");
        assert(store.exists("patch_003.diff") && "Written file should exist");
        
        auto content = store.read("patch_003.diff");
        assert(content.has_value() && *content == "patch three\n" && "Should read back the content");
        assert(store.sizeOf("patch_003.diff") == 12 && "Should report file size");
        
        // Overwrite keeps a single file
        store.write(3, "replaced\n");
        assert(*store.read("patch_003.diff") == "replaced\n" && "Overwrite should replace content");
        assert(store.listPatchFiles().size() == 1 && "Overwrite should not leave temporary files");
        
        assert(store.remove("patch_003.diff") && "Delete should succeed");
        assert(!store.exists("patch_003.diff") && "File should be gone");
        assert(!store.remove("patch_003.diff") && "Second delete should report failure");
        assert(!store.read("patch_003.diff").has_value() && "Deleted file should not be readable");
        
        std::cout << "✓ Write/read/delete test passed" << std::endl;
    }
    
    void testSizeAccounting() {
        std::cout << "Testing size accounting and listing..." << std::endl;
        
        std::string directory = scratch.file("session_b/patches");
        Rewind::PatchFileStore store(directory);
        store.write(2, std::string(100, 'b'));
        store.write(1, std::string(50, 'a'));
        RewindTest::writeFile(directory + "/notes.txt", std::string(1000, 'n'));
        RewindTest::writeFile(directory + "/patch_index.json", "{}");
        
        assert(store.totalSize() == 150 && "Only patch files should count toward the total");
        
        auto names = store.listPatchFiles();
        assert(names.size() == 2 && "Should list only patch files");
        assert(names[0] == "patch_001.diff" && names[1] == "patch_002.diff" && "Listing should be sorted");
        
        std::cout << "✓ Size accounting test passed" << std::endl;
    }
    
    void testRedirect() {
        std::cout << "Testing directory changes..." << std::endl;
        
        Rewind::PatchFileStore store(scratch.file("first/patches"));
        store.write(1, "first");
        store.setDirectory(scratch.file("second/patches"));
        assert(!store.exists("patch_001.diff") && "New directory should be empty");
        store.setDirectory(std::nullopt);
        assert(!store.write(1, "x").has_value() && "Writes should stop without a session");
        
        std::cout << "✓ Redirect test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running PatchFileStore unit tests..." << std::endl;
        
        testFilenames();
        testNoSession();
        testWriteReadDelete();
        testSizeAccounting();
        testRedirect();
        
        std::cout << "All PatchFileStore tests passed!" << std::endl;
    }
};

int main() {
    try {
        RewindTest::TempDirectory scratch("rewind_filestore");
        RewindTest::quietLogging(scratch);
        
        PatchFileStoreTest tests(scratch);
        tests.runAllTests();
        
        std::cout << "\n🎉 All PatchFileStore component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
