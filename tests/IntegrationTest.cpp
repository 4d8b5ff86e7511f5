// =================================================================
// tests/IntegrationTest.cpp
// =================================================================
// End-to-end tests of the rewind command line: edits go through the
// FileEditor, are captured by the PatchManager and undone again.

#include "Rewind/CliParser.hpp"
#include "Rewind/Core.hpp"
#include "TestHelpers.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <cassert>
#include <string>

class IntegrationTest {
private:
    RewindTest::TempDirectory& scratch;
    std::string config_path;
    std::string project_dir;
    std::string sessions_root;
    
    void setupProject() {
        project_dir = scratch.file("project");
        sessions_root = scratch.file("sessions");
        config_path = scratch.file("config.yml");
        
        RewindTest::writeFile(config_path,
            "sessions_root: " + sessions_root + "\n"
            "logging:\n"
            "  log_dir: " + scratch.file("logs") + "\n"
            "  console_enabled: false\n");
        
        RewindTest::writeFile(project_dir + "/src/main.cpp",
            "#include <iostream>\n"
            "\n"
            "int main() {\n"
            "    std::cout << \"Hello\" << std::endl;\n"
            "    return 0;\n"
            "}\n");
    }
    
    // Parse a command line and run it the way main() does
    int run(const std::string& arguments) {
        Rewind::CliParser parser;
        auto app = parser.setupCli();
        app->parse("--config " + config_path + " " + arguments, false);
        Rewind::Core core(parser.getCommands());
        return core.run();
    }
    
    std::string project(const std::string& name) const {
        return project_dir + "/" + name;
    }
    
    nlohmann::json index(const std::string& session) const {
        return nlohmann::json::parse(
            RewindTest::readFile(sessions_root + "/" + session + "/patches/patch_index.json"));
    }
    
public:
    explicit IntegrationTest(RewindTest::TempDirectory& dir) : scratch(dir) {
        // Sessions are passed explicitly below
        ::unsetenv("REWIND_SESSION");
        setupProject();
    }
    
    void testEditAndUndoWorkflow() {
        std::cout << "Testing edit and undo workflow..." << std::endl;
        
        std::string main_cpp = project("src/main.cpp");
        std::string original = RewindTest::readFile(main_cpp);
        
        assert(run("-s work replace " + main_cpp + " --old Hello --new World") == 0 && "Replace should succeed");
        assert(RewindTest::readFile(main_cpp).find("World") != std::string::npos && "Text should be replaced");
        
        assert(run("-s work line-edit " + main_cpp + " --start 5 --end 5 --content return_value;") == 0 &&
               "Line edit should succeed");
        assert(RewindTest::readFile(main_cpp).find("return_value;\n}") != std::string::npos && "Line should be replaced");
        
        std::string notes_source = scratch.file("notes_source.txt");
        RewindTest::writeFile(notes_source, "first note\nsecond note\n");
        assert(run("-s work write " + project("NOTES.txt") + " --from " + notes_source) == 0 && "Write should succeed");
        assert(RewindTest::readFile(project("NOTES.txt")) == "first note\nsecond note\n" && "File should be created");
        
        auto recorded = index("work");
        assert(recorded["patches"].size() == 3 && recorded["next_patch_number"] == 4 && "Three edits should be captured");
        assert(recorded["patches"][1]["operation_type"] == "line-edit" && "Operation types should be recorded");
        
        assert(run("-s work history") == 0 && "History should succeed");
        assert(run("-s work files -n 2") == 0 && "Files should succeed");
        assert(run("-s work stats") == 0 && "Stats should succeed");
        
        assert(run("-s work undo 3 --preview") == 0 && "Preview should succeed");
        assert(RewindTest::exists(project("NOTES.txt")) && "Preview should not change files");
        assert(index("work")["patches"].size() == 3 && "Preview should not change the index");
        
        assert(run("-s work undo") == 0 && "Undo should succeed");
        assert(!RewindTest::exists(project("NOTES.txt")) && "Created file should be removed");
        
        assert(run("-s work undo 2") == 0 && "Undo of two edits should succeed");
        assert(RewindTest::readFile(main_cpp) == original && "Source should be restored exactly");
        assert(index("work")["patches"].empty() && "Index should be empty");
        
        assert(run("-s work undo") == 0 && "Nothing to undo is not an error");
        
        std::cout << "✓ Edit and undo workflow test passed" << std::endl;
    }
    
    void testDeleteAndSelectiveUndo() {
        std::cout << "Testing delete and selective undo..." << std::endl;
        
        std::string a = project("a.txt");
        std::string b = project("b.txt");
        RewindTest::writeFile(a, "alpha\n");
        RewindTest::writeFile(b, "beta\n");
        
        assert(run("-s select delete " + a) == 0 && "Delete should succeed");
        assert(run("-s select delete " + b) == 0 && "Delete should succeed");
        assert(!RewindTest::exists(a) && !RewindTest::exists(b) && "Files should be deleted");
        
        assert(run("-s select undo --patch 1") == 0 && "Selective undo should succeed");
        assert(RewindTest::readFile(a) == "alpha\n" && "First file should be restored");
        assert(!RewindTest::exists(b) && "Second file should stay deleted");
        
        assert(run("-s select undo --patch 1") == 1 && "Undoing a removed patch should fail");
        assert(run("-s select undo --since 2000-01-01T00:00:00Z") == 0 && "Undo since should succeed");
        assert(RewindTest::readFile(b) == "beta\n" && "Second file should be restored");
        
        std::cout << "✓ Delete and selective undo test passed" << std::endl;
    }
    
    void testStaleUndoFails() {
        std::cout << "Testing undo after an external change..." << std::endl;
        
        std::string file = project("stale.txt");
        RewindTest::writeFile(file, "one\ntwo\nthree\n");
        assert(run("-s stale replace " + file + " --old two --new TWO") == 0 && "Replace should succeed");
        RewindTest::writeFile(file, "rewritten elsewhere\n");
        
        assert(run("-s stale undo") == 1 && "Stale undo should fail");
        assert(RewindTest::readFile(file) == "rewritten elsewhere\n" && "File should be untouched");
        assert(index("stale")["patches"].size() == 1 && "Patch should stay in the index");
        
        assert(run("-s stale clear") == 0 && "Clear should succeed");
        assert(index("stale")["patches"].empty() && index("stale")["next_patch_number"] == 1 &&
               "Clear should reset the history");
        
        std::cout << "✓ Stale undo test passed" << std::endl;
    }
    
    void testMaintenanceCommands() {
        std::cout << "Testing maintenance commands..." << std::endl;
        
        std::string file = project("maintained.txt");
        assert(run("-s maint write " + file + " --content v1") == 0 && "Write should succeed");
        std::string patches = sessions_root + "/maint/patches";
        RewindTest::writeFile(patches + "/patch_500.diff", "stray\n");
        
        assert(run("-s maint validate") == 0 && "Validate should succeed");
        assert(!RewindTest::exists(patches + "/patch_500.diff") && "Stray patch should be quarantined");
        assert(RewindTest::exists(sessions_root + "/.quarantine") && "Quarantine should be created");
        
        assert(run("cleanup-session maint") == 0 && "Cleanup should succeed");
        assert(!RewindTest::exists(patches) && "Session patches should be removed");
        
        std::cout << "✓ Maintenance commands test passed" << std::endl;
    }
    
    void testWithoutSession() {
        std::cout << "Testing commands without a session..." << std::endl;
        
        std::string file = project("untracked.txt");
        assert(run("write " + file + " --content data") == 0 && "Edits work without a session");
        assert(RewindTest::readFile(file) == "data" && "File should be written");
        assert(run("undo") == 1 && "Undo needs a session");
        assert(run("history") == 1 && "History needs a session");
        
        std::cout << "✓ Without session test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running integration tests..." << std::endl;
        
        testEditAndUndoWorkflow();
        testDeleteAndSelectiveUndo();
        testStaleUndoFails();
        testMaintenanceCommands();
        testWithoutSession();
        
        std::cout << "All integration tests passed!" << std::endl;
    }
};

int main() {
    try {
        RewindTest::TempDirectory scratch("rewind_integration");
        RewindTest::quietLogging(scratch);
        
        IntegrationTest tests(scratch);
        tests.runAllTests();
        
        std::cout << "\n🎉 All integration tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
