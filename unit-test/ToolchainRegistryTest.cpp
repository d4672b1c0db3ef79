#include <fstream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/toolchain.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

TEST(ToolchainRegistryTest, ResolvesInterpretedLanguage) {
    toolchain_registry registry = fixtures::make_test_registry();
    const toolchain_spec *spec = registry.resolve("sh");
    ASSERT_NE(spec, nullptr);
    EXPECT_FALSE(spec->needs_compile());
    EXPECT_EQ(spec->run_args("/w"), vector<string>({"sh", "/w/main.sh"}));
    EXPECT_THROW(spec->compile_args("/w"), logic_error);
}

TEST(ToolchainRegistryTest, ExpandsPlaceholdersOfCompiledLanguage) {
    toolchain_registry registry = fixtures::make_test_registry();
    const toolchain_spec *spec = registry.resolve("shc");
    ASSERT_NE(spec, nullptr);
    EXPECT_TRUE(spec->needs_compile());
    vector<string> args = spec->compile_args("/w");
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[3], "/w/main.sh");
    EXPECT_EQ(args[4], "/w/prog.sh");
    EXPECT_EQ(spec->run_args("/w"), vector<string>({"sh", "/w/prog.sh"}));
}

TEST(ToolchainRegistryTest, UnknownLanguageIsNotFound) {
    toolchain_registry registry = fixtures::make_test_registry();
    EXPECT_EQ(registry.resolve("brainfuck"), nullptr);
    EXPECT_EQ(registry.languages().size(), 4u);
}

TEST(ToolchainRegistryTest, RejectsMalformedTables) {
    auto parse = [](const string &text) { return nlohmann::json::parse(text).get<toolchain_registry>(); };
    // 重复的语言
    EXPECT_THROW(parse(R"({"languages": [
        {"id": "sh", "kind": "interpreted", "source": "a.sh", "run": ["sh", "{source}"]},
        {"id": "sh", "kind": "interpreted", "source": "b.sh", "run": ["sh", "{source}"]}]})"),
                 config_error);
    // 编译型语言没有编译命令
    EXPECT_THROW(parse(R"({"languages": [
        {"id": "c", "kind": "compiled", "source": "main.c", "run": ["{artifact}"]}]})"),
                 config_error);
    // 解释型语言有编译命令
    EXPECT_THROW(parse(R"({"languages": [
        {"id": "py", "kind": "interpreted", "source": "main.py", "compile": ["true"], "run": ["python3"]}]})"),
                 config_error);
    EXPECT_THROW(parse(R"({"languages": [
        {"id": "py", "kind": "interpreted", "source": "main.py", "run": []}]})"),
                 config_error);
}

TEST(ToolchainRegistryTest, EnvironmentIsExpanded) {
    toolchain_registry registry = nlohmann::json::parse(R"({"languages": [
        {"id": "go", "kind": "compiled", "source": "main.go", "artifact": "main",
         "compile": ["go", "build", "-o", "{artifact}", "{source}"], "run": ["{artifact}"],
         "env": {"GOCACHE": "{workdir}/.cache"},
         "run_adjust": {"time_multiplier": 2}}]})")
                                          .get<toolchain_registry>();
    const toolchain_spec *spec = registry.resolve("go");
    ASSERT_NE(spec, nullptr);
    EXPECT_EQ(spec->environment("/w").at("GOCACHE"), "/w/.cache");
    EXPECT_DOUBLE_EQ(spec->run_adjust.time_multiplier, 2);
    EXPECT_DOUBLE_EQ(spec->compile_adjust.time_multiplier, 1);
}

TEST(ToolchainRegistryTest, LoadFromFile) {
    fs::path path = RUN_DIR / (random_uuid() + ".json");
    {
        ofstream fout(path);
        fout << R"({"languages": [{"id": "sh", "kind": "interpreted", "source": "main.sh", "run": ["sh", "{source}"]}]})";
    }
    toolchain_registry registry = toolchain_registry::load(path);
    EXPECT_NE(registry.resolve("sh"), nullptr);

    EXPECT_THROW(toolchain_registry::load(RUN_DIR / "missing.json"), config_error);
}

TEST(ToolchainRegistryTest, ShippedTableIsValid) {
    toolchain_registry registry = toolchain_registry::load(fs::path(GRADER_SOURCE_DIR) / "config" / "toolchains.json");
    EXPECT_EQ(registry.languages().size(), 15u);
    for (auto &lang : {"c", "cpp", "java", "csharp", "python", "python3", "pypy3", "pascalabc", "rust", "go",
                       "javascript", "lua", "cobol", "haskell", "fortran"})
        EXPECT_NE(registry.resolve(lang), nullptr) << lang;
    EXPECT_TRUE(registry.resolve("cpp")->needs_compile());
    EXPECT_FALSE(registry.resolve("python3")->needs_compile());
    EXPECT_EQ(registry.resolve("python")->run_command, registry.resolve("python3")->run_command);
}
