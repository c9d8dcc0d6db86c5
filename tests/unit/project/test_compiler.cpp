// tests/unit/project/test_compiler.cpp - Compiler driver
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "cfgc/driver/compiler.hpp"

namespace fs = std::filesystem;
using namespace cfgc;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

bool has_message(const DiagnosticBag & diags, const std::string & needle)
{
  for (const auto & d : diags) {
    if (d.message.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

constexpr const char * k_valid_source =
  "int g;\n"
  "int main() {\n"
  "  int i;\n"
  "  i = 0;\n"
  "  while (i < g) i = i + 1;\n"
  "  return i;\n"
  "}\n";

class CompilerTest : public ::testing::Test
{
protected:
  void SetUp() override { dir_ = make_temp_dir("cfgc_compiler"); }
  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

}  // namespace

TEST_F(CompilerTest, BuildSingleFileReturnsRenderedText)
{
  const fs::path src = dir_ / "loop.c";
  write_all(src, k_valid_source);

  const CompileResult r = Compiler::compile_single_file(src, CompileOptions{});
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(r.diagnostics.empty());
  ASSERT_EQ(r.outputs.size(), 1U);
  EXPECT_EQ(r.outputs[0].format, EmitFormat::Text);
  EXPECT_TRUE(r.generated_files.empty());

  const std::string & text = r.outputs[0].content;
  EXPECT_EQ(text.rfind("/*--- program: " + src.string() + " ---*/\n", 0), 0U) << text;
  EXPECT_NE(text.find("@Globals {\n    int g ; \n}\n"), std::string::npos);
  EXPECT_NE(text.find("    while( i < g )     # loop_end: main_B3\n"), std::string::npos) << text;
}

TEST_F(CompilerTest, CheckModeProducesNoOutput)
{
  const fs::path src = dir_ / "ok.c";
  write_all(src, k_valid_source);

  CompileOptions options;
  options.mode = CompileMode::Check;
  const CompileResult r = Compiler::compile_single_file(src, options);
  EXPECT_TRUE(r.success);
  EXPECT_TRUE(r.outputs.empty());
}

TEST_F(CompilerTest, ParseErrorsFailTheBuild)
{
  const fs::path src = dir_ / "bad.c";
  write_all(src, "int main() { x = ; }\n");

  const CompileResult r = Compiler::compile_single_file(src, CompileOptions{});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.outputs.empty());
  EXPECT_TRUE(has_message(r.diagnostics, "expected expression"));

  // The registry keeps the file so diagnostics can show the source line.
  EXPECT_TRUE(r.sources.find_by_path(src).has_value());
}

TEST_F(CompilerTest, MissingInputFile)
{
  const CompileResult r = Compiler::compile_single_file(dir_ / "missing.c", CompileOptions{});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(has_message(r.diagnostics, "file not found"));
}

TEST_F(CompilerTest, WritesJsonIntoOutputDirectory)
{
  const fs::path src = dir_ / "prog.c";
  write_all(src, k_valid_source);

  CompileOptions options;
  options.emit = EmitFormat::Json;
  options.output_dir = dir_ / "out";
  const CompileResult r = Compiler::compile_single_file(src, options);
  ASSERT_TRUE(r.success);
  ASSERT_EQ(r.generated_files.size(), 1U);
  EXPECT_EQ(r.generated_files[0], dir_ / "out" / "prog.cfg.json");

  const auto j = nlohmann::json::parse(read_all(r.generated_files[0]));
  EXPECT_EQ(j["program"], src.string());
  EXPECT_EQ(j["functions"][0]["name"], "main");
  EXPECT_EQ(read_all(r.generated_files[0]), r.outputs[0].content);
}

TEST_F(CompilerTest, OutputFileNames)
{
  EXPECT_EQ(Compiler::output_file_name("dir/a.c", EmitFormat::Text), fs::path("a.cfg.txt"));
  EXPECT_EQ(Compiler::output_file_name("b.c", EmitFormat::Json), fs::path("b.cfg.json"));
}

TEST_F(CompilerTest, ProjectBuildUsesConfigDefaults)
{
  write_all(dir_ / "src" / "main.c", k_valid_source);
  write_all(dir_ / "src" / "other.c", "void f() { x = 1; }\n");

  ProjectConfig config;
  config.package.name = "demo";
  config.project_root = dir_;
  config.compiler.entry_points = {"src/main.c", "src/other.c"};
  config.compiler.output_dir = "gen";

  const CompileResult r = Compiler::compile_project(config, CompileOptions{});
  ASSERT_TRUE(r.success);
  ASSERT_EQ(r.generated_files.size(), 2U);
  EXPECT_TRUE(fs::exists(dir_ / "gen" / "main.cfg.txt"));
  EXPECT_TRUE(fs::exists(dir_ / "gen" / "other.cfg.txt"));

  // Project builds name inputs by their configured relative path.
  const std::string text = read_all(dir_ / "gen" / "other.cfg.txt");
  EXPECT_EQ(text.rfind("/*--- program: src/other.c ---*/\n", 0), 0U) << text;
}

TEST_F(CompilerTest, ProjectBuildContinuesAfterAFailingEntry)
{
  write_all(dir_ / "a.c", "int main() { x = ; }\n");
  write_all(dir_ / "b.c", "int main() { return 0; }\n");

  ProjectConfig config;
  config.project_root = dir_;
  config.compiler.entry_points = {"a.c", "b.c"};

  CompileOptions options;
  options.output_dir = dir_ / "o";
  options.emit = EmitFormat::Json;
  const CompileResult r = Compiler::compile_project(config, options);
  EXPECT_FALSE(r.success);
  ASSERT_EQ(r.outputs.size(), 1U);
  EXPECT_EQ(r.outputs[0].input, dir_ / "b.c");
  EXPECT_TRUE(fs::exists(dir_ / "o" / "b.cfg.json"));
}

TEST_F(CompilerTest, ProjectWithoutEntryPoints)
{
  ProjectConfig config;
  config.project_root = dir_;
  const CompileResult r = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(has_message(r.diagnostics, "no entry points defined"));
}
