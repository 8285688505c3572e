#include "densejson/cli/run.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace densejson::cli {
namespace {

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("densejson_cli_" + std::string{::testing::UnitTest::GetInstance()->current_test_info()->name()});
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) const {
        const auto path = dir_ / name;
        std::ofstream{path, std::ios::binary} << content;
        return path.string();
    }

    int invoke(std::vector<std::string> args) {
        args.insert(args.begin(), "densejson");
        out_.str({});
        err_.str({});
        return run(args, out_, err_);
    }

    [[nodiscard]] std::size_t error_lines() const {
        const std::string text = err_.str();
        return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    }

    std::filesystem::path dir_;
    std::ostringstream out_;
    std::ostringstream err_;
};

const std::string kPeople = R"({"data": [{"name": "Alice"}, {"name": "Bob"}]})";

TEST_F(CliTest, HelpGoesToStdout) {
    EXPECT_EQ(invoke({"--help"}), EXIT_SUCCESS);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliTest, MissingInputIsUsageError) {
    EXPECT_EQ(invoke({}), kUsageError);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, FlagWithoutValueIsUsageError) {
    const auto input = write_file("in.json", kPeople);
    EXPECT_EQ(invoke({input, "--fields"}), kUsageError);
    EXPECT_NE(err_.str().find("missing value for --fields"), std::string::npos);
}

TEST_F(CliTest, TooManyPositionalsIsUsageError) {
    const auto input = write_file("in.json", kPeople);
    EXPECT_EQ(invoke({input, "data", "extra"}), kUsageError);
}

TEST_F(CliTest, RendersWholeDocument) {
    const auto input = write_file("in.json", kPeople);
    EXPECT_EQ(invoke({input}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(),
              "{\n"
              "    \"data\": [\n"
              "        {\"name\": \"Alice\"},\n"
              "        {\"name\": \"Bob\"}\n"
              "    ]\n"
              "}\n");
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliTest, RendersResolvedValue) {
    const auto input = write_file("in.json", kPeople);
    EXPECT_EQ(invoke({input, "data/0"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "{\"name\": \"Alice\"}\n");

    EXPECT_EQ(invoke({input, "data/1/name/0"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "\"B\"\n");
}

TEST_F(CliTest, MissingFileFails) {
    EXPECT_EQ(invoke({(dir_ / "absent.json").string()}), EXIT_FAILURE);
    EXPECT_EQ(error_lines(), 1U);
    EXPECT_NE(err_.str().find("Unable to open"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, DirectoryInputFails) {
    EXPECT_EQ(invoke({dir_.string()}), EXIT_FAILURE);
    EXPECT_EQ(error_lines(), 1U);
    EXPECT_NE(err_.str().find("Failed to read"), std::string::npos);
}

TEST_F(CliTest, MalformedInputFails) {
    const auto input = write_file("bad.json", "[1] 2");
    EXPECT_EQ(invoke({input}), EXIT_FAILURE);
    EXPECT_EQ(err_.str(), input + ": Trailing characters after JSON document (offset 4)\n");
}

TEST_F(CliTest, InvalidPathFails) {
    const auto input = write_file("in.json", kPeople);
    EXPECT_EQ(invoke({input, "data/2/name"}), EXIT_FAILURE);
    EXPECT_EQ(err_.str(), "Invalid path '2/name' for remaining object [{\"name\": \"Alice\"}, {\"name\": \"Bob\"}]\n");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, PathIntoScalarRootFails) {
    const auto input = write_file("scalar.json", "17");
    EXPECT_EQ(invoke({input, "a"}), EXIT_FAILURE);
    EXPECT_EQ(err_.str(), "Accessor: expected list or dict, got 'integer'\n");
}

TEST_F(CliTest, ConfigSetsIndent) {
    const auto input = write_file("in.json", R"({"a": [1, 2]})");
    const auto config = write_file("options.json", R"({"indent": 2})");
    EXPECT_EQ(invoke({input, "--config", config}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "{\n  \"a\": [1, 2]\n}\n");
}

TEST_F(CliTest, OutOfRangeConfigFails) {
    const auto input = write_file("in.json", kPeople);
    const auto config = write_file("options.json", R"({"indent": 99})");
    EXPECT_EQ(invoke({input, "--config", config}), EXIT_FAILURE);
    EXPECT_EQ(error_lines(), 1U);
    EXPECT_NE(err_.str().find("'indent' must be between 0 and 16, got 99"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, MalformedConfigFails) {
    const auto input = write_file("in.json", kPeople);
    const auto config = write_file("options.json", "{indent: 2}");
    EXPECT_EQ(invoke({input, "--config", config}), EXIT_FAILURE);
    EXPECT_EQ(error_lines(), 1U);
}

TEST_F(CliTest, FieldsFilterSelectedList) {
    const auto input = write_file("rows.json", R"({"rows": [
        {"id": 1, "created_at": "x", "name": "a"},
        {"id": 2, "updated_at": "y"},
        {"id": 3}
    ]})");
    EXPECT_EQ(invoke({input, "rows", "--fields", "_at,name"}), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(),
              "[\n"
              "    {\"created_at\": \"x\", \"name\": \"a\"},\n"
              "    {\"updated_at\": \"y\"}\n"
              "]\n");
}

TEST_F(CliTest, FieldsOnMappingFails) {
    const auto input = write_file("in.json", kPeople);
    EXPECT_EQ(invoke({input, "--fields", "name"}), EXIT_FAILURE);
    EXPECT_EQ(err_.str(), "expected a sequence of mappings, got 'mapping'\n");
}

} // namespace
} // namespace densejson::cli
