#include "network/services/svg_dir/svg_dir_cli.hpp"
#include "svgserve/basic/arg_parser.hpp"

#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace network::svg_dir;
using SvgServe::arg_parser;

namespace
{
// getopt permutes argv, keep writable copies alive for the parser's lifetime
struct command_line {
    explicit command_line(std::vector<std::string> args) : storage(std::move(args)) {
        storage.insert(storage.begin(), "svg_dir_server");
        for (auto& arg : storage)
            argv.push_back(arg.data());
        argv.push_back(nullptr);
    }
    int argc() const {
        return static_cast<int>(storage.size());
    }
    std::vector<std::string> storage;
    std::vector<char*> argv;
};

struct parsed_command_line {
    explicit parsed_command_line(std::vector<std::string> args) :
    line(std::move(args)), parser(line.argc(), line.argv.data(), kSvgDirServerVersion) {
        add_svg_dir_options(parser);
    }
    parsed_command_line(std::initializer_list<std::string> args) :
    parsed_command_line(std::vector<std::string>(args)) {
    }
    command_line line;
    arg_parser parser;
};
} // namespace

TEST(ArgParserTest, Defaults) {
    parsed_command_line cmd {};
    ASSERT_TRUE(cmd.parser.ParseCommandLine());
    auto options = read_svg_dir_options(cmd.parser);
    EXPECT_EQ(options.bind_address, "127.0.0.1");
    EXPECT_EQ(options.port, "5000");
    EXPECT_EQ(options.index_route, "/home");
    EXPECT_EQ(options.root_dir, ".");
    EXPECT_TRUE(options.threads.empty());
    EXPECT_EQ(options.timeout_msec, "30000");
    EXPECT_FALSE(cmd.parser.HasParam(kVerboseOptionName));
    EXPECT_FALSE(cmd.parser.HasParam());
}

TEST(ArgParserTest, ShortOptions) {
    parsed_command_line cmd { "-b", "0.0.0.0", "-p", "8080", "-i", "gallery", "-t", "3", "-V", "/srv/svg" };
    ASSERT_TRUE(cmd.parser.ParseCommandLine());
    auto options = read_svg_dir_options(cmd.parser);
    EXPECT_EQ(options.bind_address, "0.0.0.0");
    EXPECT_EQ(options.port, "8080");
    EXPECT_EQ(options.index_route, "gallery");
    EXPECT_EQ(options.threads, "3");
    EXPECT_EQ(options.root_dir, "/srv/svg");
    EXPECT_TRUE(cmd.parser.HasParam(kVerboseOptionName));
}

TEST(ArgParserTest, LongOptions) {
    parsed_command_line cmd { "/srv/svg", "--bind", "::1", "--port=9000", "--index", "/start", "--timeout", "0",
                              "--log-dir", "/tmp/logs", "--verbose" };
    ASSERT_TRUE(cmd.parser.ParseCommandLine());
    auto options = read_svg_dir_options(cmd.parser);
    EXPECT_EQ(options.bind_address, "::1");
    EXPECT_EQ(options.port, "9000");
    EXPECT_EQ(options.index_route, "/start");
    EXPECT_EQ(options.timeout_msec, "0");
    EXPECT_EQ(options.root_dir, "/srv/svg");
    EXPECT_EQ(cmd.parser.GetOptionValue(kLogDirOptionName), std::optional<std::string>("/tmp/logs"));
    EXPECT_TRUE(cmd.parser.HasParam(kVerboseOptionName));
}

TEST(ArgParserTest, LastOccurrenceWins) {
    parsed_command_line cmd { "-p", "1", "--port", "2", "-p3" };
    ASSERT_TRUE(cmd.parser.ParseCommandLine());
    EXPECT_EQ(read_svg_dir_options(cmd.parser).port, "3");
    auto all = cmd.parser.GetOptionValues(kPortOptionName);
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 3u);
}

TEST(ArgParserTest, HelpAndVersion) {
    {
        parsed_command_line cmd { "-h" };
        ASSERT_TRUE(cmd.parser.ParseCommandLine());
        EXPECT_TRUE(cmd.parser.HasParam());
        std::ostringstream os;
        cmd.parser.ShowHelp(os);
        for (auto name : { "--bind", "--port", "--index", "--threads", "--timeout", "--log-dir", "--verbose",
                           "--help", "--version" }) {
            EXPECT_NE(os.str().find(name), std::string::npos) << name;
        }
        EXPECT_NE(os.str().find(kSvgDirUsageGuide), std::string::npos);
    }
    {
        parsed_command_line cmd { "--version" };
        ASSERT_TRUE(cmd.parser.ParseCommandLine());
        EXPECT_TRUE(cmd.parser.HasParam(arg_parser::kVersionOptionName));
        std::ostringstream os;
        cmd.parser.ShowVersion(os);
        EXPECT_NE(os.str().find(kSvgDirServerVersion), std::string::npos);
    }
}

TEST(ArgParserTest, InvalidCommandLine) {
    for (auto args : { std::vector<std::string> { "--unknown" }, std::vector<std::string> { "-x" },
                       std::vector<std::string> { "-p" }, std::vector<std::string> { "--port" } }) {
        parsed_command_line cmd(args);
        EXPECT_FALSE(cmd.parser.ParseCommandLine()) << args.front();
    }
}

TEST(ArgParserTest, TooManyDirectories) {
    parsed_command_line cmd { "/srv/a", "/srv/b" };
    ASSERT_TRUE(cmd.parser.ParseCommandLine());
    EXPECT_THROW(read_svg_dir_options(cmd.parser), std::invalid_argument);
}

TEST(ArgParserTest, OptionTable) {
    parsed_command_line cmd {};
    // names and short options are unique
    EXPECT_FALSE(cmd.parser.AddOption(kPortOptionName, "duplicate"));
    EXPECT_FALSE(cmd.parser.AddOption("other", "duplicate short option", 'p'));
    EXPECT_FALSE(cmd.parser.AddOption("other", "reserved short option", '?'));
    EXPECT_FALSE(cmd.parser.AddOption("other", "reserved short option", 'h'));
    EXPECT_TRUE(cmd.parser.AddOption("other", "long only option"));
}

TEST(ArgParserTest, GetValueFallsBackToDefault) {
    parsed_command_line cmd { "-t", "12" };
    ASSERT_TRUE(cmd.parser.ParseCommandLine());
    EXPECT_EQ(cmd.parser.GetValue<std::string>(kThreadsOptionName, "1"), "12");
    EXPECT_EQ(cmd.parser.GetValue<std::string>(kPortOptionName, "7"), "7");
    EXPECT_EQ(cmd.parser.GetValue<std::string>("not-registered", "x"), "x");
    EXPECT_FALSE(cmd.parser.GetOptionValue(kTimeoutOptionName).has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
