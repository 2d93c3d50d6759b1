#include "Golden.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace GF;
using nlohmann::json;

namespace {

struct TempDir {
    explicit TempDir(std::string_view name) {
        static std::atomic<int> counter{0};
        auto const stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path()
               / (std::string(name) + "_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_"
                  + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::filesystem::path path;
};

class UpdateEnvGuard {
public:
    explicit UpdateEnvGuard(char const* value) {
        if (char const* existing = std::getenv("GOLDEN_UPDATE"))
            this->original = std::string(existing);
        if (value)
            ::setenv("GOLDEN_UPDATE", value, 1);
        else
            ::unsetenv("GOLDEN_UPDATE");
    }
    UpdateEnvGuard(UpdateEnvGuard const&)            = delete;
    UpdateEnvGuard& operator=(UpdateEnvGuard const&) = delete;
    ~UpdateEnvGuard() {
        if (this->original)
            ::setenv("GOLDEN_UPDATE", this->original->c_str(), 1);
        else
            ::unsetenv("GOLDEN_UPDATE");
    }

private:
    std::optional<std::string> original;
};

auto const kCaller = Format::CallerIdentity{"golden_test.cpp", "TestSnapshot"};

auto optionsIn(std::filesystem::path const& dir, bool update) -> GoldenOptions {
    GoldenOptions options;
    options.update = update;
    options.dir    = dir;
    options.fsync  = false;
    return options;
}

auto readAll(std::filesystem::path const& path) -> std::string {
    std::ifstream      stream(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

auto golden_from_helper() -> Golden {
    return Golden{};
}

auto messageOf(Expected<void> const& result) -> std::string {
    return result ? std::string{} : result.error().message.value_or("");
}

} // namespace

TEST_SUITE("golden") {
    TEST_CASE("update writes the formatted value") {
        TempDir tmp("gf_golden_update");
        Golden  golden{optionsIn(tmp.path, true), kCaller};

        REQUIRE(golden.assertValue("output", json{{"name", "test"}, {"value", 42}}).has_value());

        auto const path = tmp.path / "golden_test_TestSnapshot_output.golden";
        CHECK(golden.pathFor("output") == path);
        CHECK(readAll(path) == "{\n  \"name\": \"test\",\n  \"value\": 42\n}");
    }

    TEST_CASE("verify passes on identical content") {
        TempDir tmp("gf_golden_identical");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertValue("text", std::string{"hello\nworld\n"}));

        Golden golden{optionsIn(tmp.path, false), kCaller};
        CHECK(golden.assertValue("text", std::string{"hello\nworld\n"}).has_value());
        CHECK(golden.assertBytes("text", "hello\nworld\n").has_value());
    }

    TEST_CASE("reformatted json is equal") {
        TempDir tmp("gf_golden_reformatted");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("doc", R"({"b":[1,2],"a":1})"));

        Golden golden{optionsIn(tmp.path, false), kCaller};
        CHECK(golden.assertBytes("doc", "{\n    \"a\": 1,\n    \"b\": [1, 2]\n}\n").has_value());
    }

    TEST_CASE("array order is ignored by default") {
        TempDir tmp("gf_golden_order");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller)
                    .assertValue("tags", json{{"tags", {"go", "testing", "golden"}}}));

        Golden golden{optionsIn(tmp.path, false), kCaller};
        CHECK(golden.assertValue("tags", json{{"tags", {"testing", "golden", "go"}}}).has_value());

        auto strict        = optionsIn(tmp.path, false);
        strict.ignoreOrder = false;
        auto result        = Golden(strict, kCaller).assertValue("tags", json{{"tags", {"testing", "golden", "go"}}});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::Mismatch);
    }

    TEST_CASE("changed field fails with a replace line") {
        TempDir tmp("gf_golden_mismatch");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertValue("record", json{{"a", 1}, {"ts", "X"}}));

        Golden golden{optionsIn(tmp.path, false), kCaller};
        auto   result = golden.assertValue("record", json{{"a", 1}, {"ts", "Y"}});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::Mismatch);

        auto const path    = golden.pathFor("record");
        auto const rule    = std::string(80, '-');
        auto const message = messageOf(result);
        CHECK(message
              == "Golden test failed\n"
                 "File: " + path.string() + "\n"
                 "Comparison: JSON semantic comparison\n"
                 "\n"
                 "Differences found:\n"
                 + rule + "\n"
                 "    1  {\n"
                 "    2    \"a\": 1,\n"
                 "-   3    \"ts\": \"X\"\n"
                 "+   3    \"ts\": \"Y\"\n"
                 "    4  }\n"
                 "    5  \n"
                 + rule + "\n"
                 "Tip: Run with update mode to accept changes\n");
    }

    TEST_CASE("ignored fields hide volatile values") {
        TempDir tmp("gf_golden_ignore");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertValue("record", json{{"a", 1}, {"ts", "X"}}));

        auto options         = optionsIn(tmp.path, false);
        options.ignoreFields = {"ts"};
        Golden golden{options, kCaller};
        CHECK(golden.assertValue("record", json{{"a", 1}, {"ts", "Y"}}).has_value());
        CHECK_FALSE(golden.assertValue("record", json{{"a", 2}, {"ts", "X"}}).has_value());
    }

    TEST_CASE("removed line is reported") {
        TempDir tmp("gf_golden_removed");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("lines", "a\nb\nc\n"));

        auto options      = optionsIn(tmp.path, false);
        options.algorithm = Diff::DiffAlgorithm::Myers;
        auto result       = Golden(options, kCaller).assertBytes("lines", "a\nc\n");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::Mismatch);
        auto const message = messageOf(result);
        CHECK(message.find("Comparison: Text comparison with preprocessing\n") != std::string::npos);
        CHECK(message.find("    1  a\n-   2  b\n    3  c\n") != std::string::npos);
    }

    TEST_CASE("missing golden file") {
        TempDir tmp("gf_golden_missing");
        Golden  golden{optionsIn(tmp.path, false), kCaller};
        auto    result = golden.assertBytes("absent", "anything");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::NotFound);
        CHECK(messageOf(result)
              == "Golden file " + golden.pathFor("absent").string()
                     + " does not exist. Run with update mode to create it.");
        CHECK_FALSE(std::filesystem::exists(golden.pathFor("absent")));
    }

    TEST_CASE("oversized golden file is refused") {
        TempDir tmp("gf_golden_oversized");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("big", std::string(64, 'x')));

        auto options        = optionsIn(tmp.path, false);
        options.maxFileSize = 16;
        auto result         = Golden(options, kCaller).assertBytes("big", std::string(64, 'x'));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CapacityExceeded);
        CHECK(messageOf(result).starts_with("Failed to read golden file "));
    }

    TEST_CASE("update failure names the golden file") {
        TempDir tmp("gf_golden_write_failure");
        {
            std::ofstream blocker(tmp.path / "blocker");
            blocker << "file in the way";
        }
        Golden golden{optionsIn(tmp.path / "blocker", true), kCaller};
        auto   result = golden.assertBytes("out", "data");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::IoFailure);
        CHECK(messageOf(result).starts_with("Failed to write golden file "));
    }

    TEST_CASE("whitespace option for text") {
        TempDir tmp("gf_golden_whitespace");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("text", "hello   world\n"));

        auto options             = optionsIn(tmp.path, false);
        options.ignoreWhitespace = true;
        CHECK(Golden(options, kCaller).assertBytes("text", " hello\tworld").has_value());
        CHECK_FALSE(Golden(optionsIn(tmp.path, false), kCaller).assertBytes("text", " hello\tworld").has_value());
    }

    TEST_CASE("custom comparison decides equality") {
        TempDir tmp("gf_golden_custom");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("len", "abc"));

        auto options          = optionsIn(tmp.path, false);
        options.customCompare = [](std::string_view expected, std::string_view actual) {
            return expected.size() == actual.size();
        };
        Golden golden{options, kCaller};
        CHECK(golden.assertBytes("len", "xyz").has_value());

        auto result = golden.assertBytes("len", "wxyz");
        REQUIRE_FALSE(result.has_value());
        CHECK(messageOf(result).find("Comparison: Custom comparison function\n") != std::string::npos);
    }

    TEST_CASE("conflicting options are rejected before touching disk") {
        TempDir tmp("gf_golden_conflict");
        auto    options       = optionsIn(tmp.path, true);
        options.customCompare = [](std::string_view, std::string_view) { return true; };
        options.ignoreFields  = {"ts"};
        Golden golden{options, kCaller};

        auto result = golden.assertBytes("conflict", "data");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::InvalidConfiguration);
        CHECK_FALSE(std::filesystem::exists(golden.pathFor("conflict")));
    }

    TEST_CASE("update mode follows the environment") {
        TempDir tmp("gf_golden_env");
        {
            UpdateEnvGuard guard{"true"};
            GoldenOptions  options;
            options.dir   = tmp.path;
            options.fsync = false;
            REQUIRE(Golden(options, kCaller).assertBytes("env", "from env"));
        }
        CHECK(readAll(tmp.path / "golden_test_TestSnapshot_env.golden") == "from env");

        UpdateEnvGuard guard{"false"};
        GoldenOptions  options;
        options.dir = tmp.path;
        CHECK_FALSE(options.update);
        CHECK_FALSE(Golden(options, kCaller).assertBytes("env", "changed").has_value());
    }

    TEST_CASE("color output decorates the failure message") {
        TempDir tmp("gf_golden_color");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("c", "a\n"));

        auto options        = optionsIn(tmp.path, false);
        options.colorOutput = true;
        auto const message  = messageOf(Golden(options, kCaller).assertBytes("c", "b\n"));
        CHECK(message.find("\033[1;31mGolden test failed\033[0m") != std::string::npos);
        CHECK(message.find("\033[31m-   1  a\033[0m\n") != std::string::npos);
        CHECK(message.find("\033[32m+   1  b\033[0m\n") != std::string::npos);
        CHECK(message.find("\xE2\x94\x80") != std::string::npos);
    }

    TEST_CASE("context lines fold long unchanged stretches") {
        TempDir     tmp("gf_golden_context");
        std::string expected;
        std::string actual;
        for (int i = 0; i < 20; ++i) {
            expected += "row " + std::to_string(i) + "\n";
            actual += (i == 10 ? std::string{"changed"} : "row " + std::to_string(i)) + "\n";
        }
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("rows", expected));

        auto options         = optionsIn(tmp.path, false);
        options.contextLines = 2;
        auto const message   = messageOf(Golden(options, kCaller).assertBytes("rows", actual));
        CHECK(message.find("@@ ... 8 unchanged lines ... @@\n") != std::string::npos);
        CHECK(message.find("-  11  row 10\n+  11  changed\n") != std::string::npos);
        CHECK(message.find("row 3\n") == std::string::npos);
    }

    TEST_CASE("default identity comes from the constructing function") {
        auto const golden = golden_from_helper();
        CHECK(golden.caller().originFile == "test_Golden.cpp");
        CHECK(golden.caller().originTest == "golden-from-helper");
        CHECK(golden.pathFor("x") == std::filesystem::path("testdata/test_Golden_golden-from-helper_x.golden"));

        auto parsed = Store::parsePath(golden.pathFor("x"), Store::DefaultNaming{});
        REQUIRE(parsed.has_value());
        CHECK(*parsed == golden.identityFor("x"));
    }

    TEST_CASE("test case bodies get the fallback identity") {
        Golden golden;
        CHECK(golden.caller().originFile == Format::kUnknownOriginFile);
        CHECK(golden.caller().originTest == Format::kUnknownOriginTest);
        CHECK(golden.pathFor("x") == std::filesystem::path("testdata/unknown_test_UnknownTest_x.golden"));
    }

    TEST_CASE("explicit test names are stored without underscores") {
        Golden golden{optionsIn("testdata", false), Format::CallerIdentity{"my_test.cpp", "Test_With_Parts"}};
        CHECK(golden.caller().originTest == "Test-With-Parts");
        CHECK(golden.pathFor("out") == std::filesystem::path("testdata/my_test_Test-With-Parts_out.golden"));

        auto parsed = Store::parsePath(golden.pathFor("out"), Store::DefaultNaming{});
        REQUIRE(parsed.has_value());
        CHECK(*parsed == golden.identityFor("out"));
    }

    TEST_CASE("directory option is placed under testdata") {
        auto options = optionsIn("custom_golden", false);
        Golden golden{options, kCaller};
        CHECK(golden.pathFor("output") == std::filesystem::path("testdata/custom_golden/golden_test_TestSnapshot_output.golden"));
        CHECK(golden.identityFor("output").artifact == "output");
    }

    TEST_CASE("custom naming strategy") {
        struct FlatNaming final : Store::NamingStrategy {
            auto generateFilename(std::string_view, std::string_view, std::string_view artifact) const
                -> std::string override {
                return std::string(artifact) + ".snap";
            }
            auto parseFilename(std::string_view) const -> Expected<Store::GoldenIdentity> override {
                return std::unexpected(Error{Error::Code::InvalidPath, "not parseable"});
            }
        };
        TempDir tmp("gf_golden_naming");
        auto    options = optionsIn(tmp.path, true);
        options.naming  = std::make_shared<FlatNaming>();
        Golden golden{options, kCaller};
        REQUIRE(golden.assertBytes("frame", "pixels").has_value());
        CHECK(readAll(tmp.path / "frame.snap") == "pixels");
    }

    TEST_CASE("parallel assertions on shared and distinct files") {
        TempDir tmp("gf_golden_parallel");
        REQUIRE(Golden(optionsIn(tmp.path, true), kCaller).assertBytes("shared", "stable\n"));

        std::atomic<int>         failures{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 6; ++i) {
            threads.emplace_back([&, i] {
                Golden verifier{optionsIn(tmp.path, false), kCaller};
                Golden updater{optionsIn(tmp.path, true), kCaller};
                for (int round = 0; round < 10; ++round) {
                    if (!verifier.assertBytes("shared", "stable\n"))
                        ++failures;
                    if (!updater.assertBytes("own" + std::to_string(i), std::to_string(round)))
                        ++failures;
                }
            });
        }
        for (auto& thread : threads)
            thread.join();
        CHECK(failures.load() == 0);
        for (int i = 0; i < 6; ++i) {
            Golden verifier{optionsIn(tmp.path, false), kCaller};
            CHECK(verifier.assertBytes("own" + std::to_string(i), "9").has_value());
        }
    }
}
