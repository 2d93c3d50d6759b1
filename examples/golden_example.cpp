#include <goldenfile/GoldenFile.hpp>

#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

using namespace GF;
using nlohmann::json;

struct CommandLineOptions {
    std::filesystem::path dir   = std::filesystem::temp_directory_path() / "goldenfile_example";
    bool                  color = false;
    bool                  keep  = false;
};

static auto parse_options(int argc, char** argv) -> CommandLineOptions {
    CommandLineOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--color") {
            opts.color = true;
        } else if (arg == "--keep") {
            opts.keep = true;
        } else if (arg == "--dir" && i + 1 < argc) {
            opts.dir = argv[++i];
        } else {
            std::cerr << "usage: goldenfile_example [--dir <path>] [--color] [--keep]\n";
        }
    }
    return opts;
}

static auto report(std::string_view step, Expected<void> const& result) -> bool {
    if (result) {
        std::cout << "[ok]   " << step << '\n';
        return true;
    }
    std::cout << "[fail] " << step << " (" << errorCodeToString(result.error().code) << ")\n"
              << result.error().message.value_or("") << '\n';
    return false;
}

auto main(int argc, char** argv) -> int {
    auto const opts = parse_options(argc, argv);

    GoldenOptions recordOptions;
    recordOptions.update = true;
    recordOptions.dir    = opts.dir;
    Format::CallerIdentity const caller{"golden_example.cpp", "Walkthrough"};

    // Record the golden files once.
    Golden recorder{recordOptions, caller};
    auto const user = json{{"id", 123}, {"name", "John Doe"}, {"active", true}, {"ts", "2023-01-01T00:00:00Z"}};
    bool ok = report("record user", recorder.assertValue("user", user));
    ok &= report("record fruits", recorder.assertValue("fruits", std::vector<std::string>{"apple", "banana", "cherry"}));
    ok &= report("record banner", recorder.assertValue("banner", std::string{"Hello, Golden Test!\nsecond line\n"}));

    GoldenOptions verifyOptions = recordOptions;
    verifyOptions.update        = false;
    verifyOptions.colorOutput   = opts.color;

    // Equal after reordering and reformatting.
    Golden verifier{verifyOptions, caller};
    ok &= report("verify reordered fruits",
                 verifier.assertValue("fruits", std::vector<std::string>{"cherry", "apple", "banana"}));

    // Volatile timestamp excluded from the comparison.
    GoldenOptions ignoreOptions = verifyOptions;
    ignoreOptions.ignoreFields  = {"ts"};
    auto changedUser            = user;
    changedUser["ts"]           = "2024-06-30T12:00:00Z";
    ok &= report("verify user ignoring ts", Golden{ignoreOptions, caller}.assertValue("user", changedUser));

    // A real difference, shown with its diff.
    auto const mismatch = verifier.assertValue("banner", std::string{"Hello, Golden Test!\nchanged line\n"});
    bool const mismatchReported = !mismatch && mismatch.error().code == Error::Code::Mismatch;
    report("verify changed banner (expected to fail)", mismatch);

    std::map<std::string, int> const counts{{"apples", 3}, {"pears", 0}};
    ok &= report("record counts", recorder.assertValue("counts", counts));
    std::cout << "golden files in " << resolveBaseDir(opts.dir).string() << '\n';

    if (!opts.keep) {
        std::error_code ec;
        std::filesystem::remove_all(resolveBaseDir(opts.dir), ec);
    }
    return ok && mismatchReported ? 0 : 1;
}
