#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace GF;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        // Touch every enum value using a runtime loop so the compiler cannot
        // constant-fold the switch.
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::CapacityExceeded);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto runtimeCode = code;
            auto label       = errorCodeToString(runtimeCode);
            CHECK_FALSE(label.empty());
            Error e{runtimeCode, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::NotFound, "testdata/a.golden"};
        CHECK(describeError(withMsg) == "not_found:testdata/a.golden");

        Error withoutMsg{Error::Code::Mismatch, {}};
        CHECK(describeError(withoutMsg) == "mismatch");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Infrastructure and mismatch codes have distinct labels") {
        CHECK(errorCodeToString(Error::Code::IoFailure) == "io_failure");
        CHECK(errorCodeToString(Error::Code::NotFound) == "not_found");
        CHECK(errorCodeToString(Error::Code::Mismatch) == "mismatch");
        CHECK(errorCodeToString(Error::Code::InvalidConfiguration) == "invalid_configuration");
    }
}
