#include "../PrismTestHelper.hpp"

#include "parse/Loader.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace Prism;
using Prism::Test::kCounterSource;
using Prism::Test::ScratchDirectory;

namespace {

auto sandboxCodeOf(LoadResult<LoadedDocument> const& result) -> SandboxError::Code {
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == LoadError::Code::Sandbox);
    REQUIRE(result.error().sandbox.has_value());
    return result.error().sandbox->code;
}

// Valid document padded with a trailing comment to exactly `bytes` bytes.
auto paddedSource(std::size_t bytes) -> std::string {
    std::string source{"@app \"Big\"\n@version 1\n-- "};
    source.append(bytes - source.size(), 'x');
    return source;
}

} // namespace

TEST_SUITE("parse.loader") {
    TEST_CASE("Loads a document inside the application root") {
        ScratchDirectory scratch;
        scratch.write(scratch.root() / "counter.prism", kCounterSource);
        scratch.write(scratch.root() / "nested" / "inner.prism", kCounterSource);

        SandboxPolicy policy{.appRoot = scratch.root()};
        auto          loaded = loadDocument("counter.prism", policy);
        REQUIRE_MESSAGE(loaded.has_value(), (loaded ? std::string{} : describeError(loaded.error())));
        CHECK(loaded->document.appName == "Counter");
        CHECK(loaded->sourceBytes == kCounterSource.size());
        CHECK(loaded->path.filename() == "counter.prism");

        auto nested = loadDocument("nested/inner.prism", policy);
        CHECK(nested.has_value());

        auto absolute = loadDocument((scratch.root() / "counter.prism").string(), policy);
        CHECK(absolute.has_value());
    }

    TEST_CASE("Path traversal is rejected whether or not the target exists") {
        ScratchDirectory scratch;
        scratch.write(scratch.outside() / "secrets.prism", kCounterSource);
        SandboxPolicy policy{.appRoot = scratch.root()};

        CHECK(sandboxCodeOf(loadDocument("../secrets.prism", policy)) == SandboxError::Code::PathRejected);
        CHECK(sandboxCodeOf(loadDocument("../missing.prism", policy)) == SandboxError::Code::PathRejected);
        CHECK(sandboxCodeOf(loadDocument("a/../../secrets.prism", policy)) == SandboxError::Code::PathRejected);
        CHECK(sandboxCodeOf(loadDocument((scratch.outside() / "secrets.prism").string(), policy))
              == SandboxError::Code::PathRejected);
        CHECK(sandboxCodeOf(loadDocument("notes.txt", policy)) == SandboxError::Code::PathRejected);
        CHECK(sandboxCodeOf(loadDocument("", policy)) == SandboxError::Code::PathRejected);
    }

    TEST_CASE("Symlinks may not escape the application root") {
        ScratchDirectory scratch;
        scratch.write(scratch.outside() / "secrets.prism", kCounterSource);
        std::error_code ec;
        std::filesystem::create_symlink(scratch.outside() / "secrets.prism", scratch.root() / "link.prism", ec);
        if (ec) {
            MESSAGE("symlinks unavailable: " << ec.message());
            return;
        }
        SandboxPolicy policy{.appRoot = scratch.root()};
        CHECK(sandboxCodeOf(loadDocument("link.prism", policy)) == SandboxError::Code::PathRejected);
    }

    TEST_CASE("Missing files are I/O errors") {
        ScratchDirectory scratch;
        SandboxPolicy    policy{.appRoot = scratch.root()};
        auto             missing = loadDocument("absent.prism", policy);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == LoadError::Code::Io);
    }

    TEST_CASE("Sources over the limit are rejected before parsing") {
        ScratchDirectory scratch;
        // Not valid syntax: a parse would fail with Syntax, not FileTooLarge.
        std::string oversized(kMaxSourceBytes + 1, '{');
        CHECK(oversized.size() == 1'048'577);
        scratch.write(scratch.root() / "big.prism", oversized);

        SandboxPolicy policy{.appRoot = scratch.root()};
        CHECK(sandboxCodeOf(loadDocument("big.prism", policy)) == SandboxError::Code::FileTooLarge);
        CHECK(sandboxCodeOf(loadSource(oversized, policy)) == SandboxError::Code::FileTooLarge);

        auto exact = loadSource(paddedSource(kMaxSourceBytes), policy);
        CHECK(exact.has_value());

        scratch.write(scratch.root() / "exact.prism", paddedSource(kMaxSourceBytes));
        CHECK(loadDocument("exact.prism", policy).has_value());

        SandboxPolicy tight{.appRoot = scratch.root(), .maxSourceBytes = 16};
        CHECK(sandboxCodeOf(loadSource(kCounterSource, tight)) == SandboxError::Code::FileTooLarge);
    }

    TEST_CASE("Parse and resolution errors surface unchanged") {
        SandboxPolicy policy{};
        auto          syntax = loadSource("@app \"x\"\n@version 1\nstate {", policy);
        REQUIRE_FALSE(syntax.has_value());
        CHECK(syntax.error().code == LoadError::Code::Syntax);

        auto unresolved = loadSource("@app \"x\"\n@version 1\nview { text \"{nope}\" }", policy);
        REQUIRE_FALSE(unresolved.has_value());
        CHECK(unresolved.error().code == LoadError::Code::UnresolvedIdentifier);
    }
}
