#pragma once
#include "ast/Document.hpp"
#include "core/Error.hpp"
#include "sandbox/Sandbox.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace Prism {

struct LoadedDocument {
    Document              document;
    std::filesystem::path path;
    std::size_t           sourceBytes = 0;
};

// The only entry point that touches the filesystem. Order: path checks, size
// check on the file's metadata, read, size check on the bytes read, parse,
// identifier resolution.
[[nodiscard]] auto loadDocument(std::string_view requested, SandboxPolicy const& policy) -> LoadResult<LoadedDocument>;

// In-memory variant: size check, parse, identifier resolution.
[[nodiscard]] auto loadSource(std::string_view source, SandboxPolicy const& policy) -> LoadResult<LoadedDocument>;

} // namespace Prism
