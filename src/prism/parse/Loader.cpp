#include "Loader.hpp"

#include "Parser.hpp"
#include "log/TaggedLogger.hpp"

#include <fstream>
#include <string>
#include <system_error>

namespace Prism {
namespace {

auto ioError(std::string message) -> std::unexpected<LoadError> {
    prism_log("Load failed: " + message, "Loader", "ERROR");
    return std::unexpected(LoadError{LoadError::Code::Io, std::move(message)});
}

auto readBounded(std::filesystem::path const& path, std::size_t limit) -> LoadResult<std::string> {
    std::ifstream file{path, std::ios::binary};
    if (!file)
        return ioError("cannot open '" + path.string() + "'");

    std::string contents;
    contents.resize(limit + 1);
    file.read(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (file.bad())
        return ioError("read error on '" + path.string() + "'");
    contents.resize(static_cast<std::size_t>(file.gcount()));
    return contents;
}

} // namespace

auto loadSource(std::string_view source, SandboxPolicy const& policy) -> LoadResult<LoadedDocument> {
    if (auto sized = checkSourceSize(source.size(), policy.maxSourceBytes); !sized)
        return std::unexpected(LoadError{sized.error()});

    auto document = parseDocument(source);
    if (!document)
        return std::unexpected(document.error());
    if (auto resolved = validateDocument(*document); !resolved)
        return std::unexpected(resolved.error());

    prism_log("Loaded '" + document->appName + "' with " + std::to_string(document->state.size()) + " variables and "
                  + std::to_string(document->actions.size()) + " actions",
              "Loader", "INFO");
    return LoadedDocument{.document = std::move(*document), .path = {}, .sourceBytes = source.size()};
}

auto loadDocument(std::string_view requested, SandboxPolicy const& policy) -> LoadResult<LoadedDocument> {
    auto path = validateRequestPath(requested, policy.appRoot);
    if (!path)
        return std::unexpected(LoadError{path.error()});

    std::error_code ec;
    auto const      status = std::filesystem::status(*path, ec);
    if (ec || !std::filesystem::is_regular_file(status))
        return ioError("'" + path->string() + "' is not a readable file");

    auto const size = std::filesystem::file_size(*path, ec);
    if (ec)
        return ioError("cannot stat '" + path->string() + "': " + ec.message());
    if (auto sized = checkSourceSize(static_cast<std::size_t>(size), policy.maxSourceBytes); !sized)
        return std::unexpected(LoadError{sized.error()});

    auto source = readBounded(*path, policy.maxSourceBytes);
    if (!source)
        return std::unexpected(source.error());

    auto loaded = loadSource(*source, policy);
    if (!loaded)
        return loaded;
    loaded->path = std::move(*path);
    return loaded;
}

} // namespace Prism
