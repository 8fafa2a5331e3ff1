#include "Sandbox.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <system_error>

namespace Prism {
namespace {

auto rejected(std::string message) -> std::unexpected<SandboxError> {
    prism_log("Path rejected: " + message, "Sandbox", "ERROR");
    return std::unexpected(SandboxError{SandboxError::Code::PathRejected, std::move(message)});
}

auto hasTraversalSegment(std::string_view path) -> bool {
    std::size_t start = 0;
    while (start <= path.size()) {
        auto const end = path.find_first_of("/\\", start);
        auto const segment = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (segment == "..")
            return true;
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return false;
}

auto isWithin(std::filesystem::path const& candidate, std::filesystem::path const& root) -> bool {
    auto const [rootEnd, candidateEnd] = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
    if (rootEnd == root.end())
        return true;
    // A trailing separator on the root shows up as an empty final element.
    return std::next(rootEnd) == root.end() && rootEnd->empty();
}

} // namespace

auto validateRequestPath(std::string_view requested, std::filesystem::path const& appRoot)
    -> SandboxResult<std::filesystem::path> {
    std::string const request{requested};
    if (request.empty())
        return rejected("empty path");
    if (hasTraversalSegment(requested))
        return rejected("'" + request + "' contains a '..' segment");

    std::filesystem::path path{request};
    if (path.extension() != ".prism")
        return rejected("'" + request + "' is not a .prism file");

    std::error_code ec;
    auto root = std::filesystem::absolute(appRoot, ec);
    if (!ec)
        root = std::filesystem::weakly_canonical(root, ec);
    if (ec)
        return rejected("application root '" + appRoot.string() + "' cannot be resolved: " + ec.message());

    auto candidate = path.is_absolute() ? path : root / path;
    candidate      = std::filesystem::weakly_canonical(candidate, ec);
    if (ec)
        return rejected("'" + request + "' cannot be resolved: " + ec.message());

    if (!isWithin(candidate, root))
        return rejected("'" + request + "' resolves outside the application root");

    return candidate;
}

auto checkSourceSize(std::size_t bytes, std::size_t limit) -> SandboxResult<void> {
    if (bytes > limit) {
        prism_log("Source of " + std::to_string(bytes) + " bytes exceeds " + std::to_string(limit), "Sandbox", "ERROR");
        return std::unexpected(SandboxError{SandboxError::Code::FileTooLarge,
                                            std::to_string(bytes) + " bytes exceeds the " + std::to_string(limit) + " byte limit"});
    }
    return {};
}

auto MemoryBudget::update(Component component, std::size_t bytes) -> SandboxResult<void> {
    if (exhausted_)
        return std::unexpected(SandboxError{SandboxError::Code::MemoryExceeded, "memory budget already exhausted"});

    auto& slot = components_[static_cast<std::size_t>(component)];
    auto const next = used_ - slot + bytes;
    if (next > limit_) {
        exhausted_ = true;
        prism_log("Memory budget exceeded by " + std::string{componentName(component)} + ": "
                      + std::to_string(next) + " > " + std::to_string(limit_),
                  "Sandbox", "ERROR");
        return std::unexpected(SandboxError{SandboxError::Code::MemoryExceeded,
                                            std::string{componentName(component)} + " pushed usage to "
                                                + std::to_string(next) + " of " + std::to_string(limit_) + " bytes"});
    }
    slot  = bytes;
    used_ = next;
    peak_ = std::max(peak_, used_);
    return {};
}

auto MemoryBudget::headroom(Component component) const noexcept -> std::size_t {
    auto const others = used_ - usage(component);
    if (exhausted_ || others >= limit_)
        return 0;
    return limit_ - others;
}

auto MemoryBudget::release(Component component) noexcept -> void {
    auto& slot = components_[static_cast<std::size_t>(component)];
    used_ -= slot;
    slot = 0;
}

auto componentName(MemoryBudget::Component component) -> std::string_view {
    switch (component) {
    case MemoryBudget::Component::Source:
        return "source";
    case MemoryBudget::Component::State:
        return "state";
    case MemoryBudget::Component::Tree:
        return "tree";
    case MemoryBudget::Component::PreviousTree:
        return "previous_tree";
    case MemoryBudget::Component::Count:
        break;
    }
    return "unknown";
}

} // namespace Prism
