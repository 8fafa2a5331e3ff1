#pragma once
#include "core/Error.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <string_view>

namespace Prism {

inline constexpr std::size_t kMaxSourceBytes   = 1024 * 1024;
inline constexpr std::size_t kMemoryLimitBytes = 16 * 1024 * 1024;

struct SandboxPolicy {
    std::filesystem::path appRoot          = ".";
    std::size_t           maxSourceBytes   = kMaxSourceBytes;
    std::size_t           memoryLimitBytes = kMemoryLimitBytes;
};

/*
 * Load-time checks. A request is rejected when it does not name a .prism
 * file, has a ".." segment, or resolves (symlinks included) outside the
 * application root. The segment check runs before any filesystem access so a
 * traversal attempt is rejected whether or not the target exists.
 *
 * Returns the resolved absolute path on success.
 */
[[nodiscard]] auto validateRequestPath(std::string_view requested, std::filesystem::path const& appRoot)
    -> SandboxResult<std::filesystem::path>;

[[nodiscard]] auto checkSourceSize(std::size_t bytes, std::size_t limit) -> SandboxResult<void>;

/**
 * MemoryBudget: conservative accounting of memory attributable to a running
 * application.
 *
 * Each component reports its current estimated footprint; the budget keeps
 * the sum and rejects any report that would push it past the limit. Once
 * exceeded the budget stays exhausted: a memory violation terminates the
 * application and is never retried.
 */
class MemoryBudget {
public:
    enum class Component : std::size_t {
        Source = 0,
        State,
        Tree,
        PreviousTree,
        Count
    };

    explicit MemoryBudget(std::size_t limit = kMemoryLimitBytes)
        : limit_(limit) {}

    // Replaces the component's estimate with `bytes`.
    [[nodiscard]] auto update(Component component, std::size_t bytes) -> SandboxResult<void>;

    auto release(Component component) noexcept -> void;

    [[nodiscard]] auto used() const noexcept -> std::size_t { return used_; }
    [[nodiscard]] auto peak() const noexcept -> std::size_t { return peak_; }
    [[nodiscard]] auto limit() const noexcept -> std::size_t { return limit_; }
    [[nodiscard]] auto exhausted() const noexcept -> bool { return exhausted_; }
    [[nodiscard]] auto usage(Component component) const noexcept -> std::size_t {
        return components_[static_cast<std::size_t>(component)];
    }

    // Largest estimate `component` may report with every other component
    // unchanged; 0 once exhausted.
    [[nodiscard]] auto headroom(Component component) const noexcept -> std::size_t;

private:
    std::size_t limit_;
    std::size_t used_      = 0;
    std::size_t peak_      = 0;
    bool        exhausted_ = false;
    std::array<std::size_t, static_cast<std::size_t>(Component::Count)> components_{};
};

[[nodiscard]] auto componentName(MemoryBudget::Component component) -> std::string_view;

} // namespace Prism
