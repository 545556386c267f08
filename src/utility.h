#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

template <typename C>
requires std::is_nothrow_invocable_v<std::decay_t<C>>
struct defer {
    explicit defer(C &&callable) : _callable(std::move(callable)) {};
    defer(const defer &other) = delete;
    defer &operator=(const defer &other) = delete;
    defer(defer &&other) = delete;
    defer &operator=(defer &&other) = delete;
    ~defer() { _callable(); };

  private:
    C _callable;
};

// Strips leading and trailing ASCII whitespace
std::string trim(std::string_view text);

namespace platform
{

std::optional<std::filesystem::path> get_home_dir();

// Starts a detached process; throws std::runtime_error if it cannot be
// spawned.
void run_command(const std::vector<std::string> &args);

} // namespace platform
