#pragma once

#include <filesystem>
#include <system_error>

namespace nicefind::platform {

// A leading '.' always counts as hidden. On Windows the hidden attribute bit
// counts as well; failing to read it sets `ec`.
[[nodiscard]] bool is_hidden(const std::filesystem::directory_entry& entry, std::error_code& ec);

[[nodiscard]] bool stdout_is_terminal();

} // namespace nicefind::platform
