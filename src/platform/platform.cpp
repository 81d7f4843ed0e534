#include "nicefind/platform.h"

#include <cstdio>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace nicefind::platform {

bool is_hidden(const std::filesystem::directory_entry& entry, std::error_code& ec) {
    ec.clear();
    const auto filename = entry.path().filename().string();
    if (!filename.empty() && filename.front() == '.') {
        return true;
    }
#ifdef _WIN32
    const DWORD attrs = ::GetFileAttributesW(entry.path().c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES) {
        ec.assign(static_cast<int>(::GetLastError()), std::system_category());
        return false;
    }
    return (attrs & FILE_ATTRIBUTE_HIDDEN) != 0;
#else
    return false;
#endif
}

bool stdout_is_terminal() {
#ifdef _WIN32
    return ::_isatty(::_fileno(stdout)) != 0;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

} // namespace nicefind::platform
