#include "sift/platform.h"

#ifdef _WIN32
#    ifndef NOMINMAX
#        define NOMINMAX 1
#    endif
#    include <io.h>
#    include <windows.h>
#else
#    include <pwd.h>
#    include <sys/ioctl.h>
#    include <unistd.h>
#endif

#include <cstdlib>

namespace sift {

bool Platform::enableVirtualTerminal()
{
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);

    if (hOut == INVALID_HANDLE_VALUE) {
        return false;
    }

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode)) {
        return false;
    }

    if ((dwMode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0) {
        return true;
    }

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    return SetConsoleMode(hOut, dwMode) != 0;
#else
    return true;
#endif
}

bool Platform::isOutputTerminal()
{
#ifdef _WIN32
    HANDLE handle = GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }

    DWORD mode = 0;
    if (GetConsoleMode(handle, &mode) != 0) {
        return true;
    }

    return GetFileType(handle) == FILE_TYPE_CHAR;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

int Platform::terminalWidth()
{
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (GetConsoleScreenBufferInfo(hOut, &csbi)) {
        return (csbi.srWindow.Right - csbi.srWindow.Left + 1);
    }
    return 80;
#else
    struct winsize w {
    };
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
#endif
}

bool Platform::canTraverse(const std::filesystem::path& dir)
{
#ifdef _WIN32
    return ::_waccess(dir.c_str(), 04) == 0;
#else
    return ::access(dir.c_str(), R_OK | X_OK) == 0;
#endif
}

bool Platform::canRead(const std::filesystem::path& path)
{
#ifdef _WIN32
    return ::_waccess(path.c_str(), 04) == 0;
#else
    return ::access(path.c_str(), R_OK) == 0;
#endif
}

bool Platform::canWrite(const std::filesystem::path& path)
{
#ifdef _WIN32
    return ::_waccess(path.c_str(), 02) == 0;
#else
    return ::access(path.c_str(), W_OK) == 0;
#endif
}

std::filesystem::path Platform::homeDirectory()
{
#ifdef _WIN32
    if (const char* profile = std::getenv("USERPROFILE")) {
        if (profile[0] != '\0') return std::filesystem::path(profile);
    }
    return {};
#else
    if (const char* home = std::getenv("HOME")) {
        if (home[0] != '\0') return std::filesystem::path(home);
    }
    if (const passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir != nullptr) return std::filesystem::path(pw->pw_dir);
    }
    return {};
#endif
}

}  // namespace sift
