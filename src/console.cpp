#include "console.hpp"
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace helpfmt {

Console::Console() : colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
#ifdef _WIN32
    // Enable ANSI escape codes on Windows 10+
    HANDLE hErr = GetStdHandle(STD_ERROR_HANDLE);
    if (hErr != INVALID_HANDLE_VALUE) {
        DWORD mode = 0;
        if (GetConsoleMode(hErr, &mode)) {
            mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hErr, mode);
        }
    }
    if (_isatty(_fileno(stderr)) == 0) {
        colors_enabled_ = false;
    }
#else
    if (isatty(STDERR_FILENO) == 0) {
        colors_enabled_ = false;
    }
#endif
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        colors_enabled_ = false;
    }
}

void Console::println(const std::string& text) const {
    std::cout << text << std::endl;
}

void Console::print_error(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::RED << text << ansi::RESET << std::endl;
    } else {
        std::cerr << text << std::endl;
    }
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cerr << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cerr << "* " << text << std::endl;
    }
}

} // namespace helpfmt
