#include <adbmux/console.hpp>

namespace adbmux {

namespace {

const char* escape (Color color) {
    switch (color) {
        case Color::red: return "\033[31m";
        case Color::green: return "\033[32m";
        case Color::cyan: return "\033[36m";
        case Color::none: break;
    }
    return "";
}

const char* const kReset = "\033[0m";

std::string paint (const std::string& text, Color color, bool colored) {
    if (!colored || Color::none == color || text.empty()) {
        return text;
    }
    return escape(color) + text + kReset;
}

} // <anonymous>

void Console::print (const std::string& text, Color color) {
    mOut << paint(text, color, mOutColored) << std::endl;
}

void Console::error (const std::string& text) {
    mErr << paint(text, Color::red, mErrColored) << std::endl;
}

} // namespace adbmux
