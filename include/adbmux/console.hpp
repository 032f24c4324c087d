#ifndef ADBMUX_CONSOLE_HPP
#define ADBMUX_CONSOLE_HPP

#include <iostream>
#include <string>

namespace adbmux {

enum class Color {
    none,
    red,
    green,
    cyan
};

// Line-oriented user output: normal text goes to `out`, errors to `err` in red. Each stream is
// colored on its own, so that e.g. redirecting stdout to a file keeps errors red on a terminal.
class Console {
public:
    Console (std::ostream& out, std::ostream& err, bool colored)
        : Console(out, err, colored, colored)
    {}

    Console (std::ostream& out, std::ostream& err, bool outColored, bool errColored)
        : mOut(out), mErr(err), mOutColored(outColored), mErrColored(errColored)
    {}

    void print (const std::string& text, Color color = Color::none);
    void error (const std::string& text);

    bool outColored () const { return mOutColored; }
    bool errColored () const { return mErrColored; }

private:
    std::ostream& mOut;
    std::ostream& mErr;
    bool mOutColored;
    bool mErrColored;
};

} // namespace adbmux

#endif
