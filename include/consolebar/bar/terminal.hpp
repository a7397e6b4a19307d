#pragma once

#include <string>
#include <ostream>

namespace consolebar {
namespace bar {

// 0-based cell coordinates.
struct CursorPosition {
    int column = 0;
    int row = 0;
};

// Terminal control surface used by progress bars. Implementations are not
// required to be thread-safe; callers serialize access through a terminal lock.
class Terminal {
public:
    virtual ~Terminal() = default;
    
    virtual CursorPosition cursorPosition() = 0;
    virtual void setCursorPosition(int column, int row) = 0;
    virtual void setCursorVisible(bool visible) = 0;
    
    // Writes text verbatim at the cursor, without an implicit newline.
    virtual void write(const std::string& text) = 0;
};

// ANSI/VT100 terminal driven through an output stream. Cursor queries are sent
// as DSR (ESC[6n) and the reply is read from input_fd in non-canonical mode.
class AnsiTerminal : public Terminal {
public:
    AnsiTerminal(std::ostream& out, int output_fd, int input_fd);
    
    CursorPosition cursorPosition() override;
    void setCursorPosition(int column, int row) override;
    void setCursorVisible(bool visible) override;
    void write(const std::string& text) override;

private:
    std::ostream& out_;
    int output_fd_;
    int input_fd_;
    
    void emit(const std::string& sequence);
    std::string readCursorReply();
};

}}
