#pragma once

#include "terminal.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace consolebar {
namespace bar {

using TerminalLock = std::shared_ptr<std::mutex>;

// Shared state handed to progress bars at construction: the terminal they
// draw on, the lock new bars use unless given their own, and the number of
// rows the screen has scrolled since the context was created. Bars keep
// their rows relative to that count, so a scroll caused by any writer moves
// every live bar. A context must outlive the bars built from it.
class BarContext {
public:
    // Process-wide context drawing on stdout.
    static BarContext& instance();
    
    explicit BarContext(std::shared_ptr<Terminal> terminal);
    BarContext(std::shared_ptr<Terminal> terminal, TerminalLock default_lock);
    
    BarContext(const BarContext&) = delete;
    BarContext& operator=(const BarContext&) = delete;
    
    // Affects bars constructed afterwards only.
    void setDefaultLockObject(TerminalLock lock);
    TerminalLock defaultLockObject() const;
    
    std::shared_ptr<Terminal> terminal() const { return terminal_; }
    
    // Writes plain text under lock and records any scroll it caused.
    void print(const std::string& text, const TerminalLock& lock);
    void print(const std::string& text);
    
    // Caller must hold the terminal lock of the write that scrolled.
    void recordScroll(int rows);
    long scrolledRows() const;

private:
    std::shared_ptr<Terminal> terminal_;
    
    mutable std::mutex mutex_;
    TerminalLock default_lock_;
    long scrolled_rows_ = 0;
};

}}
