#pragma once

#include <string>
#include <ostream>
#include <memory>
#include <cstddef>

// Prefixes every line written through it before forwarding to a sink.
// Complete lines are written to the sink in a single call so output from
// several hosts sharing one sink interleaves by line, not by byte.
// A null sink discards everything.
class LineWrapper {
public:
    LineWrapper(std::string prefix, std::shared_ptr<std::ostream> sink);

    void write(const char* data, std::size_t len);

    // Emit any trailing partial line (prefixed, without adding a newline).
    void finish();

private:
    std::string prefix_;
    std::shared_ptr<std::ostream> sink_;
    std::string pending_;
};
