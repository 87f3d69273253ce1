#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace minibasic {

/**
 * OutputBuffer
 *
 * Append-only text sink for a program run. Statement handlers write one
 * record per event, each ending in '\n'. An optional echo callback sees
 * every chunk as it is written (the console front end uses it for live
 * output); the buffer itself stays the source of truth for getOutput().
 */
class OutputBuffer {
public:
    using EchoCallback = std::function<void(const std::string&)>;

    void append(const std::string& text) {
        buffer_ += text;
        lineCount_ += static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
        if (echo_) echo_(text);
    }

    void appendLine(const std::string& text) { append(text + "\n"); }

    void clear() {
        buffer_.clear();
        lineCount_ = 0;
    }

    const std::string& str() const { return buffer_; }
    size_t lineCount() const { return lineCount_; }
    bool empty() const { return buffer_.empty(); }

    void setEchoCallback(EchoCallback cb) { echo_ = std::move(cb); }

private:
    std::string buffer_;
    size_t lineCount_{0};
    EchoCallback echo_{};
};

} // namespace minibasic
