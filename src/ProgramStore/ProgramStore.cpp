#include "ProgramStore.hpp"

#include <sstream>
#include <stdexcept>

#include "../Runtime/StringFunctions.hpp"

namespace minibasic {

ProgramStore::ProgramStore()
    : matcher_(&ProgramStore::prefixMatch) {
}

ProgramStore::~ProgramStore() = default;

size_t ProgramStore::load(const std::string& source) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= source.size()) {
        size_t nl = source.find('\n', start);
        if (nl == std::string::npos) nl = source.size();
        segments.push_back(source.substr(start, nl - start));
        start = nl + 1;
    }

    // Trailing empty segments carry no lines ("a\nb\n" is two lines, "" is none)
    while (!segments.empty() && segments.back().empty()) {
        segments.pop_back();
    }

    lines_.clear();
    lines_.reserve(segments.size());
    for (const auto& segment : segments) {
        lines_.push_back(trim(segment));
    }
    return lines_.size();
}

void ProgramStore::clear() {
    lines_.clear();
}

const std::string& ProgramStore::getLine(size_t index) const {
    if (index >= lines_.size()) {
        throw std::out_of_range("ProgramStore::getLine index " + std::to_string(index) +
                                " out of range (size " + std::to_string(lines_.size()) + ")");
    }
    return lines_[index];
}

std::optional<size_t> ProgramStore::findLine(const std::string& target) const {
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (matcher_(lines_[i], target)) return i;
    }
    return std::nullopt;
}

void ProgramStore::setLineMatcher(LineMatcher matcher) {
    matcher_ = matcher ? std::move(matcher) : LineMatcher(&ProgramStore::prefixMatch);
}

std::string ProgramStore::listing() const {
    std::ostringstream oss;
    for (const auto& line : lines_) {
        oss << line << "\n";
    }
    return oss.str();
}

bool ProgramStore::prefixMatch(const std::string& line, const std::string& target) {
    return startsWith(line, target);
}

bool ProgramStore::exactLabelMatch(const std::string& line, const std::string& target) {
    std::string label = leadingDigits(line);
    return !label.empty() && label == target;
}

} // namespace minibasic
