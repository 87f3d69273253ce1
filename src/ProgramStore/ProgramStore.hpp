#ifndef MINIBASIC_PROGRAMSTORE_H
#define MINIBASIC_PROGRAMSTORE_H

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace minibasic {

/**
 * Program Store
 *
 * Holds the loaded program as an ordered list of trimmed source lines,
 * addressed by zero-based load position. A line may begin with a numeric
 * label; the label stays in the stored text and is what GOTO/IF targets
 * are matched against.
 *
 * Operations supported:
 * - Load (replace) the whole program from source text
 * - Index access and listing
 * - Jump-target resolution through a pluggable label matcher
 */
class ProgramStore {
public:
    // Decides whether a stored line is the target named by a jump
    using LineMatcher = std::function<bool(const std::string& line, const std::string& target)>;

    ProgramStore();
    ~ProgramStore();

    /**
     * Replace the program with the lines of `source`
     * Segments are split on '\n' and trimmed. Trailing empty segments are
     * dropped, so empty text gives an empty program.
     * @return number of lines stored
     */
    size_t load(const std::string& source);

    /**
     * Clear all program lines
     */
    void clear();

    size_t size() const { return lines_.size(); }
    bool isEmpty() const { return lines_.empty(); }

    /**
     * Get a program line by index
     * @throws std::out_of_range if index >= size()
     */
    const std::string& getLine(size_t index) const;

    const std::vector<std::string>& getLines() const { return lines_; }

    /**
     * Resolve a jump target
     * @param target Label text from GOTO / IF ... GOTO
     * @return index of the first matching line, or nullopt
     */
    std::optional<size_t> findLine(const std::string& target) const;

    void setLineMatcher(LineMatcher matcher);

    // Program text, one stored line per row, for LIST and SAVE
    std::string listing() const;

    // Built-in matchers

    // Stored line starts with the target text ("1" matches "10 print 1")
    static bool prefixMatch(const std::string& line, const std::string& target);

    // Leading digit run of the line equals the target exactly
    static bool exactLabelMatch(const std::string& line, const std::string& target);

private:
    std::vector<std::string> lines_;
    LineMatcher matcher_;
};

} // namespace minibasic

#endif // MINIBASIC_PROGRAMSTORE_H
