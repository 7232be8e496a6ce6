#pragma once

#include "qapp/types.hpp"

#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Unit File Model (systemd INI dialect)
// ============================================================================

enum class UnitLineKind {
    Blank,
    Comment,
    Section,
    Entry,
};

struct UnitLine {
    UnitLineKind kind = UnitLineKind::Blank;

    // Source text. For an entry spanning continuation lines this holds all
    // physical lines joined with '\n'.
    std::string raw;

    std::string section;  // section name (Section) or owning section (Entry)
    std::string key;
    std::string value;    // continuation lines folded, surrounding whitespace trimmed

    bool modified = false;
};

/**
 * Parsed unit file that round-trips byte-for-byte.
 *
 * Lines that are never modified are serialized from their raw text, so
 * comments, blank lines, ordering and spacing survive preprocessing.
 * Keys may repeat within a section; order is preserved.
 */
class UnitFile {
public:
    // PREPROCESS_ERROR on an unterminated section header, a directive
    // outside any section, or a non-comment line without '='.
    static Result<UnitFile> parse(const std::string& text, const std::string& source_name);

    std::string serialize() const;

    std::vector<UnitLine>& lines() { return lines_; }
    const std::vector<UnitLine>& lines() const { return lines_; }

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // All values of `key` in `section`, in file order
    std::vector<std::string> values(const std::string& section, const std::string& key) const;

    // Replace the value of an entry line
    void setValue(size_t index, const std::string& value);

    // Insert key=value right after the first header of `section`. The section
    // is appended at the end of the file when missing.
    void insertAfterHeader(const std::string& section,
                           const std::string& key,
                           const std::string& value);

private:
    std::vector<UnitLine> lines_;
    bool trailing_newline_ = false;
};

} // namespace qapp
