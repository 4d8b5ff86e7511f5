// =================================================================
// src/Rewind/PatchApplier.cpp
// =================================================================
// Implementation for forward and reverse diff application.

#include "Rewind/PatchApplier.hpp"
#include "Rewind/DiffCodec.hpp"
#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace Rewind {

namespace {

// Swap the roles of the two sides of a hunk
DiffHunk reversed(const DiffHunk& hunk) {
    DiffHunk result;
    result.old_start = hunk.new_start;
    result.old_count = hunk.new_count;
    result.new_start = hunk.old_start;
    result.new_count = hunk.old_count;
    result.lines.reserve(hunk.lines.size());
    for (const auto& line : hunk.lines) {
        HunkLine swapped = line;
        if (line.type == HunkLineType::ADDED) {
            swapped.type = HunkLineType::REMOVED;
        } else if (line.type == HunkLineType::REMOVED) {
            swapped.type = HunkLineType::ADDED;
        }
        result.lines.push_back(std::move(swapped));
    }
    return result;
}

bool matchesAt(const std::vector<std::string>& lines, size_t position,
               const std::vector<std::string>& expected) {
    if (position + expected.size() > lines.size()) {
        return false;
    }
    for (size_t i = 0; i < expected.size(); ++i) {
        if (lines[position + i] != expected[i]) {
            return false;
        }
    }
    return true;
}

// Search outward from the nominal position, never before the cursor
std::optional<size_t> locateHunk(const std::vector<std::string>& lines, size_t nominal,
                                 size_t cursor, const std::vector<std::string>& expected) {
    if (expected.empty()) {
        size_t position = std::max(nominal, cursor);
        if (position > lines.size()) {
            return std::nullopt;
        }
        return position;
    }
    if (expected.size() > lines.size()) {
        return std::nullopt;
    }
    
    size_t last_start = lines.size() - expected.size();
    if (nominal < cursor) {
        nominal = cursor;
    }
    for (size_t distance = 0; ; ++distance) {
        bool below = nominal >= cursor + distance;
        bool above = nominal + distance <= last_start;
        if (!below && !above) {
            break;
        }
        if (below && matchesAt(lines, nominal - distance, expected)) {
            return nominal - distance;
        }
        if (distance > 0 && above && matchesAt(lines, nominal + distance, expected)) {
            return nominal + distance;
        }
    }
    return std::nullopt;
}

std::string printable(const std::string& line) {
    if (!line.empty() && line.back() == '\n') {
        return line.substr(0, line.size() - 1);
    }
    return line;
}

} // anonymous namespace

PatchResult PatchApplier::apply(const std::string& diff_text, const std::string& content, bool reverse) const {
    PatchResult result;
    
    if (diff_text.empty()) {
        result.error = "Empty diff content";
        return result;
    }
    
    std::string parse_error;
    auto parsed = DiffCodec::parse(diff_text, &parse_error);
    if (!parsed) {
        result.error = "Invalid diff: " + parse_error;
        return result;
    }
    
    std::vector<std::string> lines = DiffCodec::splitLines(content);
    std::vector<std::string> output;
    output.reserve(lines.size());
    
    size_t cursor = 0;
    long offset = 0;
    size_t hunk_number = 0;
    
    for (const auto& original_hunk : parsed->hunks) {
        ++hunk_number;
        DiffHunk hunk = reverse ? reversed(original_hunk) : original_hunk;
        
        std::vector<std::string> expected;
        std::vector<std::string> replacement;
        for (const auto& line : hunk.lines) {
            if (line.type != HunkLineType::ADDED) {
                expected.push_back(line.text);
            }
            if (line.type != HunkLineType::REMOVED) {
                replacement.push_back(line.text);
            }
        }
        
        // A lone "-0,0" hunk describes an empty original; alongside other
        // hunks it is a zero-context insertion before line 1
        if (hunk.old_start == 0 && hunk.old_count == 0 && parsed->hunks.size() == 1 && !lines.empty()) {
            result.error = "Hunk #" + std::to_string(hunk_number) + " " + hunk.header() +
                           " expects empty content but the target has " + std::to_string(lines.size()) + " lines";
            return result;
        }
        
        // A zero-length side names the line before the change
        long base = static_cast<long>(hunk.old_count > 0 && hunk.old_start > 0 ? hunk.old_start - 1 : hunk.old_start);
        long nominal = std::max(0L, base + offset);
        
        auto position = locateHunk(lines, static_cast<size_t>(nominal), cursor, expected);
        if (!position) {
            result.error = "Hunk #" + std::to_string(hunk_number) + " " + hunk.header() + " does not match the current content";
            size_t check = std::min(static_cast<size_t>(nominal), lines.size());
            for (size_t i = 0; i < expected.size(); ++i) {
                if (check + i >= lines.size() || lines[check + i] != expected[i]) {
                    result.error += " (expected \"" + printable(expected[i]) + "\" at line " +
                                    std::to_string(check + i + 1) + ")";
                    break;
                }
            }
            return result;
        }
        
        output.insert(output.end(), lines.begin() + cursor, lines.begin() + *position);
        output.insert(output.end(), replacement.begin(), replacement.end());
        cursor = *position + expected.size();
        offset = static_cast<long>(*position) - base;
    }
    
    output.insert(output.end(), lines.begin() + cursor, lines.end());
    
    for (const auto& line : output) {
        result.content += line;
    }
    result.success = true;
    return result;
}

std::optional<std::string> PatchApplier::simulate(const std::string& diff_text,
                                                  const std::string& content,
                                                  bool reverse) const noexcept {
    try {
        PatchResult result = apply(diff_text, content, reverse);
        if (!result.success) {
            return std::nullopt;
        }
        return result.content;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace Rewind
