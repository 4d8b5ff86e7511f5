// =================================================================
// src/Rewind/DiffCodec.cpp
// =================================================================
// Implementation for unified diff encoding and decoding.

#include "Rewind/DiffCodec.hpp"
#include "dtl/dtl.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace Rewind {

const std::string DiffCodec::DIFF_MARKER =
    "===================================================================";

static const std::string NO_NEWLINE_MARKER = "\\ No newline at end of file";

static bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

// Splits on '\n' without keeping the separator; a trailing newline does not
// produce an empty last element.
static std::vector<std::string> rawLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Parses "a,b" or "a" (count defaults to 1)
static bool parseRange(const std::string& text, size_t& start, size_t& count) {
    size_t comma = text.find(',');
    std::string start_str = text.substr(0, comma);
    std::string count_str = comma == std::string::npos ? "1" : text.substr(comma + 1);
    if (start_str.empty() || count_str.empty()) {
        return false;
    }
    auto is_number = [](const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    };
    if (!is_number(start_str) || !is_number(count_str)) {
        return false;
    }
    start = std::stoul(start_str);
    count = std::stoul(count_str);
    return true;
}

static bool parseHunkHeader(const std::string& line, DiffHunk& hunk) {
    // @@ -old_start[,old_count] +new_start[,new_count] @@ [section]
    std::istringstream stream(line);
    std::string at_open, old_range, new_range, at_close;
    stream >> at_open >> old_range >> new_range >> at_close;
    if (at_open != "@@" || at_close != "@@" || old_range.size() < 2 || new_range.size() < 2 ||
        old_range[0] != '-' || new_range[0] != '+') {
        return false;
    }
    return parseRange(old_range.substr(1), hunk.old_start, hunk.old_count) &&
           parseRange(new_range.substr(1), hunk.new_start, hunk.new_count);
}

std::string DiffHunk::header() const {
    std::ostringstream out;
    out << "@@ -" << old_start << "," << old_count
        << " +" << new_start << "," << new_count << " @@";
    return out.str();
}

DiffCodec::DiffCodec(size_t context_lines)
    : m_context_lines(context_lines) {
}

std::vector<std::string> DiffCodec::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t begin = 0;
    while (begin < text.size()) {
        size_t end = text.find('\n', begin);
        if (end == std::string::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, end - begin + 1));
        begin = end + 1;
    }
    return lines;
}

std::string DiffCodec::buildDiff(const std::string& original,
                                 const std::string& updated,
                                 const std::string& display_path) const {
    // Lines keep their newline so that "x" and "x\n" compare unequal
    using elem = std::string;
    using sequence = std::vector<elem>;
    sequence original_lines = splitLines(original);
    sequence updated_lines = splitLines(updated);
    
    dtl::Diff<elem, sequence> diff(original_lines, updated_lines);
    diff.compose();
    auto ses = diff.getSes().getSequence();
    
    std::string basename = std::filesystem::path(display_path).filename().string();
    if (basename.empty()) {
        basename = display_path;
    }
    
    std::ostringstream result;
    result << "--- a/" << basename << "\n";
    result << "+++ b/" << basename << "\n";
    
    const size_t n = ses.size();
    std::vector<size_t> changes;
    std::vector<size_t> old_before(n + 1, 0);
    std::vector<size_t> new_before(n + 1, 0);
    for (size_t i = 0; i < n; ++i) {
        auto type = ses[i].second.type;
        old_before[i + 1] = old_before[i] + (type != dtl::SES_ADD ? 1 : 0);
        new_before[i + 1] = new_before[i] + (type != dtl::SES_DELETE ? 1 : 0);
        if (type != dtl::SES_COMMON) {
            changes.push_back(i);
        }
    }
    
    size_t k = 0;
    while (k < changes.size()) {
        size_t start = changes[k] >= m_context_lines ? changes[k] - m_context_lines : 0;
        size_t last = changes[k];
        // Merge changes separated by at most two contexts worth of common lines
        while (k + 1 < changes.size() && changes[k + 1] - last - 1 <= 2 * m_context_lines) {
            ++k;
            last = changes[k];
        }
        size_t end = std::min(n, last + 1 + m_context_lines);
        ++k;
        
        DiffHunk hunk;
        hunk.old_count = old_before[end] - old_before[start];
        hunk.new_count = new_before[end] - new_before[start];
        hunk.old_start = hunk.old_count > 0 ? old_before[start] + 1 : old_before[start];
        hunk.new_start = hunk.new_count > 0 ? new_before[start] + 1 : new_before[start];
        result << hunk.header() << "\n";
        
        for (size_t i = start; i < end; ++i) {
            char prefix = ' ';
            if (ses[i].second.type == dtl::SES_DELETE) {
                prefix = '-';
            } else if (ses[i].second.type == dtl::SES_ADD) {
                prefix = '+';
            }
            const std::string& line = ses[i].first;
            result << prefix << line;
            if (line.empty() || line.back() != '\n') {
                result << "\n" << NO_NEWLINE_MARKER << "\n";
            }
        }
    }
    
    return result.str();
}

std::string DiffCodec::wrap(const std::string& operation_type,
                            const std::string& absolute_path,
                            const std::string& timestamp,
                            const std::string& diff_text) {
    std::ostringstream document;
    document << "# Rewind Patch File\n";
    document << "# Operation: " << operation_type << "\n";
    document << "# File: " << absolute_path << "\n";
    document << "# Timestamp: " << timestamp << "\n";
    document << "# \n";
    document << "# To apply this patch in reverse: patch -R -p1 < this_file\n";
    document << "#\n";
    document << DIFF_MARKER << "\n";
    document << diff_text;
    return document.str();
}

std::optional<std::string> DiffCodec::unwrap(const std::string& document_text) {
    size_t pos = 0;
    while (pos < document_text.size()) {
        size_t end = document_text.find('\n', pos);
        size_t next = end == std::string::npos ? document_text.size() : end + 1;
        std::string line = document_text.substr(pos, (end == std::string::npos ? document_text.size() : end) - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line == DIFF_MARKER) {
            return document_text.substr(next);
        }
        pos = next;
    }
    
    // Documents without the marker: take everything from the first diff header
    pos = 0;
    while (pos < document_text.size()) {
        size_t end = document_text.find('\n', pos);
        size_t next = end == std::string::npos ? document_text.size() : end + 1;
        std::string line = document_text.substr(pos, next - pos);
        if (startsWith(line, "--- ") || startsWith(line, "@@ ")) {
            return document_text.substr(pos);
        }
        pos = next;
    }
    
    return std::nullopt;
}

std::optional<PatchHeader> DiffCodec::readHeader(const std::string& document_text) {
    PatchHeader header;
    bool found = false;
    for (const auto& line : rawLines(document_text)) {
        if (line == DIFF_MARKER) {
            break;
        }
        if (startsWith(line, "# Operation: ")) {
            header.operation_type = line.substr(13);
            found = true;
        } else if (startsWith(line, "# File: ")) {
            header.file_path = line.substr(8);
            found = true;
        } else if (startsWith(line, "# Timestamp: ")) {
            header.timestamp = line.substr(13);
            found = true;
        }
    }
    if (!found) {
        return std::nullopt;
    }
    return header;
}

std::optional<ParsedDiff> DiffCodec::parse(const std::string& diff_text, std::string* error) {
    auto fail = [error](const std::string& message) -> std::optional<ParsedDiff> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };
    
    std::vector<std::string> lines = rawLines(diff_text);
    ParsedDiff parsed;
    bool saw_header = false;
    size_t i = 0;
    
    while (i < lines.size()) {
        const std::string& line = lines[i];
        
        if (startsWith(line, "--- ") && parsed.hunks.empty()) {
            parsed.old_file = line.substr(4);
            saw_header = true;
            ++i;
            continue;
        }
        if (startsWith(line, "+++ ") && parsed.hunks.empty()) {
            parsed.new_file = line.substr(4);
            saw_header = true;
            ++i;
            continue;
        }
        if (!startsWith(line, "@@")) {
            ++i;
            continue;
        }
        
        DiffHunk hunk;
        if (!parseHunkHeader(line, hunk)) {
            return fail("Malformed hunk header: " + line);
        }
        ++i;
        
        size_t remaining_old = hunk.old_count;
        size_t remaining_new = hunk.new_count;
        while (i < lines.size() && (remaining_old > 0 || remaining_new > 0)) {
            const std::string& body = lines[i];
            if (startsWith(body, "\\")) {
                if (!hunk.lines.empty() && !hunk.lines.back().text.empty()) {
                    hunk.lines.back().text.pop_back();
                }
                ++i;
                continue;
            }
            
            char prefix = body.empty() ? ' ' : body[0];
            std::string text = (body.empty() ? std::string() : body.substr(1)) + "\n";
            if (prefix == ' ' && remaining_old > 0 && remaining_new > 0) {
                hunk.lines.push_back({HunkLineType::CONTEXT, text});
                --remaining_old;
                --remaining_new;
            } else if (prefix == '-' && remaining_old > 0) {
                hunk.lines.push_back({HunkLineType::REMOVED, text});
                --remaining_old;
            } else if (prefix == '+' && remaining_new > 0) {
                hunk.lines.push_back({HunkLineType::ADDED, text});
                --remaining_new;
            } else {
                return fail("Unexpected line in hunk " + hunk.header() + ": " + body);
            }
            ++i;
        }
        
        if (remaining_old > 0 || remaining_new > 0) {
            return fail("Truncated hunk " + hunk.header());
        }
        
        // The marker may follow the last line of the hunk
        if (i < lines.size() && startsWith(lines[i], "\\")) {
            if (!hunk.lines.empty() && !hunk.lines.back().text.empty()) {
                hunk.lines.back().text.pop_back();
            }
            ++i;
        }
        
        parsed.hunks.push_back(std::move(hunk));
    }
    
    if (!saw_header && parsed.hunks.empty()) {
        return fail("No diff content found");
    }
    
    return parsed;
}

DiffStats DiffCodec::stats(const std::string& diff_text) {
    DiffStats stats;
    
    auto parsed = parse(diff_text);
    if (parsed) {
        for (const auto& hunk : parsed->hunks) {
            for (const auto& line : hunk.lines) {
                if (line.type == HunkLineType::ADDED) {
                    stats.additions++;
                } else if (line.type == HunkLineType::REMOVED) {
                    stats.deletions++;
                }
            }
        }
    } else {
        // Malformed diff: count by prefix only
        for (const auto& line : rawLines(diff_text)) {
            if (startsWith(line, "+") && !startsWith(line, "+++")) {
                stats.additions++;
            } else if (startsWith(line, "-") && !startsWith(line, "---")) {
                stats.deletions++;
            }
        }
    }
    
    stats.changes = stats.additions + stats.deletions;
    return stats;
}

} // namespace Rewind
