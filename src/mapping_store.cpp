#include "mapping_store.hpp"
#include <cctype>
#include <cstdio>
#include <exception>
#include <sstream>

#include "decode.hpp"
#include "file_io.hpp"
#include "log.hpp"
#include "string_util.hpp"

namespace uneff {

namespace {

MappingEntry make_entry(char32_t ch, const char* name, bool remove, const char32_t* replacement = U"") {
    MappingEntry e;
    e.character = ch;
    e.name = name;
    e.remove = remove;
    e.replacement = replacement;
    return e;
}

std::vector<MappingEntry> build_default_table() {
    return {
        make_entry(0xFFFD, "Replacement Character", true),
        make_entry(0x0000, "NULL", true),
        make_entry(0x001A, "Substitute", true),
        make_entry(0x001C, "File Separator", true),
        make_entry(0x001D, "Group Separator", true),
        make_entry(0x001E, "Record Separator", true),
        make_entry(0x001F, "Unit Separator", true),
        make_entry(0x2028, "Line Separator", true),
        make_entry(0x2029, "Paragraph Separator", true),
        make_entry(0x200B, "Zero Width Space", true),
        make_entry(0x200C, "Zero Width Non-Joiner", true),
        make_entry(0x200D, "Zero Width Joiner", true),
        make_entry(0x200E, "Left-to-Right Mark", true),
        make_entry(0x200F, "Right-to-Left Mark", true),
        make_entry(0x202A, "Left-to-Right Embedding", true),
        make_entry(0x202B, "Right-to-Left Embedding", true),
        make_entry(0x202C, "Pop Directional Formatting", true),
        make_entry(0x202D, "Left-to-Right Override", true),
        make_entry(0x202E, "Right-to-Left Override", true),
        make_entry(0x2061, "Function Application", true),
        make_entry(0x2062, "Invisible Times", true),
        make_entry(0x2063, "Invisible Separator", true),
        make_entry(0x2064, "Invisible Plus", true),
        make_entry(0x2066, "Left-to-Right Isolate", true),
        make_entry(0x2067, "Right-to-Left Isolate", true),
        make_entry(0x2068, "First Strong Isolate", true),
        make_entry(0x2069, "Pop Directional Isolate", true),
        make_entry(0xFEFF, "BOM (in middle of file)", true),

        // typographic characters, off unless the user enables them
        make_entry(0x2018, "Left Single Quotation Mark", false, U"'"),
        make_entry(0x2019, "Right Single Quotation Mark", false, U"'"),
        make_entry(0x201C, "Left Double Quotation Mark", false, U"\""),
        make_entry(0x201D, "Right Double Quotation Mark", false, U"\""),
        make_entry(0x2039, "Single Left-Pointing Angle Quotation Mark", false, U"<"),
        make_entry(0x203A, "Single Right-Pointing Angle Quotation Mark", false, U">"),
        make_entry(0x00AB, "Left-Pointing Double Angle Quotation Mark", false, U"<<"),
        make_entry(0x00BB, "Right-Pointing Double Angle Quotation Mark", false, U">>"),
        make_entry(0x2013, "En Dash", false, U"-"),
        make_entry(0x2014, "Em Dash", false, U"--"),
        make_entry(0x2026, "Horizontal Ellipsis", false, U"..."),
        make_entry(0x2032, "Prime", false, U"'"),
        make_entry(0x2033, "Double Prime", false, U"\""),
        make_entry(0x2010, "Hyphen", false, U"-"),
        make_entry(0x2011, "Non-Breaking Hyphen", false, U"-"),
        make_entry(0x2012, "Figure Dash", false, U"-"),
        make_entry(0x2022, "Bullet", false, U"*"),
        make_entry(0x00B7, "Middle Dot", false, U"."),
    };
}

// QUOTE_MINIMAL style: "a,b" and "say ""hi""".
std::vector<std::string> split_csv_row(const std::string& row) {
    std::vector<std::string> fields;
    std::string cur;
    bool in_quotes = false;
    for (size_t i = 0; i < row.size(); ++i) {
        char c = row[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < row.size() && row[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    fields.push_back(cur);
    return fields;
}

std::string quote_csv_field(const std::string& f) {
    if (f.find_first_of(",\"\r\n") == std::string::npos) return f;
    std::string out = "\"";
    for (char c : f) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string unescape_replacement(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[i + 1];
            if (n == 'n') { out.push_back('\n'); ++i; continue; }
            if (n == 't') { out.push_back('\t'); ++i; continue; }
            if (n == 'r') { out.push_back('\r'); ++i; continue; }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string escape_replacement(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\n') out += "\\n";
        else if (c == '\t') out += "\\t";
        else if (c == '\r') out += "\\r";
        else out.push_back(c);
    }
    return out;
}

std::string format_escape(char32_t ch) {
    char buf[16];
    if (ch > 0xFFFF) std::snprintf(buf, sizeof(buf), "\\U%08x", static_cast<unsigned>(ch));
    else std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
    return buf;
}

bool is_hex(const std::string& s) {
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return !s.empty();
}

MappingLoadResult degraded_result(const std::string& error) {
    MappingLoadResult res;
    res.mappings = MappingStore::Fallback();
    res.degraded = true;
    res.error = error;
    return res;
}

} // namespace

const std::vector<MappingEntry>& MappingStore::DefaultTable() {
    static const std::vector<MappingEntry> table = build_default_table();
    return table;
}

const MappingSet& MappingStore::Defaults() {
    static const MappingSet active = [] {
        MappingSet set;
        for (const auto& e : DefaultTable()) {
            if (e.remove) set.push_back(e);
        }
        DropConflictingReplacements(set);
        return set;
    }();
    return active;
}

const MappingSet& MappingStore::Fallback() {
    static const MappingSet fallback = {
        make_entry(0xFFFD, "Replacement Character", true),
        make_entry(0xFEFF, "BOM (in middle of file)", true),
    };
    return fallback;
}

bool MappingStore::ParseUnicodeEscape(const std::string& text, char32_t& out) {
    std::string t = Trim(text);
    if (t.size() < 2 || t[0] != '\\') return false;
    std::string digits = t.substr(2);
    if (t[1] == 'u') {
        if (digits.size() != 4) return false;
    } else if (t[1] == 'U') {
        if (digits.size() != 8) return false;
    } else {
        return false;
    }
    if (!is_hex(digits)) return false;
    unsigned long cp = std::stoul(digits, nullptr, 16);
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    out = static_cast<char32_t>(cp);
    return true;
}

bool MappingStore::ParseRemoveFlag(const std::string& text, bool& out) {
    std::string t = ToLower(Trim(text));
    if (t == "true") { out = true; return true; }
    if (t == "false") { out = false; return true; }
    return false;
}

MappingParseResult MappingStore::Parse(const std::string& csv, bool verbose) {
    MappingParseResult res;
    std::istringstream in(csv);
    std::string line;
    size_t line_no = 0;
    bool header_checked = false;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (Trim(line).empty()) continue;
        ++res.rows;

        std::vector<std::string> fields = split_csv_row(line);
        if (!header_checked) {
            header_checked = true;
            if (ToLower(Trim(fields[0])) == "character") continue;
        }
        if (fields.size() < 4) {
            if (verbose) LogWarning("Mappings line " + std::to_string(line_no) + ": expected at least 4 fields, skipped");
            ++res.skipped;
            continue;
        }

        bool remove = false;
        if (!ParseRemoveFlag(fields[3], remove)) {
            if (verbose) LogWarning("Mappings line " + std::to_string(line_no) + ": invalid Remove value '" + Trim(fields[3]) + "', skipped");
            ++res.skipped;
            continue;
        }
        if (!remove) continue;

        MappingEntry entry;
        entry.remove = true;
        entry.name = Trim(fields[2]);
        if (!ParseUnicodeEscape(fields[1], entry.character)) {
            if (verbose) LogWarning("Error parsing unicode sequence: " + Trim(fields[1]));
            ++res.skipped;
            continue;
        }
        if (fields.size() >= 5 && !fields[4].empty()) {
            auto repl = TryDecodeUtf8Strict(unescape_replacement(fields[4]));
            if (!repl || repl->find(entry.character) != std::u32string::npos) {
                if (verbose) LogWarning("Mappings line " + std::to_string(line_no) + ": unusable replacement for " + entry.name + ", skipped");
                ++res.skipped;
                continue;
            }
            entry.replacement = std::move(*repl);
        }
        res.mappings.push_back(std::move(entry));
    }
    res.skipped += DropConflictingReplacements(res.mappings, verbose);
    return res;
}

int MappingStore::DropConflictingReplacements(MappingSet& mappings, bool verbose) {
    std::u32string active;
    for (const auto& e : mappings) active.push_back(e.character);

    int dropped = 0;
    MappingSet kept;
    kept.reserve(mappings.size());
    for (auto& e : mappings) {
        if (e.replacement.find_first_of(active) != std::u32string::npos) {
            if (verbose) LogWarning("Replacement for " + e.name + " contains a mapped character, skipped");
            ++dropped;
            continue;
        }
        kept.push_back(std::move(e));
    }
    mappings.swap(kept);
    return dropped;
}

std::string MappingStore::Serialize(const std::vector<MappingEntry>& table) {
    std::ostringstream out;
    out << "Character,Unicode,Name,Remove,Replacement\n";
    for (const auto& e : table) {
        // control characters are left out of the literal column
        std::string literal = (e.character < 0x20 || e.character == 0x7F) ? "" : EncodeUtf8(e.character);
        out << quote_csv_field(literal) << ','
            << quote_csv_field(format_escape(e.character)) << ','
            << quote_csv_field(e.name) << ','
            << (e.remove ? "True" : "False") << ','
            << quote_csv_field(escape_replacement(EncodeUtf8(e.replacement))) << '\n';
    }
    return out.str();
}

MappingLoadResult MappingStore::Load(const std::string& path, bool createIfMissing, bool verbose) {
    try {
        if (!PathExists(path)) {
            MappingLoadResult res;
            if (!createIfMissing) {
                res.mappings = Fallback();
                return res;
            }
            if (verbose) {
                LogInfo("Mappings file not found at: " + path);
                LogInfo("Creating default mappings file...");
            }
            res.mappings = Defaults();
            std::string err;
            if (WriteFileAtomic(path, Serialize(DefaultTable()), err)) {
                res.created = true;
                if (verbose) LogInfo("Default mappings saved to: " + path);
            } else {
                res.error = err;
                if (verbose) LogWarning("Could not save default mappings (" + err + "), using them for this run only.");
            }
            return res;
        }

        std::string bytes;
        if (!ReadFileBytes(path, bytes)) {
            if (verbose) {
                LogError("Error reading mappings file: " + path);
                LogInfo("Using default mappings instead.");
            }
            return degraded_result("cannot read mappings file: " + path);
        }
        if (bytes.size() >= 3 &&
            static_cast<unsigned char>(bytes[0]) == 0xEF &&
            static_cast<unsigned char>(bytes[1]) == 0xBB &&
            static_cast<unsigned char>(bytes[2]) == 0xBF) {
            bytes.erase(0, 3);
        }

        MappingParseResult parsed = Parse(bytes, verbose);
        if (parsed.rows == 0) {
            if (verbose) {
                LogError("Mappings file is empty: " + path);
                LogInfo("Using default mappings instead.");
            }
            return degraded_result("empty mappings file: " + path);
        }
        MappingLoadResult res;
        res.mappings = std::move(parsed.mappings);
        res.skipped = parsed.skipped;
        if (verbose) {
            LogInfo("Loaded " + std::to_string(res.mappings.size()) + " problematic character mappings from: " + path);
        }
        return res;
    } catch (const std::exception& e) {
        if (verbose) {
            LogError(std::string("Error reading mappings file: ") + e.what());
            LogInfo("Using default mappings instead.");
        }
        return degraded_result(e.what());
    }
}

} // namespace uneff
