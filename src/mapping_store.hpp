#pragma once
#include <string>
#include <vector>

namespace uneff {

struct MappingEntry {
    char32_t character = 0;
    std::string name;
    bool remove = false;
    // Substituted for each occurrence; empty means the character is deleted.
    std::u32string replacement;
};

// Active entries (remove == true) in table order.
using MappingSet = std::vector<MappingEntry>;

struct MappingParseResult {
    MappingSet mappings;
    int skipped = 0;
    int rows = 0;  // non-blank lines, header included
};

struct MappingLoadResult {
    MappingSet mappings;
    bool created = false;   // default table was written to disk for this run
    bool degraded = false;  // source unusable, minimal fallback in use
    int skipped = 0;
    std::string error;
};

class MappingStore {
public:
    // Full compiled-in table, inactive typographic rows included.
    static const std::vector<MappingEntry>& DefaultTable();
    // Active subset of DefaultTable().
    static const MappingSet& Defaults();
    // {replacement character, BOM}
    static const MappingSet& Fallback();

    // "\uXXXX" or "\UXXXXXXXX" -> scalar value. Surrogates and values
    // above U+10FFFF are rejected.
    static bool ParseUnicodeEscape(const std::string& text, char32_t& out);

    // Accepts "true"/"false" in any case; anything else is rejected.
    static bool ParseRemoveFlag(const std::string& text, bool& out);

    // Parses CSV table text: Character, Unicode, Name, Remove[, Replacement].
    // Malformed rows are counted and skipped.
    static MappingParseResult Parse(const std::string& csv, bool verbose = false);

    // Removes entries whose replacement contains any character of the set,
    // so no pass can reintroduce a mapped character. Returns the count removed.
    static int DropConflictingReplacements(MappingSet& mappings, bool verbose = false);

    static std::string Serialize(const std::vector<MappingEntry>& table);

    // Never throws. Missing source: with createIfMissing the default table is
    // written and used, otherwise Fallback() is returned. Unreadable source
    // degrades to Fallback().
    static MappingLoadResult Load(const std::string& path, bool createIfMissing, bool verbose = false);
};

} // namespace uneff
