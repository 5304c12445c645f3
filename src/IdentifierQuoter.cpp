#include "IdentifierQuoter.hpp"
#include "CapabilityMatrix.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace schemaforge {

namespace {

const std::unordered_set<std::string>& reservedKeywords() {
    static const std::unordered_set<std::string> keywords = {
        "SELECT", "FROM", "WHERE", "INSERT", "UPDATE", "DELETE", "CREATE", "DROP",
        "ALTER", "TABLE", "VIEW", "INDEX", "AND", "OR", "NOT", "NULL", "TRUE",
        "FALSE", "AS", "ON", "JOIN", "LEFT", "RIGHT", "INNER", "OUTER", "FULL",
        "ORDER", "BY", "GROUP", "HAVING", "LIMIT", "OFFSET", "UNION", "ALL",
        "DISTINCT", "INTO", "VALUES", "SET", "DEFAULT", "PRIMARY", "KEY",
        "FOREIGN", "REFERENCES", "CONSTRAINT", "UNIQUE", "CHECK", "CASE", "WHEN",
        "THEN", "ELSE", "END", "IF", "EXISTS", "IN", "BETWEEN", "LIKE", "IS",
        "USER", "ROLE", "GRANT", "REVOKE", "SCHEMA", "DATABASE", "PUBLIC",
        "POLICY", "USING", "FORCE", "TRIGGER", "FUNCTION", "PROCEDURE", "BEGIN",
        "AFTER", "BEFORE", "FOR", "EACH", "ROW", "STATEMENT", "RETURN", "RETURNS",
        "LANGUAGE", "IMMUTABLE", "STABLE", "VOLATILE", "COLUMN", "RENAME", "TO",
        "WITH", "EXECUTE", "DECLARE", "TRUNCATE", "CASCADE", "RESTRICT",
    };
    return keywords;
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

IdentifierQuoter::IdentifierQuoter(Dialect dialect)
    : m_dialect(dialect),
      m_open(capabilitiesFor(dialect).identifierQuoteChar),
      m_close(capabilitiesFor(dialect).identifierCloseChar) {
}

// ============================================================================
// Quoting
// ============================================================================

bool IdentifierQuoter::isReservedKeyword(const std::string& word) {
    std::string upper = word;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return reservedKeywords().count(upper) > 0;
}

bool IdentifierQuoter::needsQuoting(const std::string& segment) {
    if (segment.empty()) return true;
    if (!isIdentStart(segment[0])) return true;
    if (!std::all_of(segment.begin(), segment.end(), isIdentChar)) return true;
    return isReservedKeyword(segment);
}

std::string IdentifierQuoter::quoteAlways(const std::string& segment) const {
    std::string result;
    result.reserve(segment.size() + 2);
    result += m_open;
    for (char c : segment) {
        if (c == m_close) {
            result += m_close;
            result += m_close;
        } else {
            result += c;
        }
    }
    result += m_close;
    return result;
}

std::string IdentifierQuoter::quoteSegment(const std::string& segment) const {
    return needsQuoting(segment) ? quoteAlways(segment) : segment;
}

std::string IdentifierQuoter::quote(const std::string& name) const {
    std::string result;
    std::string::size_type start = 0;
    while (true) {
        auto dot = name.find('.', start);
        std::string segment = name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        result += quoteSegment(segment);
        if (dot == std::string::npos) break;
        result += '.';
        start = dot + 1;
    }
    return result;
}

std::string IdentifierQuoter::qualify(const std::optional<std::string>& schema,
                                      const std::string& name) const {
    if (schema && !schema->empty()) {
        return quoteSegment(*schema) + "." + quoteSegment(name);
    }
    return quoteSegment(name);
}

// ============================================================================
// Unquoting
// ============================================================================

std::vector<std::string> IdentifierQuoter::splitQuoted(const std::string& text) const {
    std::vector<std::string> segments;
    std::string current;
    bool inQuotes = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            current += c;
            if (c == m_close) {
                if (i + 1 < text.size() && text[i + 1] == m_close) {
                    current += text[++i];
                } else {
                    inQuotes = false;
                }
            }
        } else if (c == m_open && current.empty()) {
            current += c;
            inQuotes = true;
        } else if (c == '.') {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    segments.push_back(current);
    return segments;
}

std::string IdentifierQuoter::unquote(const std::string& text) const {
    std::string result;
    bool first = true;

    for (const auto& segment : splitQuoted(text)) {
        if (!first) result += '.';
        first = false;

        if (segment.size() >= 2 && segment.front() == m_open && segment.back() == m_close) {
            std::string inner = segment.substr(1, segment.size() - 2);
            std::string plain;
            plain.reserve(inner.size());
            for (size_t i = 0; i < inner.size(); ++i) {
                plain += inner[i];
                if (inner[i] == m_close && i + 1 < inner.size() && inner[i + 1] == m_close) {
                    ++i;
                }
            }
            result += plain;
        } else {
            result += segment;
        }
    }
    return result;
}

std::string escapeStringLiteral(const std::string& value) {
    std::string result;
    result.reserve(value.size() * 2);
    for (char c : value) {
        if (c == '\'') result += "''";
        else result += c;
    }
    return result;
}

}  // namespace schemaforge
