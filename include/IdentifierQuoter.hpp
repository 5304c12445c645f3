#pragma once

/**
 * @file IdentifierQuoter.hpp
 * @brief Dialect-aware identifier quoting and escaping.
 *
 * Every identifier that ends up in generated SQL passes through this class.
 * An identifier is quoted only when it has to be:
 * - it is empty
 * - its first character is not a letter or underscore
 * - it contains a character outside [A-Za-z0-9_]
 * - its uppercased form is a reserved keyword
 *
 * Quote Characters:
 * - PostgreSQL, SQLite: "name"   (embedded " doubled)
 * - MySQL:              `name`   (embedded ` doubled)
 * - SQL Server:         [name]   (embedded ] doubled)
 *
 * Compound names such as schema.table are quoted one segment at a time.
 */

#include "Dialect.hpp"
#include <optional>
#include <string>
#include <vector>

namespace schemaforge {

class IdentifierQuoter {
public:
    explicit IdentifierQuoter(Dialect dialect);

    /**
     * @brief Quote a possibly dotted identifier, segment by segment.
     * @param name Identifier such as "users" or "app.users".
     * @return Identifier safe to embed in SQL text.
     */
    std::string quote(const std::string& name) const;

    /**
     * @brief Quote a single identifier segment if it needs quoting.
     *
     * Dots are not treated as separators.
     */
    std::string quoteSegment(const std::string& segment) const;

    /**
     * @brief Unconditionally wrap a single segment in quote characters.
     */
    std::string quoteAlways(const std::string& segment) const;

    /**
     * @brief Build schema.name with both parts quoted.
     * @param schema Optional schema; when empty only the name is quoted.
     * @param name Object name.
     */
    std::string qualify(const std::optional<std::string>& schema,
                        const std::string& name) const;

    /**
     * @brief Strip quoting from a dotted identifier.
     *
     * Inverse of quote(): removes the quote characters of each segment and
     * un-doubles escaped quote characters. Dots inside a quoted segment are
     * kept as part of that segment.
     */
    std::string unquote(const std::string& text) const;

    // Check a single segment against the quoting rules
    static bool needsQuoting(const std::string& segment);

    // Case-insensitive lookup in the reserved keyword set
    static bool isReservedKeyword(const std::string& word);

    Dialect dialect() const { return m_dialect; }
    char openChar() const { return m_open; }
    char closeChar() const { return m_close; }

private:
    std::vector<std::string> splitQuoted(const std::string& text) const;

    Dialect m_dialect;
    char m_open;
    char m_close;
};

// Escape a string literal body for single-quoted SQL ('O''Brien')
std::string escapeStringLiteral(const std::string& value);

}  // namespace schemaforge
