#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace docgate::frontmatter {

/**
 * @brief One metadata value as written, before schema checks.
 *
 * YAML scalars are typed the way a YAML 1.2 core-schema loader would type
 * them; TOML values keep their native type.
 */
struct RawValue {
    enum class Kind { NIL, STRING, BOOLEAN, INTEGER, FLOAT, LIST, TABLE };

    Kind kind = Kind::NIL;
    std::string text;                   // scalar text (STRING, INTEGER, FLOAT)
    bool boolean = false;
    int64_t integer = 0;
    std::vector<std::string> items;     // LIST elements, stringified
};

using RawFields = std::map<std::string, RawValue>;

enum class BlockStyle { NONE, YAML, TOML };

struct SplitResult {
    BlockStyle style = BlockStyle::NONE;
    std::string_view block;     // between the fences
    std::string_view body;      // everything after the closing fence
};

/**
 * @brief Locate a leading "---" (YAML) or "+++" (TOML) fenced block.
 *
 * A leading UTF-8 BOM is skipped. An opening fence with no closing fence
 * is not a metadata block; the whole input is body.
 */
[[nodiscard]] SplitResult split(std::string_view raw);

/// Returns false and sets @p error on a malformed block.
[[nodiscard]] bool parse_yaml(std::string_view block, RawFields& out, std::string& error);
[[nodiscard]] bool parse_toml(std::string_view block, RawFields& out, std::string& error);

/**
 * @brief Apply raw fields to DocumentMetadata.
 * @return Schema problems (invalid sensitivity, wrong field types), in
 *         field order. Missing sensitivity is not reported here.
 */
[[nodiscard]] std::vector<std::string> apply_fields(const RawFields& fields,
                                                    DocumentMetadata& metadata);

/**
 * @brief Parse a raw document into metadata + body.
 *
 * Never throws. A syntax error in the block leaves the metadata at its
 * defaults and is recorded in Document::metadata_errors.
 */
[[nodiscard]] Document parse_document(std::string path, std::string raw_content);

} // namespace docgate::frontmatter
