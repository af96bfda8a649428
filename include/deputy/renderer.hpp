#pragma once

/**
 * @file renderer.hpp
 * @brief Writes command results as tables, JSON documents or JSON Lines
 *
 * A Renderer is built once per invocation from the resolved RenderOptions.
 * In JSON mode single values are pretty-printed, lists are wrapped in an
 * {"items": [...], "meta": {...}} envelope, and raw mode streams one compact
 * value per line. A --query filter is compiled before anything is written
 * and applied to the document that would otherwise have been printed.
 *
 * @example
 * ```cpp
 * deputy::Renderer r(std::cout, opts);
 * if (r.options().json()) {
 *     auto res = r.output_list(items);
 * } else {
 *     r.table({"ID", "NAME"}, rows);
 * }
 * ```
 */

#include "deputy/errors.hpp"
#include "deputy/output.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

namespace deputy {

// ============================================================================
// Table Writer
// ============================================================================

/**
 * @brief Column-aligned text table
 *
 * Rows are buffered until flush(). Columns are separated by two spaces and
 * the last column is never padded. Widths are measured in code points so
 * non-ASCII names line up.
 */
class TableWriter {
public:
    TableWriter(std::ostream& out, bool color) : out_(out), color_(color) {}

    void header(std::vector<std::string> columns);
    void row(std::vector<std::string> cells);
    void flush();

private:
    std::ostream& out_;
    bool color_;
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
};

// Number of code points in a UTF-8 string.
size_t display_width(const std::string& s);

// ============================================================================
// Renderer
// ============================================================================

class Renderer {
public:
    Renderer(std::ostream& out, RenderOptions options)
        : out_(out), options_(std::move(options)) {}

    const RenderOptions& options() const { return options_; }

    // Write a single value. In JSON mode a null or empty value with
    // fail_on_empty set returns the empty-result error and prints nothing.
    // In text mode the value is written as indented JSON.
    Result<void> output(const nlohmann::json& value);

    // Write a list (a JSON array). Envelope in JSON mode, JSON Lines in raw
    // mode. Text callers use table() instead.
    Result<void> output_list(const nlohmann::json& items);

    // Text table with a header row. An empty row set prints the header only.
    void table(const std::vector<std::string>& headers,
               const std::vector<std::vector<std::string>>& rows);

    // {"count": N, "limit": L, "offset": O} with limit/offset only when > 0.
    nlohmann::json list_meta(size_t count) const;

private:
    Result<void> write_document(const nlohmann::json& document, bool is_list);
    void write_value(const nlohmann::json& value, bool compact);

    std::ostream& out_;
    RenderOptions options_;
};

// ============================================================================
// Pagination
// ============================================================================

/**
 * @brief Client-side paging for endpoints that return everything
 *
 * Drops the first `offset` items, then keeps at most `limit` items when
 * `limit` is positive.
 */
template<typename T>
std::vector<T> apply_pagination(std::vector<T> items, int offset, int limit) {
    if (offset > 0) {
        if (static_cast<size_t>(offset) >= items.size()) {
            return {};
        }
        items.erase(items.begin(), items.begin() + offset);
    }
    if (limit > 0 && static_cast<size_t>(limit) < items.size()) {
        items.erase(items.begin() + limit, items.end());
    }
    return items;
}

} // namespace deputy
