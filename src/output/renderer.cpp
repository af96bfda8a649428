#include "deputy/renderer.hpp"
#include "deputy/query.hpp"

#include <spdlog/spdlog.h>

namespace deputy {

namespace {

const char* const kBold = "\033[1m";
const char* const kReset = "\033[0m";

std::string dump(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool is_empty_value(const nlohmann::json& value) {
    if (value.is_null()) return true;
    if (value.is_array() || value.is_object()) return value.empty();
    return false;
}

} // namespace

// ============================================================================
// Table Writer
// ============================================================================

size_t display_width(const std::string& s) {
    size_t width = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++width;
    }
    return width;
}

void TableWriter::header(std::vector<std::string> columns) {
    header_ = std::move(columns);
}

void TableWriter::row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

void TableWriter::flush() {
    size_t ncols = header_.size();
    for (const auto& r : rows_) ncols = std::max(ncols, r.size());
    if (ncols == 0) return;

    std::vector<size_t> widths(ncols, 0);
    auto measure = [&widths](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    measure(header_);
    for (const auto& r : rows_) measure(r);

    auto write_line = [&](const std::vector<std::string>& cells, bool is_header) {
        std::string line;
        for (size_t i = 0; i < cells.size(); ++i) {
            line += cells[i];
            if (i + 1 < cells.size()) {
                line.append(widths[i] - display_width(cells[i]) + 2, ' ');
            }
        }
        if (is_header && color_) {
            out_ << kBold << line << kReset << "\n";
        } else {
            out_ << line << "\n";
        }
    };

    if (!header_.empty()) write_line(header_, true);
    for (const auto& r : rows_) write_line(r, false);
    out_.flush();

    rows_.clear();
}

// ============================================================================
// Renderer
// ============================================================================

nlohmann::json Renderer::list_meta(size_t count) const {
    nlohmann::json meta;
    meta["count"] = count;
    if (options_.limit && *options_.limit > 0) meta["limit"] = *options_.limit;
    if (options_.offset && *options_.offset > 0) meta["offset"] = *options_.offset;
    return meta;
}

Result<void> Renderer::output(const nlohmann::json& value) {
    if (!options_.json()) {
        out_ << dump(value, 2) << "\n";
        return Result<void>::ok();
    }
    return write_document(value, false);
}

Result<void> Renderer::output_list(const nlohmann::json& items) {
    if (!options_.json()) {
        // Text callers render tables themselves; fall back to JSON.
        out_ << dump(items, 2) << "\n";
        return Result<void>::ok();
    }

    if (options_.raw) {
        return write_document(items, true);
    }

    nlohmann::json envelope;
    envelope["items"] = items.is_array() ? items : nlohmann::json::array();
    envelope["meta"] = list_meta(envelope["items"].size());
    return write_document(envelope, true);
}

Result<void> Renderer::write_document(const nlohmann::json& document, bool is_list) {
    std::optional<Query> query;
    if (options_.query && !options_.query->empty()) {
        auto compiled = Query::compile(*options_.query);
        if (compiled.isErr()) {
            return Result<void>::err(compiled.error());
        }
        query = std::move(compiled.value());
    }

    if (options_.fail_on_empty) {
        const nlohmann::json& subject = (is_list && document.contains("items")) && !options_.raw
            ? document["items"]
            : document;
        if (is_empty_value(subject)) {
            spdlog::debug("empty result with --fail-empty, nothing written");
            return Result<void>::err(Error::emptyResult());
        }
    }

    if (query) {
        auto results = query->run(document);
        if (results.isErr()) {
            return Result<void>::err(results.error());
        }
        spdlog::debug("query '{}' produced {} result(s)", query->expression(), results.value().size());
        for (const auto& r : results.value()) {
            write_value(r, options_.raw);
        }
        return Result<void>::ok();
    }

    if (options_.raw && document.is_array()) {
        for (const auto& item : document) {
            write_value(item, true);
        }
        return Result<void>::ok();
    }

    write_value(document, options_.raw);
    return Result<void>::ok();
}

void Renderer::write_value(const nlohmann::json& value, bool compact) {
    // JSON Lines consumers read line by line, so flush each one.
    if (compact) {
        out_ << dump(value, -1) << "\n";
        out_.flush();
    } else {
        out_ << dump(value, 2) << "\n";
    }
}

void Renderer::table(const std::vector<std::string>& headers,
                     const std::vector<std::vector<std::string>>& rows) {
    TableWriter tw(out_, options_.color && !options_.json());
    tw.header(headers);
    for (const auto& r : rows) {
        tw.row(r);
    }
    tw.flush();
}

} // namespace deputy
