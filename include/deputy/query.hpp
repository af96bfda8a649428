#pragma once

/**
 * @file query.hpp
 * @brief jq filters over JSON output
 *
 * A thin wrapper over libjq. Documents cross the boundary as serialized
 * JSON, so results carry jq's own semantics (number handling, key order,
 * error texts).
 *
 * @example
 * ```cpp
 * auto q = deputy::Query::compile(".items[] | {Id, name: .DisplayName}");
 * if (q.isOk()) {
 *     auto out = q.value().run(document);
 * }
 * ```
 */

#include "deputy/errors.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace deputy {

class Query {
public:
    // Compile an expression. Syntax errors are INVALID_INPUT errors whose
    // message starts with "invalid jq query".
    static Result<Query> compile(const std::string& expression);

    // Run the filter. A filter may produce zero, one or many outputs.
    // Runtime failures (e.g. indexing a number) are GENERAL errors whose
    // message starts with "jq: ".
    Result<std::vector<nlohmann::json>> run(const nlohmann::json& input) const;

    const std::string& expression() const { return expression_; }

private:
    struct State;

    Query(std::string expression, std::shared_ptr<State> state)
        : expression_(std::move(expression)), state_(std::move(state)) {}

    std::string expression_;
    std::shared_ptr<State> state_;
};

} // namespace deputy
