#include "deputy/query.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <jq.h>
}

namespace deputy {

using json = nlohmann::json;

namespace {

// Text of a jv message. Consumes the value.
std::string message_text(jv message) {
    if (jv_get_kind(message) == JV_KIND_STRING) {
        std::string text = jv_string_value(message);
        jv_free(message);
        return text;
    }
    jv dumped = jv_dump_string(message, 0);
    std::string text = jv_string_value(dumped);
    jv_free(dumped);
    return text;
}

void collect_message(void* data, jv message) {
    static_cast<std::vector<std::string>*>(data)->push_back(message_text(message));
}

// First compile diagnostic without the "jq: error: " prefix or the echoed
// program text.
std::string compile_reason(const std::vector<std::string>& messages) {
    if (messages.empty()) {
        return "compile error";
    }
    std::string reason = messages.front();
    const std::string prefix = "jq: error: ";
    if (reason.compare(0, prefix.size(), prefix) == 0) {
        reason.erase(0, prefix.size());
    }
    auto newline = reason.find('\n');
    if (newline != std::string::npos) {
        reason.erase(newline);
    }
    while (!reason.empty() && (reason.back() == ':' || reason.back() == ' ')) {
        reason.pop_back();
    }
    return reason;
}

} // namespace

// One compiled program. jq_state is reset by every jq_start, so a Query can
// run any number of documents in sequence.
struct Query::State {
    jq_state* jq = nullptr;
    std::vector<std::string> messages;

    State() = default;
    State(const State&) = delete;
    State& operator=(const State&) = delete;

    ~State() {
        if (jq) jq_teardown(&jq);
    }
};

Result<Query> Query::compile(const std::string& expression) {
    auto state = std::make_shared<State>();
    state->jq = jq_init();
    if (!state->jq) {
        return Result<Query>::err(Error(ErrorCode::GENERAL, "jq: failed to initialize"));
    }
    jq_set_error_cb(state->jq, collect_message, &state->messages);

    if (!jq_compile(state->jq, expression.c_str())) {
        for (const auto& m : state->messages) {
            spdlog::debug("jq: {}", m);
        }
        return Result<Query>::err(Error(ErrorCode::INVALID_INPUT,
            "invalid jq query: " + compile_reason(state->messages)));
    }
    state->messages.clear();
    return Result<Query>::ok(Query(expression, std::move(state)));
}

Result<std::vector<json>> Query::run(const json& input) const {
    using R = Result<std::vector<json>>;

    std::string text = input.dump(-1, ' ', false, json::error_handler_t::replace);
    jv document = jv_parse_sized(text.data(), static_cast<int>(text.size()));
    if (!jv_is_valid(document)) {
        jv message = jv_invalid_get_msg(document);
        std::string reason = jv_get_kind(message) == JV_KIND_NULL
            ? (jv_free(message), std::string("input is not valid JSON"))
            : message_text(message);
        return R::err(Error(ErrorCode::GENERAL, "jq: " + reason));
    }

    state_->messages.clear();
    jq_start(state_->jq, document, 0);

    std::vector<json> results;
    while (true) {
        jv out = jq_next(state_->jq);
        if (!jv_is_valid(out)) {
            if (jv_invalid_has_msg(jv_copy(out))) {
                return R::err(Error(ErrorCode::GENERAL,
                    "jq: " + message_text(jv_invalid_get_msg(out))));
            }
            jv_free(out);
            break;
        }

        jv dumped = jv_dump_string(out, 0);
        json value = json::parse(jv_string_value(dumped), nullptr, false);
        jv_free(dumped);
        if (value.is_discarded()) {
            return R::err(Error(ErrorCode::GENERAL, "jq: result is not valid JSON"));
        }
        results.push_back(std::move(value));
    }

    return R::ok(std::move(results));
}

} // namespace deputy
