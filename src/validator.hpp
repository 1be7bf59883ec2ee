#pragma once
#include "event.hpp"
#include "types.hpp"
#include <string>
#include <map>
#include <memory>
#include <vector>
#include <optional>
#include <stdexcept>
#include <functional>
#include <nlohmann/json.hpp>

namespace guardrail {

struct ValidatorOutcome {
    Verdict verdict = Verdict::allow;
    std::string message;
    std::vector<Violation> violations;

    static ValidatorOutcome allow() { return {}; }
};

// Contract every hook implementation satisfies. Implementations hold no
// per-event state: run() may be called concurrently from several workers.
class Validator {
public:
    virtual ~Validator() = default;

    virtual std::string name() const = 0;

    // Cheap pre-filter on the event; the registry matcher runs first.
    virtual bool match(const ToolUseEvent& ev) const { return ev.has_file(); }

    virtual ValidatorOutcome run(const ToolUseEvent& ev) const = 0;

    virtual bool fixable() const { return false; }

    // Transformed file content, or nullopt when there is nothing to change.
    virtual std::optional<std::string> fix(const ToolUseEvent& ev, const std::string& content) const {
        (void)ev;
        (void)content;
        return std::nullopt;
    }
};

using ValidatorPtr = std::shared_ptr<const Validator>;

// Builds a validator from a hook's "options" object (may be null).
using ValidatorFactory = std::function<ValidatorPtr(const nlohmann::json& options)>;

// Closed set of validator kinds, populated once at startup.
class ValidatorSet {
public:
    void register_kind(const std::string& kind, ValidatorFactory factory) {
        factories_[kind] = std::move(factory);
    }

    bool has(const std::string& kind) const {
        return factories_.count(kind) > 0;
    }

    ValidatorPtr create(const std::string& kind, const nlohmann::json& options) const {
        auto it = factories_.find(kind);
        if (it == factories_.end()) {
            throw std::runtime_error("Unknown validator: " + kind);
        }
        return it->second(options);
    }

private:
    std::map<std::string, ValidatorFactory> factories_;
};

} // namespace guardrail
