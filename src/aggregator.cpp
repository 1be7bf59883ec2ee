#include "aggregator.hpp"
#include "utils.hpp"
#include <algorithm>
#include <set>
#include <tuple>

namespace guardrail {

namespace {

const std::string kTruncated = " [truncated]";

// text cut to at most max_chars bytes, on a UTF-8 boundary, marked as cut
// whenever the budget leaves room for the marker.
std::string truncate_message(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    if (max_chars <= kTruncated.size()) return utf8_prefix(text, max_chars);
    return utf8_prefix(text, max_chars - kTruncated.size()) + kTruncated;
}

struct Entry {
    Priority priority;
    std::string family;
    std::string hook;
    std::string text;

    bool operator<(const Entry& o) const {
        return std::tie(priority, family, hook, text) < std::tie(o.priority, o.family, o.hook, o.text);
    }
};

std::string message_of(const ExecutionResult& r) {
    if (!r.message.empty()) return r.message;
    std::string joined;
    for (auto& v : r.violations) {
        if (v.message.empty()) continue;
        if (!joined.empty()) joined += "; ";
        joined += v.message;
    }
    if (!joined.empty()) return joined;
    return "Hook '" + r.hook_name + "' reported " + to_string(r.verdict);
}

} // namespace

Decision aggregate(const std::vector<ExecutionResult>& results, const MessageLimits& limits) {
    Decision d;
    std::vector<Entry> entries;

    for (auto& r : results) {
        if (r.faulted()) {
            d.faults.push_back(r.hook_name);
            continue;
        }
        if (r.verdict == Verdict::allow) continue;
        d.verdict = std::max(d.verdict, r.verdict);
        d.contributing_hooks.push_back(r.hook_name);
        entries.push_back({r.priority, r.family, r.hook_name, message_of(r)});
    }

    std::sort(d.faults.begin(), d.faults.end());
    std::sort(d.contributing_hooks.begin(), d.contributing_hooks.end());
    std::sort(entries.begin(), entries.end());

    std::set<std::string> seen;
    std::vector<std::string> unique;
    for (auto& e : entries) {
        if (seen.insert(e.text).second) unique.push_back(e.text);
    }

    size_t max_messages = static_cast<size_t>(std::max(1, limits.max_messages));
    size_t max_chars = static_cast<size_t>(std::max(1, limits.max_chars));
    size_t chars = 0;
    for (auto& text : unique) {
        if (d.messages.size() >= max_messages) break;
        // The first message always fits, cut to the budget if need be.
        if (d.messages.empty() && text.size() > max_chars) {
            d.messages.push_back(truncate_message(text, max_chars));
            chars = max_chars;
            continue;
        }
        if (chars + text.size() > max_chars) break;
        chars += text.size();
        d.messages.push_back(text);
    }
    if (d.messages.size() < unique.size()) {
        d.messages.push_back("+" + std::to_string(unique.size() - d.messages.size()) + " more");
    }
    return d;
}

} // namespace guardrail
