#include "builtin_validators.hpp"
#include "../utils.hpp"
#include <atomic>
#include <array>
#include <cstdio>
#include <stdexcept>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#include <process.h>
#define getpid _getpid
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace guardrail {

// Scratch files for one command invocation, removed on scope exit.
struct CommandScratch {
    std::string input;
    std::string errors;

    CommandScratch() {
        static std::atomic<int> counter{0};
        auto base = fs::temp_directory_path() /
                    ("guardrail-" + std::to_string(getpid()) + "-" + std::to_string(counter++));
        input = base.string() + ".json";
        errors = base.string() + ".err";
    }
    ~CommandScratch() {
        std::error_code ec;
        fs::remove(input, ec);
        fs::remove(errors, ec);
    }
    CommandScratch(const CommandScratch&) = delete;
    CommandScratch& operator=(const CommandScratch&) = delete;
};

static std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    size_t start = s.find_first_not_of(" \r\n");
    return start == std::string::npos ? "" : s.substr(start);
}

// Single-quoted for sh, embedded quotes escaped as '\''
static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

// External hook: the event JSON goes to stdin. Exit 0 allows (stdout may
// carry {"verdict":"warn","message":...}), exit 2 blocks with stderr as the
// message, anything else is a fault.
class CommandValidator : public Validator {
public:
    CommandValidator(std::string command, int kill_after_sec)
        : command_(std::move(command)), kill_after_sec_(kill_after_sec) {}

    std::string name() const override { return "command"; }

    bool match(const ToolUseEvent&) const override { return true; }

    ValidatorOutcome run(const ToolUseEvent& ev) const override {
        CommandScratch scratch;
        if (!write_file(scratch.input, dump_json(ev.to_json()))) {
            throw std::runtime_error("cannot stage hook input at " + scratch.input);
        }

        // Grouped so the redirections cover every command in a compound line.
        std::string full_cmd = "(" + command_ + ") < \"" + scratch.input + "\" 2> \"" + scratch.errors + "\"";
#ifndef _WIN32
        // Hung hooks are ignored by the executor; this reaps them eventually.
        if (kill_after_sec_ > 0) {
            full_cmd = "timeout " + std::to_string(kill_after_sec_) + " sh -c " + shell_quote(full_cmd);
        }
#endif

        FILE* pipe = popen(full_cmd.c_str(), "r");
        if (!pipe) throw std::runtime_error("failed to launch: " + command_);

        std::string output;
        std::array<char, 4096> buf;
        while (auto n = std::fread(buf.data(), 1, buf.size(), pipe)) {
            output.append(buf.data(), n);
        }
        int status = pclose(pipe);
#ifndef _WIN32
        if (WIFEXITED(status)) status = WEXITSTATUS(status);
        else status = -1;
#endif
        std::string errors = trim(read_file(scratch.errors));

        if (status == 2) {
            ValidatorOutcome out;
            out.verdict = Verdict::block;
            out.message = errors.empty() ? "Blocked by hook command: " + command_ : errors;
            return out;
        }
        if (status != 0) {
            throw std::runtime_error("hook command exited with status " + std::to_string(status) +
                                     (errors.empty() ? "" : ": " + errors.substr(0, 200)));
        }

        output = trim(output);
        if (output.empty() || output[0] != '{') return ValidatorOutcome::allow();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(output);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("malformed hook output: ") + e.what());
        }
        ValidatorOutcome out;
        auto verdict = parse_verdict(j.value("verdict", std::string("allow")));
        if (!verdict) throw std::runtime_error("hook output has an unknown verdict");
        out.verdict = *verdict;
        out.message = j.value("message", std::string());
        return out;
    }

private:
    std::string command_;
    int kill_after_sec_;
};

void register_command_validator(ValidatorSet& set) {
    set.register_kind("command", [](const nlohmann::json& options) -> ValidatorPtr {
        std::string command = options.is_object() ? options.value("command", std::string()) : "";
        if (command.empty()) throw std::runtime_error("command hook requires a \"command\" string");
        int kill_after = options.value("killAfterSec", 30);
        return std::make_shared<CommandValidator>(std::move(command), kill_after);
    });
}

} // namespace guardrail
