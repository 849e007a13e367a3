#include "sync/Transcript.hpp"

#include <fmt/core.h>

namespace compass::sync {

void Transcript::section(const std::string& title) {
    if (!text_.empty() && text_.back() != '\n') text_ += '\n';
    if (!text_.empty()) text_ += '\n';
    text_ += fmt::format("=== {} ===\n", title);
}

void Transcript::note(const std::string& line) {
    text_ += line;
    text_ += '\n';
}

void Transcript::record(const std::vector<std::string>& args, const ExecResult& result) {
    text_ += fmt::format("$ {}\n", commandLine(args));
    if (result.timed_out) text_ += "timed out, process killed\n";
    text_ += fmt::format("return code: {}\n", result.exit_code);

    const auto block = [this](const char* label, const std::string& body) {
        if (body.empty()) return;
        text_ += fmt::format("{}:\n{}", label, body);
        if (body.back() != '\n') text_ += '\n';
    };
    block("stdout", result.stdout_text);
    block("stderr", result.stderr_text);
}

std::string Transcript::commandLine(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        if (!a.empty() && a.find_first_of(" \t\n'\"\\$`") == std::string::npos) {
            out += a;
            continue;
        }
        out += '\'';
        for (const char c : a) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += '\'';
    }
    return out;
}

}
