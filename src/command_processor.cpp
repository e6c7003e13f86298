#include "wwriter/command_processor.hpp"
#include <iostream>
#include <regex>
#include <sstream>
#include <cerrno>
#include <cstring>

#include <glib.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wwriter {

void CommandRegistry::add(const std::string& phrase, CommandHandler handler) {
    entries_.push_back({sanitize_text(phrase), std::move(handler)});
}

CommandProcessor::CommandProcessor(CommandRegistry registry)
    : registry_(std::move(registry)) {}

const CommandEntry* CommandProcessor::match(const std::string& sanitized) const {
    for (const auto& entry : registry_.entries()) {
        if (!entry.phrase.empty() && sanitized.find(entry.phrase) != std::string::npos) {
            return &entry;
        }
    }
    return nullptr;
}

CommandOutcome CommandProcessor::execute(const std::string& text) const {
    CommandOutcome outcome;
    outcome.text = text;

    const CommandEntry* entry = match(sanitize_text(text));
    if (!entry || !entry->handler) return outcome;

    std::cout << "Command detected: " << entry->phrase << std::endl;

    try {
        CommandOutcome handled = entry->handler(text);
        if (!handled.executed) {
            std::cerr << "Command '" << entry->phrase << "' failed" << std::endl;
            return outcome;
        }
        return handled;
    } catch (const std::exception& e) {
        std::cerr << "Error executing '" << entry->phrase << "' command: " << e.what() << std::endl;
        return outcome;
    }
}

std::string sanitize_text(const std::string& text) {
    gchar* valid = g_utf8_make_valid(text.c_str(), static_cast<gssize>(text.size()));

    // Any codepoint other than a letter, digit or '_' separates words
    std::string words;
    words.reserve(text.size());
    bool pending_space = false;
    for (const gchar* p = valid; *p; p = g_utf8_next_char(p)) {
        gunichar c = g_utf8_get_char(p);
        if (!g_unichar_isalnum(c) && c != '_') {
            pending_space = true;
            continue;
        }
        if (pending_space && !words.empty()) {
            words += ' ';
        }
        pending_space = false;
        words.append(p, g_utf8_next_char(p) - p);
    }
    g_free(valid);

    gchar* lower = g_utf8_strdown(words.c_str(), static_cast<gssize>(words.size()));
    std::string result(lower);
    g_free(lower);
    return result;
}

std::string remove_phrase(const std::string& text, const std::string& phrase) {
    static const std::regex special_chars(R"([.^$|()\[\]{}*+?\\])");

    // "wiz open edge" -> wiz\s+open\s+edge
    std::istringstream words(phrase);
    std::string word;
    std::string pattern;
    while (words >> word) {
        if (!pattern.empty()) pattern += R"(\s+)";
        pattern += std::regex_replace(word, special_chars, R"(\$&)");
    }
    if (pattern.empty()) return text;

    std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
    std::string result = std::regex_replace(text, re, "");

    size_t start = result.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = result.find_last_not_of(" \t\n\r");
    return result.substr(start, end - start + 1);
}

bool launch_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;

    // The grandchild reports exec failure through a close-on-exec pipe
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        std::cerr << "pipe failed: " << std::strerror(errno) << std::endl;
        return false;
    }

    pid_t child = fork();
    if (child < 0) {
        std::cerr << "fork failed: " << std::strerror(errno) << std::endl;
        close(fds[0]);
        close(fds[1]);
        return false;
    }

    if (child == 0) {
        close(fds[0]);
        setsid();
        pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? 1 : 0);
        }

        std::vector<char*> args;
        for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        int err = errno;
        ssize_t written = write(fds[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    close(fds[1]);

    int status = 0;
    while (waitpid(child, &status, 0) < 0 && errno == EINTR) {}

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(fds[0]);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::cerr << "Failed to launch " << argv[0] << std::endl;
        return false;
    }
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        std::cerr << "Failed to launch " << argv[0] << ": " << std::strerror(exec_errno) << std::endl;
        return false;
    }

    return true;
}

CommandHandler make_launch_command(const std::string& phrase, std::vector<std::string> argv) {
    return [phrase, argv](const std::string& transcription) {
        CommandOutcome outcome;
        outcome.text = transcription;

        if (!launch_detached(argv)) {
            return outcome;
        }

        outcome.executed = true;
        outcome.text = remove_phrase(transcription, phrase);
        return outcome;
    };
}

void register_default_commands(CommandRegistry& registry) {
    // Opens Microsoft Edge
    registry.add("wiz open edge", make_launch_command("wiz open edge", {"microsoft-edge"}));
}

} // namespace wwriter
