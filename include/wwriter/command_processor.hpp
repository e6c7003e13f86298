#pragma once

#include <string>
#include <vector>
#include <functional>

namespace wwriter {

struct CommandOutcome {
    bool executed = false;
    std::string text;       // Transcription with the command phrase removed
};

// Receives the original (unsanitized) transcription
using CommandHandler = std::function<CommandOutcome(const std::string& transcription)>;

struct CommandEntry {
    std::string phrase;     // Sanitized, lowercase
    CommandHandler handler;
};

// Ordered list of voice commands. Registration order decides which command
// fires when several phrases match.
class CommandRegistry {
public:
    void add(const std::string& phrase, CommandHandler handler);

    const std::vector<CommandEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<CommandEntry> entries_;
};

class CommandProcessor {
public:
    CommandProcessor() = default;
    explicit CommandProcessor(CommandRegistry registry);

    // Detect and run at most one command. Without a match the text is returned unchanged.
    CommandOutcome execute(const std::string& text) const;

    // First registered entry whose phrase occurs in the sanitized text
    const CommandEntry* match(const std::string& sanitized) const;

    const CommandRegistry& registry() const { return registry_; }

private:
    CommandRegistry registry_;
};

// Lowercase, punctuation to spaces, whitespace collapsed and trimmed
std::string sanitize_text(const std::string& text);

// Case-insensitive removal of every occurrence of phrase (words may be
// separated by any whitespace), result trimmed
std::string remove_phrase(const std::string& text, const std::string& phrase);

// Start a detached process. Returns false if it could not be executed.
bool launch_detached(const std::vector<std::string>& argv);

// Handler that launches argv and strips phrase from the transcription
CommandHandler make_launch_command(const std::string& phrase, std::vector<std::string> argv);

// Built-in commands ("wiz open edge")
void register_default_commands(CommandRegistry& registry);

} // namespace wwriter
