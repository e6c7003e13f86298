// Automated tests for voice command detection

#include "wwriter/command_processor.hpp"
#include <iostream>
#include <cassert>
#include <stdexcept>

using namespace wwriter;

// Handler that records its calls and strips its phrase
CommandHandler counting_handler(const std::string& phrase, int& calls) {
    return [phrase, &calls](const std::string& transcription) {
        ++calls;
        CommandOutcome outcome;
        outcome.executed = true;
        outcome.text = remove_phrase(transcription, phrase);
        return outcome;
    };
}

void test_sanitize() {
    std::cout << "Testing text sanitization..." << std::endl;

    assert(sanitize_text("Wiz, open Edge!") == "wiz open edge");
    assert(sanitize_text("  Wiz...open   EDGE  ") == "wiz open edge");
    assert(sanitize_text("snake_case stays") == "snake_case stays");
    assert(sanitize_text("?!.") == "");
    assert(sanitize_text("Caf\xc3\xa9 time") == "caf\xc3\xa9 time");
    assert(sanitize_text("\xc3\x89" "COUTE \xc3\x87" "A") == "\xc3\xa9" "coute \xc3\xa7" "a");

    std::cout << "  PASS" << std::endl;
}

// Whisper output often carries typographic punctuation
void test_sanitize_unicode_punctuation() {
    std::cout << "Testing sanitization of Unicode punctuation..." << std::endl;

    assert(sanitize_text("Wiz\xe2\x80\xa6 open edge") == "wiz open edge");      // ellipsis
    assert(sanitize_text("wiz\xe2\x80\x94open edge") == "wiz open edge");       // em dash
    assert(sanitize_text("\xe2\x80\x9cWiz open edge.\xe2\x80\x9d") == "wiz open edge");
    assert(sanitize_text("wiz\xc2\xa0open\xc2\xa0edge") == "wiz open edge");   // no-break space
    assert(sanitize_text("\xe2\x80\xa6") == "");

    int calls = 0;
    CommandRegistry registry;
    registry.add("wiz open edge", counting_handler("wiz open edge", calls));
    CommandProcessor processor(std::move(registry));

    assert(processor.execute("Wiz\xe2\x80\xa6 open edge.").executed);
    assert(processor.execute("wiz\xe2\x80\x94open edge").executed);
    assert(calls == 2);

    std::cout << "  PASS" << std::endl;
}

void test_no_match_returns_text_unchanged() {
    std::cout << "Testing no command match..." << std::endl;

    int calls = 0;
    CommandRegistry registry;
    registry.add("wiz open edge", counting_handler("wiz open edge", calls));
    CommandProcessor processor(std::move(registry));

    CommandOutcome outcome = processor.execute("Hello, World.");
    assert(!outcome.executed);
    assert(outcome.text == "Hello, World.");
    assert(calls == 0);

    std::cout << "  PASS" << std::endl;
}

void test_match_ignores_case_and_punctuation() {
    std::cout << "Testing command match..." << std::endl;

    int calls = 0;
    CommandRegistry registry;
    registry.add("Wiz open edge", counting_handler("wiz open edge", calls));
    CommandProcessor processor(std::move(registry));

    CommandOutcome outcome = processor.execute("Wiz, open Edge please");
    assert(outcome.executed);
    assert(calls == 1);
    // Phrase removal is literal, punctuation between words blocks it
    assert(outcome.text == "Wiz, open Edge please");

    outcome = processor.execute("Please WIZ OPEN   EDGE.");
    assert(outcome.executed);
    assert(calls == 2);
    assert(outcome.text == "Please .");

    std::cout << "  PASS" << std::endl;
}

void test_first_registered_match_wins() {
    std::cout << "Testing registration order..." << std::endl;

    int edge_calls = 0;
    int open_calls = 0;
    CommandRegistry registry;
    registry.add("wiz open edge", counting_handler("wiz open edge", edge_calls));
    registry.add("wiz open", counting_handler("wiz open", open_calls));
    CommandProcessor processor(std::move(registry));

    // Both phrases occur; only the first registered runs
    CommandOutcome outcome = processor.execute("wiz open edge");
    assert(outcome.executed);
    assert(edge_calls == 1);
    assert(open_calls == 0);
    assert(outcome.text.empty());

    outcome = processor.execute("wiz open the door");
    assert(edge_calls == 1);
    assert(open_calls == 1);
    assert(outcome.text == "the door");

    std::cout << "  PASS" << std::endl;
}

void test_failing_handler_keeps_text() {
    std::cout << "Testing failing command handler..." << std::endl;

    CommandRegistry registry;
    registry.add("wiz crash", [](const std::string&) -> CommandOutcome {
        throw std::runtime_error("boom");
    });
    registry.add("wiz fail", [](const std::string&) {
        return CommandOutcome{false, "ignored"};
    });
    CommandProcessor processor(std::move(registry));

    CommandOutcome outcome = processor.execute("Wiz crash now");
    assert(!outcome.executed);
    assert(outcome.text == "Wiz crash now");

    outcome = processor.execute("wiz fail");
    assert(!outcome.executed);
    assert(outcome.text == "wiz fail");

    std::cout << "  PASS" << std::endl;
}

void test_remove_phrase() {
    std::cout << "Testing phrase removal..." << std::endl;

    assert(remove_phrase("Wiz open edge and search", "wiz open edge") == "and search");
    assert(remove_phrase("go WIZ\topen\n edge", "wiz open edge") == "go");
    assert(remove_phrase("wiz open edge wiz open edge", "wiz open edge") == "");
    assert(remove_phrase("nothing here", "wiz open edge") == "nothing here");
    // Regex metacharacters in a phrase are literal
    assert(remove_phrase("say a+b now", "a+b") == "say  now");

    std::cout << "  PASS" << std::endl;
}

void test_launch_missing_program() {
    std::cout << "Testing launch of missing program..." << std::endl;

    assert(!launch_detached({}));
    assert(!launch_detached({"/nonexistent/wwriter-test-binary"}));

    // A launch failure leaves the transcription alone
    CommandRegistry registry;
    registry.add("wiz run", make_launch_command("wiz run", {"/nonexistent/wwriter-test-binary"}));
    CommandProcessor processor(std::move(registry));

    CommandOutcome outcome = processor.execute("wiz run it");
    assert(!outcome.executed);
    assert(outcome.text == "wiz run it");

    std::cout << "  PASS" << std::endl;
}

void test_launch_existing_program() {
    std::cout << "Testing launch of existing program..." << std::endl;

    CommandRegistry registry;
    registry.add("wiz run", make_launch_command("wiz run", {"true"}));
    CommandProcessor processor(std::move(registry));

    CommandOutcome outcome = processor.execute("Wiz run it");
    assert(outcome.executed);
    assert(outcome.text == "it");

    std::cout << "  PASS" << std::endl;
}

void test_default_commands() {
    std::cout << "Testing default commands..." << std::endl;

    CommandRegistry registry;
    register_default_commands(registry);
    assert(registry.size() == 1);
    assert(registry.entries()[0].phrase == "wiz open edge");

    CommandProcessor processor(std::move(registry));
    assert(processor.match("please wiz open edge") != nullptr);
    assert(processor.match("wiz open") == nullptr);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Command Processor Test Suite ===" << std::endl << std::endl;

    test_sanitize();
    test_sanitize_unicode_punctuation();
    test_no_match_returns_text_unchanged();
    test_match_ignores_case_and_punctuation();
    test_first_registered_match_wins();
    test_failing_handler_keeps_text();
    test_remove_phrase();
    test_launch_missing_program();
    test_launch_existing_program();
    test_default_commands();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
