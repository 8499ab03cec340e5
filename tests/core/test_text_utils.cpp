/**
 * test_text_utils.cpp - Unit tests for normalization, hashing and base64
 */

#include "vsp/core/TextUtils.hpp"
#include "vsp/core/Types.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace vsp::core;

void test_normalize() {
    assert(normalizeUtterance("  Find   Organic Milk. ") == "find organic milk");
    assert(normalizeUtterance("find organic milk") == "find organic milk");
    assert(normalizeUtterance("What's on sale?!") == "what's on sale");
    assert(normalizeUtterance("eggs,") == "eggs");
    assert(normalizeUtterance("   ").empty());
    assert(normalizeUtterance("").empty());

    std::cout << "[PASS] test_normalize" << std::endl;
}

void test_hash_equivalence() {
    assert(hashText(normalizeUtterance("Find organic milk.")) ==
           hashText(normalizeUtterance("find  organic milk")));
    assert(hashText("find organic milk") != hashText("find organic eggs"));
    // FNV-1a offset basis
    assert(hashText("") == 14695981039346656037ULL);

    std::cout << "[PASS] test_hash_equivalence" << std::endl;
}

void test_terminal_punctuation() {
    assert(endsWithTerminalPunctuation("Find organic milk."));
    assert(endsWithTerminalPunctuation("really?  "));
    assert(endsWithTerminalPunctuation("stop!"));
    assert(!endsWithTerminalPunctuation("find organic"));
    assert(!endsWithTerminalPunctuation("milk,"));
    assert(!endsWithTerminalPunctuation(""));

    std::cout << "[PASS] test_terminal_punctuation" << std::endl;
}

void test_trim_and_join() {
    assert(trim("  a b  ") == "a b");
    assert(trim("\t\n") == "");
    assert(joinFragments("find", "organic milk") == "find organic milk");
    assert(joinFragments("", " milk ") == "milk");
    assert(joinFragments("milk ", "") == "milk");

    std::cout << "[PASS] test_trim_and_join" << std::endl;
}

void test_base64() {
    std::string text = "Man";
    assert(base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size()) == "TWFu");

    text = "Ma";
    assert(base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size()) == "TWE=");

    text = "M";
    assert(base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size()) == "TQ==");

    std::vector<uint8_t> pcm = {0x00, 0xFF, 0x10, 0x80, 0x7F};
    auto decoded = base64Decode(base64Encode(pcm.data(), pcm.size()));
    assert(decoded == pcm);

    assert(base64Encode(nullptr, 0).empty());
    assert(base64Decode("").empty());

    std::cout << "[PASS] test_base64" << std::endl;
}

void test_audio_format() {
    vsp::AudioFormat format{16000, 1};
    assert(format.bytesPerSecond() == 32000);
    assert(format.bytesFor(std::chrono::milliseconds(20)) == 640);
    assert(format.durationOf(32000).count() == 1000);

    vsp::AudioFormat odd{22050, 1};
    // Always a whole number of samples
    assert(odd.bytesFor(std::chrono::milliseconds(1)) % 2 == 0);

    std::cout << "[PASS] test_audio_format" << std::endl;
}

void test_state_names() {
    assert(std::string(vsp::toString(vsp::TurnState::Idle)) == "idle");
    assert(std::string(vsp::toString(vsp::TurnState::Listening)) == "listening");
    assert(std::string(vsp::toString(vsp::TurnState::Dispatching)) == "dispatching");
    assert(std::string(vsp::toString(vsp::TurnState::Speaking)) == "speaking");

    std::cout << "[PASS] test_state_names" << std::endl;
}

int main() {
    std::cout << "=== TextUtils Tests ===" << std::endl;

    test_normalize();
    test_hash_equivalence();
    test_terminal_punctuation();
    test_trim_and_join();
    test_base64();
    test_audio_format();
    test_state_names();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
