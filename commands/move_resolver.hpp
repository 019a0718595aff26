#pragma once
#include <string>
#include <vector>
#include "commands/command.hpp"
#include "commands/command_grammar.hpp"
#include "phonetics/normalizer.hpp"
#include "phonetics/vocabulary.hpp"

struct DisambiguationState;

// ------------------------------------------------------------
// MoveResolver: normalized tokens -> ResolutionOutcome
//
// Pure: the result depends only on the arguments and the immutable
// vocabulary/grammar tables held by reference. Priority order:
//   1. follow-up narrowing of a pending disambiguation
//   2. command grammar for the screen context
//   3. castling and bare coordinates ("c4")
//   4. direct notation ("knight f3" contains "nf3")
//   5. piece + destination
//   6. grouping into Resolved / Ambiguous / Unmatched
// ------------------------------------------------------------
class MoveResolver {
public:
    MoveResolver(const Phonetics::Vocabulary& vocab, const CommandGrammar& grammar);

    ResolutionOutcome resolve(const Phonetics::TokenSequence& tokens,
                              const std::vector<std::string>& legalMoves,
                              const std::string& context,
                              const DisambiguationState* pending = nullptr) const;

    // Step 1 alone: the single pending candidate the follow-up names
    std::optional<std::string> narrow(const Phonetics::TokenSequence& tokens,
                                      const std::vector<std::string>& candidates) const;

private:
    const Phonetics::Vocabulary& vocab;
    const CommandGrammar& grammar;
};
