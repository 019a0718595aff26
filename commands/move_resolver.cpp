#include "commands/move_resolver.hpp"
#include "commands/disambiguation.hpp"
#include "logger.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <set>

using Phonetics::TokenSequence;
using San::PieceType;

namespace {

struct OriginHint {
    std::optional<char> file;
    std::optional<char> rank;

    bool empty() const { return !file && !rank; }
};

// Squares and loose coordinates spoken in an utterance
struct Mentions {
    std::vector<std::string> squares;   // in spoken order
    OriginHint loose;                   // file/rank tokens not part of a square
};

struct Candidate {
    std::string san;
    San::MoveInfo info;
    size_t directLength = 0;            // canonical SAN length when contained
};

const std::set<std::string> kPromotionWords = {
    "promote", "promotes", "promotion", "promoting", "promoted", "equals"
};

Mentions scanSquares(const TokenSequence& tokens) {
    Mentions out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];
        if (Phonetics::isSquareToken(t)) {
            out.squares.push_back(t);
        } else if (Phonetics::isFileToken(t) && i + 1 < tokens.size() &&
                   Phonetics::isRankToken(tokens[i + 1])) {
            out.squares.push_back(t + tokens[i + 1]);
            ++i;
        } else if (Phonetics::isFileToken(t)) {
            if (!out.loose.file) out.loose.file = t[0];
        } else if (Phonetics::isRankToken(t)) {
            if (!out.loose.rank) out.loose.rank = t[0];
        }
    }
    return out;
}

// Compare only the components both sides carry; at least one must compare
bool originMatches(const San::MoveInfo& info, const OriginHint& hint) {
    bool compared = false;
    if (hint.file && info.originFile) {
        if (*hint.file != *info.originFile) return false;
        compared = true;
    }
    if (hint.rank && info.originRank) {
        if (*hint.rank != *info.originRank) return false;
        compared = true;
    }
    return compared;
}

bool originConflicts(const San::MoveInfo& info, const OriginHint& hint) {
    if (hint.file && info.originFile && *hint.file != *info.originFile) return true;
    if (hint.rank && info.originRank && *hint.rank != *info.originRank) return true;
    return false;
}

std::string concatTokens(const TokenSequence& tokens) {
    std::string out;
    for (const auto& t : tokens) out += t;
    return out;
}

std::optional<std::string> pickPawnMove(const std::vector<Candidate>& group,
                                        std::optional<PieceType> promotion) {
    if (group.empty()) return std::nullopt;
    if (promotion) {
        for (const auto& c : group) {
            if (c.info.promotion == promotion) return c.san;
        }
        return std::nullopt;
    }
    for (const auto& c : group) {
        if (c.info.promotion == PieceType::Queen) return c.san;
    }
    return group.front().san;
}

ResolutionOutcome resolvedMove(const std::string& san) {
    MoveCommand mv;
    mv.candidates.push_back(san);
    return Resolved{mv};
}

// Pawn moves onto one square. Promotion variants of the same pawn collapse
// to one move; pawns from different files stay ambiguous.
ResolutionOutcome resolvePawnGroup(const std::vector<Candidate>& group,
                                   std::optional<PieceType> promotion,
                                   const std::string& destination) {
    std::vector<std::optional<char>> origins;
    for (const auto& c : group) {
        if (std::find(origins.begin(), origins.end(), c.info.originFile) == origins.end()) {
            origins.push_back(c.info.originFile);
        }
    }

    std::vector<std::string> picks;
    for (const auto& origin : origins) {
        std::vector<Candidate> samePawn;
        for (const auto& c : group) {
            if (c.info.originFile == origin) samePawn.push_back(c);
        }
        if (auto pick = pickPawnMove(samePawn, promotion)) picks.push_back(*pick);
    }

    if (picks.empty()) return Unmatched{};
    if (picks.size() == 1) return resolvedMove(picks.front());

    Ambiguous amb;
    amb.piece = PieceType::Pawn;
    amb.square = destination;
    amb.candidates = std::move(picks);
    return amb;
}

// Canonical SAN spelled by consecutive whole tokens ("n" "f3", "e" "d5"),
// so a word like "then" never lends its last letter to "ne5"
bool spelledByTokens(const TokenSequence& tokens, const std::string& canon) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string joined;
        for (size_t j = i; j < tokens.size() && joined.size() < canon.size(); ++j) {
            joined += tokens[j];
            if (joined == canon) return true;
        }
    }
    return false;
}

} // namespace

MoveResolver::MoveResolver(const Phonetics::Vocabulary& vocab, const CommandGrammar& grammar)
    : vocab(vocab), grammar(grammar) {}

// ------------------------------------------------------------
// Step 1: follow-up narrowing
// ------------------------------------------------------------
std::optional<std::string> MoveResolver::narrow(const TokenSequence& tokens,
                                                const std::vector<std::string>& candidates) const {
    OriginHint hint;
    for (const auto& t : tokens) {
        if (Phonetics::isSquareToken(t)) {
            if (!hint.file) hint.file = t[0];
            if (!hint.rank) hint.rank = t[1];
        } else if (Phonetics::isFileToken(t)) {
            if (!hint.file) hint.file = t[0];
        } else if (Phonetics::isRankToken(t)) {
            if (!hint.rank) hint.rank = t[0];
        }
    }

    // Homophones like "the" -> d only count when nothing canonical was heard
    if (hint.empty()) {
        for (const auto& t : tokens) {
            auto alias = vocab.disambiguationAlias(t);
            if (!alias) continue;
            if (Phonetics::isFileToken(*alias) && !hint.file) hint.file = (*alias)[0];
            if (Phonetics::isRankToken(*alias) && !hint.rank) hint.rank = (*alias)[0];
        }
    }
    if (hint.empty()) return std::nullopt;

    std::vector<std::string> kept;
    for (const auto& san : candidates) {
        auto info = San::parse(san);
        if (info && originMatches(*info, hint)) kept.push_back(san);
    }

    if (kept.size() == 1) return kept.front();
    LOG_TRACE("Resolver", "Follow-up kept " + std::to_string(kept.size()) + " candidate(s)");
    return std::nullopt;
}

// ------------------------------------------------------------
// Full pipeline
// ------------------------------------------------------------
ResolutionOutcome MoveResolver::resolve(const TokenSequence& tokens,
                                        const std::vector<std::string>& legalMoves,
                                        const std::string& context,
                                        const DisambiguationState* pending) const {
    if (tokens.empty()) return Unmatched{};

    // 1. pending disambiguation
    if (pending) {
        if (auto pick = narrow(tokens, pending->candidates)) {
            LOG_DEBUG("Resolver", "Follow-up resolved to " + *pick);
            return resolvedMove(*pick);
        }
    }

    // 2. commands
    const std::string text = Phonetics::joinTokens(tokens);
    if (auto cmd = grammar.match(text, context)) {
        return Resolved{*cmd};
    }

    if (legalMoves.empty()) return Unmatched{};

    TokenSequence stripped;
    for (const auto& t : tokens) {
        if (!vocab.isConnector(t) && !vocab.isFiller(t)) stripped.push_back(t);
    }
    if (stripped.empty()) return Unmatched{};

    // 3a. castling
    auto has = [&](std::initializer_list<const char*> words) {
        for (const char* w : words) {
            if (std::find(stripped.begin(), stripped.end(), w) != stripped.end()) return true;
        }
        return false;
    };

    if (has({"castle", "castles"})) {
        bool wantLong  = has({"queenside", "long", "queen"});
        bool wantShort = has({"kingside", "short", "king"});
        std::optional<std::string> shortSan, longSan;
        for (const auto& san : legalMoves) {
            auto info = San::parse(san);
            if (!info) continue;
            if (info->castleShort && !shortSan) shortSan = san;
            if (info->castleLong && !longSan) longSan = san;
        }

        std::optional<std::string> pick;
        if (wantLong && !wantShort)      pick = longSan;
        else if (wantShort && !wantLong) pick = shortSan;
        else                             pick = shortSan ? shortSan : longSan;

        if (pick) return resolvedMove(*pick);
        LOG_DEBUG("Resolver", "Castling requested but not legal");
        return Unmatched{};
    }

    const std::string concat = concatTokens(stripped);

    // 3b. bare coordinate: a pawn move onto the named square
    if (concat.size() == 2 && Phonetics::isSquareToken(concat)) {
        std::vector<Candidate> pawnMoves;
        for (const auto& san : legalMoves) {
            auto info = San::parse(san);
            if (info && info->piece == PieceType::Pawn && info->destination == concat) {
                pawnMoves.push_back({san, *info, 0});
            }
        }
        if (!pawnMoves.empty()) {
            return resolvePawnGroup(pawnMoves, std::nullopt, concat);
        }
    }

    // Mover, promotion piece and squares
    std::optional<PieceType> promotion;
    std::optional<size_t> promotionIndex;
    for (size_t i = 0; i + 1 < stripped.size(); ++i) {
        if (kPromotionWords.count(stripped[i])) {
            if (auto p = San::pieceFromWord(stripped[i + 1])) {
                promotion = p;
                promotionIndex = i + 1;
                break;
            }
        }
    }

    Mentions mentions = scanSquares(stripped);
    std::string destination = mentions.squares.empty() ? "" : mentions.squares.back();

    if (!promotion && !destination.empty() && (destination[1] == '1' || destination[1] == '8')) {
        auto last = San::pieceFromWord(stripped.back());
        if (last && *last != PieceType::Pawn && *last != PieceType::King) {
            bool squareBeforeLast = stripped.size() >= 2 &&
                                    !Phonetics::isSquareToken(stripped.back());
            if (squareBeforeLast) {
                promotion = last;
                promotionIndex = stripped.size() - 1;
            }
        }
    }

    std::optional<PieceType> mover;
    for (size_t i = 0; i < stripped.size(); ++i) {
        if (promotionIndex && i == *promotionIndex) continue;
        if (auto p = San::pieceFromWord(stripped[i])) {
            mover = p;
            break;
        }
    }

    OriginHint hint = mentions.loose;
    if (mentions.squares.size() > 1) {
        const std::string& origin = mentions.squares[mentions.squares.size() - 2];
        hint.file = origin[0];
        hint.rank = origin[1];
    }

    // 4 + 5. direct notation, piece + destination
    std::vector<Candidate> matches;
    for (const auto& san : legalMoves) {
        auto info = San::parse(san);
        if (!info || info->castleShort || info->castleLong) continue;

        bool pieceAgrees = mover ? info->piece == *mover : true;
        std::string canon = San::canonical(san);
        bool direct = pieceAgrees && !canon.empty() && spelledByTokens(stripped, canon);

        bool pieceDest = !destination.empty() && info->destination == destination &&
                         (mover ? info->piece == *mover : info->piece == PieceType::Pawn);

        if (info->piece == PieceType::Pawn && promotion && info->promotion &&
            info->promotion != promotion) {
            continue;
        }

        if (direct || pieceDest) {
            matches.push_back({san, *info, direct ? canon.size() : 0});
        }
    }

    if (matches.empty()) {
        LOG_DEBUG("Resolver", "No legal move matches \"" + text + "\"");
        return Unmatched{};
    }

    // 6. origin hints, grouping
    if (!hint.empty()) {
        std::vector<Candidate> filtered;
        for (const auto& c : matches) {
            if (!originConflicts(c.info, hint)) filtered.push_back(c);
        }
        if (!filtered.empty()) matches = std::move(filtered);
    }

    struct Group {
        PieceType piece;
        std::string destination;
        std::vector<Candidate> moves;
        size_t bestDirect = 0;
    };
    std::vector<Group> groups;
    for (const auto& c : matches) {
        auto it = std::find_if(groups.begin(), groups.end(), [&](const Group& g) {
            return g.piece == c.info.piece && g.destination == c.info.destination;
        });
        if (it == groups.end()) {
            groups.push_back({c.info.piece, c.info.destination, {}, 0});
            it = std::prev(groups.end());
        }
        it->moves.push_back(c);
        it->bestDirect = std::max(it->bestDirect, c.directLength);
    }

    if (groups.size() > 1) {
        size_t best = 0;
        for (const auto& g : groups) best = std::max(best, g.bestDirect);
        std::vector<Group> kept;
        if (best > 0) {
            for (auto& g : groups) {
                if (g.bestDirect == best) kept.push_back(std::move(g));
            }
        }
        if (kept.size() != 1) {
            LOG_DEBUG("Resolver", "Conflicting interpretations for \"" + text + "\" (" +
                                  std::to_string(groups.size()) + " groups)");
            return Unmatched{};
        }
        groups = std::move(kept);
    }

    Group& group = groups.front();
    if (group.moves.size() == 1) {
        return resolvedMove(group.moves.front().san);
    }

    if (group.piece == PieceType::Pawn) {
        return resolvePawnGroup(group.moves, promotion, group.destination);
    }

    // One spoken exact notation inside the group settles it
    size_t directCount = 0;
    const Candidate* directPick = nullptr;
    for (const auto& c : group.moves) {
        if (c.directLength == group.bestDirect && c.directLength > 0) {
            ++directCount;
            directPick = &c;
        }
    }
    if (directCount == 1) {
        return resolvedMove(directPick->san);
    }

    Ambiguous amb;
    amb.piece = group.piece;
    amb.square = group.destination;
    for (const auto& c : group.moves) amb.candidates.push_back(c.san);
    return amb;
}
