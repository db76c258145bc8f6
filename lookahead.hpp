#ifndef LOOKAHEAD_H
#define LOOKAHEAD_H

#include "line_parser.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <vector>

class SequenceExhausted : public std::out_of_range
{
public:
    SequenceExhausted() : std::out_of_range {"advance() past the end of the item sequence"} {}
};

// Single pass cursor over parsed items that can look at the next item
// without consuming it.
class LookaheadSequence
{
public:
    using Producer = std::function<std::optional<ParsedItem>()>;

    explicit LookaheadSequence(Producer producer);
    // Reads the vector in place; it must outlive the sequence.
    explicit LookaheadSequence(const std::vector<ParsedItem>& items);

    // Idempotent. Returns nullptr once the producer has run dry.
    const ParsedItem* peek();

    // Throws SequenceExhausted when nothing is left.
    ParsedItem advance();

    bool exhausted() { return peek() == nullptr; }
    std::size_t consumed() const { return m_consumed; }

private:
    Producer m_producer {};
    std::optional<ParsedItem> m_peeked {};
    bool m_done {false};
    std::size_t m_consumed {};
};

#endif
