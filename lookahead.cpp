#include "lookahead.hpp"

#include <utility>

LookaheadSequence::LookaheadSequence(Producer producer)
    : m_producer {std::move(producer)}
{
}

LookaheadSequence::LookaheadSequence(const std::vector<ParsedItem>& items)
    : m_producer {[&items, next = std::size_t {0}]() mutable -> std::optional<ParsedItem> {
          if (next >= items.size()) {
              return std::nullopt;
          }
          return items[next++];
      }}
{
}

const ParsedItem* LookaheadSequence::peek() {
    if (m_peeked) {
        return &*m_peeked;
    }
    if (m_done || !m_producer) {
        return nullptr;
    }

    m_peeked = m_producer();
    if (!m_peeked) {
        m_done = true;
        return nullptr;
    }
    return &*m_peeked;
}

ParsedItem LookaheadSequence::advance() {
    if (!peek()) {
        throw SequenceExhausted {};
    }
    ParsedItem item = std::move(*m_peeked);
    m_peeked.reset();
    ++m_consumed;
    return item;
}
