#ifndef PGHSTORE_PARSER_H
#define PGHSTORE_PARSER_H

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pghstore_codec.h"

namespace pghstore
{

/**
 * One `key=>value` entry. An empty `second` is SQL `NULL`, which is not the same as `""`.
 */
using Pair = std::pair<std::string, std::optional<std::string>>;

/**
 * Pairs in the order in which they appeared in the text. Duplicate keys are kept.
 */
using Document = std::vector<Pair>;

/**
 * Cursor over one hstore text. Every call to `next()` matches one pair at the current offset.
 */
class Scanner
{
    std::shared_ptr<const std::string> text;
    TextCodec codec;
    std::string::size_type offset = 0;

public:
    Scanner(const std::shared_ptr<const std::string> &text, const TextCodec &codec);

    /**
     * Store the next pair in `pair` and return `true`, or return `false` when nothing but
     * whitespace is left.
     *
     * Throws `MalformedInput`, with the offset at which the pair should have started, when no pair
     * can be matched there and the rest is not just whitespace.
     */
    bool next(Pair &pair);

    /**
     * Offset just past the last matched pair (including its terminating comma, if any).
     */
    std::string::size_type position() const;
};

/**
 * \brief Input iterator that scans the next pair on every increment.
 *
 * Errors surface from the increment that reaches them, so the pairs before a malformed spot are
 * all seen first.
 */
class PairIterator
{
    std::shared_ptr<Scanner> scanner;
    Pair current;

    void advance();

public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Pair;
    using difference_type = std::ptrdiff_t;
    using pointer = const Pair *;
    using reference = const Pair &;

    /**
     * \brief basically the constructor for the end iterator.
     */
    PairIterator() = default;
    PairIterator(const std::shared_ptr<Scanner> &scanner);

    bool operator==(const PairIterator &rhs) const;
    bool operator!=(const PairIterator &rhs) const;
    PairIterator &operator++();
    PairIterator operator++(int);
    const Pair &operator*() const;
    const Pair *operator->() const;
};

/**
 * The lazy result of `parse()`. Each `begin()` starts a new scan over the same text.
 */
class Pairs
{
    std::shared_ptr<const std::string> text;
    TextCodec codec;

public:
    Pairs(std::string text, const TextCodec &codec);

    PairIterator begin() const;
    PairIterator end() const;

    Document to_document() const;
};

/**
 * Parse hstore text, as produced by PostgreSQL's `hstore_out()` or written by hand.
 *
 * Keys and values may be quoted (with backslash escapes) or bare; an unquoted `NULL`, in any case,
 * is SQL `NULL`. Each key and value is unescaped first and then decoded from `encoding` to UTF-8.
 * An unknown `encoding` is an `InvalidArgument`, thrown before anything is scanned.
 */
Pairs parse(std::string text, const std::string &encoding = "UTF-8");

}

#endif // PGHSTORE_PARSER_H
