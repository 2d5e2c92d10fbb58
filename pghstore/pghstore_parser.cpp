#include "pghstore_parser.h"

#include <cctype>
#include <stdexcept>

#include "logger.h"
#include "pghstore_error.h"
#include "pghstore_escape.h"
#include "utils.h"

namespace
{

using size_type = std::string::size_type;

/**
 * What one pair matched. `end` points past the terminating comma, or at the end of the input.
 */
struct Match
{
    std::string key;
    std::optional<std::string> value;
    size_type end = 0;
};

/**
 * Offset of the unescaped double quote that closes the quoted span opening at `open`, or `npos`
 * when the span is never closed.
 */
size_type closing_quote(const std::string &s, size_type open)
{
    size_type i = open + 1;
    while (i < s.size())
    {
        if (s[i] == '"')
            return i;

        if (s[i] == '\\')
        {
            if (i + 1 == s.size())
                return std::string::npos;
            i += 2;
        }
        else
            ++i;
    }
    return std::string::npos;
}

size_type skip_space(const std::string &s, size_type i)
{
    while (i < s.size() and pghstore::is_space(s[i]))
        ++i;
    return i;
}

/**
 * A quoted or `NULL` value ends with a comma or with the end of the input, optionally after some
 * whitespace.
 */
bool terminator_at(const std::string &s, size_type pos, size_type &end)
{
    pos = skip_space(s, pos);

    if (pos < s.size() and s[pos] == ',')
    {
        end = pos + 1;
        return true;
    }

    if (pos == s.size())
    {
        end = pos;
        return true;
    }

    return false;
}

bool is_null_token(const std::string &s, size_type pos)
{
    static const char NULL_TOKEN[] = "NULL";

    if (s.size() - pos < 4)
        return false;

    for (size_type i = 0; i < 4; ++i)
    {
        if (std::toupper(static_cast<unsigned char>(s[pos + i])) != NULL_TOKEN[i])
            return false;
    }
    return true;
}

/**
 * Match the value that follows the `=>` ending just before `after_arrow`.
 *
 * Alternatives are tried in order: quoted, `NULL`, bare run up to the next comma. When none of
 * them fits after all the whitespace following the arrow, the whitespace is given back one
 * character at a time, which lets a bare value consist of that whitespace.
 */
bool match_value(const std::string &s, size_type after_arrow, Match &m)
{
    size_type start = skip_space(s, after_arrow);

    while (true)
    {
        if (start < s.size() and s[start] == '"')
        {
            size_type close = closing_quote(s, start);
            if (close != std::string::npos and terminator_at(s, close + 1, m.end))
            {
                m.value = pghstore::unescape(s.substr(start + 1, close - start - 1));
                return true;
            }
        }

        if (is_null_token(s, start) and terminator_at(s, start + 4, m.end))
        {
            m.value.reset();
            return true;
        }

        if (start < s.size() and s[start] != ',')
        {
            size_type comma = s.find(',', start);
            if (comma == std::string::npos)
            {
                m.value = s.substr(start);
                m.end = s.size();
            }
            else
            {
                m.value = s.substr(start, comma - start);
                m.end = comma + 1;
            }
            return true;
        }

        if (start == after_arrow)
            return false;
        --start;
    }
}

/**
 * Match the optional whitespace, the `=>` and the value that follow a key ending at `key_end`.
 */
bool match_after_key(const std::string &s, size_type key_end, Match &m)
{
    size_type arrow = skip_space(s, key_end);
    if (arrow + 1 >= s.size() or s[arrow] != '=' or s[arrow + 1] != '>')
        return false;

    return match_value(s, arrow + 2, m);
}

/**
 * Match a whole pair starting at `start`, which must not be whitespace.
 *
 * A quoted key is tried first. Failing that, the key is the shortest run of non-whitespace that is
 * followed by a complete `=>` and value; a bare key can therefore contain `"`, `=` and `>`.
 */
bool match_pair(const std::string &s, size_type start, Match &m)
{
    if (s[start] == '"')
    {
        size_type close = closing_quote(s, start);
        if (close != std::string::npos and match_after_key(s, close + 1, m))
        {
            m.key = pghstore::unescape(s.substr(start + 1, close - start - 1));
            return true;
        }
    }

    for (size_type key_end = start + 1; key_end <= s.size() and not pghstore::is_space(s[key_end - 1]); ++key_end)
    {
        if (match_after_key(s, key_end, m))
        {
            m.key = s.substr(start, key_end - start);
            return true;
        }
    }

    return false;
}

}

pghstore::Scanner::Scanner(const std::shared_ptr<const std::string> &text, const TextCodec &codec)
    : text(text),
      codec(codec)
{
}

bool pghstore::Scanner::next(Pair &pair)
{
    const std::string &s = *text;

    size_type start = skip_space(s, offset);
    if (start >= s.size())
        return false;

    Match m;
    if (not match_pair(s, start, m))
    {
        Logger::getInstance()->log(LOG_DEBUG1, "No hstore pair matches at position %zu (first non-blank at %zu)", offset, start);
        throw MalformedInput(offset);
    }

    pair.first = codec.decode(m.key);
    if (m.value)
        pair.second = codec.decode(m.value.value());
    else
        pair.second.reset();

    offset = m.end;
    return true;
}

std::string::size_type pghstore::Scanner::position() const
{
    return offset;
}

pghstore::PairIterator::PairIterator(const std::shared_ptr<Scanner> &scanner)
    : scanner(scanner)
{
    advance();
}

void pghstore::PairIterator::advance()
{
    if (not scanner)
        throw std::runtime_error("Trying to advance the end iterator");

    if (not scanner->next(current))
        scanner.reset();
}

bool pghstore::PairIterator::operator==(const PairIterator &rhs) const
{
    if (not scanner or not rhs.scanner)
        return scanner == rhs.scanner;

    return scanner == rhs.scanner and scanner->position() == rhs.scanner->position();
}

bool pghstore::PairIterator::operator!=(const PairIterator &rhs) const
{
    return not (*this == rhs);
}

pghstore::PairIterator &pghstore::PairIterator::operator++()
{
    advance();
    return *this;
}

pghstore::PairIterator pghstore::PairIterator::operator++(int)
{
    PairIterator previous(*this);
    advance();
    return previous;
}

const pghstore::Pair &pghstore::PairIterator::operator*() const
{
    if (not scanner)
        throw std::runtime_error("Trying to dereference the end iterator");

    return current;
}

const pghstore::Pair *pghstore::PairIterator::operator->() const
{
    return &operator*();
}

pghstore::Pairs::Pairs(std::string text, const TextCodec &codec)
    : text(std::make_shared<const std::string>(std::move(text))),
      codec(codec)
{
}

pghstore::PairIterator pghstore::Pairs::begin() const
{
    return PairIterator(std::make_shared<Scanner>(text, codec));
}

pghstore::PairIterator pghstore::Pairs::end() const
{
    return PairIterator();
}

pghstore::Document pghstore::Pairs::to_document() const
{
    Document document(begin(), end());

    Logger::getInstance()->log(LOG_DEBUG3, "Parsed %zu hstore pairs from %zu bytes", document.size(), text->size());

    return document;
}

pghstore::Pairs pghstore::parse(std::string text, const std::string &encoding)
{
    return Pairs(std::move(text), TextCodec(encoding));
}
