#ifndef candidate_hh_INCLUDED
#define candidate_hh_INCLUDED

#include "string.hh"
#include "units.hh"
#include "vector.hh"

#include <memory>

namespace Tabgrid
{

// A completion proposal: the whole line as it reads once accepted,
// and the label shown for it in the candidate grid.
struct Candidate
{
    String new_line;
    String display;

    friend bool operator==(const Candidate&, const Candidate&) = default;
};

using CandidateList = Vector<Candidate>;

// Completion source producing full candidates for a line and a cursor position
class Completer
{
public:
    virtual ~Completer() = default;
    virtual CandidateList fetch(StringView line, CharCount pos) const = 0;
};

struct PrefixCompletions
{
    // text to insert at the cursor for each candidate
    Vector<String> suffixes;
    // count of characters before the cursor every candidate shares
    CharCount shared_length = 0;
};

// Completion source only proposing text to insert at the cursor
class PrefixCompleter
{
public:
    virtual ~PrefixCompleter() = default;
    virtual PrefixCompletions complete(StringView line, CharCount pos) const = 0;
};

class PrefixCompleterAdapter : public Completer
{
public:
    explicit PrefixCompleterAdapter(std::unique_ptr<PrefixCompleter> completer);

    CandidateList fetch(StringView line, CharCount pos) const override;

private:
    std::unique_ptr<PrefixCompleter> m_completer;
};

// inserts a literal tab
class TabCompleter : public PrefixCompleter
{
public:
    PrefixCompletions complete(StringView line, CharCount pos) const override;
};

// completes the blank separated word before the cursor against a word list,
// in list order and without duplicates
class WordListCompleter : public PrefixCompleter
{
public:
    explicit WordListCompleter(Vector<String> words);

    PrefixCompletions complete(StringView line, CharCount pos) const override;

private:
    Vector<String> m_words;
};

}

#endif // candidate_hh_INCLUDED
